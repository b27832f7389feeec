/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file errors.h
 * @brief Exception types raised by the RCSV library.
 *
 * Contract violations derive from std::invalid_argument / std::logic_error,
 * data and I/O problems from std::runtime_error.  Callers that only care about
 * "something went wrong" can catch std::exception.
 */

#include <stdexcept>
#include <string>
#include <string_view>

#include "definitions.h"

namespace rcsv {

    /**
     * @brief Raised when a ColumnMapping is constructed with an empty column name.
     */
    class EmptyColumnMapping : public std::invalid_argument {
    public:
        EmptyColumnMapping()
            : std::invalid_argument("Error: Column mapping name cannot be empty") {}
    };

    /**
     * @brief Raised when a cell cannot be converted to the declared type of a field.
     */
    class ConversionError : public std::runtime_error {
        std::string cell_;
        FieldType   target_;

    public:
        ConversionError(std::string_view cell, FieldType target)
            : std::runtime_error("Error: Cannot convert '" + std::string(cell) + "' to " + fieldTypeToString(target))
            , cell_(cell)
            , target_(target)
        {}

        const std::string&  cell() const       { return cell_; }
        FieldType           targetType() const { return target_; }
    };

} // namespace rcsv
