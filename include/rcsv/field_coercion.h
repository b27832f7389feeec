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
 * @file field_coercion.h
 * @brief Conversion between CSV cell text and scalar field values.
 *
 * Read direction:  coerce<T>(cell)   -> T, throws ConversionError
 * Write direction: stringify(value)  -> std::string
 *
 * Design:
 *   - std::from_chars() / std::to_chars() for all numeric types (no locale)
 *   - Surrounding spaces are ignored for non-string types, strings are taken verbatim
 *   - bool accepts true/false/1/0 (case-insensitive), writes true/false
 *   - std::chrono::year_month_day uses ISO 8601 calendar dates (YYYY-MM-DD)
 *   - std::optional<T>: empty cell <-> std::nullopt
 *   - The whole cell must be consumed, "12abc" is not an int
 */

#include <chrono>
#include <string>
#include <string_view>

#include "definitions.h"
#include "errors.h"

namespace rcsv {

    template<ScalarField T>
    T coerce(std::string_view cell);

    template<ScalarField T>
    std::string stringify(const T& value);

    namespace detail {
        inline std::string_view trimSpaces(std::string_view cell);
        inline bool parseBool(std::string_view cell, bool& out);
        inline bool parseDate(std::string_view cell, std::chrono::year_month_day& out);
        inline std::string formatDate(const std::chrono::year_month_day& date);
    } // namespace detail

} // namespace rcsv
