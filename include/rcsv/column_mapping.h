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
 * @file column_mapping.h
 * @brief Explicit field-to-column name association.
 *
 * A field either carries a ColumnMapping (its column is named explicitly) or
 * uses its own field name.  ColumnSource models both cases:
 *
 *     ColumnSource src = FieldName{};           // column = field name
 *     ColumnSource src = ColumnMapping("Age");  // column = "Age"
 */

#include <string>
#include <string_view>
#include <variant>

#include "definitions.h"
#include "errors.h"

namespace rcsv {

    class ColumnMapping {
        std::string declared_name_;
        std::string lower_case_name_;

    public:
        /// @throws EmptyColumnMapping if name is empty
        explicit ColumnMapping(std::string_view name)
            : declared_name_(name)
            , lower_case_name_(toLowerAscii(name))
        {
            if (declared_name_.empty()) {
                throw EmptyColumnMapping();
            }
        }

        const std::string&  declaredName() const    { return declared_name_; }
        const std::string&  lowerCaseName() const   { return lower_case_name_; }

        const std::string&  name(bool lowerCase) const {
            return lowerCase ? lower_case_name_ : declared_name_;
        }

        bool operator==(const ColumnMapping& other) const = default;
    };

    /// Tag: the column identity is the field's own name.
    struct FieldName {
        bool operator==(const FieldName&) const = default;
    };

    using ColumnSource = std::variant<FieldName, ColumnMapping>;

    /// Resolve the column name of a field from its source and the casing option.
    inline std::string columnNameOf(const ColumnSource& source, std::string_view fieldName, bool lowerCase) {
        if (const auto* mapping = std::get_if<ColumnMapping>(&source)) {
            return mapping->name(lowerCase);
        }
        return lowerCase ? toLowerAscii(fieldName) : std::string(fieldName);
    }

} // namespace rcsv
