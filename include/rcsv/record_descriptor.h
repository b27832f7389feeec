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
 * @file record_descriptor.h
 * @brief RecordDescriptor — caller-supplied field list of a record type.
 *
 * The engine never inspects a record type on its own.  Instead every record type
 * provides a RecordTraits<T> specialization returning the ordered list of its fields,
 * each with a name, an optional ColumnMapping and typed get/set accessors:
 *
 *     struct Person {
 *         std::string userName;
 *         int32_t     userAge = 0;
 *     };
 *
 *     template<> struct rcsv::RecordTraits<Person> {
 *         static rcsv::RecordDescriptor<Person> describe() {
 *             return rcsv::RecordDescriptor<Person>()
 *                 .field("UserName", &Person::userName, rcsv::ColumnMapping("Name"))
 *                 .field("UserAge",  &Person::userAge,  rcsv::ColumnMapping("Age"));
 *         }
 *     };
 *
 * Field order is the order of the field() / property() calls.
 */

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "column_mapping.h"
#include "definitions.h"
#include "field_coercion.h"

namespace rcsv {

    /**
     * @brief One field of a record type: identity, column source and type-erased accessors.
     */
    template<typename T>
    struct FieldDescriptor {
        using Assign = std::function<void(T&, std::string_view)>;
        using Format = std::function<std::string(const T&)>;

        std::string     name;       // field name
        ColumnSource    source;     // declared column or field name
        FieldType       type;       // scalar kind (diagnostics)
        bool            optional;   // field is a std::optional<>
        Assign          assign;     // coerce cell and store, may throw ConversionError
        Format          format;     // load and stringify

        std::string     columnName(bool lowerCase) const { return columnNameOf(source, name, lowerCase); }
        bool            hasMapping() const               { return std::holds_alternative<ColumnMapping>(source); }
    };

    template<typename T>
    class RecordDescriptor {
        std::vector<FieldDescriptor<T>> fields_;

        void append(FieldDescriptor<T> field);

    public:
        RecordDescriptor() = default;

        /// Register a data member, column named after the field.
        template<ScalarField M>
        RecordDescriptor& field(std::string_view name, M T::* member);

        /// Register a data member with an explicit column mapping.
        template<ScalarField M>
        RecordDescriptor& field(std::string_view name, M T::* member, ColumnMapping mapping);

        /**
         * @brief Register a field through accessor callables.
         * @tparam M      scalar type exchanged with the accessors
         * @param get     callable (const T&) -> M
         * @param set     callable (T&, M) -> void
         */
        template<ScalarField M, typename Getter, typename Setter>
        RecordDescriptor& property(std::string_view name, Getter get, Setter set, ColumnSource source = FieldName{});

        const std::vector<FieldDescriptor<T>>&  fields() const      { return fields_; }
        size_t                                  fieldCount() const  { return fields_.size(); }
        bool                                    empty() const       { return fields_.empty(); }
    };

    /**
     * @brief Customization point: specialize with `static RecordDescriptor<T> describe()`.
     */
    template<typename T>
    struct RecordTraits {};

} // namespace rcsv
