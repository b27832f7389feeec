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
 * @file record_descriptor.hpp
 * @brief RecordDescriptor template implementations.
 */

#include "record_descriptor.h"
#include "field_coercion.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace rcsv {

    template<typename T>
    void RecordDescriptor<T>::append(FieldDescriptor<T> field) {
        if (field.name.empty()) {
            throw std::invalid_argument("Error: Field name cannot be empty");
        }
        auto duplicate = std::find_if(fields_.begin(), fields_.end(),
            [&field](const FieldDescriptor<T>& f) { return f.name == field.name; });
        if (duplicate != fields_.end()) {
            throw std::invalid_argument("Error: Duplicate field name: " + field.name);
        }
        fields_.push_back(std::move(field));
    }

    template<typename T>
    template<ScalarField M>
    RecordDescriptor<T>& RecordDescriptor<T>::field(std::string_view name, M T::* member) {
        return property<M>(name,
            [member](const T& record) -> const M& { return record.*member; },
            [member](T& record, M value) { record.*member = std::move(value); });
    }

    template<typename T>
    template<ScalarField M>
    RecordDescriptor<T>& RecordDescriptor<T>::field(std::string_view name, M T::* member, ColumnMapping mapping) {
        return property<M>(name,
            [member](const T& record) -> const M& { return record.*member; },
            [member](T& record, M value) { record.*member = std::move(value); },
            ColumnSource{std::move(mapping)});
    }

    template<typename T>
    template<ScalarField M, typename Getter, typename Setter>
    RecordDescriptor<T>& RecordDescriptor<T>::property(std::string_view name, Getter get, Setter set, ColumnSource source) {
        FieldDescriptor<T> field{
            std::string(name),
            std::move(source),
            toFieldType<M>(),
            is_optional_v<M>,
            [set](T& record, std::string_view cell) { set(record, coerce<M>(cell)); },
            [get](const T& record) { return stringify<M>(get(record)); }
        };
        append(std::move(field));
        return *this;
    }

} // namespace rcsv
