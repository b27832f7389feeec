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
 * @file record_concept.h
 * @brief RecordConcept — C++20 concept for types that can be read and written as CSV records.
 *
 * A record type must be default constructible (one instance is created per data line)
 * and describe its fields through a RecordTraits<T> specialization.
 */

#include <concepts>

#include "record_descriptor.h"

namespace rcsv {

    template<typename T>
    concept RecordConcept = std::default_initializable<T> && requires {
        { RecordTraits<T>::describe() } -> std::convertible_to<RecordDescriptor<T>>;
    };

} // namespace rcsv
