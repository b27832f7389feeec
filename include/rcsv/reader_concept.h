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
 * @file reader_concept.h
 * @brief ReaderConcept — C++20 concept defining the common blocking reader API.
 *
 * RecordReader<T> and RowReader both satisfy this concept, enabling generic algorithms:
 *
 *     template<rcsv::ReaderConcept R>
 *     size_t countRows(R& reader) {
 *         size_t n = 0;
 *         while (reader.readNext()) ++n;
 *         return n;
 *     }
 */

#include <concepts>
#include <cstddef>
#include <string>
#include <vector>

namespace rcsv {

    template<typename R>
    concept ReaderConcept = requires(R reader, const R& const_reader) {
        // Row access
        { const_reader.row()        }   -> std::same_as<const typename R::RowType&>;
        { const_reader.batch()      }   -> std::same_as<const std::vector<typename R::RowType>&>;

        // Iteration
        { reader.readNext()         }   -> std::convertible_to<bool>;
        { reader.fetchBatch()       }   -> std::convertible_to<size_t>;
        { const_reader.isDone()     }   -> std::convertible_to<bool>;

        // Header
        { reader.header()           }   -> std::convertible_to<const std::vector<std::string>&>;

        // Diagnostics
        { const_reader.getErrorMsg()}   -> std::convertible_to<const std::string&>;
        { const_reader.rowPos()     }   -> std::convertible_to<size_t>;
        { const_reader.fileLine()   }   -> std::convertible_to<size_t>;
    };

} // namespace rcsv
