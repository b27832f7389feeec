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
 * @file writer_concept.h
 * @brief WriterConcept — C++20 concept defining the common writer API.
 *
 * RecordWriter<T> and RowWriter both satisfy this concept:
 *
 *     template<rcsv::WriterConcept W>
 *     void writeData(W& writer, const std::vector<typename W::RowType>& rows) {
 *         for (const auto& r : rows) writer.write(r);
 *         writer.close();
 *     }
 */

#include <concepts>
#include <cstddef>
#include <string>

namespace rcsv {

    template<typename W>
    concept WriterConcept = requires(W writer, const W& const_writer, const typename W::RowType& row) {
        // Writing
        { writer.write(row)         };
        { writer.close()            };

        // Diagnostics
        { const_writer.getErrorMsg()}   -> std::convertible_to<const std::string&>;
        { const_writer.rowCount()   }   -> std::convertible_to<size_t>;
    };

} // namespace rcsv
