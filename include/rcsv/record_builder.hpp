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
 * @file record_builder.hpp
 * @brief RecordBuilder / RowBuilder implementations.
 */

#include "record_builder.h"
#include "column_index.hpp"
#include "header_resolver.hpp"
#include "row.hpp"
#include <iostream>
#include <stdexcept>

namespace rcsv {

    // ── RecordBuilder ───────────────────────────────────────────────────

    template<RecordConcept T>
    RecordBuilder<T>::RecordBuilder(ResolvedHeaderPtr<T> header, bool logErrors)
        : header_(std::move(header))
        , log_errors_(logErrors)
    {
        if (!header_) {
            throw std::invalid_argument("Error: RecordBuilder requires a resolved header");
        }
    }

    template<RecordConcept T>
    void RecordBuilder<T>::bindHeader(const std::vector<std::string>& headerColumns) {
        ColumnIndex index;
        index.build(headerColumns);

        positions_.clear();
        positions_.reserve(header_->columnCount());
        for (const auto& name : header_->columnNames()) {
            positions_.push_back(index.find(name));
        }
    }

    template<RecordConcept T>
    T RecordBuilder<T>::build(const std::vector<std::string_view>& cells, size_t fileLine, std::string& errMsg) const {
        T record{};
        const auto& fields = header_->fields();

        for (size_t f = 0; f < fields.size() && f < positions_.size(); ++f) {
            const size_t pos = positions_[f];
            if (pos == ColumnIndex::npos || pos >= cells.size()) {
                continue;
            }

            try {
                fields[f].assign(record, cells[pos]);
            } catch (const ConversionError& ex) {
                if (log_errors_) {
                    throw;
                }
                errMsg = "Warning: " + std::string(ex.what()) + " for field '" + fields[f].name +
                         "' at file line " + std::to_string(fileLine);
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << errMsg << std::endl;
                }
                break; // remaining fields of this record keep their defaults
            }
        }
        return record;
    }

    // ── RowBuilder ──────────────────────────────────────────────────────

    inline void RowBuilder::bindHeader(const std::vector<std::string>& headerColumns) {
        template_.clear();
        template_.reserve(headerColumns.size());
        positions_.clear();
        positions_.reserve(headerColumns.size());
        for (const auto& name : headerColumns) {
            // Repeated names share the first position, the right-most cell wins
            positions_.push_back(template_.set(name, std::nullopt));
        }
    }

    inline Row RowBuilder::build(const std::vector<std::string_view>& cells, size_t, std::string&) const {
        Row row = template_;
        for (size_t j = 0; j < positions_.size(); ++j) {
            Row::Value& value = row.valueAt(positions_[j]);
            if (j < cells.size() && !cells[j].empty()) {
                value = std::string(cells[j]);
            } else {
                value = std::nullopt;
            }
        }
        return row;
    }

} // namespace rcsv
