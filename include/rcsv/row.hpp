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
 * @file row.hpp
 * @brief Row implementation.
 */

#include "row.h"
#include "column_index.hpp"
#include <stdexcept>

namespace rcsv {

    inline Row::Row(std::initializer_list<Entry> entries) {
        reserve(entries.size());
        for (const auto& e : entries) {
            set(e.first, e.second);
        }
    }

    inline const Row::Value& Row::at(std::string_view key) const {
        const Value* value = find(key);
        if (value == nullptr) {
            throw std::out_of_range("Error: Row has no column named '" + std::string(key) + "'");
        }
        return *value;
    }

    inline void Row::clear() {
        entries_.clear();
        index_.clear();
    }

    inline const Row::Entry& Row::entry(size_t position) const {
        if constexpr (RANGE_CHECKING) {
            return entries_.at(position);
        } else {
            return entries_[position];
        }
    }

    inline const Row::Value* Row::find(std::string_view key) const {
        size_t pos = index_.find(key);
        return pos == ColumnIndex::npos ? nullptr : &entries_[pos].second;
    }

    inline std::vector<std::string> Row::keys() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& e : entries_) {
            result.push_back(e.first);
        }
        return result;
    }

    inline void Row::reserve(size_t n) {
        entries_.reserve(n);
        index_.reserve(n);
    }

    inline size_t Row::set(std::string_view key, Value value) {
        size_t pos = index_.find(key);
        if (pos != ColumnIndex::npos) {
            entries_[pos].second = std::move(value);
            return pos;
        }
        pos = entries_.size();
        entries_.emplace_back(std::string(key), std::move(value));
        index_.insert(key, pos);
        return pos;
    }

    inline Row::Value& Row::valueAt(size_t position) {
        if constexpr (RANGE_CHECKING) {
            return entries_.at(position).second;
        } else {
            return entries_[position].second;
        }
    }

    inline const Row::Value& Row::valueAt(size_t position) const {
        if constexpr (RANGE_CHECKING) {
            return entries_.at(position).second;
        } else {
            return entries_[position].second;
        }
    }

} // namespace rcsv
