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
 * @file column_index.hpp
 * @brief ColumnIndex implementation.
 */

#include "column_index.h"
#include <algorithm>

namespace rcsv {

    template<typename NameRange>
    inline void ColumnIndex::build(const NameRange& names) {
        data_.clear();
        size_t position = 0;
        for (const auto& name : names) {
            data_.emplace_back(std::string(name), position++);
        }
        std::sort(data_.begin(), data_.end(), Comparator());
    }

    inline size_t ColumnIndex::find(std::string_view name) const {
        auto it = std::lower_bound(data_.begin(), data_.end(), name, Comparator());
        if (it == data_.end() || it->first != name) {
            return npos;
        }
        return it->second;
    }

    inline void ColumnIndex::insert(std::string_view name, size_t position) {
        Entry entry{std::string(name), position};
        auto it = std::upper_bound(data_.begin(), data_.end(), entry, Comparator());
        data_.insert(it, std::move(entry));
    }

} // namespace rcsv
