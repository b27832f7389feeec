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
 * @file column_index.h
 * @brief Column name -> position lookup implementing a flat_map strategy.
 */

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "definitions.h"

namespace rcsv {

    /**
     * @brief Index for column names implementing a flat_map strategy.
     *
     * Instead of node-based storage like std::map, key-value pairs (Column Name -> Position)
     * are kept in a sorted std::vector.  Lookups use binary search over contiguous memory,
     * which is efficient for the typical number of columns in a CSV file.
     *
     * Names are not required to be unique.  Entries are ordered by (name, position), so a
     * lookup of a duplicated name yields its first position, the same answer a linear scan
     * from the left gives.
     */
    class ColumnIndex {
    public:
        /// Key-Value pair type: {Column Name, Column Position}
        using Entry = std::pair<std::string, size_t>;
        using Container = std::vector<Entry>;
        using ConstIterator = Container::const_iterator;

        static constexpr size_t npos = std::numeric_limits<size_t>::max();

    private:
        Container data_;

        /**
         * @brief Internal comparator for transparent lookups.
         * Allows comparing Entry objects with string keys directly.
         * When names are equal, uses the position as secondary sort key.
         */
        struct Comparator {
            using is_transparent = void;
            bool operator()(const Entry& e, std::string_view k) const { return e.first < k; }
            bool operator()(std::string_view k, const Entry& e) const { return k < e.first; }
            bool operator()(const Entry& a, const Entry& b) const {
                if (a.first != b.first) return a.first < b.first;
                return a.second < b.second;
            }
        };

    public:
        ColumnIndex() = default;

        ConstIterator begin() const     { return data_.begin(); }
        ConstIterator end() const       { return data_.end(); }

        /**
         * @brief Rebuilds the index from an ordered list of names.
         * @param names Column names, position i is the column index of names[i].
         */
        template<typename NameRange>
        void build(const NameRange& names);

        void clear()                    { data_.clear(); }
        bool contains(std::string_view name) const { return find(name) != npos; }
        bool empty() const              { return data_.empty(); }

        /**
         * @brief Retrieves the position of a name.
         * @return The lowest position carrying that name, or npos if absent.
         */
        size_t find(std::string_view name) const;

        /**
         * @brief Inserts a name at the given position, keeping the index sorted.
         * Existing entries are not renumbered.
         */
        void insert(std::string_view name, size_t position);

        void reserve(size_t n)          { data_.reserve(n); }
        size_t size() const             { return data_.size(); }
    };

} // namespace rcsv
