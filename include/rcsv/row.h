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
 * @file row.h
 * @brief Row — one CSV line without a fixed record type.
 *
 * An ordered mapping column name -> optional string value.
 *   - Keys are unique, order is insertion order (header order when read).
 *   - set() on an existing key overwrites the value in place.
 *   - std::nullopt is "no value"; the reader maps empty cells to std::nullopt
 *     and the writer emits std::nullopt as an empty cell.
 */

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "column_index.h"
#include "definitions.h"

namespace rcsv {

    class Row {
    public:
        using Value         = std::optional<std::string>;
        using Entry         = std::pair<std::string, Value>;
        using ConstIterator = std::vector<Entry>::const_iterator;

    private:
        std::vector<Entry>  entries_;
        ColumnIndex         index_;

    public:
        Row() = default;
        Row(std::initializer_list<Entry> entries);

        ConstIterator       begin() const                   { return entries_.begin(); }
        ConstIterator       end() const                     { return entries_.end(); }

        /// @throws std::out_of_range if key is absent
        const Value&        at(std::string_view key) const;
        void                clear();
        bool                contains(std::string_view key) const    { return index_.contains(key); }
        bool                empty() const                           { return entries_.empty(); }
        const Entry&        entry(size_t position) const;

        /// Pointer to the value of key, nullptr if the key is absent.
        const Value*        find(std::string_view key) const;

        std::vector<std::string> keys() const;
        size_t              position(std::string_view key) const    { return index_.find(key); }
        void                reserve(size_t n);

        /// Insert key at the end, or overwrite its value if present. Returns the key's position.
        size_t              set(std::string_view key, Value value);
        size_t              size() const                            { return entries_.size(); }

        /// Value at a position, for positional fills of rows sharing one header.
        Value&              valueAt(size_t position);
        const Value&        valueAt(size_t position) const;

        /// Order-sensitive comparison of keys and values.
        bool                operator==(const Row& other) const      { return entries_ == other.entries_; }
    };

} // namespace rcsv
