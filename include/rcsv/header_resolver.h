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
 * @file header_resolver.h
 * @brief HeaderResolver — per-type memoized (fields, column names) resolution.
 *
 * For a record type T the resolver walks RecordTraits<T>::describe() once and produces
 * the ordered field list together with the ordered column names (declared mapping name or
 * field name, lower-cased when configured).  The result is cached by type identity for the
 * lifetime of the resolver.
 *
 * Thread safety:
 *   - resolve() may be called concurrently from any number of threads.
 *   - Two threads missing the cache for the same type both compute the entry; the results
 *     are equal and the first one stored wins.
 *   - Cached entries are immutable.  clearCaches() drops all of them; readers that already
 *     hold a std::shared_ptr to an entry keep using it.
 */

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "record_concept.h"
#include "record_descriptor.h"

namespace rcsv {

    /**
     * @brief Resolved header of one record type: fields and their column names, same order.
     */
    template<typename T>
    class ResolvedHeader {
        std::vector<FieldDescriptor<T>> fields_;
        std::vector<std::string>        column_names_;

    public:
        ResolvedHeader(std::vector<FieldDescriptor<T>> fields, std::vector<std::string> columnNames)
            : fields_(std::move(fields))
            , column_names_(std::move(columnNames))
        {}

        const std::vector<FieldDescriptor<T>>&  fields() const          { return fields_; }
        const std::vector<std::string>&         columnNames() const     { return column_names_; }
        size_t                                  columnCount() const     { return column_names_.size(); }
        bool                                    empty() const           { return fields_.empty(); }
    };

    template<typename T>
    using ResolvedHeaderPtr = std::shared_ptr<const ResolvedHeader<T>>;

    class HeaderResolver {
        mutable std::shared_mutex                                       mutex_;
        std::unordered_map<std::type_index, std::shared_ptr<const void>> cache_;
        bool                                                            lower_case_ = false;

    public:
        explicit HeaderResolver(bool useLowerCaseHeaders = false)
            : lower_case_(useLowerCaseHeaders) {}

        HeaderResolver(const HeaderResolver&) = delete;
        HeaderResolver& operator=(const HeaderResolver&) = delete;

        /// Cached resolution of T, computed on first use.
        template<RecordConcept T>
        ResolvedHeaderPtr<T>    resolve();

        /// Uncached resolution of T.
        template<RecordConcept T>
        ResolvedHeaderPtr<T>    compute() const;

        template<RecordConcept T>
        bool                    isCached() const;

        size_t                  cachedTypeCount() const;
        void                    clearCaches();
        bool                    useLowerCaseHeaders() const     { return lower_case_; }
    };

} // namespace rcsv
