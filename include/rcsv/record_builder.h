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
 * @file record_builder.h
 * @brief Builders turning split data lines into items, one per reader mode.
 *
 * RecordBuilder<T>  — typed mode, populates a new T per line through its resolved header
 * RowBuilder        — generic mode, zips header names to cells into a Row
 *
 * Both bind to the file header once (bindHeader) and then build one item per data line.
 */

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "column_index.h"
#include "header_resolver.h"
#include "record_concept.h"
#include "row.h"

namespace rcsv {

    /// Turns the cells of one data line into an item, after being bound to the file header.
    template<typename B>
    concept BuilderConcept = requires(B& builder, const B& cbuilder,
                                      const std::vector<std::string>& header,
                                      const std::vector<std::string_view>& cells,
                                      std::string& errMsg) {
        typename B::ItemType;
        { builder.bindHeader(header) };
        { cbuilder.build(cells, size_t{}, errMsg) } -> std::same_as<typename B::ItemType>;
    };

    template<RecordConcept T>
    class RecordBuilder {
    public:
        using ItemType = T;

    private:
        ResolvedHeaderPtr<T>    header_;
        std::vector<size_t>     positions_;     // header position of each field, npos if absent
        bool                    log_errors_ = false;

    public:
        RecordBuilder(ResolvedHeaderPtr<T> header, bool logErrors);

        void                    bindHeader(const std::vector<std::string>& headerColumns);

        /**
         * @brief Create a record from the cells of one data line.
         *
         * Fields whose column is absent from the header, or whose cell is missing from a
         * short line, keep their default value.  On a ConversionError the remaining fields of
         * this record are skipped and the partial record is returned, unless logErrors is set,
         * in which case the error propagates.
         *
         * @param errMsg receives a warning when a conversion error is suppressed
         */
        T                       build(const std::vector<std::string_view>& cells, size_t fileLine, std::string& errMsg) const;

        const ResolvedHeader<T>& resolvedHeader() const     { return *header_; }
        const std::vector<size_t>& positions() const        { return positions_; }
    };

    class RowBuilder {
    public:
        using ItemType = Row;

    private:
        Row                     template_;      // header keys, all values std::nullopt
        std::vector<size_t>     positions_;     // entry position of each header column

    public:
        RowBuilder() = default;

        void                    bindHeader(const std::vector<std::string>& headerColumns);

        /**
         * @brief Create a row from the cells of one data line.
         * Empty and missing cells become std::nullopt, cells beyond the header are dropped.
         */
        Row                     build(const std::vector<std::string_view>& cells, size_t fileLine, std::string& errMsg) const;
    };

} // namespace rcsv
