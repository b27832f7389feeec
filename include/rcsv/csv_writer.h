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
 * @file csv_writer.h
 * @brief RecordWriter / RowWriter — write typed records or generic rows as delimited text.
 *
 * Both writers format one line per item into a reusable buffer and hand it to a LineSink.
 * Values are joined by the configured delimiter without quoting or escaping.
 *
 * Header rules:
 *   - RecordWriter: column names come from the resolved header of T.  writeAll() over an
 *     empty range emits a single empty header line (when includeHeader is set).
 *   - RowWriter: column names come from the keys of the first row written.  Later rows
 *     are emitted in their own key order, unchecked.  An empty range writes nothing.
 *
 * Usage:
 *     rcsv::StringLineSink sink;
 *     rcsv::RecordWriter<Person> writer(sink, resolver.resolve<Person>(), config);
 *     writer.write(person);
 *     writer.close();
 *
 * writeRecordsAsync() / writeRowsAsync() run the same formatting on a std::async task
 * against an AsyncLineSink.
 */

#include <cstddef>
#include <future>
#include <ranges>
#include <string>
#include <vector>

#include "config.h"
#include "header_resolver.h"
#include "line_sink.h"
#include "record_concept.h"
#include "row.h"

namespace rcsv {

    namespace detail {

        template<RecordConcept T>
        class RecordFormatter {
            ResolvedHeaderPtr<T>    header_;
            std::string             delimiter_;

        public:
            RecordFormatter(ResolvedHeaderPtr<T> header, std::string delimiter);

            void                    appendHeader(std::string& out) const;
            void                    appendRecord(const T& record, std::string& out) const;
            const ResolvedHeader<T>& header() const     { return *header_; }
        };

        class RowFormatter {
            std::string             delimiter_;

        public:
            explicit RowFormatter(std::string delimiter) : delimiter_(std::move(delimiter)) {}

            void                    appendHeader(const Row& first, std::string& out) const;
            void                    appendRow(const Row& row, std::string& out) const;
        };

        /// Blocking write of `records` through an AsyncLineSink, awaiting each line.
        template<RecordConcept T>
        size_t writeRecordLines(AsyncLineSink& sink, const RecordFormatter<T>& formatter,
                                const std::vector<T>& records, bool includeHeader);

        /// Blocking write of `rows` through an AsyncLineSink, awaiting each line.
        size_t writeRowLines(AsyncLineSink& sink, const RowFormatter& formatter,
                             const std::vector<Row>& rows, bool includeHeader);

    } // namespace detail

    /**
     * @brief Writes records of type T to a borrowed LineSink.
     */
    template<RecordConcept T>
    class RecordWriter {
    public:
        using RowType           = T;

    private:
        std::string                 err_msg_;
        LineSink&                   sink_;
        detail::RecordFormatter<T>  formatter_;
        bool                        include_header_;
        bool                        header_written_ = false;
        size_t                      row_cnt_ = 0;
        std::string                 buf_;

    public:
        RecordWriter(LineSink& sink, ResolvedHeaderPtr<T> header, const CsvConfig& config = {});

        void                    close();
        const std::string&      getErrorMsg() const     { return err_msg_; }
        size_t                  rowCount() const        { return row_cnt_; }
        void                    write(const T& record);

        /// Write every record of `records`. Returns the number of records written.
        template<std::ranges::input_range Range>
        size_t                  writeAll(Range&& records);

        /// Emit the header line now (once). No-op if includeHeader is off.
        void                    writeHeader();
    };

    /**
     * @brief Writes generic rows to a borrowed LineSink.
     */
    class RowWriter {
    public:
        using RowType           = Row;

    private:
        std::string             err_msg_;
        LineSink&               sink_;
        detail::RowFormatter    formatter_;
        bool                    include_header_;
        bool                    header_written_ = false;
        size_t                  row_cnt_ = 0;
        std::string             buf_;

    public:
        RowWriter(LineSink& sink, const CsvConfig& config = {});

        void                    close();
        const std::string&      getErrorMsg() const     { return err_msg_; }
        size_t                  rowCount() const        { return row_cnt_; }
        void                    write(const Row& row);

        template<std::ranges::input_range Range>
        size_t                  writeAll(Range&& rows);
    };

    /// Write `records` to `sink` on a background task. The future holds the record count.
    template<RecordConcept T>
    std::future<size_t> writeRecordsAsync(AsyncLineSink& sink, ResolvedHeaderPtr<T> header,
                                          std::vector<T> records, const CsvConfig& config = {});

    /// Write `rows` to `sink` on a background task. The future holds the row count.
    std::future<size_t> writeRowsAsync(AsyncLineSink& sink, std::vector<Row> rows, const CsvConfig& config = {});

} // namespace rcsv
