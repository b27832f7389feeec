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
 * @file csv_writer.hpp
 * @brief RecordWriter / RowWriter / async write implementations.
 */

#include "csv_writer.h"
#include "header_resolver.hpp"
#include "line_sink.hpp"
#include "line_splitter.h"
#include "row.hpp"
#include <iostream>
#include <stdexcept>

namespace rcsv {

    namespace detail {

        // ── RecordFormatter ─────────────────────────────────────────────

        template<RecordConcept T>
        RecordFormatter<T>::RecordFormatter(ResolvedHeaderPtr<T> header, std::string delimiter)
            : header_(std::move(header))
            , delimiter_(std::move(delimiter))
        {
            if (!header_) {
                throw std::invalid_argument("Error: RecordFormatter requires a resolved header");
            }
        }

        template<RecordConcept T>
        void RecordFormatter<T>::appendHeader(std::string& out) const {
            appendJoined(out, header_->columnNames(), delimiter_);
        }

        template<RecordConcept T>
        void RecordFormatter<T>::appendRecord(const T& record, std::string& out) const {
            bool first = true;
            for (const auto& field : header_->fields()) {
                if (!first) out.append(delimiter_);
                out.append(field.format(record));
                first = false;
            }
        }

        // ── RowFormatter ────────────────────────────────────────────────

        inline void RowFormatter::appendHeader(const Row& first, std::string& out) const {
            bool firstCell = true;
            for (const auto& [key, value] : first) {
                if (!firstCell) out.append(delimiter_);
                out.append(key);
                firstCell = false;
            }
        }

        inline void RowFormatter::appendRow(const Row& row, std::string& out) const {
            bool firstCell = true;
            for (const auto& [key, value] : row) {
                if (!firstCell) out.append(delimiter_);
                if (value) out.append(*value);
                firstCell = false;
            }
        }

    } // namespace detail

    // ── RecordWriter ────────────────────────────────────────────────────

    template<RecordConcept T>
    RecordWriter<T>::RecordWriter(LineSink& sink, ResolvedHeaderPtr<T> header, const CsvConfig& config)
        : sink_(sink)
        , formatter_(std::move(header), config.columnDelimiter)
        , include_header_(config.includeHeader)
    {
        config.validate();
    }

    template<RecordConcept T>
    void RecordWriter<T>::close() {
        sink_.flush();
    }

    template<RecordConcept T>
    void RecordWriter<T>::writeHeader() {
        if (header_written_) {
            return;
        }
        header_written_ = true;
        if (!include_header_) {
            return;
        }
        buf_.clear();
        formatter_.appendHeader(buf_);
        sink_.writeLine(buf_);
    }

    template<RecordConcept T>
    void RecordWriter<T>::write(const T& record) {
        writeHeader();
        buf_.clear();
        formatter_.appendRecord(record, buf_);
        sink_.writeLine(buf_);
        row_cnt_++;
    }

    template<RecordConcept T>
    template<std::ranges::input_range Range>
    size_t RecordWriter<T>::writeAll(Range&& records) {
        const size_t before = row_cnt_;
        for (const auto& record : records) {
            write(record);
        }
        if (row_cnt_ == before && !header_written_) {
            // nothing to describe the columns with: an empty header line only
            header_written_ = true;
            if (include_header_) {
                sink_.writeLine("");
            }
            err_msg_ = "Warning: No records to write";
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
        }
        return row_cnt_ - before;
    }

    // ── RowWriter ───────────────────────────────────────────────────────

    inline RowWriter::RowWriter(LineSink& sink, const CsvConfig& config)
        : sink_(sink)
        , formatter_(config.columnDelimiter)
        , include_header_(config.includeHeader)
    {
        config.validate();
    }

    inline void RowWriter::close() {
        sink_.flush();
    }

    inline void RowWriter::write(const Row& row) {
        if (!header_written_) {
            header_written_ = true;
            if (include_header_) {
                buf_.clear();
                formatter_.appendHeader(row, buf_);
                sink_.writeLine(buf_);
            }
        }
        buf_.clear();
        formatter_.appendRow(row, buf_);
        sink_.writeLine(buf_);
        row_cnt_++;
    }

    template<std::ranges::input_range Range>
    size_t RowWriter::writeAll(Range&& rows) {
        const size_t before = row_cnt_;
        for (const Row& row : rows) {
            write(row);
        }
        return row_cnt_ - before;
    }

    // ── Async ───────────────────────────────────────────────────────────

    namespace detail {

        template<RecordConcept T>
        size_t writeRecordLines(AsyncLineSink& sink, const RecordFormatter<T>& formatter,
                                const std::vector<T>& records, bool includeHeader) {
            std::string line;
            if (includeHeader) {
                if (!records.empty()) {
                    formatter.appendHeader(line);
                }
                sink.writeLineAsync(line).get();
            }
            for (const T& record : records) {
                line.clear();
                formatter.appendRecord(record, line);
                sink.writeLineAsync(line).get();
            }
            sink.flushAsync().get();
            return records.size();
        }

        inline size_t writeRowLines(AsyncLineSink& sink, const RowFormatter& formatter,
                                    const std::vector<Row>& rows, bool includeHeader) {
            if (rows.empty()) {
                return 0;
            }
            std::string line;
            if (includeHeader) {
                formatter.appendHeader(rows.front(), line);
                sink.writeLineAsync(line).get();
            }
            for (const Row& row : rows) {
                line.clear();
                formatter.appendRow(row, line);
                sink.writeLineAsync(line).get();
            }
            sink.flushAsync().get();
            return rows.size();
        }

    } // namespace detail

    template<RecordConcept T>
    std::future<size_t> writeRecordsAsync(AsyncLineSink& sink, ResolvedHeaderPtr<T> header,
                                          std::vector<T> records, const CsvConfig& config) {
        config.validate();
        return std::async(std::launch::async,
            [&sink, formatter = detail::RecordFormatter<T>(std::move(header), config.columnDelimiter),
             records = std::move(records), includeHeader = config.includeHeader]() {
                return detail::writeRecordLines(sink, formatter, records, includeHeader);
            });
    }

    inline std::future<size_t> writeRowsAsync(AsyncLineSink& sink, std::vector<Row> rows, const CsvConfig& config) {
        config.validate();
        return std::async(std::launch::async,
            [&sink, formatter = detail::RowFormatter(config.columnDelimiter),
             rows = std::move(rows), includeHeader = config.includeHeader]() {
                return detail::writeRowLines(sink, formatter, rows, includeHeader);
            });
    }

} // namespace rcsv
