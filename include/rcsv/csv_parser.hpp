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
 * @file csv_parser.hpp
 * @brief CsvParser implementation.
 *
 * Every asynchronous entry point runs the whole operation on one std::async task.  Lines
 * travel through AsyncLineSourceAdapter / AsyncLineSinkAdapter with deferred launch, so
 * each line request is served on that task's thread.
 */

#include "csv_parser.h"
#include "async_batch_reader.hpp"
#include "batch_reader.hpp"
#include "csv_writer.hpp"
#include "header_resolver.hpp"
#include "line_sink.hpp"
#include "line_source.hpp"

namespace rcsv {

    inline CsvParser::CsvParser(CsvConfig config)
        : config_(std::move(config))
    {
        config_.validate();
        resolver_ = std::make_unique<HeaderResolver>(config_.useLowerCaseHeaders);
    }

    template<typename Configure>
        requires std::invocable<Configure, CsvConfig&>
    CsvParser CsvParser::fromConfig(Configure&& configure) {
        CsvConfig config;
        std::forward<Configure>(configure)(config);
        return CsvParser(std::move(config));
    }

    // ── Streaming ───────────────────────────────────────────────────────

    template<RecordConcept T>
    RecordReader<T> CsvParser::toEnumerable(std::istream& stream) {
        return toEnumerable<T>(std::make_unique<StreamLineSource>(stream));
    }

    template<RecordConcept T>
    RecordReader<T> CsvParser::toEnumerable(const FilePath& filepath) {
        return toEnumerable<T>(std::make_unique<FileLineSource>(filepath));
    }

    template<RecordConcept T>
    RecordReader<T> CsvParser::toEnumerable(std::unique_ptr<LineSource> source) {
        return RecordReader<T>(std::move(source), recordBuilder<T>(), config_);
    }

    inline RowReader CsvParser::toRowEnumerable(std::istream& stream) {
        return toRowEnumerable(std::make_unique<StreamLineSource>(stream));
    }

    inline RowReader CsvParser::toRowEnumerable(const FilePath& filepath) {
        return toRowEnumerable(std::make_unique<FileLineSource>(filepath));
    }

    inline RowReader CsvParser::toRowEnumerable(std::unique_ptr<LineSource> source) {
        return RowReader(std::move(source), RowBuilder(), config_);
    }

    template<RecordConcept T>
    AsyncRecordReader<T> CsvParser::toEnumerableAsync(AsyncLineSource& source) {
        return AsyncRecordReader<T>(source, recordBuilder<T>(), config_);
    }

    inline AsyncRowReader CsvParser::toRowEnumerableAsync(AsyncLineSource& source) {
        return AsyncRowReader(source, RowBuilder(), config_);
    }

    // ── Whole collections ───────────────────────────────────────────────

    template<RecordConcept T>
    std::vector<T> CsvParser::toVector(std::istream& stream) {
        return toEnumerable<T>(stream).readAll(config_.initialCapacity);
    }

    template<RecordConcept T>
    std::vector<T> CsvParser::toVector(const FilePath& filepath) {
        return toEnumerable<T>(filepath).readAll(config_.initialCapacity);
    }

    inline std::vector<Row> CsvParser::toRowVector(std::istream& stream) {
        return toRowEnumerable(stream).readAll(config_.initialCapacity);
    }

    inline std::vector<Row> CsvParser::toRowVector(const FilePath& filepath) {
        return toRowEnumerable(filepath).readAll(config_.initialCapacity);
    }

    template<RecordConcept T>
    std::vector<T> CsvParser::fromCsvString(std::string text) {
        return toEnumerable<T>(std::make_unique<StringLineSource>(std::move(text))).readAll(config_.initialCapacity);
    }

    inline std::vector<Row> CsvParser::rowsFromCsvString(std::string text) {
        return toRowEnumerable(std::make_unique<StringLineSource>(std::move(text))).readAll(config_.initialCapacity);
    }

    template<RecordConcept T>
    std::future<std::vector<T>> CsvParser::toVectorAsync(std::istream& stream, std::stop_token stop) {
        return std::async(std::launch::async,
            [&stream, builder = recordBuilder<T>(), config = config_, stop = std::move(stop)]() mutable {
                AsyncRecordReader<T> reader(
                    std::make_unique<AsyncLineSourceAdapter>(std::make_unique<StreamLineSource>(stream)),
                    std::move(builder), config);
                return reader.readAll(stop, config.initialCapacity);
            });
    }

    template<RecordConcept T>
    std::future<std::vector<T>> CsvParser::toVectorAsync(const FilePath& filepath, std::stop_token stop) {
        return std::async(std::launch::async,
            [filepath, builder = recordBuilder<T>(), config = config_, stop = std::move(stop)]() mutable {
                AsyncRecordReader<T> reader(
                    std::make_unique<AsyncLineSourceAdapter>(std::make_unique<FileLineSource>(filepath)),
                    std::move(builder), config);
                return reader.readAll(stop, config.initialCapacity);
            });
    }

    inline std::future<std::vector<Row>> CsvParser::toRowVectorAsync(std::istream& stream, std::stop_token stop) {
        return std::async(std::launch::async,
            [&stream, config = config_, stop = std::move(stop)]() {
                AsyncRowReader reader(
                    std::make_unique<AsyncLineSourceAdapter>(std::make_unique<StreamLineSource>(stream)),
                    RowBuilder(), config);
                return reader.readAll(stop, config.initialCapacity);
            });
    }

    inline std::future<std::vector<Row>> CsvParser::toRowVectorAsync(const FilePath& filepath, std::stop_token stop) {
        return std::async(std::launch::async,
            [filepath, config = config_, stop = std::move(stop)]() {
                AsyncRowReader reader(
                    std::make_unique<AsyncLineSourceAdapter>(std::make_unique<FileLineSource>(filepath)),
                    RowBuilder(), config);
                return reader.readAll(stop, config.initialCapacity);
            });
    }

    // ── Writing ─────────────────────────────────────────────────────────

    template<RecordRange Range>
    size_t CsvParser::parseToSink(const Range& records, LineSink& sink) {
        using T = std::ranges::range_value_t<Range>;
        RecordWriter<T> writer(sink, resolver_->resolve<T>(), config_);
        size_t count = writer.writeAll(records);
        writer.close();
        return count;
    }

    template<RowRange Range>
    size_t CsvParser::parseToSink(const Range& rows, LineSink& sink) {
        RowWriter writer(sink, config_);
        size_t count = writer.writeAll(rows);
        writer.close();
        return count;
    }

    template<RecordRange Range>
    std::string CsvParser::parseToString(const Range& records) {
        StringLineSink sink;
        parseToSink(records, sink);
        return sink.release();
    }

    template<RowRange Range>
    std::string CsvParser::parseToString(const Range& rows) {
        StringLineSink sink;
        parseToSink(rows, sink);
        return sink.release();
    }

    template<RecordRange Range>
    size_t CsvParser::parseToStream(const Range& records, std::ostream& stream) {
        StreamLineSink sink(stream);
        return parseToSink(records, sink);
    }

    template<RowRange Range>
    size_t CsvParser::parseToStream(const Range& rows, std::ostream& stream) {
        StreamLineSink sink(stream);
        return parseToSink(rows, sink);
    }

    template<RecordRange Range>
    size_t CsvParser::parseToFile(const FilePath& filepath, const Range& records) {
        FileLineSink sink(filepath);
        size_t count = parseToSink(records, sink);
        sink.close();
        return count;
    }

    template<RowRange Range>
    size_t CsvParser::parseToFile(const FilePath& filepath, const Range& rows) {
        FileLineSink sink(filepath);
        size_t count = parseToSink(rows, sink);
        sink.close();
        return count;
    }

    template<RecordConcept T>
    std::future<size_t> CsvParser::parseToSinkAsync(std::vector<T> records, AsyncLineSink& sink) {
        return writeRecordsAsync<T>(sink, resolver_->resolve<T>(), std::move(records), config_);
    }

    inline std::future<size_t> CsvParser::parseToSinkAsync(std::vector<Row> rows, AsyncLineSink& sink) {
        return writeRowsAsync(sink, std::move(rows), config_);
    }

    template<RecordConcept T>
    std::future<std::string> CsvParser::parseToStringAsync(std::vector<T> records) {
        return std::async(std::launch::async,
            [formatter = detail::RecordFormatter<T>(resolver_->resolve<T>(), config_.columnDelimiter),
             records = std::move(records), includeHeader = config_.includeHeader]() {
                auto text = std::make_unique<StringLineSink>();
                StringLineSink* textSink = text.get();
                AsyncLineSinkAdapter sink(std::move(text));
                detail::writeRecordLines(sink, formatter, records, includeHeader);
                return textSink->release();
            });
    }

    inline std::future<std::string> CsvParser::parseToStringAsync(std::vector<Row> rows) {
        return std::async(std::launch::async,
            [formatter = detail::RowFormatter(config_.columnDelimiter),
             rows = std::move(rows), includeHeader = config_.includeHeader]() {
                auto text = std::make_unique<StringLineSink>();
                StringLineSink* textSink = text.get();
                AsyncLineSinkAdapter sink(std::move(text));
                detail::writeRowLines(sink, formatter, rows, includeHeader);
                return textSink->release();
            });
    }

    template<RecordConcept T>
    std::future<size_t> CsvParser::parseToStreamAsync(std::vector<T> records, std::ostream& stream) {
        return std::async(std::launch::async,
            [&stream, formatter = detail::RecordFormatter<T>(resolver_->resolve<T>(), config_.columnDelimiter),
             records = std::move(records), includeHeader = config_.includeHeader]() {
                AsyncLineSinkAdapter sink(std::make_unique<StreamLineSink>(stream));
                return detail::writeRecordLines(sink, formatter, records, includeHeader);
            });
    }

    inline std::future<size_t> CsvParser::parseToStreamAsync(std::vector<Row> rows, std::ostream& stream) {
        return std::async(std::launch::async,
            [&stream, formatter = detail::RowFormatter(config_.columnDelimiter),
             rows = std::move(rows), includeHeader = config_.includeHeader]() {
                AsyncLineSinkAdapter sink(std::make_unique<StreamLineSink>(stream));
                return detail::writeRowLines(sink, formatter, rows, includeHeader);
            });
    }

    template<RecordConcept T>
    std::future<size_t> CsvParser::parseToFileAsync(const FilePath& filepath, std::vector<T> records) {
        return std::async(std::launch::async,
            [filepath, formatter = detail::RecordFormatter<T>(resolver_->resolve<T>(), config_.columnDelimiter),
             records = std::move(records), includeHeader = config_.includeHeader]() {
                auto file = std::make_unique<FileLineSink>(filepath);
                FileLineSink* fileSink = file.get();
                AsyncLineSinkAdapter sink(std::move(file));
                size_t count = detail::writeRecordLines(sink, formatter, records, includeHeader);
                fileSink->close();
                return count;
            });
    }

    inline std::future<size_t> CsvParser::parseToFileAsync(const FilePath& filepath, std::vector<Row> rows) {
        return std::async(std::launch::async,
            [filepath, formatter = detail::RowFormatter(config_.columnDelimiter),
             rows = std::move(rows), includeHeader = config_.includeHeader]() {
                auto file = std::make_unique<FileLineSink>(filepath);
                FileLineSink* fileSink = file.get();
                AsyncLineSinkAdapter sink(std::move(file));
                size_t count = detail::writeRowLines(sink, formatter, rows, includeHeader);
                fileSink->close();
                return count;
            });
    }

} // namespace rcsv
