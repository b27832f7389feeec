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
 * @file csv_parser.h
 * @brief CsvParser — entry points for reading and writing records and rows.
 *
 * A CsvParser holds one CsvConfig and one HeaderResolver.  Resolved headers are cached per
 * record type for the lifetime of the parser (or until clearCaches()).  All entry points
 * are safe to call concurrently on one parser; the readers and writers they create are not.
 *
 * Reading:
 *     rcsv::CsvParser parser = rcsv::CsvParser::fromConfig([](rcsv::CsvConfig& c) {
 *         c.columnDelimiter = ";";
 *     });
 *     std::vector<Person> people = parser.toVector<Person>("people.csv");
 *
 *     auto reader = parser.toEnumerable<Person>(stream);    // lazy, batched
 *     for (Person& p : reader) { ... }
 *
 * Writing:
 *     std::string text = parser.parseToString(people);
 *     parser.parseToFile("out.csv", rows);
 *
 * Borrowed streams and sinks must outlive the readers and futures created from them.
 */

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <future>
#include <istream>
#include <memory>
#include <ostream>
#include <ranges>
#include <stop_token>
#include <string>
#include <vector>

#include "async_batch_reader.h"
#include "batch_reader.h"
#include "config.h"
#include "csv_writer.h"
#include "header_resolver.h"
#include "line_sink.h"
#include "line_source.h"
#include "record_concept.h"
#include "row.h"

namespace rcsv {

    template<typename R>
    concept RecordRange = std::ranges::input_range<R> && RecordConcept<std::ranges::range_value_t<R>>;

    template<typename R>
    concept RowRange = std::ranges::input_range<R> && std::same_as<std::ranges::range_value_t<R>, Row>;

    class CsvParser {
    public:
        using FilePath = std::filesystem::path;

    private:
        CsvConfig                       config_;
        std::unique_ptr<HeaderResolver> resolver_;

    public:
        /// @throws std::invalid_argument if `config` does not validate
        explicit CsvParser(CsvConfig config = {});

        /// Build a parser from a callback that adjusts a default CsvConfig.
        template<typename Configure>
            requires std::invocable<Configure, CsvConfig&>
        static CsvParser                fromConfig(Configure&& configure);

        void                            clearCaches()           { resolver_->clearCaches(); }
        const CsvConfig&                config() const          { return config_; }
        HeaderResolver&                 headerResolver()        { return *resolver_; }

        // ── Streaming ───────────────────────────────────────────────────

        template<RecordConcept T>
        RecordReader<T>                 toEnumerable(std::istream& stream);
        template<RecordConcept T>
        RecordReader<T>                 toEnumerable(const FilePath& filepath);
        template<RecordConcept T>
        RecordReader<T>                 toEnumerable(std::unique_ptr<LineSource> source);

        RowReader                       toRowEnumerable(std::istream& stream);
        RowReader                       toRowEnumerable(const FilePath& filepath);
        RowReader                       toRowEnumerable(std::unique_ptr<LineSource> source);

        template<RecordConcept T>
        AsyncRecordReader<T>            toEnumerableAsync(AsyncLineSource& source);
        AsyncRowReader                  toRowEnumerableAsync(AsyncLineSource& source);

        // ── Whole collections ───────────────────────────────────────────

        template<RecordConcept T>
        std::vector<T>                  toVector(std::istream& stream);
        template<RecordConcept T>
        std::vector<T>                  toVector(const FilePath& filepath);
        std::vector<Row>                toRowVector(std::istream& stream);
        std::vector<Row>                toRowVector(const FilePath& filepath);

        template<RecordConcept T>
        std::vector<T>                  fromCsvString(std::string text);
        std::vector<Row>                rowsFromCsvString(std::string text);

        /// Stopping `stop` ends the read at the next batch boundary; the future holds what was read.
        template<RecordConcept T>
        std::future<std::vector<T>>     toVectorAsync(std::istream& stream, std::stop_token stop = {});
        template<RecordConcept T>
        std::future<std::vector<T>>     toVectorAsync(const FilePath& filepath, std::stop_token stop = {});
        std::future<std::vector<Row>>   toRowVectorAsync(std::istream& stream, std::stop_token stop = {});
        std::future<std::vector<Row>>   toRowVectorAsync(const FilePath& filepath, std::stop_token stop = {});

        // ── Writing ─────────────────────────────────────────────────────

        template<RecordRange Range>
        size_t                          parseToSink(const Range& records, LineSink& sink);
        template<RowRange Range>
        size_t                          parseToSink(const Range& rows, LineSink& sink);

        template<RecordRange Range>
        std::string                     parseToString(const Range& records);
        template<RowRange Range>
        std::string                     parseToString(const Range& rows);

        template<RecordRange Range>
        size_t                          parseToStream(const Range& records, std::ostream& stream);
        template<RowRange Range>
        size_t                          parseToStream(const Range& rows, std::ostream& stream);

        template<RecordRange Range>
        size_t                          parseToFile(const FilePath& filepath, const Range& records);
        template<RowRange Range>
        size_t                          parseToFile(const FilePath& filepath, const Range& rows);

        template<RecordConcept T>
        std::future<size_t>             parseToSinkAsync(std::vector<T> records, AsyncLineSink& sink);
        std::future<size_t>             parseToSinkAsync(std::vector<Row> rows, AsyncLineSink& sink);

        template<RecordConcept T>
        std::future<std::string>        parseToStringAsync(std::vector<T> records);
        std::future<std::string>        parseToStringAsync(std::vector<Row> rows);

        template<RecordConcept T>
        std::future<size_t>             parseToStreamAsync(std::vector<T> records, std::ostream& stream);
        std::future<size_t>             parseToStreamAsync(std::vector<Row> rows, std::ostream& stream);

        template<RecordConcept T>
        std::future<size_t>             parseToFileAsync(const FilePath& filepath, std::vector<T> records);
        std::future<size_t>             parseToFileAsync(const FilePath& filepath, std::vector<Row> rows);

    private:
        template<RecordConcept T>
        RecordBuilder<T>                recordBuilder()         { return RecordBuilder<T>(resolver_->resolve<T>(), config_.logErrors); }
    };

} // namespace rcsv
