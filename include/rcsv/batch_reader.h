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
 * @file batch_reader.h
 * @brief BatchReader — lazy, batched, single-pass CSV reader.
 *
 * The reader pulls lines from a LineSource in batches of CsvConfig::batchSize:
 *
 *   Start ──header line──> HeaderRead ──fill──> batch ──emit──> fill ... ──short fill──> Done
 *
 * The first line is the header (an empty source yields an empty header).  Every further
 * line becomes one item, built by the Builder (typed records or generic rows).  The
 * source is exhausted once a fill pass reads fewer than batchSize lines.
 *
 * Usage:
 *     rcsv::StringLineSource source("Name;Age\nAlice;30\n");
 *     rcsv::RecordReader<Person> reader(source, builder, config);
 *     while (reader.readNext()) {
 *         const Person& p = reader.record();
 *     }
 *
 *     for (Person& p : reader) { ... }      // equivalent, input iterator
 */

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"
#include "definitions.h"
#include "line_source.h"
#include "record_builder.h"

namespace rcsv {

    namespace detail {

        /**
         * @brief Read state shared by the blocking and the asynchronous reader.
         *
         * Line input is injected per call as `bool readLine(std::string&)`, so the same
         * batching logic runs over a LineSource or over an AsyncLineSource.
         */
        template<BuilderConcept Builder>
        class BatchCore {
        public:
            using ItemType = typename Builder::ItemType;
            enum class State { START, HEADER_READ, DONE };

        private:
            Builder                         builder_;
            std::string                     delimiter_;
            size_t                          batch_size_;

            State                           state_ = State::START;
            std::vector<std::string>        header_;
            std::vector<ItemType>           batch_;
            std::string                     err_msg_;
            size_t                          row_pos_ = 0;       // data rows read so far
            size_t                          file_line_ = 0;     // 1-based raw line counter, header included

            std::string                     line_buf_;
            std::vector<std::string_view>   cells_;

        public:
            BatchCore(Builder builder, const CsvConfig& config);

            template<typename ReadLine>
            void                            readHeader(ReadLine&& readLine);

            /// Replace the batch with up to batchSize items. Returns the number of items read.
            template<typename ReadLine>
            size_t                          fill(ReadLine&& readLine);

            void                            finish();

            std::vector<ItemType>&          batch()                 { return batch_; }
            const std::vector<ItemType>&    batch() const           { return batch_; }
            size_t                          batchSize() const       { return batch_size_; }
            const Builder&                  builder() const         { return builder_; }
            size_t                          fileLine() const        { return file_line_; }
            const std::string&              getErrorMsg() const     { return err_msg_; }
            const std::vector<std::string>& header() const          { return header_; }
            bool                            isDone() const          { return state_ == State::DONE; }
            size_t                          rowPos() const          { return row_pos_; }
            State                           state() const           { return state_; }
        };

    } // namespace detail

    /**
     * @brief Blocking batched reader over a LineSource.
     *
     * The source is either borrowed (must outlive the reader) or owned.
     * Items are yielded in input order; the sequence cannot be restarted.
     */
    template<BuilderConcept Builder>
    class BatchReader {
    public:
        using ItemType          = typename Builder::ItemType;
        using RowType           = ItemType;

        class Iterator {
            BatchReader*        reader_ = nullptr;

        public:
            using iterator_concept  = std::input_iterator_tag;
            using iterator_category = std::input_iterator_tag;
            using value_type        = ItemType;
            using difference_type   = std::ptrdiff_t;

            Iterator() = default;
            explicit Iterator(BatchReader* reader) : reader_(reader) {}

            ItemType&           operator*() const   { return reader_->record(); }
            Iterator&           operator++()        { if (!reader_->readNext()) reader_ = nullptr; return *this; }
            void                operator++(int)     { ++*this; }

            friend bool         operator==(const Iterator& it, std::default_sentinel_t) { return it.reader_ == nullptr; }
        };

    private:
        std::unique_ptr<LineSource>     owned_source_;
        LineSource*                     source_;
        detail::BatchCore<Builder>      core_;
        size_t                          current_ = NO_ITEM;     // index of record() within the batch

        static constexpr size_t         NO_ITEM = static_cast<size_t>(-1);

    public:
        BatchReader(LineSource& source, Builder builder, const CsvConfig& config = {});
        BatchReader(std::unique_ptr<LineSource> source, Builder builder, const CsvConfig& config = {});

        BatchReader(const BatchReader&) = delete;
        BatchReader& operator=(const BatchReader&) = delete;
        BatchReader(BatchReader&&) = default;
        BatchReader& operator=(BatchReader&&) = default;

        /// Header cells of the source; reads the header line on first call.
        const std::vector<std::string>& header();

        /// Drop the current batch and read the next one. Returns its size, 0 once exhausted.
        size_t                          fetchBatch();

        /// Advance to the next item. Returns false once the source is exhausted.
        bool                            readNext();

        /// Move all remaining items into a vector.
        std::vector<ItemType>           readAll(size_t reserve = 0);

        const std::vector<ItemType>&    batch() const           { return core_.batch(); }
        size_t                          batchSize() const       { return core_.batchSize(); }
        size_t                          fileLine() const        { return core_.fileLine(); }
        const std::string&              getErrorMsg() const     { return core_.getErrorMsg(); }
        bool                            isDone() const          { return core_.isDone() && remaining() == 0; }
        ItemType&                       record();
        const ItemType&                 record() const;
        const ItemType&                 row() const             { return record(); }
        size_t                          rowPos() const          { return core_.rowPos(); }

        Iterator                        begin();
        std::default_sentinel_t         end() const             { return std::default_sentinel; }

    private:
        bool                            readLine(std::string& line) { return source_->readLine(line); }
        size_t                          remaining() const;
    };

    template<RecordConcept T>
    using RecordReader = BatchReader<RecordBuilder<T>>;

    using RowReader = BatchReader<RowBuilder>;

} // namespace rcsv
