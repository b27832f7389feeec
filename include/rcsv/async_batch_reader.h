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
 * @file async_batch_reader.h
 * @brief AsyncBatchReader — the batched reader over an AsyncLineSource.
 *
 * Same state machine as BatchReader (detail::BatchCore), driven from a std::async task.
 * Each line is requested through AsyncLineSource::readLineAsync() and awaited before the
 * next one, so lines and items stay in source order.
 *
 * Cancellation is cooperative: the std::stop_token is checked before every batch, never
 * inside one.  A cancelled reader is done; items of completed batches are kept.
 *
 * Usage:
 *     rcsv::AsyncRecordReader<Person> reader(source, builder, config);
 *     while (reader.fetchBatchAsync(token).get() > 0) {
 *         for (auto& p : reader.batch()) { ... }
 *     }
 */

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "batch_reader.h"
#include "config.h"
#include "line_source.h"
#include "record_builder.h"

namespace rcsv {

    template<BuilderConcept Builder>
    class AsyncBatchReader {
    public:
        using ItemType          = typename Builder::ItemType;

    private:
        std::unique_ptr<AsyncLineSource>    owned_source_;
        AsyncLineSource*                    source_;
        detail::BatchCore<Builder>          core_;
        std::atomic<bool>                   in_flight_{false};

    public:
        AsyncBatchReader(AsyncLineSource& source, Builder builder, const CsvConfig& config = {});
        AsyncBatchReader(std::unique_ptr<AsyncLineSource> source, Builder builder, const CsvConfig& config = {});

        AsyncBatchReader(const AsyncBatchReader&) = delete;
        AsyncBatchReader& operator=(const AsyncBatchReader&) = delete;

        /**
         * @brief Read the next batch on a background task.
         * @return future of the batch size, 0 once the source is exhausted or the token is stopped
         * @throws std::logic_error if a previous fetch has not completed yet
         */
        std::future<size_t>             fetchBatchAsync(std::stop_token stop = {});

        /**
         * @brief Read all remaining items on a background task.
         * Stopping the token ends the read at the next batch boundary; the future then
         * holds the items read so far.
         */
        std::future<std::vector<ItemType>> readAllAsync(std::stop_token stop = {}, size_t reserve = 0);

        /// readAllAsync() on the calling thread, for callers already running on a task.
        std::vector<ItemType>           readAll(std::stop_token stop = {}, size_t reserve = 0);

        // Accessors are valid while no fetch is in flight
        const std::vector<ItemType>&    batch() const           { return core_.batch(); }
        std::vector<ItemType>           takeBatch()             { return std::move(core_.batch()); }
        size_t                          batchSize() const       { return core_.batchSize(); }
        size_t                          fileLine() const        { return core_.fileLine(); }
        const std::string&              getErrorMsg() const     { return core_.getErrorMsg(); }
        const std::vector<std::string>& header() const          { return core_.header(); }
        bool                            isDone() const          { return core_.isDone(); }
        bool                            isFetching() const      { return in_flight_.load(); }
        size_t                          rowPos() const          { return core_.rowPos(); }

    private:
        void                            beginFetch();
        size_t                          fetchBatchBlocking(const std::stop_token& stop);
        std::vector<ItemType>           readAllBlocking(const std::stop_token& stop, size_t reserve);
        bool                            readLine(std::string& line);
    };

    template<RecordConcept T>
    using AsyncRecordReader = AsyncBatchReader<RecordBuilder<T>>;

    using AsyncRowReader = AsyncBatchReader<RowBuilder>;

} // namespace rcsv
