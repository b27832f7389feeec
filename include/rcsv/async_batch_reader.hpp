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
 * @file async_batch_reader.hpp
 * @brief AsyncBatchReader implementation.
 */

#include "async_batch_reader.h"
#include "batch_reader.hpp"
#include <optional>
#include <stdexcept>

namespace rcsv {

    namespace detail {

        /// Clears the in-flight flag when a fetch task ends, normally or by exception.
        class FetchGuard {
            std::atomic<bool>&  flag_;
        public:
            explicit FetchGuard(std::atomic<bool>& flag) : flag_(flag) {}
            ~FetchGuard() { flag_.store(false); }

            FetchGuard(const FetchGuard&) = delete;
            FetchGuard& operator=(const FetchGuard&) = delete;
        };

    } // namespace detail

    template<BuilderConcept Builder>
    AsyncBatchReader<Builder>::AsyncBatchReader(AsyncLineSource& source, Builder builder, const CsvConfig& config)
        : source_(&source)
        , core_(std::move(builder), config)
    {}

    template<BuilderConcept Builder>
    AsyncBatchReader<Builder>::AsyncBatchReader(std::unique_ptr<AsyncLineSource> source, Builder builder, const CsvConfig& config)
        : owned_source_(std::move(source))
        , source_(owned_source_.get())
        , core_(std::move(builder), config)
    {
        if (!source_) {
            throw std::invalid_argument("Error: AsyncBatchReader requires a line source");
        }
    }

    template<BuilderConcept Builder>
    std::future<size_t> AsyncBatchReader<Builder>::fetchBatchAsync(std::stop_token stop) {
        beginFetch();
        try {
            return std::async(std::launch::async, [this, stop = std::move(stop)]() {
                detail::FetchGuard guard(in_flight_);
                return fetchBatchBlocking(stop);
            });
        } catch (...) {
            in_flight_.store(false);
            throw;
        }
    }

    template<BuilderConcept Builder>
    std::future<std::vector<typename AsyncBatchReader<Builder>::ItemType>>
    AsyncBatchReader<Builder>::readAllAsync(std::stop_token stop, size_t reserve) {
        beginFetch();
        try {
            return std::async(std::launch::async, [this, stop = std::move(stop), reserve]() {
                detail::FetchGuard guard(in_flight_);
                return readAllBlocking(stop, reserve);
            });
        } catch (...) {
            in_flight_.store(false);
            throw;
        }
    }

    template<BuilderConcept Builder>
    std::vector<typename AsyncBatchReader<Builder>::ItemType>
    AsyncBatchReader<Builder>::readAll(std::stop_token stop, size_t reserve) {
        beginFetch();
        detail::FetchGuard guard(in_flight_);
        return readAllBlocking(stop, reserve);
    }

    template<BuilderConcept Builder>
    void AsyncBatchReader<Builder>::beginFetch() {
        if (in_flight_.exchange(true)) {
            throw std::logic_error("Error: A batch fetch is already in progress");
        }
    }

    template<BuilderConcept Builder>
    size_t AsyncBatchReader<Builder>::fetchBatchBlocking(const std::stop_token& stop) {
        if (stop.stop_requested()) {
            core_.finish();
            return 0;
        }
        return core_.fill([this](std::string& line) { return readLine(line); });
    }

    template<BuilderConcept Builder>
    std::vector<typename AsyncBatchReader<Builder>::ItemType>
    AsyncBatchReader<Builder>::readAllBlocking(const std::stop_token& stop, size_t reserve) {
        std::vector<ItemType> items;
        items.reserve(reserve);
        while (fetchBatchBlocking(stop) > 0) {
            for (auto& item : core_.batch()) {
                items.push_back(std::move(item));
            }
            core_.batch().clear();
        }
        return items;
    }

    template<BuilderConcept Builder>
    bool AsyncBatchReader<Builder>::readLine(std::string& line) {
        std::optional<std::string> next = source_->readLineAsync().get();
        if (!next) {
            return false;
        }
        line = std::move(*next);
        return true;
    }

} // namespace rcsv
