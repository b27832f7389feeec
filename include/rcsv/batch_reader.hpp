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
 * @file batch_reader.hpp
 * @brief BatchReader / BatchCore implementations.
 */

#include "batch_reader.h"
#include "line_source.hpp"
#include "line_splitter.h"
#include "record_builder.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace rcsv {

    namespace detail {

        template<BuilderConcept Builder>
        BatchCore<Builder>::BatchCore(Builder builder, const CsvConfig& config)
            : builder_(std::move(builder))
            , delimiter_(config.columnDelimiter)
            , batch_size_(config.batchSize)
        {
            config.validate();
            batch_.reserve(std::min(batch_size_, DEFAULT_BATCH_SIZE));
        }

        template<BuilderConcept Builder>
        template<typename ReadLine>
        void BatchCore<Builder>::readHeader(ReadLine&& readLine) {
            if (state_ != State::START) {
                return;
            }

            header_.clear();
            if (readLine(line_buf_)) {
                file_line_++;
                stripCarriageReturn(line_buf_);
                splitLine(line_buf_, delimiter_, cells_);
                header_.reserve(cells_.size());
                for (const auto& cell : cells_) {
                    header_.emplace_back(cell);
                }
            } else {
                err_msg_ = "Warning: CSV source is empty (no header line)";
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << err_msg_ << std::endl;
                }
            }
            builder_.bindHeader(header_);
            state_ = State::HEADER_READ;
        }

        template<BuilderConcept Builder>
        template<typename ReadLine>
        size_t BatchCore<Builder>::fill(ReadLine&& readLine) {
            batch_.clear();
            if (state_ == State::START) {
                readHeader(readLine);
            }
            if (state_ == State::DONE) {
                return 0;
            }

            try {
                size_t linesRead = 0;
                while (linesRead < batch_size_ && readLine(line_buf_)) {
                    linesRead++;
                    file_line_++;
                    stripCarriageReturn(line_buf_);
                    splitLine(line_buf_, delimiter_, cells_);
                    batch_.push_back(builder_.build(cells_, file_line_, err_msg_));
                }
                if (linesRead < batch_size_) {
                    state_ = State::DONE;
                }
            } catch (...) {
                // a failed pass ends the sequence; its partial batch is never emitted
                finish();
                throw;
            }

            row_pos_ += batch_.size();
            return batch_.size();
        }

        template<BuilderConcept Builder>
        void BatchCore<Builder>::finish() {
            state_ = State::DONE;
            batch_.clear();
        }

    } // namespace detail

    // ── BatchReader ─────────────────────────────────────────────────────

    template<BuilderConcept Builder>
    BatchReader<Builder>::BatchReader(LineSource& source, Builder builder, const CsvConfig& config)
        : source_(&source)
        , core_(std::move(builder), config)
    {}

    template<BuilderConcept Builder>
    BatchReader<Builder>::BatchReader(std::unique_ptr<LineSource> source, Builder builder, const CsvConfig& config)
        : owned_source_(std::move(source))
        , source_(owned_source_.get())
        , core_(std::move(builder), config)
    {
        if (!source_) {
            throw std::invalid_argument("Error: BatchReader requires a line source");
        }
    }

    template<BuilderConcept Builder>
    const std::vector<std::string>& BatchReader<Builder>::header() {
        core_.readHeader([this](std::string& line) { return readLine(line); });
        return core_.header();
    }

    template<BuilderConcept Builder>
    size_t BatchReader<Builder>::fetchBatch() {
        current_ = NO_ITEM;
        return core_.fill([this](std::string& line) { return readLine(line); });
    }

    template<BuilderConcept Builder>
    bool BatchReader<Builder>::readNext() {
        size_t next = (current_ == NO_ITEM) ? 0 : current_ + 1;
        while (next >= core_.batch().size()) {
            if (core_.isDone()) {
                core_.batch().clear();
                current_ = NO_ITEM;
                return false;
            }
            fetchBatch();
            next = 0;
        }
        current_ = next;
        return true;
    }

    template<BuilderConcept Builder>
    std::vector<typename BatchReader<Builder>::ItemType> BatchReader<Builder>::readAll(size_t reserve) {
        std::vector<ItemType> items;
        items.reserve(reserve);

        auto& batch = core_.batch();
        size_t first = (current_ == NO_ITEM) ? 0 : current_ + 1;
        while (true) {
            for (size_t i = first; i < batch.size(); ++i) {
                items.push_back(std::move(batch[i]));
            }
            batch.clear();
            current_ = NO_ITEM;
            if (core_.isDone()) {
                break;
            }
            fetchBatch();
            first = 0;
        }
        return items;
    }

    template<BuilderConcept Builder>
    typename BatchReader<Builder>::ItemType& BatchReader<Builder>::record() {
        if constexpr (RANGE_CHECKING) {
            if (current_ == NO_ITEM || current_ >= core_.batch().size()) {
                throw std::logic_error("Error: No current record, call readNext() first");
            }
        }
        return core_.batch()[current_];
    }

    template<BuilderConcept Builder>
    const typename BatchReader<Builder>::ItemType& BatchReader<Builder>::record() const {
        if constexpr (RANGE_CHECKING) {
            if (current_ == NO_ITEM || current_ >= core_.batch().size()) {
                throw std::logic_error("Error: No current record, call readNext() first");
            }
        }
        return core_.batch()[current_];
    }

    template<BuilderConcept Builder>
    typename BatchReader<Builder>::Iterator BatchReader<Builder>::begin() {
        if (!readNext()) {
            return Iterator();
        }
        return Iterator(this);
    }

    template<BuilderConcept Builder>
    size_t BatchReader<Builder>::remaining() const {
        const size_t size = core_.batch().size();
        if (current_ == NO_ITEM) {
            return size;
        }
        return (current_ + 1 < size) ? size - current_ - 1 : 0;
    }

} // namespace rcsv
