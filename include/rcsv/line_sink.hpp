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
 * @file line_sink.hpp
 * @brief LineSink implementations.
 */

#include "line_sink.h"
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace rcsv {

    inline void LineSink::writeLine(std::string_view line) {
        write(line);
        write(std::string_view(&LINE_TERMINATOR, 1));
    }

    // ── StreamLineSink ──────────────────────────────────────────────────

    inline void StreamLineSink::write(std::string_view chunk) {
        stream_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!stream_) {
            throw std::runtime_error("Error: Failed to write to output stream");
        }
    }

    inline void StreamLineSink::flush() {
        stream_.flush();
        if (!stream_) {
            throw std::runtime_error("Error: Failed to flush output stream");
        }
    }

    // ── FileLineSink ────────────────────────────────────────────────────

    inline FileLineSink::FileLineSink(const FilePath& filepath)
        : sink_(stream_)
    {
        FilePath absolutePath = std::filesystem::absolute(filepath);

        // Create parent directory if needed
        FilePath parentDir = absolutePath.parent_path();
        if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
            std::error_code ec;
            if (!std::filesystem::create_directories(parentDir, ec)) {
                throw std::runtime_error("Error: Cannot create directory: " + parentDir.string() +
                                         " (Error: " + ec.message() + ")");
            }
        }

        // Open text file (not binary, let the OS handle line endings)
        stream_.open(absolutePath, std::ios::out | std::ios::trunc);
        if (!stream_.good()) {
            throw std::runtime_error("Error: Cannot open file for writing: " + absolutePath.string());
        }
        file_path_ = absolutePath;
    }

    inline FileLineSink::~FileLineSink() {
        if (!stream_.is_open()) {
            return;
        }
        stream_.flush();
        stream_.close();
        if constexpr (DEBUG_OUTPUTS) {
            if (stream_.fail()) {
                std::cerr << "Warning: Failed to close file: " << file_path_.string() << std::endl;
            }
        }
    }

    inline void FileLineSink::close() {
        if (!stream_.is_open()) {
            return;
        }
        sink_.flush();
        stream_.close();
        if (stream_.fail()) {
            throw std::runtime_error("Error: Failed to close file: " + file_path_.string());
        }
    }

    // ── Async sinks ─────────────────────────────────────────────────────

    inline std::future<void> AsyncLineSink::writeLineAsync(std::string line) {
        line.push_back(LINE_TERMINATOR);
        return writeAsync(std::move(line));
    }

    inline std::future<void> AsyncLineSink::flushAsync() {
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

    inline AsyncLineSinkAdapter::AsyncLineSinkAdapter(std::unique_ptr<LineSink> sink, std::launch policy)
        : sink_(std::move(sink))
        , policy_(policy)
    {
        if (!sink_) {
            throw std::invalid_argument("Error: AsyncLineSinkAdapter requires a line sink");
        }
    }

    inline std::future<void> AsyncLineSinkAdapter::writeAsync(std::string chunk) {
        return std::async(policy_, [sink = sink_.get(), chunk = std::move(chunk)]() {
            sink->write(chunk);
        });
    }

    inline std::future<void> AsyncLineSinkAdapter::flushAsync() {
        return std::async(policy_, [sink = sink_.get()]() { sink->flush(); });
    }

} // namespace rcsv
