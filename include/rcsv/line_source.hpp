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
 * @file line_source.hpp
 * @brief LineSource implementations.
 */

#include "line_source.h"
#include <stdexcept>
#include <system_error>

namespace rcsv {

    inline bool StreamLineSource::readLine(std::string& line) {
        if (std::getline(stream_, line)) {
            return true;
        }
        if (stream_.bad()) {
            throw std::runtime_error("Error: Failed to read from input stream");
        }
        return false;
    }

    inline FileLineSource::FileLineSource(const FilePath& filepath)
        : source_(stream_)
    {
        FilePath absolutePath = std::filesystem::absolute(filepath);

        // Check if file exists
        if (!std::filesystem::exists(absolutePath)) {
            throw std::runtime_error("Error: File does not exist: " + absolutePath.string());
        }

        // Check if it's a regular file
        if (!std::filesystem::is_regular_file(absolutePath)) {
            throw std::runtime_error("Error: Path is not a regular file: " + absolutePath.string());
        }

        // Check read permissions
        std::error_code ec;
        auto perms = std::filesystem::status(absolutePath, ec).permissions();
        if (ec || (perms & std::filesystem::perms::owner_read) == std::filesystem::perms::none) {
            throw std::runtime_error("Error: No read permission for file: " + absolutePath.string());
        }

        stream_.open(absolutePath, std::ios::in);
        if (!stream_.is_open()) {
            throw std::runtime_error("Error: Cannot open file for reading: " + absolutePath.string());
        }
        file_path_ = absolutePath;
    }

    inline AsyncLineSourceAdapter::AsyncLineSourceAdapter(std::unique_ptr<LineSource> source, std::launch policy)
        : source_(std::move(source))
        , policy_(policy)
    {
        if (!source_) {
            throw std::invalid_argument("Error: AsyncLineSourceAdapter requires a line source");
        }
    }

    inline std::future<std::optional<std::string>> AsyncLineSourceAdapter::readLineAsync() {
        return std::async(policy_, [source = source_.get()]() -> std::optional<std::string> {
            std::string line;
            if (!source->readLine(line)) {
                return std::nullopt;
            }
            return line;
        });
    }

} // namespace rcsv
