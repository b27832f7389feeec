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
 * @file line_source.h
 * @brief Line-oriented text sources consumed by the reader engines.
 *
 * LineSource       — blocking "read next line or end-of-input"
 * AsyncLineSource  — the same, returning a std::future per line
 *
 * Lines are returned without their terminator.  The engines never open files;
 * FileLineSource is a convenience wrapper that owns its std::ifstream.
 */

#include <filesystem>
#include <fstream>
#include <future>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "definitions.h"

namespace rcsv {

    class LineSource {
    public:
        virtual ~LineSource() = default;

        /// Read the next line into `line`. Returns false at end of input.
        virtual bool readLine(std::string& line) = 0;
    };

    /**
     * @brief Reads lines from a borrowed std::istream.
     * @throws std::runtime_error from readLine() if the stream reports a hard I/O error (badbit)
     */
    class StreamLineSource : public LineSource {
        std::istream&   stream_;

    public:
        explicit StreamLineSource(std::istream& stream) : stream_(stream) {}
        bool readLine(std::string& line) override;
    };

    /**
     * @brief Reads lines from an owned copy of a string.
     */
    class StringLineSource : public LineSource {
        std::istringstream  stream_;
        StreamLineSource    source_;

    public:
        explicit StringLineSource(std::string text)
            : stream_(std::move(text))
            , source_(stream_) {}

        StringLineSource(const StringLineSource&) = delete;
        StringLineSource& operator=(const StringLineSource&) = delete;

        bool readLine(std::string& line) override { return source_.readLine(line); }
    };

    /**
     * @brief Reads lines from a file it opens and owns.
     * @throws std::runtime_error on construction if the file is missing, not a regular
     *         file, not readable, or cannot be opened.
     */
    class FileLineSource : public LineSource {
    public:
        using FilePath = std::filesystem::path;

    private:
        FilePath            file_path_;
        std::ifstream       stream_;
        StreamLineSource    source_;

    public:
        explicit FileLineSource(const FilePath& filepath);

        FileLineSource(const FileLineSource&) = delete;
        FileLineSource& operator=(const FileLineSource&) = delete;

        const FilePath&     filePath() const            { return file_path_; }
        bool                readLine(std::string& line) override { return source_.readLine(line); }
    };

    class AsyncLineSource {
    public:
        virtual ~AsyncLineSource() = default;

        /// Next line, or std::nullopt at end of input. Errors surface through the future.
        virtual std::future<std::optional<std::string>> readLineAsync() = 0;
    };

    /**
     * @brief Exposes a blocking LineSource through the asynchronous interface.
     *
     * Each readLineAsync() call schedules one readLine() with the given launch policy.
     * The default (std::launch::deferred) performs the read when the future is waited on,
     * on the waiting thread.  Calls must not overlap: wait for one future before
     * requesting the next line.
     */
    class AsyncLineSourceAdapter : public AsyncLineSource {
        std::unique_ptr<LineSource> source_;
        std::launch                 policy_;

    public:
        explicit AsyncLineSourceAdapter(std::unique_ptr<LineSource> source,
                                        std::launch policy = std::launch::deferred);

        std::future<std::optional<std::string>> readLineAsync() override;
    };

} // namespace rcsv
