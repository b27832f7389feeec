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
 * @file line_sink.h
 * @brief Line-oriented text sinks fed by the writer engine.
 *
 * LineSink       — blocking write(chunk) / writeLine(line)
 * AsyncLineSink  — the same, returning a std::future per call
 */

#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "definitions.h"

namespace rcsv {

    class LineSink {
    public:
        virtual ~LineSink() = default;

        virtual void write(std::string_view chunk) = 0;

        /// Write a line followed by the line terminator.
        virtual void writeLine(std::string_view line);

        virtual void flush() {}
    };

    /**
     * @brief Writes to a borrowed std::ostream.
     * @throws std::runtime_error if the stream enters a failed state
     */
    class StreamLineSink : public LineSink {
        std::ostream&   stream_;

    public:
        explicit StreamLineSink(std::ostream& stream) : stream_(stream) {}

        void write(std::string_view chunk) override;
        void flush() override;
    };

    /**
     * @brief Collects everything written into a string.
     */
    class StringLineSink : public LineSink {
        std::string     text_;

    public:
        StringLineSink() = default;

        void                write(std::string_view chunk) override  { text_.append(chunk); }
        const std::string&  str() const                             { return text_; }
        std::string         release()                               { return std::move(text_); }
    };

    /**
     * @brief Writes to a file it creates (or truncates) and owns.
     *
     * Missing parent directories are created.  The file is flushed and closed on destruction.
     * @throws std::runtime_error on construction if the file cannot be created.
     */
    class FileLineSink : public LineSink {
    public:
        using FilePath = std::filesystem::path;

    private:
        FilePath            file_path_;
        std::ofstream       stream_;
        StreamLineSink      sink_;

    public:
        explicit FileLineSink(const FilePath& filepath);
        ~FileLineSink() override;

        FileLineSink(const FileLineSink&) = delete;
        FileLineSink& operator=(const FileLineSink&) = delete;

        void                close();
        const FilePath&     filePath() const                        { return file_path_; }
        bool                isOpen() const                          { return stream_.is_open(); }
        void                write(std::string_view chunk) override  { sink_.write(chunk); }
        void                flush() override                        { sink_.flush(); }
    };

    class AsyncLineSink {
    public:
        virtual ~AsyncLineSink() = default;

        virtual std::future<void> writeAsync(std::string chunk) = 0;
        virtual std::future<void> writeLineAsync(std::string line);
        virtual std::future<void> flushAsync();
    };

    /**
     * @brief Exposes a blocking LineSink through the asynchronous interface.
     * Calls must not overlap: wait for one future before issuing the next write.
     */
    class AsyncLineSinkAdapter : public AsyncLineSink {
        std::unique_ptr<LineSink>   sink_;
        std::launch                 policy_;

    public:
        explicit AsyncLineSinkAdapter(std::unique_ptr<LineSink> sink,
                                      std::launch policy = std::launch::deferred);

        LineSink&           sink()                  { return *sink_; }
        std::future<void>   writeAsync(std::string chunk) override;
        std::future<void>   flushAsync() override;
    };

} // namespace rcsv
