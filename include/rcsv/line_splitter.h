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
 * @file line_splitter.h
 * @brief Literal-delimiter splitting and joining of CSV lines.
 *
 * No quoting: a delimiter inside a value always splits it, and join() does not
 * escape values that contain the delimiter or a line terminator.
 *
 * split("a;b;", ";")  -> ["a", "b", ""]
 * split("", ";")      -> [""]
 */

#include <string>
#include <string_view>
#include <vector>

namespace rcsv {

    /// Split `line` on every occurrence of `delimiter`, cells are views into `line`.
    inline void splitLine(std::string_view line, std::string_view delimiter, std::vector<std::string_view>& cells) {
        cells.clear();
        if (delimiter.empty()) {
            cells.push_back(line);
            return;
        }
        size_t start = 0;
        while (true) {
            size_t pos = line.find(delimiter, start);
            if (pos == std::string_view::npos) {
                cells.push_back(line.substr(start));
                return;
            }
            cells.push_back(line.substr(start, pos - start));
            start = pos + delimiter.size();
        }
    }

    /// Strip a trailing '\r' left over from CRLF line endings.
    inline void stripCarriageReturn(std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }

    /// Append `cells` joined by `delimiter` to `out`.
    template<typename CellRange>
    void appendJoined(std::string& out, const CellRange& cells, std::string_view delimiter) {
        bool first = true;
        for (const auto& cell : cells) {
            if (!first) out.append(delimiter);
            out.append(cell);
            first = false;
        }
    }

} // namespace rcsv
