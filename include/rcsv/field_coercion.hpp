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
 * @file field_coercion.hpp
 * @brief coerce() / stringify() implementations.
 */

#include "field_coercion.h"
#include <array>
#include <charconv>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <type_traits>

namespace rcsv {

    namespace detail {

        inline std::string_view trimSpaces(std::string_view cell) {
            while (!cell.empty() && (cell.front() == ' ' || cell.front() == '\t')) cell.remove_prefix(1);
            while (!cell.empty() && (cell.back() == ' ' || cell.back() == '\t')) cell.remove_suffix(1);
            return cell;
        }

        inline bool iequals(std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                char ca = a[i];
                char cb = b[i];
                if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
                if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
                if (ca != cb) return false;
            }
            return true;
        }

        inline bool parseBool(std::string_view cell, bool& out) {
            if (iequals(cell, "true") || cell == "1") {
                out = true;
                return true;
            }
            if (iequals(cell, "false") || cell == "0") {
                out = false;
                return true;
            }
            return false;
        }

        /// from_chars over the full cell, an explicit leading '+' is accepted
        template<typename T>
        bool parseNumber(std::string_view cell, T& out) {
            if (cell.size() > 1 && cell.front() == '+' && cell[1] != '-' && cell[1] != '+') {
                cell.remove_prefix(1);
            }
            if (cell.empty()) {
                return false;
            }
            const char* first = cell.data();
            const char* last  = cell.data() + cell.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

        inline bool parseDate(std::string_view cell, std::chrono::year_month_day& out) {
            // YYYY-MM-DD
            if (cell.size() != 10 || cell[4] != '-' || cell[7] != '-') {
                return false;
            }
            int y = 0;
            unsigned m = 0;
            unsigned d = 0;
            if (!parseNumber(cell.substr(0, 4), y) ||
                !parseNumber(cell.substr(5, 2), m) ||
                !parseNumber(cell.substr(8, 2), d)) {
                return false;
            }
            std::chrono::year_month_day date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
            if (!date.ok()) {
                return false;
            }
            out = date;
            return true;
        }

        inline std::string formatDate(const std::chrono::year_month_day& date) {
            std::array<char, 16> buf{};
            int n = std::snprintf(buf.data(), buf.size(), "%04d-%02u-%02u",
                                  static_cast<int>(date.year()),
                                  static_cast<unsigned>(date.month()),
                                  static_cast<unsigned>(date.day()));
            return std::string(buf.data(), n > 0 ? static_cast<size_t>(n) : 0);
        }

        /// Any numeric type via std::to_chars (no locale, shortest round-trip form for floats)
        template<typename T>
        std::string formatNumber(T value) {
            std::array<char, 64> buf{};
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
            if (ec != std::errc{}) {
                throw std::runtime_error("Error: Cannot format numeric value");
            }
            return std::string(buf.data(), ptr);
        }

    } // namespace detail

    // ── Read direction ──────────────────────────────────────────────────

    template<ScalarField T>
    T coerce(std::string_view cell) {
        if constexpr (is_optional_v<T>) {
            using S = typename T::value_type;
            if (cell.empty()) {
                return std::nullopt;
            }
            return T{coerce<S>(cell)};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::string(cell);
        } else if constexpr (std::is_same_v<T, char>) {
            if (cell.size() != 1) {
                throw ConversionError(cell, FieldType::CHAR);
            }
            return cell.front();
        } else if constexpr (std::is_same_v<T, bool>) {
            bool value = false;
            if (!detail::parseBool(detail::trimSpaces(cell), value)) {
                throw ConversionError(cell, FieldType::BOOL);
            }
            return value;
        } else if constexpr (std::is_same_v<T, std::chrono::year_month_day>) {
            std::chrono::year_month_day value{};
            if (!detail::parseDate(detail::trimSpaces(cell), value)) {
                throw ConversionError(cell, FieldType::DATE);
            }
            return value;
        } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) {
            // from_chars on (un)signed char parses digits, widen to catch range errors explicitly
            using Wide = std::conditional_t<std::is_signed_v<T>, int, unsigned>;
            Wide wide = 0;
            if (!detail::parseNumber(detail::trimSpaces(cell), wide) ||
                wide < static_cast<Wide>(std::numeric_limits<T>::min()) ||
                wide > static_cast<Wide>(std::numeric_limits<T>::max())) {
                throw ConversionError(cell, toFieldType<T>());
            }
            return static_cast<T>(wide);
        } else {
            T value{};
            if (!detail::parseNumber(detail::trimSpaces(cell), value)) {
                throw ConversionError(cell, toFieldType<T>());
            }
            return value;
        }
    }

    // ── Write direction ─────────────────────────────────────────────────

    template<ScalarField T>
    std::string stringify(const T& value) {
        if constexpr (is_optional_v<T>) {
            return value.has_value() ? stringify(*value) : std::string();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else if constexpr (std::is_same_v<T, char>) {
            return std::string(1, value);
        } else if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::chrono::year_month_day>) {
            return detail::formatDate(value);
        } else if constexpr (std::is_same_v<T, int8_t>) {
            return detail::formatNumber(static_cast<int>(value));
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            return detail::formatNumber(static_cast<unsigned>(value));
        } else {
            return detail::formatNumber(value);
        }
    }

} // namespace rcsv
