/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the RCSV library */
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#ifndef RCSV_DEBUG_OUTPUTS
#define RCSV_DEBUG_OUTPUTS 0
#endif

#ifndef RCSV_RANGE_CHECKING
#define RCSV_RANGE_CHECKING 1
#endif

namespace rcsv {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Echo suppressed warnings and error messages to std::cerr
    constexpr bool DEBUG_OUTPUTS = (RCSV_DEBUG_OUTPUTS != 0);

    // Bounds-checked positional access (at() instead of operator[])
    constexpr bool RANGE_CHECKING = (RCSV_RANGE_CHECKING != 0);

    // Defaults of CsvConfig
    constexpr const char* DEFAULT_DELIMITER        = ",";
    constexpr size_t      DEFAULT_BATCH_SIZE       = 1000;
    constexpr size_t      DEFAULT_INITIAL_CAPACITY = 16;
    constexpr char        LINE_TERMINATOR          = '\n';

    // Scalar kind of a record field, used for diagnostics and error messages
    enum class FieldType : uint16_t {
        BOOL = 0x0001,
        UINT8 = 0x0002,
        UINT16 = 0x0003,
        UINT32 = 0x0004,
        UINT64 = 0x0005,
        INT8 = 0x0006,
        INT16 = 0x0007,
        INT32 = 0x0008,
        INT64 = 0x0009,
        FLOAT = 0x000A,
        DOUBLE = 0x000B,
        STRING = 0x000C,
        CHAR = 0x000D,
        DATE = 0x000E
    };

    template<typename T>
    constexpr bool always_false = false;

    template<typename T>
    struct is_optional : std::false_type {};

    template<typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    constexpr bool is_optional_v = is_optional<T>::value;

    // Strips std::optional<> from a field type
    template<typename T>
    struct scalar_of { using type = T; };

    template<typename T>
    struct scalar_of<std::optional<T>> { using type = T; };

    template<typename T>
    using scalar_of_t = typename scalar_of<T>::type;

    template<typename T>
    constexpr FieldType toFieldType() {
        using S = scalar_of_t<std::remove_cvref_t<T>>;
        if constexpr (std::is_same_v<S, bool>) return FieldType::BOOL;
        else if constexpr (std::is_same_v<S, char>) return FieldType::CHAR;
        else if constexpr (std::is_same_v<S, int8_t>) return FieldType::INT8;
        else if constexpr (std::is_same_v<S, int16_t>) return FieldType::INT16;
        else if constexpr (std::is_same_v<S, int32_t>) return FieldType::INT32;
        else if constexpr (std::is_same_v<S, int64_t>) return FieldType::INT64;
        else if constexpr (std::is_same_v<S, uint8_t>) return FieldType::UINT8;
        else if constexpr (std::is_same_v<S, uint16_t>) return FieldType::UINT16;
        else if constexpr (std::is_same_v<S, uint32_t>) return FieldType::UINT32;
        else if constexpr (std::is_same_v<S, uint64_t>) return FieldType::UINT64;
        else if constexpr (std::is_same_v<S, float>) return FieldType::FLOAT;
        else if constexpr (std::is_same_v<S, double>) return FieldType::DOUBLE;
        else if constexpr (std::is_same_v<S, std::string>) return FieldType::STRING;
        else if constexpr (std::is_same_v<S, std::chrono::year_month_day>) return FieldType::DATE;
        else static_assert(always_false<T>, "Unsupported field type");
    }

    template<typename T>
    constexpr bool is_scalar_field_v =
        std::is_same_v<T, bool> || std::is_same_v<T, char> ||
        std::is_same_v<T, int8_t> || std::is_same_v<T, int16_t> ||
        std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t> ||
        std::is_same_v<T, uint8_t> || std::is_same_v<T, uint16_t> ||
        std::is_same_v<T, uint32_t> || std::is_same_v<T, uint64_t> ||
        std::is_same_v<T, float> || std::is_same_v<T, double> ||
        std::is_same_v<T, std::string> || std::is_same_v<T, std::chrono::year_month_day>;

    // A field type the coercion layer can convert, optionally wrapped in std::optional
    template<typename T>
    concept ScalarField = is_scalar_field_v<scalar_of_t<T>>;

    inline std::string fieldTypeToString(FieldType type) {
        switch (type) {
            case FieldType::BOOL: return "bool";
            case FieldType::UINT8: return "uint8";
            case FieldType::UINT16: return "uint16";
            case FieldType::UINT32: return "uint32";
            case FieldType::UINT64: return "uint64";
            case FieldType::INT8: return "int8";
            case FieldType::INT16: return "int16";
            case FieldType::INT32: return "int32";
            case FieldType::INT64: return "int64";
            case FieldType::FLOAT: return "float";
            case FieldType::DOUBLE: return "double";
            case FieldType::STRING: return "string";
            case FieldType::CHAR: return "char";
            case FieldType::DATE: return "date";
            default: return "undefined";
        }
    }

    // ASCII lower-casing, locale independent
    inline std::string toLowerAscii(std::string_view text) {
        std::string result(text);
        for (char& c : result) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return result;
    }

} // namespace rcsv
