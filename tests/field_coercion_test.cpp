/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file field_coercion_test.cpp
 * @brief Tests for coerce<T>() / stringify() cell conversions.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <rcsv/rcsv.h>

using namespace std::chrono;

// ============================================================================
// Read direction
// ============================================================================

TEST(FieldCoercionTest, Integers) {
    EXPECT_EQ(rcsv::coerce<int32_t>("42"), 42);
    EXPECT_EQ(rcsv::coerce<int32_t>("-17"), -17);
    EXPECT_EQ(rcsv::coerce<int32_t>("+5"), 5);
    EXPECT_EQ(rcsv::coerce<int32_t>("  7 "), 7);
    EXPECT_EQ(rcsv::coerce<int64_t>("9876543210"), 9876543210LL);
    EXPECT_EQ(rcsv::coerce<uint64_t>("18446744073709551615"), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(rcsv::coerce<int16_t>("-32768"), std::numeric_limits<int16_t>::min());
}

TEST(FieldCoercionTest, SmallIntegersAreNumbersNotCharacters) {
    EXPECT_EQ(rcsv::coerce<int8_t>("-128"), int8_t(-128));
    EXPECT_EQ(rcsv::coerce<int8_t>("127"), int8_t(127));
    EXPECT_EQ(rcsv::coerce<uint8_t>("255"), uint8_t(255));
    EXPECT_THROW(rcsv::coerce<int8_t>("128"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<uint8_t>("256"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<uint8_t>("-1"), rcsv::ConversionError);
}

TEST(FieldCoercionTest, IntegerErrors) {
    EXPECT_THROW(rcsv::coerce<int32_t>(""), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<int32_t>("abc"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<int32_t>("12abc"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<int32_t>("1.5"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<int32_t>("99999999999"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<uint32_t>("-1"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<int32_t>("+-1"), rcsv::ConversionError);
}

TEST(FieldCoercionTest, ConversionErrorCarriesCellAndType) {
    try {
        rcsv::coerce<int32_t>("x1");
        FAIL() << "expected ConversionError";
    } catch (const rcsv::ConversionError& ex) {
        EXPECT_EQ(ex.cell(), "x1");
        EXPECT_EQ(ex.targetType(), rcsv::FieldType::INT32);
        EXPECT_NE(std::string(ex.what()).find("int32"), std::string::npos);
    }
}

TEST(FieldCoercionTest, FloatingPoint) {
    EXPECT_DOUBLE_EQ(rcsv::coerce<double>("3.25"), 3.25);
    EXPECT_DOUBLE_EQ(rcsv::coerce<double>("-1e3"), -1000.0);
    EXPECT_FLOAT_EQ(rcsv::coerce<float>("0.5"), 0.5f);
    EXPECT_THROW(rcsv::coerce<double>("3,25"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<double>(""), rcsv::ConversionError);
}

TEST(FieldCoercionTest, Booleans) {
    EXPECT_TRUE(rcsv::coerce<bool>("true"));
    EXPECT_TRUE(rcsv::coerce<bool>("TRUE"));
    EXPECT_TRUE(rcsv::coerce<bool>("True"));
    EXPECT_TRUE(rcsv::coerce<bool>("1"));
    EXPECT_FALSE(rcsv::coerce<bool>("false"));
    EXPECT_FALSE(rcsv::coerce<bool>("0"));
    EXPECT_THROW(rcsv::coerce<bool>("yes"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<bool>(""), rcsv::ConversionError);
}

TEST(FieldCoercionTest, StringsAreVerbatim) {
    EXPECT_EQ(rcsv::coerce<std::string>("  padded  "), "  padded  ");
    EXPECT_EQ(rcsv::coerce<std::string>(""), "");
    EXPECT_EQ(rcsv::coerce<std::string>("\"quoted\""), "\"quoted\"");
}

TEST(FieldCoercionTest, Characters) {
    EXPECT_EQ(rcsv::coerce<char>("x"), 'x');
    EXPECT_THROW(rcsv::coerce<char>(""), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<char>("xy"), rcsv::ConversionError);
}

TEST(FieldCoercionTest, Dates) {
    year_month_day expected{year{2024}, month{2}, day{29}};
    EXPECT_EQ(rcsv::coerce<year_month_day>("2024-02-29"), expected);
    EXPECT_THROW(rcsv::coerce<year_month_day>("2023-02-29"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<year_month_day>("2024/02/29"), rcsv::ConversionError);
    EXPECT_THROW(rcsv::coerce<year_month_day>("24-02-29"), rcsv::ConversionError);
}

TEST(FieldCoercionTest, OptionalEmptyCellIsNullopt) {
    EXPECT_EQ(rcsv::coerce<std::optional<int32_t>>(""), std::nullopt);
    EXPECT_EQ(rcsv::coerce<std::optional<int32_t>>("12"), std::optional<int32_t>(12));
    EXPECT_THROW(rcsv::coerce<std::optional<int32_t>>("twelve"), rcsv::ConversionError);
    EXPECT_EQ(rcsv::coerce<std::optional<std::string>>(""), std::nullopt);
}

// ============================================================================
// Write direction
// ============================================================================

TEST(FieldCoercionTest, Stringify) {
    EXPECT_EQ(rcsv::stringify(int32_t(-42)), "-42");
    EXPECT_EQ(rcsv::stringify(int8_t(-5)), "-5");
    EXPECT_EQ(rcsv::stringify(uint8_t(200)), "200");
    EXPECT_EQ(rcsv::stringify(true), "true");
    EXPECT_EQ(rcsv::stringify(false), "false");
    EXPECT_EQ(rcsv::stringify(2.5), "2.5");
    EXPECT_EQ(rcsv::stringify('c'), "c");
    EXPECT_EQ(rcsv::stringify(std::string("text")), "text");
    EXPECT_EQ(rcsv::stringify(year_month_day{year{1999}, month{12}, day{31}}), "1999-12-31");
    EXPECT_EQ(rcsv::stringify(std::optional<int32_t>()), "");
    EXPECT_EQ(rcsv::stringify(std::optional<int32_t>(3)), "3");
}

TEST(FieldCoercionTest, FloatsSurviveTextForm) {
    const double values[] = {0.1, 1.0 / 3.0, -2.5e-300, 1e300};
    for (double v : values) {
        EXPECT_EQ(rcsv::coerce<double>(rcsv::stringify(v)), v);
    }
    EXPECT_EQ(rcsv::coerce<float>(rcsv::stringify(0.1f)), 0.1f);
}
