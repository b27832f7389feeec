/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file row_test.cpp
 * @brief Tests for Row and the ColumnIndex flat map behind it.
 */

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <rcsv/rcsv.h>

// ============================================================================
// ColumnIndex
// ============================================================================

TEST(ColumnIndexTest, BuildAndFind) {
    rcsv::ColumnIndex index;
    index.build(std::vector<std::string>{"b", "a", "c"});
    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.find("b"), 0u);
    EXPECT_EQ(index.find("a"), 1u);
    EXPECT_EQ(index.find("c"), 2u);
    EXPECT_EQ(index.find("d"), rcsv::ColumnIndex::npos);
    EXPECT_FALSE(index.contains("d"));
}

TEST(ColumnIndexTest, DuplicateNamesFindFirstPosition) {
    rcsv::ColumnIndex index;
    index.build(std::vector<std::string>{"x", "y", "x", "x"});
    EXPECT_EQ(index.find("x"), 0u);
    EXPECT_EQ(index.find("y"), 1u);
}

TEST(ColumnIndexTest, InsertKeepsOrder) {
    rcsv::ColumnIndex index;
    index.insert("m", 0);
    index.insert("a", 1);
    index.insert("z", 2);
    EXPECT_EQ(index.find("a"), 1u);
    EXPECT_EQ(index.find("m"), 0u);
    EXPECT_EQ(index.find("z"), 2u);
    EXPECT_EQ(index.begin()->first, "a");
    index.clear();
    EXPECT_TRUE(index.empty());
}

// ============================================================================
// Row
// ============================================================================

TEST(RowTest, KeepsInsertionOrder) {
    rcsv::Row row;
    row.set("z", std::string("1"));
    row.set("a", std::string("2"));
    row.set("m", std::nullopt);
    EXPECT_EQ(row.keys(), (std::vector<std::string>{"z", "a", "m"}));
    EXPECT_EQ(row.size(), 3u);
    EXPECT_EQ(row.entry(1).first, "a");
}

TEST(RowTest, SetOverwritesInPlace) {
    rcsv::Row row{{"id", "1"}, {"name", "a"}};
    size_t pos = row.set("id", std::string("2"));
    EXPECT_EQ(pos, 0u);
    EXPECT_EQ(row.size(), 2u);
    EXPECT_EQ(row.at("id"), std::optional<std::string>("2"));
    EXPECT_EQ(row.keys(), (std::vector<std::string>{"id", "name"}));
}

TEST(RowTest, LookupAndMissingKeys) {
    rcsv::Row row{{"id", "1"}, {"name", std::nullopt}};
    EXPECT_TRUE(row.contains("name"));
    EXPECT_EQ(row.at("name"), std::nullopt);
    EXPECT_EQ(row.find("missing"), nullptr);
    EXPECT_THROW(row.at("missing"), std::out_of_range);
    EXPECT_EQ(row.position("name"), 1u);
    EXPECT_EQ(row.position("missing"), rcsv::ColumnIndex::npos);
}

TEST(RowTest, PositionalAccess) {
    rcsv::Row row{{"a", std::nullopt}, {"b", std::nullopt}};
    row.valueAt(1) = "x";
    EXPECT_EQ(row.at("b"), std::optional<std::string>("x"));
    if constexpr (rcsv::RANGE_CHECKING) {
        EXPECT_THROW(row.valueAt(5), std::out_of_range);
    }
}

TEST(RowTest, EqualityIsOrderSensitive) {
    rcsv::Row ab{{"a", "1"}, {"b", "2"}};
    rcsv::Row ba{{"b", "2"}, {"a", "1"}};
    rcsv::Row ab2{{"a", "1"}, {"b", "2"}};
    EXPECT_EQ(ab, ab2);
    EXPECT_FALSE(ab == ba);
}

TEST(RowTest, ClearEmptiesKeysAndIndex) {
    rcsv::Row row{{"a", "1"}};
    row.clear();
    EXPECT_TRUE(row.empty());
    EXPECT_FALSE(row.contains("a"));
}
