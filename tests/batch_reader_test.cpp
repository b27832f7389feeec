/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file batch_reader_test.cpp
 * @brief Tests for the blocking batched reader (typed and generic mode).
 *
 * Test categories:
 *   1. Concept verification (static_assert)
 *   2. Header handling
 *   3. Batch boundaries
 *   4. Missing columns and cells
 *   5. Conversion error policy
 *   6. Generic rows
 */

#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <ranges>
#include <string>
#include <vector>

#include <rcsv/rcsv.h>
#include "test_records.h"

using rcsv_test::Person;
using rcsv_test::Primitives;

// ============================================================================
// 1. Concept verification — compile-time checks
// ============================================================================

static_assert(rcsv::ReaderConcept<rcsv::RecordReader<Person>>,
              "RecordReader<Person> must satisfy ReaderConcept");
static_assert(rcsv::ReaderConcept<rcsv::RowReader>,
              "RowReader must satisfy ReaderConcept");
static_assert(std::input_iterator<rcsv::RowReader::Iterator>);
static_assert(std::ranges::input_range<rcsv::RecordReader<Person>>);
static_assert(rcsv::BuilderConcept<rcsv::RecordBuilder<Person>>);
static_assert(rcsv::BuilderConcept<rcsv::RowBuilder>);

// ============================================================================
// Test fixture
// ============================================================================

class BatchReaderTest : public ::testing::Test {
protected:
    rcsv::HeaderResolver resolver_;

    template<typename T>
    rcsv::RecordReader<T> recordReader(std::string text, const rcsv::CsvConfig& config) {
        return rcsv::RecordReader<T>(std::make_unique<rcsv::StringLineSource>(std::move(text)),
                                     rcsv::RecordBuilder<T>(resolver_.resolve<T>(), config.logErrors),
                                     config);
    }

    rcsv::RowReader rowReader(std::string text, const rcsv::CsvConfig& config) {
        return rcsv::RowReader(std::make_unique<rcsv::StringLineSource>(std::move(text)),
                               rcsv::RowBuilder(), config);
    }

    static rcsv::CsvConfig semicolon(size_t batchSize = rcsv::DEFAULT_BATCH_SIZE) {
        rcsv::CsvConfig config;
        config.columnDelimiter = ";";
        config.batchSize = batchSize;
        return config;
    }

    /// "Name;Age" followed by n people named p0..p{n-1}, age = index
    static std::string people(size_t n) {
        std::string text = "Name;Age\n";
        for (size_t i = 0; i < n; ++i) {
            text += "p" + std::to_string(i) + ";" + std::to_string(i) + "\n";
        }
        return text;
    }
};

// ============================================================================
// 2. Header handling
// ============================================================================

TEST_F(BatchReaderTest, ReadsNameAgeScenario) {
    auto reader = recordReader<Person>("Name;Age\nAlice;30\nBob;25\n", semicolon());

    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"Alice", 30}));
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"Bob", 25}));
    EXPECT_FALSE(reader.readNext());
    EXPECT_TRUE(reader.isDone());
    EXPECT_EQ(reader.rowPos(), 2u);
    EXPECT_EQ(reader.fileLine(), 3u);
    EXPECT_EQ(reader.header(), (std::vector<std::string>{"Name", "Age"}));
}

TEST_F(BatchReaderTest, HeaderBeforeFirstRecord) {
    auto reader = recordReader<Person>("Age;Name\n7;Zed\n", semicolon());
    EXPECT_EQ(reader.header(), (std::vector<std::string>{"Age", "Name"}));
    EXPECT_EQ(reader.fileLine(), 1u);
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"Zed", 7}));
}

TEST_F(BatchReaderTest, EmptySourceYieldsNothing) {
    auto reader = recordReader<Person>("", semicolon());
    EXPECT_FALSE(reader.readNext());
    EXPECT_TRUE(reader.header().empty());
    EXPECT_TRUE(reader.isDone());
    EXPECT_FALSE(reader.getErrorMsg().empty());
}

TEST_F(BatchReaderTest, HeaderOnlyYieldsNothing) {
    auto reader = recordReader<Person>("Name;Age\n", semicolon());
    EXPECT_EQ(reader.fetchBatch(), 0u);
    EXPECT_TRUE(reader.isDone());
}

TEST_F(BatchReaderTest, CrLfLineEndings) {
    auto reader = recordReader<Person>("Name;Age\r\nAlice;30\r\n", semicolon());
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"Alice", 30}));
}

TEST_F(BatchReaderTest, DuplicateHeaderUsesFirstColumn) {
    auto reader = recordReader<Person>("Name;Age;Name\nfirst;1;second\n", semicolon());
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record().userName, "first");
}

TEST_F(BatchReaderTest, MultiCharacterDelimiter) {
    rcsv::CsvConfig config;
    config.columnDelimiter = "||";
    auto reader = recordReader<Person>("Name||Age\nA|B||3\n", config);
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"A|B", 3}));
}

TEST_F(BatchReaderTest, InvalidConfigurationThrows) {
    rcsv::CsvConfig config;
    config.batchSize = 0;
    EXPECT_THROW(recordReader<Person>("Name;Age\n", config), std::invalid_argument);
    config = rcsv::CsvConfig{};
    config.columnDelimiter.clear();
    EXPECT_THROW(rowReader("a\n", config), std::invalid_argument);
}

// ============================================================================
// 3. Batch boundaries
// ============================================================================

TEST_F(BatchReaderTest, SameRecordsForEveryBatchSize) {
    constexpr size_t N = 10;
    const std::string text = people(N);
    std::vector<Person> expected;
    for (size_t i = 0; i < N; ++i) {
        expected.push_back(Person{"p" + std::to_string(i), static_cast<int32_t>(i)});
    }

    for (size_t batchSize : {size_t{1}, N - 1, N, N + 1, size_t{100000}}) {
        SCOPED_TRACE("batchSize=" + std::to_string(batchSize));
        auto reader = recordReader<Person>(text, semicolon(batchSize));
        std::vector<Person> got;
        while (reader.readNext()) {
            got.push_back(reader.record());
        }
        EXPECT_EQ(got, expected);
        EXPECT_EQ(reader.rowPos(), N);
    }
}

TEST_F(BatchReaderTest, FetchBatchSizes) {
    auto reader = recordReader<Person>(people(5), semicolon(2));
    EXPECT_EQ(reader.fetchBatch(), 2u);
    EXPECT_EQ(reader.batch().size(), 2u);
    EXPECT_EQ(reader.batch()[1].userName, "p1");
    EXPECT_FALSE(reader.isDone());
    EXPECT_EQ(reader.fetchBatch(), 2u);
    EXPECT_EQ(reader.fetchBatch(), 1u);
    EXPECT_EQ(reader.batch()[0].userName, "p4");
    EXPECT_EQ(reader.fetchBatch(), 0u);
    EXPECT_TRUE(reader.isDone());
}

TEST_F(BatchReaderTest, ExactMultipleNeedsOneEmptyPass) {
    auto reader = recordReader<Person>(people(4), semicolon(2));
    EXPECT_EQ(reader.fetchBatch(), 2u);
    EXPECT_EQ(reader.fetchBatch(), 2u);
    EXPECT_FALSE(reader.isDone());
    EXPECT_EQ(reader.fetchBatch(), 0u);
    EXPECT_TRUE(reader.isDone());
}

TEST_F(BatchReaderTest, RangeForAndReadAll) {
    auto reader = recordReader<Person>(people(7), semicolon(3));
    size_t count = 0;
    for (Person& p : reader) {
        EXPECT_EQ(p.userAge, static_cast<int32_t>(count));
        ++count;
    }
    EXPECT_EQ(count, 7u);

    auto second = recordReader<Person>(people(7), semicolon(3));
    ASSERT_TRUE(second.readNext());
    ASSERT_TRUE(second.readNext());
    std::vector<Person> rest = second.readAll();
    ASSERT_EQ(rest.size(), 5u);
    EXPECT_EQ(rest.front().userName, "p2");
    EXPECT_EQ(rest.back().userName, "p6");
    EXPECT_TRUE(second.isDone());
}

TEST_F(BatchReaderTest, RecordWithoutReadNextThrows) {
    auto reader = recordReader<Person>(people(1), semicolon());
    if constexpr (rcsv::RANGE_CHECKING) {
        EXPECT_THROW(reader.record(), std::logic_error);
    }
}

// ============================================================================
// 4. Missing columns and cells
// ============================================================================

TEST_F(BatchReaderTest, MissingCellKeepsDefault) {
    auto reader = recordReader<Person>("Name;Age\nAlice\n;\nBob;4;extra;cells\n", semicolon());
    std::vector<Person> got = reader.readAll();
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0], (Person{"Alice", 0}));
    EXPECT_TRUE(got[1].userName.empty());
    EXPECT_EQ(got[1].userAge, 0);
    EXPECT_EQ(got[2], (Person{"Bob", 4}));
}

TEST_F(BatchReaderTest, MissingColumnKeepsDefault) {
    auto reader = recordReader<Person>("Name;Other\nAlice;x\n", semicolon());
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"Alice", 0}));
}

TEST_F(BatchReaderTest, EmptyLineIsDefaultRecord) {
    auto reader = recordReader<Person>("Name;Age\n\nBob;2\n", semicolon());
    std::vector<Person> got = reader.readAll();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0], Person{});
    EXPECT_EQ(got[1], (Person{"Bob", 2}));
}

TEST_F(BatchReaderTest, LowerCaseHeaders) {
    rcsv::HeaderResolver lower(true);
    rcsv::CsvConfig config = semicolon();
    rcsv::RecordReader<rcsv_test::Item> reader(
        std::make_unique<rcsv::StringLineSource>("item_id;label\n5;five\n"),
        rcsv::RecordBuilder<rcsv_test::Item>(lower.resolve<rcsv_test::Item>(), false), config);
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (rcsv_test::Item{5, "five"}));
}

TEST_F(BatchReaderTest, AllScalarKinds) {
    auto reader = recordReader<Primitives>(
        "flag,i8,i16,i32,i64,u8,u16,u32,u64,f32,f64,letter,text,day,maybe\n"
        "true,-8,-16,-32,-64,8,16,32,64,1.5,2.25,z, spaced ,2024-05-06,\n"
        "0,1,2,3,4,5,6,7,8,0,0,a,,1970-01-01,9\n",
        rcsv::CsvConfig{});
    std::vector<Primitives> got = reader.readAll();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_TRUE(got[0].flag);
    EXPECT_EQ(got[0].i8, -8);
    EXPECT_EQ(got[0].i64, -64);
    EXPECT_EQ(got[0].u64, 64u);
    EXPECT_FLOAT_EQ(got[0].f32, 1.5f);
    EXPECT_DOUBLE_EQ(got[0].f64, 2.25);
    EXPECT_EQ(got[0].letter, 'z');
    EXPECT_EQ(got[0].text, " spaced ");
    EXPECT_EQ(got[0].day, (std::chrono::year_month_day{std::chrono::year{2024}, std::chrono::month{5}, std::chrono::day{6}}));
    EXPECT_EQ(got[0].maybe, std::nullopt);
    EXPECT_FALSE(got[1].flag);
    EXPECT_EQ(got[1].maybe, std::optional<int32_t>(9));
}

// ============================================================================
// 5. Conversion error policy
// ============================================================================

TEST_F(BatchReaderTest, SuppressedErrorKeepsPartialRecord) {
    rcsv::CsvConfig config = semicolon();
    config.logErrors = false;
    auto reader = recordReader<rcsv_test::Sensor>("Reading;Id\nhot;S1\n2.5;S2\n", config);

    std::vector<rcsv_test::Sensor> got = reader.readAll();
    ASSERT_EQ(got.size(), 2u);
    // Id is resolved before Reading, the failing Reading ends the first record
    EXPECT_EQ(got[0].id(), "S1");
    EXPECT_DOUBLE_EQ(got[0].value(), 0.0);
    EXPECT_EQ(got[1].id(), "S2");
    EXPECT_DOUBLE_EQ(got[1].value(), 2.5);
    EXPECT_NE(reader.getErrorMsg().find("Value"), std::string::npos);
    EXPECT_NE(reader.getErrorMsg().find("line 2"), std::string::npos);
}

TEST_F(BatchReaderTest, SuppressedErrorSkipsRemainingFields) {
    rcsv::CsvConfig config = semicolon();
    auto reader = recordReader<Person>("Age;Name\nold;Alice\n", config);
    // UserName is populated first (field order), then UserAge fails
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record(), (Person{"Alice", 0}));

    auto failsFirst = recordReader<Primitives>("i8,i16,text\nbad,5,t\n", rcsv::CsvConfig{});
    ASSERT_TRUE(failsFirst.readNext());
    EXPECT_EQ(failsFirst.record().i8, 0);
    EXPECT_EQ(failsFirst.record().i16, 0);
    EXPECT_TRUE(failsFirst.record().text.empty());
}

TEST_F(BatchReaderTest, RethrownErrorEndsRead) {
    rcsv::CsvConfig config = semicolon(2);
    config.logErrors = true;
    auto reader = recordReader<Person>("Name;Age\nA;1\nB;2\nC;x\nD;4\n", config);

    ASSERT_TRUE(reader.readNext());
    ASSERT_TRUE(reader.readNext());
    EXPECT_THROW(reader.readNext(), rcsv::ConversionError);
    EXPECT_TRUE(reader.isDone());
    EXPECT_FALSE(reader.readNext());
}

// ============================================================================
// 6. Generic rows
// ============================================================================

TEST_F(BatchReaderTest, RowsNormalizeEmptyValues) {
    auto reader = rowReader("id;name\n1;\n", semicolon());
    ASSERT_TRUE(reader.readNext());
    const rcsv::Row& row = reader.row();
    EXPECT_EQ(row.keys(), (std::vector<std::string>{"id", "name"}));
    EXPECT_EQ(row.at("id"), std::optional<std::string>("1"));
    EXPECT_EQ(row.at("name"), std::nullopt);
    EXPECT_FALSE(reader.readNext());
}

TEST_F(BatchReaderTest, RowsTruncateAndPad) {
    auto reader = rowReader("a,b\n1,2,3\n4\n", rcsv::CsvConfig{});
    std::vector<rcsv::Row> rows = reader.readAll();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (rcsv::Row{{"a", "1"}, {"b", "2"}}));
    EXPECT_EQ(rows[1], (rcsv::Row{{"a", "4"}, {"b", std::nullopt}}));
}

TEST_F(BatchReaderTest, RowsDuplicateHeaderLastCellWins) {
    auto reader = rowReader("k,v,k\n1,2,3\n", rcsv::CsvConfig{});
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.row().size(), 2u);
    EXPECT_EQ(reader.row().at("k"), std::optional<std::string>("3"));
    EXPECT_EQ(reader.row().position("k"), 0u);
}

TEST_F(BatchReaderTest, RowsFromEmptySource) {
    auto reader = rowReader("", rcsv::CsvConfig{});
    EXPECT_TRUE(reader.readAll().empty());
}

TEST_F(BatchReaderTest, RowsAcrossBatches) {
    std::string text = "n\n";
    for (int i = 0; i < 25; ++i) {
        text += std::to_string(i) + "\n";
    }
    auto reader = rowReader(text, semicolon(4));
    int expected = 0;
    for (const rcsv::Row& row : reader) {
        EXPECT_EQ(row.at("n"), std::optional<std::string>(std::to_string(expected)));
        ++expected;
    }
    EXPECT_EQ(expected, 25);
}
