/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file column_mapping_test.cpp
 * @brief Tests for ColumnMapping, ColumnSource and RecordDescriptor.
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include <rcsv/rcsv.h>
#include "test_records.h"

using rcsv_test::Person;
using rcsv_test::Sensor;

static_assert(rcsv::RecordConcept<Person>);
static_assert(rcsv::RecordConcept<rcsv_test::Primitives>);
static_assert(rcsv::RecordConcept<rcsv_test::Empty>);
static_assert(!rcsv::RecordConcept<rcsv::Row>, "Row has no RecordTraits");
static_assert(!rcsv::RecordConcept<int>);

// ============================================================================
// ColumnMapping
// ============================================================================

TEST(ColumnMappingTest, KeepsDeclaredAndLowerCaseName) {
    rcsv::ColumnMapping mapping("UserName");
    EXPECT_EQ(mapping.declaredName(), "UserName");
    EXPECT_EQ(mapping.lowerCaseName(), "username");
    EXPECT_EQ(mapping.name(false), "UserName");
    EXPECT_EQ(mapping.name(true), "username");
}

TEST(ColumnMappingTest, EmptyNameThrows) {
    EXPECT_THROW(rcsv::ColumnMapping(""), rcsv::EmptyColumnMapping);
    EXPECT_THROW(rcsv::ColumnMapping(""), std::invalid_argument);
}

TEST(ColumnMappingTest, ColumnNameOfSource) {
    rcsv::ColumnSource own = rcsv::FieldName{};
    rcsv::ColumnSource mapped = rcsv::ColumnMapping("Age");

    EXPECT_EQ(rcsv::columnNameOf(own, "UserAge", false), "UserAge");
    EXPECT_EQ(rcsv::columnNameOf(own, "UserAge", true), "userage");
    EXPECT_EQ(rcsv::columnNameOf(mapped, "UserAge", false), "Age");
    EXPECT_EQ(rcsv::columnNameOf(mapped, "UserAge", true), "age");
}

// ============================================================================
// RecordDescriptor
// ============================================================================

TEST(RecordDescriptorTest, FieldsKeepRegistrationOrder) {
    auto descriptor = rcsv::RecordTraits<Person>::describe();
    ASSERT_EQ(descriptor.fieldCount(), 2u);
    EXPECT_EQ(descriptor.fields()[0].name, "UserName");
    EXPECT_EQ(descriptor.fields()[1].name, "UserAge");
    EXPECT_EQ(descriptor.fields()[0].type, rcsv::FieldType::STRING);
    EXPECT_EQ(descriptor.fields()[1].type, rcsv::FieldType::INT32);
    EXPECT_TRUE(descriptor.fields()[0].hasMapping());
    EXPECT_EQ(descriptor.fields()[1].columnName(false), "Age");
}

TEST(RecordDescriptorTest, AssignAndFormatThroughMembers) {
    auto descriptor = rcsv::RecordTraits<Person>::describe();
    Person p;
    descriptor.fields()[0].assign(p, "Alice");
    descriptor.fields()[1].assign(p, "30");
    EXPECT_EQ(p.userName, "Alice");
    EXPECT_EQ(p.userAge, 30);
    EXPECT_EQ(descriptor.fields()[1].format(p), "30");
    EXPECT_THROW(descriptor.fields()[1].assign(p, "old"), rcsv::ConversionError);
    EXPECT_EQ(p.userAge, 30);
}

TEST(RecordDescriptorTest, AssignAndFormatThroughAccessors) {
    auto descriptor = rcsv::RecordTraits<Sensor>::describe();
    ASSERT_EQ(descriptor.fieldCount(), 2u);
    EXPECT_FALSE(descriptor.fields()[0].hasMapping());
    EXPECT_EQ(descriptor.fields()[1].columnName(false), "Reading");

    Sensor s;
    descriptor.fields()[0].assign(s, "T-1");
    descriptor.fields()[1].assign(s, "21.5");
    EXPECT_EQ(s.id(), "T-1");
    EXPECT_DOUBLE_EQ(s.value(), 21.5);
    EXPECT_EQ(descriptor.fields()[1].format(s), "21.5");
}

TEST(RecordDescriptorTest, OptionalFieldsAreFlagged) {
    auto descriptor = rcsv::RecordTraits<rcsv_test::Primitives>::describe();
    EXPECT_TRUE(descriptor.fields().back().optional);
    EXPECT_FALSE(descriptor.fields().front().optional);
}

TEST(RecordDescriptorTest, RejectsDuplicateAndEmptyFieldNames) {
    rcsv::RecordDescriptor<Person> descriptor;
    descriptor.field("UserName", &Person::userName);
    EXPECT_THROW(descriptor.field("UserName", &Person::userName), std::invalid_argument);
    EXPECT_THROW(descriptor.field("", &Person::userAge), std::invalid_argument);
    EXPECT_EQ(descriptor.fieldCount(), 1u);
}
