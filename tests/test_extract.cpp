/**
 * @file test_extract.cpp
 * @brief Tests for source field extraction and scalar normalization
 */

#include <gtest/gtest.h>
#include "patcher/Extract.hpp"
#include "patcher/Errors.hpp"

#include <limits>

using namespace patcher;

// ============================================================================
// to_scalar
// ============================================================================

TEST(ToScalar, Leaves) {
    EXPECT_TRUE(is_null(to_scalar(Document(nullptr))));
    EXPECT_EQ(std::get<bool>(to_scalar(Document(true))), true);
    EXPECT_EQ(std::get<std::int64_t>(to_scalar(Document(-5))), -5);
    EXPECT_DOUBLE_EQ(std::get<double>(to_scalar(Document(2.5))), 2.5);
    EXPECT_EQ(std::get<std::string>(to_scalar(Document("hi"))), "hi");
}

TEST(ToScalar, ParsedIntegersAreSignedWide) {
    // The parser stores non-negative integers as unsigned
    auto doc = Document::parse(R"({"n": 42})");
    ASSERT_TRUE(doc["n"].is_number_unsigned());

    auto s = to_scalar(doc["n"]);
    ASSERT_TRUE(std::holds_alternative<std::int64_t>(s));
    EXPECT_EQ(std::get<std::int64_t>(s), 42);
}

TEST(ToScalar, UnsignedAboveInt64Wraps) {
    auto s = to_scalar(Document(std::numeric_limits<std::uint64_t>::max()));
    EXPECT_EQ(std::get<std::int64_t>(s), -1);
}

TEST(ToScalar, ContainersAreNested) {
    Document obj = {{"a", 1}};
    auto s = to_scalar(obj);
    ASSERT_TRUE(std::holds_alternative<Nested>(s));
    EXPECT_EQ(std::get<Nested>(s).value, obj);

    EXPECT_TRUE(std::holds_alternative<Nested>(to_scalar(Document::array({1, 2}))));
}

TEST(KindName, AllKinds) {
    EXPECT_EQ(kind_name(Scalar{Null{}}), "null");
    EXPECT_EQ(kind_name(Scalar{true}), "boolean");
    EXPECT_EQ(kind_name(Scalar{std::int64_t{1}}), "integer");
    EXPECT_EQ(kind_name(Scalar{1.0}), "float");
    EXPECT_EQ(kind_name(Scalar{std::string("x")}), "string");
    EXPECT_EQ(kind_name(Scalar{Nested{Document::object()}}), "nested");
}

// ============================================================================
// extract_fields
// ============================================================================

TEST(ExtractFields, TopLevelMembers) {
    Document doc = {{"FirstName", "Tommy"}, {"Dependents", 3}, {"Retired", false}};
    auto fields = extract_fields(doc);

    ASSERT_EQ(fields.size(), 3u);
    // nlohmann::json objects iterate in key order
    EXPECT_EQ(fields[0].name, "Dependents");
    EXPECT_EQ(std::get<std::int64_t>(fields[0].value), 3);
    EXPECT_EQ(fields[1].name, "FirstName");
    EXPECT_EQ(std::get<std::string>(fields[1].value), "Tommy");
    EXPECT_EQ(fields[2].name, "Retired");
    EXPECT_EQ(std::get<bool>(fields[2].value), false);
}

TEST(ExtractFields, EmptyObject) {
    EXPECT_TRUE(extract_fields(Document::object()).empty());
}

TEST(ExtractFields, NestedValuesNotFlattened) {
    Document doc = {{"Address", {{"City", "Springfield"}}}, {"Tags", {"a", "b"}}};
    auto fields = extract_fields(doc);

    ASSERT_EQ(fields.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<Nested>(fields[0].value));
    EXPECT_TRUE(std::holds_alternative<Nested>(fields[1].value));
}

TEST(ExtractFields, NullMemberKept) {
    Document doc = {{"Badge", nullptr}};
    auto fields = extract_fields(doc);

    ASSERT_EQ(fields.size(), 1u);
    EXPECT_TRUE(is_null(fields[0].value));
}

TEST(ExtractFields, NullSourceRejected) {
    const Document* none = nullptr;
    EXPECT_THROW(extract_fields(none), InvalidArgument);
    EXPECT_THROW(extract_fields(Document(nullptr)), InvalidArgument);
}

TEST(ExtractFields, NonObjectSourceRejected) {
    try {
        extract_fields(Document::array({1, 2}));
        FAIL() << "Expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.actual(), "array");
    }
    EXPECT_THROW(extract_fields(Document("text")), TypeMismatch);
    EXPECT_THROW(extract_fields(Document(3)), TypeMismatch);
    EXPECT_THROW(extract_fields(Document(true)), TypeMismatch);
}
