// ==============================================================================
// test_value_gtest.cpp - Тесты Value (GoogleTest)
// ==============================================================================

#include <winevtrc/value.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace winevtrc::test {

TEST(ValueTest, DefaultConstructed_IsNull) {
    Value value;
    EXPECT_TRUE(value.is_null());
    EXPECT_EQ(value.type(), Value::Type::Null);
    EXPECT_EQ(value.to_display_string(), "");
    EXPECT_EQ(value.to_json(), "null");
}

TEST(ValueTest, Equality_RequiresSameStorageClass) {
    EXPECT_EQ(Value(std::int64_t{5}), Value(std::int64_t{5}));
    EXPECT_NE(Value(std::int64_t{5}), Value("5"));
    EXPECT_NE(Value(std::int64_t{5}), Value(5.0));
    EXPECT_EQ(Value(), Value());
}

TEST(ValueTest, TypedAccessors_ReturnNulloptOnMismatch) {
    EXPECT_EQ(Value(std::int64_t{0x0409}).to_int64().value_or(0), 0x0409);
    EXPECT_FALSE(Value("1033").to_int64().has_value());
    EXPECT_FALSE(Value(std::int64_t{1}).to_optional_string().has_value());
    EXPECT_EQ(Value("text").to_optional_string().value_or(""), "text");
    EXPECT_TRUE(Value("not a list").to_string_vector().empty());
}

TEST(ValueTest, StringList_SerializesToJson) {
    // Arrange
    Value value = Value::make_string_list({"%SystemRoot%\\System32\\wer.dll", "Application"});

    // Act
    std::string json = value.to_json();

    // Assert
    EXPECT_EQ(json, R"(["%SystemRoot%\\System32\\wer.dll","Application"])");
    EXPECT_EQ(value.to_display_string(), json);
}

TEST(ValueTest, FromJson_StringArray_ReturnsList) {
    Value value = Value::from_json(R"(["Application Error", "Application Hang"])");

    ASSERT_TRUE(value.is_string_list());
    std::vector<std::string> items = value.to_string_vector();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "Application Error");
    EXPECT_EQ(items[1], "Application Hang");
}

TEST(ValueTest, FromJson_SkipsNonStrings) {
    Value value = Value::from_json(R"(["a", 1, null, "b"])");
    std::vector<std::string> items = value.to_string_vector();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "a");
    EXPECT_EQ(items[1], "b");
}

TEST(ValueTest, FromJson_InvalidOrNotArray_Throws) {
    EXPECT_THROW(Value::from_json("[\"unterminated"), std::runtime_error);
    EXPECT_THROW(Value::from_json(R"({"a": "b"})"), std::runtime_error);
}

TEST(ValueTest, ToDisplayString_Numbers) {
    EXPECT_EQ(Value(std::int64_t{-7}).to_display_string(), "-7");
    EXPECT_EQ(Value(std::int64_t{20240929}).to_display_string(), "20240929");
    EXPECT_EQ(Value(1.5).to_display_string(), "1.5");
}

TEST(ValueTest, ToJson_NonFiniteReal_Throws) {
    EXPECT_THROW(Value(std::numeric_limits<double>::infinity()).to_json(), std::runtime_error);
}

}  // namespace winevtrc::test
