/**
 * @file test_value_model.cpp
 * @brief Classification of nlohmann values into the closed model
 */

#include "ocp/value_model.hpp"

#include <cstdint>
#include <limits>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace ocp::value::test {

using Json = nlohmann::json;

TEST(ValueModel, ClassifiesAllSixKinds)
{
    EXPECT_EQ(classify(Json(nullptr)).value(), ValueKind::kNull);
    EXPECT_EQ(classify(Json(true)).value(), ValueKind::kBool);
    EXPECT_EQ(classify(Json(-1)).value(), ValueKind::kNumber);
    EXPECT_EQ(classify(Json(1U)).value(), ValueKind::kNumber);
    EXPECT_EQ(classify(Json(1.5)).value(), ValueKind::kNumber);
    EXPECT_EQ(classify(Json("s")).value(), ValueKind::kString);
    EXPECT_EQ(classify(Json::array()).value(), ValueKind::kArray);
    EXPECT_EQ(classify(Json::object()).value(), ValueKind::kObject);
}

TEST(ValueModel, ForeignTypesAreInvalidInput)
{
    auto binary = classify(Json::binary({0xDE, 0xAD}));
    ASSERT_FALSE(binary);
    EXPECT_EQ(binary.error().code, ocp::kInvalidInput);

    auto discarded = classify(Json(Json::value_t::discarded));
    ASSERT_FALSE(discarded);
    EXPECT_EQ(discarded.error().code, ocp::kInvalidInput);
}

TEST(ValueModel, NumericStorageFollowsParser)
{
    auto parsed = Json::parse(R"([-7, 18446744073709551615, 1.0])");
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(numeric_value(parsed[0]).value().storage));
    EXPECT_TRUE(std::holds_alternative<std::uint64_t>(numeric_value(parsed[1]).value().storage));
    EXPECT_TRUE(std::holds_alternative<double>(numeric_value(parsed[2]).value().storage));
    EXPECT_FALSE(numeric_value(Json("1")));
}

TEST(ValueModel, IntegralIsAPropertyOfTheValue)
{
    EXPECT_TRUE(NumericValue{.storage = 1678886400.0}.is_integral());
    EXPECT_TRUE(NumericValue{.storage = std::int64_t{3}}.is_integral());
    EXPECT_FALSE(NumericValue{.storage = 0.95}.is_integral());
    EXPECT_FALSE(NumericValue{.storage = std::numeric_limits<double>::infinity()}.is_integral());
}

TEST(ValueModel, Finiteness)
{
    EXPECT_TRUE(NumericValue{.storage = std::int64_t{0}}.is_finite());
    EXPECT_TRUE(NumericValue{.storage = 1e308}.is_finite());
    EXPECT_FALSE(NumericValue{.storage = std::numeric_limits<double>::quiet_NaN()}.is_finite());
}

TEST(ValueModel, SafeIntegerRange)
{
    EXPECT_TRUE(NumericValue{.storage = std::int64_t{9'007'199'254'740'991}}.is_safe_integer());
    EXPECT_TRUE(NumericValue{.storage = std::int64_t{-9'007'199'254'740'991}}.is_safe_integer());
    EXPECT_FALSE(NumericValue{.storage = std::int64_t{-9'007'199'254'740'992}}.is_safe_integer());
    EXPECT_FALSE(NumericValue{.storage = std::numeric_limits<std::int64_t>::min()}.is_safe_integer());
    EXPECT_FALSE(NumericValue{.storage = std::uint64_t{9'007'199'254'740'992}}.is_safe_integer());
    // Storage decides: a double is never treated as an exact integer
    EXPECT_FALSE(NumericValue{.storage = 1.0}.is_safe_integer());
}

TEST(ValueModel, KindNames)
{
    EXPECT_EQ(kind_name(ValueKind::kObject), "object");
    EXPECT_EQ(kind_name(ValueKind::kNumber), "number");
}

}  // namespace ocp::value::test
