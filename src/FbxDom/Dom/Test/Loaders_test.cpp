//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Dom/Loaders.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <FbxDom/Dom/Test/TreeFixtures.h>
#include <FbxDom/Testing/GTest.h>

using fbxdom::DomError;
using fbxdom::NumericConversion;
using fbxdom::dom::Bytes;
using fbxdom::dom::PrimitiveLoader;
using fbxdom::dom::PropertiesHandle;
using fbxdom::dom::PropertiesNodeId;
using fbxdom::dom::PropertyHandle;
using fbxdom::dom::Vec3Loader;
using fbxdom::tree::AttributeValue;
using fbxdom::tree::NodeId;
using fbxdom::tree::Tree;
using fbxdom::tree::TreeBuilder;

namespace fixtures = fbxdom::dom::testing;

namespace {

//! One property node per stored attribute type.
class LoadersTest : public testing::Test {
protected:
  void SetUp() override
  {
    TreeBuilder builder;
    props_ = builder.AddNode(builder.Root(), "Properties70");
    const auto add = [&](const char* key, AttributeValue value) {
      fixtures::AddProperty(builder, props_, key, "", "", { std::move(value) });
    };
    add("Bool", AttributeValue(true));
    add("I16", AttributeValue(std::int16_t { -7 }));
    add("I32", AttributeValue(std::int32_t { 70000 }));
    add("I64", AttributeValue(std::int64_t { 1 } << 40));
    add("NegI32", AttributeValue(std::int32_t { -1 }));
    add("F32", AttributeValue(0.5F));
    add("F64", AttributeValue(2.54));
    add("String", AttributeValue("text"));
    add("Bytes", AttributeValue(Bytes { std::byte { 1 }, std::byte { 2 } }));
    fixtures::AddProperty(builder, props_, "Empty", "Compound", "", {});
    fixtures::AddProperty(builder, props_, "Color", "ColorRGB", "Color",
      { AttributeValue(0.25), AttributeValue(0.5F), AttributeValue(1.0) });
    fixtures::AddProperty(builder, props_, "IntVector", "Vector3D", "Vector",
      { AttributeValue(std::int32_t { 1 }), AttributeValue(0.0),
        AttributeValue(0.0) });
    tree_ = std::make_unique<Tree>(std::move(builder).Build());
  }

  [[nodiscard]] auto Get(const char* key) const -> PropertyHandle
  {
    const auto property
      = PropertiesHandle(*tree_, PropertiesNodeId { props_ }).Get(key);
    EXPECT_TRUE(property.has_value()) << key;
    return *property;
  }

  std::unique_ptr<Tree> tree_;
  NodeId props_;
};

//! Test: every primitive type loads from its own attribute type.
NOLINT_TEST_F(LoadersTest, ExactTypes)
{
  const PrimitiveLoader<bool> as_bool { NumericConversion::kExact };
  const PrimitiveLoader<std::int16_t> as_i16 { NumericConversion::kExact };
  const PrimitiveLoader<std::int32_t> as_i32 { NumericConversion::kExact };
  const PrimitiveLoader<std::int64_t> as_i64 { NumericConversion::kExact };
  const PrimitiveLoader<float> as_f32 { NumericConversion::kExact };
  const PrimitiveLoader<double> as_f64 { NumericConversion::kExact };
  const PrimitiveLoader<std::string> as_string { NumericConversion::kExact };
  const PrimitiveLoader<Bytes> as_bytes { NumericConversion::kExact };

  EXPECT_EQ(Get("Bool").Value(as_bool), true);
  EXPECT_EQ(Get("I16").Value(as_i16), -7);
  EXPECT_EQ(Get("I32").Value(as_i32), 70000);
  EXPECT_EQ(Get("I64").Value(as_i64), std::int64_t { 1 } << 40);
  EXPECT_EQ(Get("F32").Value(as_f32), 0.5F);
  EXPECT_EQ(Get("F64").Value(as_f64), 2.54);
  EXPECT_EQ(Get("String").Value(as_string), "text");
  EXPECT_EQ(Get("Bytes").Value(as_bytes),
    (Bytes { std::byte { 1 }, std::byte { 2 } }));
}

//! Test: the exact policy rejects any other attribute type.
NOLINT_TEST_F(LoadersTest, ExactRejectsWidening)
{
  const PrimitiveLoader<std::int64_t> as_i64 { NumericConversion::kExact };
  const PrimitiveLoader<double> as_f64 { NumericConversion::kExact };
  const PrimitiveLoader<std::uint32_t> as_u32 { NumericConversion::kExact };

  const auto widened = Get("I32").Value(as_i64);
  ASSERT_FALSE(widened.has_value());
  EXPECT_EQ(widened.error().Kind(), DomError::kPropertyTypeMismatch);
  EXPECT_THAT(widened.error().Message(), testing::HasSubstr("`I32`"));
  EXPECT_THAT(widened.error().Message(), testing::HasSubstr("i32"));
  EXPECT_THAT(widened.error().Message(), testing::HasSubstr("int64"));

  EXPECT_FALSE(Get("F32").Value(as_f64).has_value());
  EXPECT_FALSE(Get("I32").Value(as_u32).has_value());
}

//! Test: the lossless policy widens integers that fit and f32 to double.
NOLINT_TEST_F(LoadersTest, LosslessWidening)
{
  EXPECT_EQ(Get("I16").Value(PrimitiveLoader<std::int64_t> {}), -7);
  EXPECT_EQ(Get("I32").Value(PrimitiveLoader<std::int64_t> {}), 70000);
  EXPECT_EQ(Get("I32").Value(PrimitiveLoader<std::uint32_t> {}), 70000U);
  EXPECT_EQ(Get("I64").Value(PrimitiveLoader<std::uint64_t> {}),
    std::uint64_t { 1 } << 40);
  EXPECT_EQ(Get("F32").Value(PrimitiveLoader<double> {}), 0.5);
}

//! Test: the lossless policy still rejects values that do not fit.
NOLINT_TEST_F(LoadersTest, LosslessRejectsNarrowing)
{
  const auto too_big = Get("I32").Value(PrimitiveLoader<std::int16_t> {});
  ASSERT_FALSE(too_big.has_value());
  EXPECT_EQ(too_big.error().Kind(), DomError::kPropertyTypeMismatch);

  const auto negative = Get("NegI32").Value(PrimitiveLoader<std::uint64_t> {});
  ASSERT_FALSE(negative.has_value());
  EXPECT_EQ(negative.error().Kind(), DomError::kPropertyTypeMismatch);

  EXPECT_FALSE(Get("F64").Value(PrimitiveLoader<float> {}).has_value());
}

//! Test: integers and floating point never convert into each other.
NOLINT_TEST_F(LoadersTest, NoIntegerFloatConversion)
{
  EXPECT_FALSE(Get("I32").Value(PrimitiveLoader<double> {}).has_value());
  EXPECT_FALSE(Get("F64").Value(PrimitiveLoader<std::int64_t> {}).has_value());
  EXPECT_FALSE(Get("Bool").Value(PrimitiveLoader<std::int32_t> {}).has_value());
  EXPECT_FALSE(Get("I32").Value(PrimitiveLoader<bool> {}).has_value());
  EXPECT_FALSE(Get("String").Value(PrimitiveLoader<Bytes> {}).has_value());
}

//! Test: a primitive load needs exactly one value attribute.
NOLINT_TEST_F(LoadersTest, PrimitiveArity)
{
  const auto empty = Get("Empty").Value(PrimitiveLoader<std::int32_t> {});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().Kind(), DomError::kPropertyTypeMismatch);

  EXPECT_FALSE(Get("Color").Value(PrimitiveLoader<double> {}).has_value());
}

//! Test: three floating point values load as a vector.
NOLINT_TEST_F(LoadersTest, Vec3)
{
  EXPECT_EQ(Get("Color").Value(Vec3Loader {}), glm::dvec3(0.25, 0.5, 1.0));

  const auto exact
    = Get("Color").Value(Vec3Loader { NumericConversion::kExact });
  ASSERT_FALSE(exact.has_value());
  EXPECT_EQ(exact.error().Kind(), DomError::kPropertyTypeMismatch);

  EXPECT_FALSE(Get("IntVector").Value(Vec3Loader {}).has_value());
  EXPECT_FALSE(Get("F64").Value(Vec3Loader {}).has_value());
}

} // namespace
