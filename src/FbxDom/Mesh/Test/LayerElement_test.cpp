//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Mesh/LayerElement.h>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <FbxDom/Testing/GTest.h>

using fbxdom::DomError;
using fbxdom::mesh::MappingMode;
using fbxdom::mesh::NormalLayer;
using fbxdom::mesh::ParseMappingMode;
using fbxdom::mesh::ParseReferenceMode;
using fbxdom::mesh::PolygonVertexIndex;
using fbxdom::mesh::PolygonVertices;
using fbxdom::mesh::ReferenceMode;
using fbxdom::mesh::TriangleVertexIndex;
using fbxdom::mesh::UvLayer;

namespace {

//! A quad [0 1 2 3] followed by a triangle [1 4 2], over 5 control points.
class LayerElementTest : public testing::Test {
protected:
  void SetUp() override
  {
    auto decoded = PolygonVertices::Decode(raw_, 5);
    ASSERT_TRUE(decoded.has_value());
    polygons_.emplace(std::move(*decoded));
  }

  const std::vector<std::int32_t> raw_ { 0, 1, 2, ~3, 1, 4, ~2 };
  std::optional<PolygonVertices> polygons_;
};

//! Test: mapping mode names, including the legacy spellings.
NOLINT_TEST(LayerElementModesTest, ParseMappingMode)
{
  EXPECT_EQ(ParseMappingMode("ByControlPoint"), MappingMode::kByControlPoint);
  EXPECT_EQ(ParseMappingMode("ByVertice"), MappingMode::kByControlPoint);
  EXPECT_EQ(ParseMappingMode("ByVertex"), MappingMode::kByControlPoint);
  EXPECT_EQ(ParseMappingMode("ByPolygonVertex"), MappingMode::kByPolygonVertex);
  EXPECT_EQ(ParseMappingMode("ByPolygon"), MappingMode::kByPolygon);
  EXPECT_EQ(ParseMappingMode("AllSame"), MappingMode::kAllSame);

  const auto by_edge = ParseMappingMode("ByEdge");
  ASSERT_FALSE(by_edge.has_value());
  EXPECT_EQ(by_edge.error().Kind(), DomError::kInvalidEnumValue);
}

//! Test: reference mode names, including the legacy `Index`.
NOLINT_TEST(LayerElementModesTest, ParseReferenceMode)
{
  EXPECT_EQ(ParseReferenceMode("Direct"), ReferenceMode::kDirect);
  EXPECT_EQ(ParseReferenceMode("IndexToDirect"), ReferenceMode::kIndexToDirect);
  EXPECT_EQ(ParseReferenceMode("Index"), ReferenceMode::kIndexToDirect);

  const auto bad = ParseReferenceMode("direct");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().Kind(), DomError::kInvalidEnumValue);
}

//! Test: ByControlPoint/Direct reads the value of the corner's control point.
NOLINT_TEST_F(LayerElementTest, ByControlPointDirect)
{
  // Arrange
  std::vector<double> values;
  for (int cp = 0; cp < 5; ++cp) {
    values.insert(values.end(), { static_cast<double>(cp), 0.0, 1.0 });
  }
  const auto normals = NormalLayer::Create(
    MappingMode::kByControlPoint, ReferenceMode::kDirect, values);
  ASSERT_TRUE(normals.has_value());

  // Act
  const auto at_5 = normals->At(PolygonVertexIndex { 5 }, *polygons_);

  // Assert
  ASSERT_TRUE(at_5.has_value());
  EXPECT_EQ(*at_5, glm::dvec3(4.0, 0.0, 1.0));
  EXPECT_EQ(normals->ValueCount(), 5U);
  EXPECT_EQ(normals->GetMappingMode(), MappingMode::kByControlPoint);
  EXPECT_EQ(normals->GetReferenceMode(), ReferenceMode::kDirect);
}

//! Test: ByPolygonVertex/IndexToDirect goes through the index array.
NOLINT_TEST_F(LayerElementTest, ByPolygonVertexIndexToDirect)
{
  const std::vector<double> values { 0.0, 0.0, 1.0, 0.0, 1.0, 1.0 };
  const std::vector<std::int32_t> indices { 0, 1, 2, 0, 2, 1, 0 };
  const auto uvs = UvLayer::Create(MappingMode::kByPolygonVertex,
    ReferenceMode::kIndexToDirect, values, indices);
  ASSERT_TRUE(uvs.has_value());

  EXPECT_EQ(
    uvs->At(PolygonVertexIndex { 1 }, *polygons_), glm::dvec2(1.0, 0.0));
  EXPECT_EQ(
    uvs->At(PolygonVertexIndex { 4 }, *polygons_), glm::dvec2(1.0, 1.0));
  EXPECT_EQ(
    uvs->At(PolygonVertexIndex { 6 }, *polygons_), glm::dvec2(0.0, 0.0));
}

//! Test: ByPolygon shares one value between all corners of a polygon.
NOLINT_TEST_F(LayerElementTest, ByPolygonDirect)
{
  const std::vector<double> values { 0.0, 0.0, 1.0, 0.0, 1.0, 0.0 };
  const auto normals = NormalLayer::Create(
    MappingMode::kByPolygon, ReferenceMode::kDirect, values);
  ASSERT_TRUE(normals.has_value());

  for (std::size_t v = 0; v < 4; ++v) {
    EXPECT_EQ(normals->At(PolygonVertexIndex { v }, *polygons_),
      glm::dvec3(0.0, 0.0, 1.0))
      << v;
  }
  for (std::size_t v = 4; v < 7; ++v) {
    EXPECT_EQ(normals->At(PolygonVertexIndex { v }, *polygons_),
      glm::dvec3(0.0, 1.0, 0.0))
      << v;
  }
}

//! Test: AllSame always reads the first value.
NOLINT_TEST_F(LayerElementTest, AllSame)
{
  const std::vector<double> values { 0.0, 1.0, 0.0 };
  const auto normals = NormalLayer::Create(
    MappingMode::kAllSame, ReferenceMode::kDirect, values);
  ASSERT_TRUE(normals.has_value());

  EXPECT_EQ(normals->At(PolygonVertexIndex { 0 }, *polygons_),
    glm::dvec3(0.0, 1.0, 0.0));
  EXPECT_EQ(normals->At(PolygonVertexIndex { 6 }, *polygons_),
    glm::dvec3(0.0, 1.0, 0.0));
}

//! Test: lookups through the triangulation resolve the same polygon vertex.
NOLINT_TEST_F(LayerElementTest, TriangleVertexLookup)
{
  std::vector<double> values;
  for (int pv = 0; pv < 7; ++pv) {
    values.insert(values.end(), { static_cast<double>(pv), 0.0 });
  }
  const auto uvs = UvLayer::Create(
    MappingMode::kByPolygonVertex, ReferenceMode::kDirect, values);
  ASSERT_TRUE(uvs.has_value());
  const auto tris = polygons_->Triangulate();

  // Triangle 1 of the quad is (0, 2, 3); triangle 2 is the whole triangle.
  EXPECT_EQ(uvs->At(TriangleVertexIndex { 3 }, tris), glm::dvec2(0.0, 0.0));
  EXPECT_EQ(uvs->At(TriangleVertexIndex { 4 }, tris), glm::dvec2(2.0, 0.0));
  EXPECT_EQ(uvs->At(TriangleVertexIndex { 5 }, tris), glm::dvec2(3.0, 0.0));
  EXPECT_EQ(uvs->At(TriangleVertexIndex { 8 }, tris), glm::dvec2(6.0, 0.0));

  const auto past_end = uvs->At(TriangleVertexIndex { 9 }, tris);
  ASSERT_FALSE(past_end.has_value());
  EXPECT_EQ(past_end.error().Kind(), DomError::kIndexOutOfRange);
}

//! Test: a polygon vertex outside the mesh is an index error.
NOLINT_TEST_F(LayerElementTest, PolygonVertexOutOfRange)
{
  const std::vector<double> values { 0.0, 1.0, 0.0 };
  const auto normals = NormalLayer::Create(
    MappingMode::kAllSame, ReferenceMode::kDirect, values);
  ASSERT_TRUE(normals.has_value());

  const auto result = normals->At(PolygonVertexIndex { 7 }, *polygons_);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Kind(), DomError::kIndexOutOfRange);
}

//! Test: malformed value and index arrays are reported as malformed nodes.
NOLINT_TEST_F(LayerElementTest, MalformedArrays)
{
  const std::vector<double> partial { 0.0, 1.0 };
  const auto bad_stride = NormalLayer::Create(
    MappingMode::kAllSame, ReferenceMode::kDirect, partial);
  ASSERT_FALSE(bad_stride.has_value());
  EXPECT_EQ(bad_stride.error().Kind(), DomError::kMalformedNode);

  const std::vector<double> values { 0.0, 1.0, 0.0 };
  const auto no_indices = NormalLayer::Create(
    MappingMode::kAllSame, ReferenceMode::kIndexToDirect, values);
  ASSERT_FALSE(no_indices.has_value());
  EXPECT_EQ(no_indices.error().Kind(), DomError::kMalformedNode);
}

//! Test: short direct arrays and bad indices fail at lookup time.
NOLINT_TEST_F(LayerElementTest, ReferencesOutsideArrays)
{
  const std::vector<double> values { 0.0, 1.0, 0.0 };
  const std::vector<std::int32_t> indices { 0, -1, 5 };
  const auto normals = NormalLayer::Create(MappingMode::kByPolygonVertex,
    ReferenceMode::kIndexToDirect, values, indices);
  ASSERT_TRUE(normals.has_value());

  EXPECT_TRUE(normals->At(PolygonVertexIndex { 0 }, *polygons_).has_value());

  const auto negative = normals->At(PolygonVertexIndex { 1 }, *polygons_);
  ASSERT_FALSE(negative.has_value());
  EXPECT_EQ(negative.error().Kind(), DomError::kMalformedNode);

  const auto past_values = normals->At(PolygonVertexIndex { 2 }, *polygons_);
  ASSERT_FALSE(past_values.has_value());
  EXPECT_EQ(past_values.error().Kind(), DomError::kMalformedNode);

  const auto past_indices = normals->At(PolygonVertexIndex { 3 }, *polygons_);
  ASSERT_FALSE(past_indices.has_value());
  EXPECT_EQ(past_indices.error().Kind(), DomError::kMalformedNode);
}

} // namespace
