//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Dom/MeshHandle.h>

#include <cstdint>
#include <memory>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <FbxDom/Dom/Document.h>
#include <FbxDom/Dom/Test/TreeFixtures.h>
#include <FbxDom/Testing/GTest.h>

using fbxdom::DomError;
using fbxdom::dom::Document;
using fbxdom::dom::MeshHandle;
using fbxdom::dom::ObjectId;
using fbxdom::mesh::ControlPointIndex;
using fbxdom::mesh::MappingMode;
using fbxdom::mesh::PolygonIndex;
using fbxdom::mesh::PolygonVertexIndex;
using fbxdom::mesh::ReferenceMode;
using fbxdom::testing::FailsWith;
using fbxdom::tree::AttributeValue;
using fbxdom::tree::TreeBuilder;

namespace fixtures = fbxdom::dom::testing;

namespace {

//! A quad and a triangle sharing an edge, with one normal and one UV layer.
class MeshHandleTest : public testing::Test {
protected:
  void SetUp() override
  {
    TreeBuilder builder;
    const auto definitions = builder.AddNode(builder.Root(), "Definitions");
    const auto defaults
      = fixtures::AddTemplate(builder, definitions, "Geometry", "FbxMesh");
    fixtures::AddIntProperty(builder, defaults, "Smoothness", 2);
    fixtures::AddIntProperty(builder, defaults, "BBoxMin", 0);

    const auto objects = builder.AddNode(builder.Root(), "Objects");
    const auto mesh = fixtures::AddMesh(builder, objects, 10, "Quad",
      { 0, 0, 0, 1, 0, 0, 1, 1, 0, 0, 1, 0, 2, 0, 0 },
      { 0, 1, 2, -4, 1, 4, -3 });
    const auto props = builder.AddNode(mesh, "Properties70");
    fixtures::AddIntProperty(builder, props, "Smoothness", 0);

    // One normal per polygon vertex: +Z for the quad, -Z for the triangle.
    fixtures::AddLayerElement(builder, mesh, "LayerElementNormal", 0,
      "ByPolygonVertex", "Direct", "Normals",
      { 0, 0, 1, 0, 0, 1, 0, 0, 1, 0, 0, 1, 0, 0, -1, 0, 0, -1, 0, 0, -1 });
    // Two UVs shared through an index per control point.
    const auto uv = fixtures::AddLayerElement(builder, mesh, "LayerElementUV",
      0, "ByVertice", "IndexToDirect", "UV", { 0, 0, 1, 1 });
    builder.AddNode(uv, "UVIndex",
      { AttributeValue(std::vector<std::int32_t> { 0, 1, 1, 0, 1 }) });

    fixtures::AddObject(builder, objects, 11, "Model", "QuadNode", "Mesh");
    const auto broken = fixtures::AddMesh(
      builder, objects, 12, "Broken", { 0, 0, 0, 1, 0, 0 }, { 0, 1, 5, -1 });
    fixtures::AddLayerElement(builder, broken, "LayerElementNormal", 0,
      "ByPolygon", "Sideways", "Normals", { 0, 0, 1 });
    fixtures::AddObject(builder, objects, 13, "Geometry", "Empty", "Mesh");

    auto document = Document::FromTree(std::move(builder).Build());
    ASSERT_TRUE(document.has_value());
    document_ = std::move(*document);
  }

  [[nodiscard]] auto Mesh(const std::int64_t id) const -> MeshHandle
  {
    const auto object = document_->ObjectById(ObjectId { id });
    EXPECT_TRUE(object.has_value());
    auto mesh = MeshHandle::FromObject(*object);
    EXPECT_TRUE(mesh.has_value());
    return *mesh;
  }

  std::unique_ptr<Document> document_;
};

//! Test: only Geometry objects with the Mesh subclass are meshes.
NOLINT_TEST_F(MeshHandleTest, RequiresGeometryMesh)
{
  const auto model = document_->ObjectById(ObjectId { 11 });
  ASSERT_TRUE(model.has_value());

  const auto mesh = MeshHandle::FromObject(*model);

  ASSERT_FALSE(mesh.has_value());
  EXPECT_EQ(mesh.error().Kind(), DomError::kInvalidObjectClass);
}

//! Test: control points come from the Vertices array.
NOLINT_TEST_F(MeshHandleTest, ControlPoints)
{
  const auto points = Mesh(10).GetControlPoints();

  ASSERT_TRUE(points.has_value());
  EXPECT_EQ(points->Count(), 5U);
  EXPECT_EQ(points->Get(ControlPointIndex { 4 }), glm::dvec3(2.0, 0.0, 0.0));
}

//! Test: polygons are decoded from PolygonVertexIndex.
NOLINT_TEST_F(MeshHandleTest, PolygonVertices)
{
  const auto polygons = Mesh(10).GetPolygonVertices();

  ASSERT_TRUE(polygons.has_value());
  EXPECT_EQ(polygons->PolygonCount(), 2U);
  EXPECT_EQ(polygons->PolygonVertexCount(), 7U);
  EXPECT_EQ(polygons->VertexCountOf(PolygonIndex { 0 }), 4U);
  EXPECT_EQ(polygons->ControlPointOf(PolygonVertexIndex { 5 }),
    ControlPointIndex { 4 });
  EXPECT_EQ(polygons->Triangulate().TriangleCount(), 3U);
}

//! Test: normals resolve per polygon vertex and per triangle corner.
NOLINT_TEST_F(MeshHandleTest, Normals)
{
  const auto mesh = Mesh(10);
  const auto polygons = mesh.GetPolygonVertices();
  ASSERT_TRUE(polygons.has_value());

  const auto normals = mesh.Normals();

  ASSERT_TRUE(normals.has_value());
  EXPECT_EQ(normals->GetMappingMode(), MappingMode::kByPolygonVertex);
  EXPECT_EQ(normals->GetReferenceMode(), ReferenceMode::kDirect);
  EXPECT_EQ(normals->At(PolygonVertexIndex { 0 }, *polygons),
    glm::dvec3(0.0, 0.0, 1.0));
  EXPECT_EQ(normals->At(PolygonVertexIndex { 6 }, *polygons),
    glm::dvec3(0.0, 0.0, -1.0));
}

//! Test: UVs resolve through the index array by control point.
NOLINT_TEST_F(MeshHandleTest, Uvs)
{
  const auto mesh = Mesh(10);
  const auto polygons = mesh.GetPolygonVertices();
  ASSERT_TRUE(polygons.has_value());

  const auto uvs = mesh.Uvs();

  ASSERT_TRUE(uvs.has_value());
  EXPECT_EQ(uvs->GetMappingMode(), MappingMode::kByControlPoint);
  EXPECT_EQ(uvs->ValueCount(), 2U);
  // Polygon vertex 5 is control point 4, which maps to UV 1.
  EXPECT_EQ(uvs->At(PolygonVertexIndex { 5 }, *polygons), glm::dvec2(1.0, 1.0));
  EXPECT_EQ(uvs->At(PolygonVertexIndex { 3 }, *polygons), glm::dvec2(0.0, 0.0));
}

//! Test: a layer index the mesh does not have is a kNodeNotFound.
NOLINT_TEST_F(MeshHandleTest, MissingLayer)
{
  const auto mesh = Mesh(10);

  const auto second = mesh.Normals(1);
  const auto none = Mesh(13).Uvs();

  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().Kind(), DomError::kNodeNotFound);
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error().Kind(), DomError::kNodeNotFound);
}

//! Test: malformed geometry is reported by the accessor that reads it.
NOLINT_TEST_F(MeshHandleTest, MalformedGeometry)
{
  const auto broken = Mesh(12);
  const auto empty = Mesh(13);

  EXPECT_THAT(broken.GetPolygonVertices(),
    FailsWith(DomError::kMalformedIndexBuffer));
  EXPECT_THAT(broken.Normals(), FailsWith(DomError::kInvalidEnumValue));
  EXPECT_THAT(empty.GetControlPoints(), FailsWith(DomError::kNodeNotFound));
}

//! Test: mesh properties fall back to the FbxMesh template.
NOLINT_TEST_F(MeshHandleTest, Properties)
{
  const auto props = Mesh(10).Properties();

  EXPECT_TRUE(props.HasDirect());
  EXPECT_TRUE(props.HasDefaults());
  EXPECT_EQ(props.Value<std::int32_t>("Smoothness"), 0);
  EXPECT_EQ(props.Value<std::int32_t>("BBoxMin"), 0);
}

} // namespace
