//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <ranges>

#include <FbxDom/Mesh/PolygonVertices.h>
#include <FbxDom/Mesh/TriangleVertices.h>

using fbxdom::mesh::ControlPointIndex;
using fbxdom::mesh::PolygonIndex;
using fbxdom::mesh::PolygonVertexIndex;
using fbxdom::mesh::TriangleIndex;
using fbxdom::mesh::TriangleVertexIndex;
using fbxdom::mesh::TriangleVertices;

TriangleVertices::TriangleVertices(
  const PolygonVertices& polygon_vertices) noexcept
  : polygon_vertices_(&polygon_vertices)
{
}

auto TriangleVertices::FirstTriangleOf(const std::size_t p) const noexcept
  -> std::size_t
{
  return polygon_vertices_->StartOf(p) - 2 * p;
}

auto TriangleVertices::TriangleCount() const noexcept -> std::size_t
{
  return FirstTriangleOf(polygon_vertices_->PolygonCount());
}

auto TriangleVertices::PolygonOf(const TriangleIndex triangle) const noexcept
  -> std::optional<PolygonIndex>
{
  if (triangle.get() >= TriangleCount()) {
    return std::nullopt;
  }
  // Every polygon has at least one triangle, so FirstTriangleOf is strictly
  // increasing and the owner is the last polygon starting at or before it.
  const auto polygons
    = std::views::iota(std::size_t { 0 }, polygon_vertices_->PolygonCount());
  const auto next = std::ranges::partition_point(polygons,
    [&](const std::size_t p) { return FirstTriangleOf(p) <= triangle.get(); });
  const auto owners = std::ranges::distance(polygons.begin(), next);
  return PolygonIndex { static_cast<std::size_t>(owners - 1) };
}

auto TriangleVertices::TrianglesOf(const PolygonIndex polygon) const
  -> std::vector<TriangleIndex>
{
  std::vector<TriangleIndex> triangles;
  if (polygon.get() >= polygon_vertices_->PolygonCount()) {
    return triangles;
  }
  const auto begin = FirstTriangleOf(polygon.get());
  const auto end = FirstTriangleOf(polygon.get() + 1);
  triangles.reserve(end - begin);
  for (auto t = begin; t < end; ++t) {
    triangles.emplace_back(t);
  }
  return triangles;
}

auto TriangleVertices::TriangleOf(
  const TriangleVertexIndex vertex) const noexcept
  -> std::optional<TriangleIndex>
{
  if (vertex.get() >= TriangleVertexCount()) {
    return std::nullopt;
  }
  return TriangleIndex { vertex.get() / 3 };
}

auto TriangleVertices::CornersOf(const TriangleIndex triangle) const noexcept
  -> std::optional<std::array<TriangleVertexIndex, 3>>
{
  if (triangle.get() >= TriangleCount()) {
    return std::nullopt;
  }
  const auto base = triangle.get() * 3;
  return std::array {
    TriangleVertexIndex { base },
    TriangleVertexIndex { base + 1 },
    TriangleVertexIndex { base + 2 },
  };
}

auto TriangleVertices::ToPolygonVertex(
  const TriangleVertexIndex vertex) const noexcept
  -> std::optional<PolygonVertexIndex>
{
  const auto triangle = TriangleOf(vertex);
  if (!triangle) {
    return std::nullopt;
  }
  const auto polygon = PolygonOf(*triangle);
  if (!polygon) {
    return std::nullopt;
  }

  const auto local_triangle = triangle->get() - FirstTriangleOf(polygon->get());
  const auto corner = vertex.get() % 3;
  const auto first_vertex = polygon_vertices_->StartOf(polygon->get());
  // Corner 0 is the fan apex; corners 1 and 2 walk along the boundary.
  const auto offset = corner == 0 ? 0 : local_triangle + corner;
  return PolygonVertexIndex { first_vertex + offset };
}

auto TriangleVertices::ToControlPoint(
  const TriangleVertexIndex vertex) const noexcept
  -> std::optional<ControlPointIndex>
{
  const auto polygon_vertex = ToPolygonVertex(vertex);
  if (!polygon_vertex) {
    return std::nullopt;
  }
  return polygon_vertices_->ControlPointOf(*polygon_vertex);
}

auto TriangleVertices::ToTriangleVertexIndex(
  const std::size_t raw) const noexcept -> std::optional<TriangleVertexIndex>
{
  if (raw >= TriangleVertexCount()) {
    return std::nullopt;
  }
  return TriangleVertexIndex { raw };
}

auto TriangleVertices::ToTriangleIndex(const std::size_t raw) const noexcept
  -> std::optional<TriangleIndex>
{
  if (raw >= TriangleCount()) {
    return std::nullopt;
  }
  return TriangleIndex { raw };
}
