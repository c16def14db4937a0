//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <optional>

#include <FbxDom/Mesh/Indices.h>
#include <FbxDom/Mesh/PolygonVertices.h>
#include <FbxDom/Mesh/TriangleVertices.h>

//! @file Conversions.h
//! Cross-space conversions, as ADL-visible free functions plus concepts.
/*!
 Generic code that needs "something that leads to a control point" or
 "something that leads to a polygon vertex" constrains on the concepts below
 instead of on a concrete index type:

 ```cpp
 template <IntoCpiWithTriVert V>
 auto Position(const V& v, const TriangleVertices& tris,
   const ControlPoints& points) -> std::optional<glm::dvec3>
 {
   const auto cpi = IntoCpi(v, tris);
   return cpi ? points.Get(*cpi) : std::nullopt;
 }
 ```

 Conversions of a PolygonVertex are total: the triple already names its
 control point. Conversions of bare indices are bounds-checked and yield
 nullopt for indices outside the mesh.
*/

namespace fbxdom::mesh {

//! @{
//! Polygon vertex space to control point space.
[[nodiscard]] inline auto IntoCpi(const PolygonVertex& vertex,
  const PolygonVertices& /*polygon_vertices*/) noexcept
  -> std::optional<ControlPointIndex>
{
  return vertex.control_point;
}

[[nodiscard]] inline auto IntoCpi(const PolygonVertexIndex vertex,
  const PolygonVertices& polygon_vertices) noexcept
  -> std::optional<ControlPointIndex>
{
  return polygon_vertices.ControlPointOf(vertex);
}
//! @}

//! Triangle vertex space to polygon vertex space.
[[nodiscard]] inline auto IntoPv(const TriangleVertexIndex vertex,
  const TriangleVertices& triangle_vertices) noexcept
  -> std::optional<PolygonVertexIndex>
{
  return triangle_vertices.ToPolygonVertex(vertex);
}

//! Triangle vertex space to control point space.
[[nodiscard]] inline auto IntoCpi(const TriangleVertexIndex vertex,
  const TriangleVertices& triangle_vertices) noexcept
  -> std::optional<ControlPointIndex>
{
  return triangle_vertices.ToControlPoint(vertex);
}

//! A value that can name a control point given the polygon vertices.
template <typename T>
concept IntoCpiWithPolyVert
  = requires(const T& value, const PolygonVertices& polygon_vertices) {
      {
        IntoCpi(value, polygon_vertices)
      } -> std::same_as<std::optional<ControlPointIndex>>;
    };

//! A value that can name a polygon vertex given the triangle vertices.
template <typename T>
concept IntoPvWithTriVert
  = requires(const T& value, const TriangleVertices& triangle_vertices) {
      {
        IntoPv(value, triangle_vertices)
      } -> std::same_as<std::optional<PolygonVertexIndex>>;
    };

//! A value that can name a control point given the triangle vertices.
template <typename T>
concept IntoCpiWithTriVert
  = requires(const T& value, const TriangleVertices& triangle_vertices) {
      {
        IntoCpi(value, triangle_vertices)
      } -> std::same_as<std::optional<ControlPointIndex>>;
    };

static_assert(IntoCpiWithPolyVert<PolygonVertex>);
static_assert(IntoCpiWithPolyVert<PolygonVertexIndex>);
static_assert(!IntoCpiWithPolyVert<ControlPointIndex>);
static_assert(IntoPvWithTriVert<TriangleVertexIndex>);
static_assert(!IntoPvWithTriVert<PolygonVertexIndex>);
static_assert(IntoCpiWithTriVert<TriangleVertexIndex>);
static_assert(!IntoCpiWithTriVert<PolygonVertexIndex>);

} // namespace fbxdom::mesh
