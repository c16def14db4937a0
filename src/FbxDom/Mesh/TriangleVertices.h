//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include <FbxDom/Mesh/Indices.h>
#include <FbxDom/Mesh/api_export.h>

namespace fbxdom::mesh {

class PolygonVertices;

//! Fan triangulation of a mesh's polygons, computed on demand.
/*!
 A polygon with corners `v0 .. v(n-1)` yields `n - 2` triangles; triangle `k`
 of that polygon is `(v0, v(k+1), v(k+2))`. Triangles are numbered polygon by
 polygon, and triangle vertex `t` is corner `t % 3` of triangle `t / 3`.

 Nothing is materialized: since polygon `p` contributes `n_p - 2` triangles,
 its first triangle is `start(p) - 2 * p` where `start(p)` is its first
 polygon vertex. Every conversion is arithmetic over the polygon boundary
 table of the underlying PolygonVertices, plus a binary search to find the
 polygon owning a triangle.

 @warning The fan is only a valid triangulation of convex polygons. Concave
 polygons yield overlapping or inverted triangles; the index mapping is kept
 as-is regardless.

 @note This view borrows the PolygonVertices it was created from.
*/
class TriangleVertices {
public:
  FBXDOM_MESH_API explicit TriangleVertices(
    const PolygonVertices& polygon_vertices) noexcept;

  [[nodiscard]] auto GetPolygonVertices() const noexcept
    -> const PolygonVertices&
  {
    return *polygon_vertices_;
  }

  FBXDOM_MESH_NDAPI auto TriangleCount() const noexcept -> std::size_t;

  [[nodiscard]] auto TriangleVertexCount() const noexcept -> std::size_t
  {
    return TriangleCount() * 3;
  }

  //! Polygon from which `triangle` was cut.
  FBXDOM_MESH_NDAPI auto PolygonOf(TriangleIndex triangle) const noexcept
    -> std::optional<PolygonIndex>;

  //! Triangles cut from `polygon`, in fan order. Empty if out of range.
  FBXDOM_MESH_NDAPI auto TrianglesOf(PolygonIndex polygon) const
    -> std::vector<TriangleIndex>;

  FBXDOM_MESH_NDAPI auto TriangleOf(TriangleVertexIndex vertex) const noexcept
    -> std::optional<TriangleIndex>;

  //! The three triangle vertex indices of `triangle`.
  FBXDOM_MESH_NDAPI auto CornersOf(TriangleIndex triangle) const noexcept
    -> std::optional<std::array<TriangleVertexIndex, 3>>;

  FBXDOM_MESH_NDAPI auto ToPolygonVertex(
    TriangleVertexIndex vertex) const noexcept
    -> std::optional<PolygonVertexIndex>;

  FBXDOM_MESH_NDAPI auto ToControlPoint(
    TriangleVertexIndex vertex) const noexcept
    -> std::optional<ControlPointIndex>;

  //! Bounds-checked conversion of an external integer into this space.
  FBXDOM_MESH_NDAPI auto ToTriangleVertexIndex(std::size_t raw) const noexcept
    -> std::optional<TriangleVertexIndex>;

  //! Bounds-checked conversion of an external integer into triangle space.
  FBXDOM_MESH_NDAPI auto ToTriangleIndex(std::size_t raw) const noexcept
    -> std::optional<TriangleIndex>;

private:
  //! Index of the first triangle of polygon `p`. Also valid for
  //! `p == PolygonCount()`, where it equals TriangleCount().
  [[nodiscard]] auto FirstTriangleOf(std::size_t p) const noexcept
    -> std::size_t;

  const PolygonVertices* polygon_vertices_;
};

} // namespace fbxdom::mesh
