//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Mesh/Indices.h>
#include <FbxDom/Mesh/api_export.h>

namespace fbxdom::mesh {

class TriangleVertices;

//! Polygons of a mesh, decoded from the wire's sign-encoded index buffer.
/*!
 On the wire, a mesh's polygons are one flat `int32` buffer of control point
 indices. The last corner of every polygon is stored as the bitwise complement
 of its control point index, which makes it the only negative entry of the
 polygon and marks the boundary:

 ```text
 raw:      0  1  2  ~3   4  5  ~6
 decoded: [0, 1, 2, 3] [4, 5, 6]
 ```

 Decoding happens once; afterwards all queries are O(1) or O(log n) against
 the table of polygon start offsets. Decoded control point indices are stored
 in polygon vertex order, so a PolygonVertexIndex is an offset into that
 sequence.

 @see TriangleVertices for the fan triangulation derived from this view.
*/
class PolygonVertices {
public:
  //! Decodes a raw `PolygonVertexIndex` buffer.
  /*!
   @param raw The wire buffer, unmodified.
   @param control_point_count When known, every decoded control point index
          is checked against it.
   @return the decoded polygons, or a kMalformedIndexBuffer error when the
           buffer does not end on a polygon boundary, a polygon has fewer than
           3 vertices, or a control point index is out of range.
  */
  FBXDOM_MESH_NDAPI static auto Decode(std::span<const std::int32_t> raw,
    std::optional<std::size_t> control_point_count = std::nullopt)
    -> Result<PolygonVertices>;

  [[nodiscard]] auto PolygonCount() const noexcept -> std::size_t
  {
    return polygon_starts_.size() - 1;
  }

  [[nodiscard]] auto PolygonVertexCount() const noexcept -> std::size_t
  {
    return control_points_.size();
  }

  //! Decoded control point indices, in polygon vertex order.
  [[nodiscard]] auto ControlPointIndices() const noexcept
    -> std::span<const ControlPointIndex>
  {
    return control_points_;
  }

  //! Corners of a polygon, in winding order.
  /*!
   Empty when `polygon` is out of range; a decoded polygon always has at least
   3 vertices.
  */
  FBXDOM_MESH_NDAPI auto VerticesOf(PolygonIndex polygon) const
    -> std::vector<PolygonVertex>;

  //! Polygon vertex index of the first corner of `polygon`.
  FBXDOM_MESH_NDAPI auto FirstVertexOf(PolygonIndex polygon) const noexcept
    -> std::optional<PolygonVertexIndex>;

  FBXDOM_MESH_NDAPI auto VertexCountOf(PolygonIndex polygon) const noexcept
    -> std::optional<std::size_t>;

  FBXDOM_MESH_NDAPI auto ControlPointOf(
    PolygonVertexIndex vertex) const noexcept
    -> std::optional<ControlPointIndex>;

  //! Polygon that owns `vertex`, found by binary search over the boundaries.
  FBXDOM_MESH_NDAPI auto PolygonOf(PolygonVertexIndex vertex) const noexcept
    -> std::optional<PolygonIndex>;

  FBXDOM_MESH_NDAPI auto VertexAt(PolygonVertexIndex vertex) const noexcept
    -> std::optional<PolygonVertex>;

  //! Bounds-checked conversion of an external integer into this space.
  FBXDOM_MESH_NDAPI auto ToPolygonVertexIndex(std::size_t raw) const noexcept
    -> std::optional<PolygonVertexIndex>;

  //! Bounds-checked conversion of an external integer into polygon space.
  FBXDOM_MESH_NDAPI auto ToPolygonIndex(std::size_t raw) const noexcept
    -> std::optional<PolygonIndex>;

  //! Fan triangulation view over these polygons.
  /*!
   The returned view refers to this object, which must outlive it.
  */
  FBXDOM_MESH_NDAPI auto Triangulate() const noexcept -> TriangleVertices;

private:
  PolygonVertices(std::vector<ControlPointIndex> control_points,
    std::vector<std::size_t> polygon_starts) noexcept;

  friend class TriangleVertices;

  //! Offset of the first polygon vertex of polygon `p`; entry
  //! `PolygonCount()` is one past the last polygon vertex.
  [[nodiscard]] auto StartOf(std::size_t p) const noexcept -> std::size_t
  {
    return polygon_starts_[p];
  }

  std::vector<ControlPointIndex> control_points_;
  std::vector<std::size_t> polygon_starts_;
};

} // namespace fbxdom::mesh
