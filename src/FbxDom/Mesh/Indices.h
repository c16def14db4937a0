//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

#include <FbxDom/Base/NamedType.h>

//! @file Indices.h
//! Strong index types, one per mesh index space.
/*!
 A mesh is addressed through several index spaces that are all plain integers
 on the wire:

 - control point space: one entry per vertex position,
 - polygon vertex space: one entry per (polygon, corner) pair, in file order,
 - polygon space: one entry per polygon,
 - triangle and triangle vertex space: the fan triangulation derived from the
   polygons, three triangle vertices per triangle.

 Each space gets its own NamedType so that an index from one space cannot be
 passed where another is expected. Converting between spaces always goes
 through PolygonVertices or TriangleVertices.
*/

namespace fbxdom::mesh {

using ControlPointIndex = NamedType<std::size_t, struct ControlPointIndexTag,
  Comparable, Hashable, Printable>;

using PolygonVertexIndex = NamedType<std::size_t,
  struct PolygonVertexIndexTag, Comparable, Hashable, Printable>;

using PolygonIndex = NamedType<std::size_t, struct PolygonIndexTag, Comparable,
  Hashable, Printable>;

using TriangleIndex = NamedType<std::size_t, struct TriangleIndexTag,
  Comparable, Hashable, Printable>;

using TriangleVertexIndex = NamedType<std::size_t,
  struct TriangleVertexIndexTag, Comparable, Hashable, Printable>;

//! One corner of one polygon, with the control point it refers to.
struct PolygonVertex {
  PolygonVertexIndex index;
  PolygonIndex polygon;
  ControlPointIndex control_point;

  friend auto operator==(const PolygonVertex&, const PolygonVertex&) -> bool
    = default;
};

} // namespace fbxdom::mesh
