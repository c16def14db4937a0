//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Dom/Object.h>
#include <FbxDom/Dom/ObjectProperties.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Mesh/ControlPoints.h>
#include <FbxDom/Mesh/LayerElement.h>
#include <FbxDom/Mesh/PolygonVertices.h>

namespace fbxdom::dom {

//! Geometry accessors of a `Geometry` object with the `Mesh` subclass.
/*!
 ```text
 Geometry 4242, "Cube\x00\x01Geometry", "Mesh"
   Vertices *24 { a: ... }
   PolygonVertexIndex *24 { a: 0, 1, 3, -3, ... }
   LayerElementNormal 0
     MappingInformationType "ByPolygonVertex"
     ReferenceInformationType "Direct"
     Normals *72 { a: ... }
   LayerElementUV 0
     MappingInformationType "ByPolygonVertex"
     ReferenceInformationType "IndexToDirect"
     UV *28 { a: ... }
     UVIndex *24 { a: ... }
 ```

 Every accessor decodes on demand and returns views into the document tree.
*/
class MeshHandle {
public:
  //! @return the mesh, or kInvalidObjectClass when `object` is not a
  //! `Geometry`/`Mesh` object.
  FBXDOM_DOM_NDAPI static auto FromObject(const ObjectHandle& object)
    -> Result<MeshHandle>;

  [[nodiscard]] auto Object() const noexcept -> const ObjectHandle&
  {
    return object_;
  }

  //! Positions from the `Vertices` array.
  FBXDOM_DOM_NDAPI auto GetControlPoints() const
    -> Result<mesh::ControlPoints>;

  //! Polygons decoded from `PolygonVertexIndex`, checked against the control
  //! point count.
  FBXDOM_DOM_NDAPI auto GetPolygonVertices() const
    -> Result<mesh::PolygonVertices>;

  //! The `LayerElementNormal` with the given layer index.
  FBXDOM_DOM_NDAPI auto Normals(std::size_t layer = 0) const
    -> Result<mesh::NormalLayer>;

  //! The `LayerElementUV` with the given layer index.
  FBXDOM_DOM_NDAPI auto Uvs(std::size_t layer = 0) const
    -> Result<mesh::UvLayer>;

  //! Mesh properties, with defaults from the `FbxMesh` template.
  FBXDOM_DOM_NDAPI auto Properties() const -> ObjectProperties;

private:
  explicit MeshHandle(ObjectHandle object) noexcept
    : object_(object)
  {
  }

  ObjectHandle object_;
};

} // namespace fbxdom::dom
