//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <span>

#include <glm/vec3.hpp>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Mesh/Indices.h>
#include <FbxDom/Mesh/api_export.h>

namespace fbxdom::mesh {

//! Non-owning view of a mesh's vertex positions.
/*!
 Wraps the flat `x0 y0 z0 x1 y1 z1 ...` coordinate array of a mesh. The array
 is owned by the document tree and must outlive this view.
*/
class ControlPoints {
public:
  //! Wraps a flat coordinate array.
  /*!
   @return the view, or a kMalformedNode error if the number of coordinates is
   not a multiple of 3.
  */
  FBXDOM_MESH_NDAPI static auto FromCoordinates(
    std::span<const double> coordinates) -> Result<ControlPoints>;

  [[nodiscard]] auto Count() const noexcept -> std::size_t
  {
    return coordinates_.size() / 3;
  }

  //! Position of a control point, or nullopt when `index` is out of range.
  FBXDOM_MESH_NDAPI auto Get(ControlPointIndex index) const noexcept
    -> std::optional<glm::dvec3>;

  //! Bounds-checked conversion of an external integer into this space.
  FBXDOM_MESH_NDAPI auto ToControlPointIndex(std::size_t raw) const noexcept
    -> std::optional<ControlPointIndex>;

  [[nodiscard]] auto Coordinates() const noexcept -> std::span<const double>
  {
    return coordinates_;
  }

private:
  explicit ControlPoints(std::span<const double> coordinates) noexcept
    : coordinates_(coordinates)
  {
  }

  std::span<const double> coordinates_;
};

} // namespace fbxdom::mesh
