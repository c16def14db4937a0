//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Mesh/ControlPoints.h>

using fbxdom::mesh::ControlPointIndex;
using fbxdom::mesh::ControlPoints;

auto ControlPoints::FromCoordinates(const std::span<const double> coordinates)
  -> Result<ControlPoints>
{
  if (coordinates.size() % 3 != 0) {
    return MakeError(DomError::kMalformedNode,
      "control point coordinates must come in triples, but got {} values",
      coordinates.size());
  }
  return ControlPoints(coordinates);
}

auto ControlPoints::Get(const ControlPointIndex index) const noexcept
  -> std::optional<glm::dvec3>
{
  if (index.get() >= Count()) {
    return std::nullopt;
  }
  const auto base = index.get() * 3;
  return glm::dvec3(
    coordinates_[base], coordinates_[base + 1], coordinates_[base + 2]);
}

auto ControlPoints::ToControlPointIndex(const std::size_t raw) const noexcept
  -> std::optional<ControlPointIndex>
{
  if (raw >= Count()) {
    return std::nullopt;
  }
  return ControlPointIndex { raw };
}
