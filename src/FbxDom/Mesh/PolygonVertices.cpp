//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <utility>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Mesh/PolygonVertices.h>
#include <FbxDom/Mesh/TriangleVertices.h>

using fbxdom::mesh::ControlPointIndex;
using fbxdom::mesh::PolygonIndex;
using fbxdom::mesh::PolygonVertex;
using fbxdom::mesh::PolygonVertexIndex;
using fbxdom::mesh::PolygonVertices;
using fbxdom::mesh::TriangleVertices;

namespace {

constexpr std::size_t kMinPolygonVertices = 3;

} // namespace

PolygonVertices::PolygonVertices(std::vector<ControlPointIndex> control_points,
  std::vector<std::size_t> polygon_starts) noexcept
  : control_points_(std::move(control_points))
  , polygon_starts_(std::move(polygon_starts))
{
  DCHECK_F(!polygon_starts_.empty());
  DCHECK_F(polygon_starts_.back() == control_points_.size());
}

auto PolygonVertices::Decode(const std::span<const std::int32_t> raw,
  const std::optional<std::size_t> control_point_count)
  -> Result<PolygonVertices>
{
  std::vector<ControlPointIndex> control_points;
  control_points.reserve(raw.size());
  std::vector<std::size_t> polygon_starts { 0 };

  for (std::size_t i = 0; i < raw.size(); ++i) {
    const auto value = raw[i];
    const bool closes_polygon = value < 0;
    // ~v == -(v + 1) for negative v, never overflows.
    const auto decoded
      = static_cast<std::size_t>(closes_polygon ? ~value : value);

    if (control_point_count && decoded >= *control_point_count) {
      return MakeError(DomError::kMalformedIndexBuffer,
        "polygon vertex {} refers to control point {}, but the mesh has only "
        "{} control points",
        i, decoded, *control_point_count);
    }
    control_points.emplace_back(decoded);

    if (closes_polygon) {
      const auto start = polygon_starts.back();
      const auto vertex_count = i + 1 - start;
      if (vertex_count < kMinPolygonVertices) {
        return MakeError(DomError::kMalformedIndexBuffer,
          "polygon {} (polygon vertices {}..{}) has {} vertices, at least {} "
          "are required",
          polygon_starts.size() - 1, start, i, vertex_count,
          kMinPolygonVertices);
      }
      polygon_starts.push_back(i + 1);
    }
  }

  if (polygon_starts.back() != raw.size()) {
    return MakeError(DomError::kMalformedIndexBuffer,
      "index buffer ends inside polygon {}: {} trailing vertices without a "
      "terminating negative index",
      polygon_starts.size() - 1, raw.size() - polygon_starts.back());
  }

  DLOG_F(2, "decoded {} polygons from {} polygon vertices",
    polygon_starts.size() - 1, raw.size());
  return PolygonVertices(std::move(control_points), std::move(polygon_starts));
}

auto PolygonVertices::VerticesOf(const PolygonIndex polygon) const
  -> std::vector<PolygonVertex>
{
  std::vector<PolygonVertex> vertices;
  if (polygon.get() >= PolygonCount()) {
    return vertices;
  }
  const auto begin = StartOf(polygon.get());
  const auto end = StartOf(polygon.get() + 1);
  vertices.reserve(end - begin);
  for (auto pv = begin; pv < end; ++pv) {
    vertices.push_back(PolygonVertex {
      .index = PolygonVertexIndex { pv },
      .polygon = polygon,
      .control_point = control_points_[pv],
    });
  }
  return vertices;
}

auto PolygonVertices::FirstVertexOf(const PolygonIndex polygon) const noexcept
  -> std::optional<PolygonVertexIndex>
{
  if (polygon.get() >= PolygonCount()) {
    return std::nullopt;
  }
  return PolygonVertexIndex { StartOf(polygon.get()) };
}

auto PolygonVertices::VertexCountOf(const PolygonIndex polygon) const noexcept
  -> std::optional<std::size_t>
{
  if (polygon.get() >= PolygonCount()) {
    return std::nullopt;
  }
  return StartOf(polygon.get() + 1) - StartOf(polygon.get());
}

auto PolygonVertices::ControlPointOf(
  const PolygonVertexIndex vertex) const noexcept
  -> std::optional<ControlPointIndex>
{
  if (vertex.get() >= PolygonVertexCount()) {
    return std::nullopt;
  }
  return control_points_[vertex.get()];
}

auto PolygonVertices::PolygonOf(const PolygonVertexIndex vertex) const noexcept
  -> std::optional<PolygonIndex>
{
  if (vertex.get() >= PolygonVertexCount()) {
    return std::nullopt;
  }
  // First start strictly greater than the vertex, minus one, is the owner.
  const auto next_start = std::upper_bound(
    polygon_starts_.begin(), polygon_starts_.end(), vertex.get());
  return PolygonIndex { static_cast<std::size_t>(
    next_start - polygon_starts_.begin() - 1) };
}

auto PolygonVertices::VertexAt(const PolygonVertexIndex vertex) const noexcept
  -> std::optional<PolygonVertex>
{
  const auto polygon = PolygonOf(vertex);
  if (!polygon) {
    return std::nullopt;
  }
  return PolygonVertex {
    .index = vertex,
    .polygon = *polygon,
    .control_point = control_points_[vertex.get()],
  };
}

auto PolygonVertices::ToPolygonVertexIndex(const std::size_t raw) const noexcept
  -> std::optional<PolygonVertexIndex>
{
  if (raw >= PolygonVertexCount()) {
    return std::nullopt;
  }
  return PolygonVertexIndex { raw };
}

auto PolygonVertices::ToPolygonIndex(const std::size_t raw) const noexcept
  -> std::optional<PolygonIndex>
{
  if (raw >= PolygonCount()) {
    return std::nullopt;
  }
  return PolygonIndex { raw };
}

auto PolygonVertices::Triangulate() const noexcept -> TriangleVertices
{
  return TriangleVertices(*this);
}
