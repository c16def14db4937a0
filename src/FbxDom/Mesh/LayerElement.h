//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Mesh/Conversions.h>
#include <FbxDom/Mesh/Indices.h>
#include <FbxDom/Mesh/PolygonVertices.h>
#include <FbxDom/Mesh/TriangleVertices.h>
#include <FbxDom/Mesh/api_export.h>

namespace fbxdom::mesh {

//! Which index space selects the entry of a layer element.
enum class MappingMode : std::uint8_t {
  kByControlPoint,
  kByPolygonVertex,
  kByPolygon,
  kAllSame,
};

//! Whether the mapping index selects a value directly or through an index
//! array.
enum class ReferenceMode : std::uint8_t {
  kDirect,
  kIndexToDirect,
};

FBXDOM_MESH_NDAPI auto to_string(MappingMode value) noexcept -> const char*;
FBXDOM_MESH_NDAPI auto to_string(ReferenceMode value) noexcept -> const char*;

//! Parses a `MappingInformationType` string.
/*!
 Accepts `ByControlPoint` and its legacy spellings `ByVertice` and `ByVertex`,
 `ByPolygonVertex`, `ByPolygon` and `AllSame`. Anything else (including
 `ByEdge`, which no index space here can address) is a kInvalidEnumValue
 error.
*/
FBXDOM_MESH_NDAPI auto ParseMappingMode(std::string_view name)
  -> Result<MappingMode>;

//! Parses a `ReferenceInformationType` string (`Direct`, `IndexToDirect`, or
//! the legacy `Index`).
FBXDOM_MESH_NDAPI auto ParseReferenceMode(std::string_view name)
  -> Result<ReferenceMode>;

namespace detail {
  //! Validates the value/index array shapes shared by every LayerElement.
  FBXDOM_MESH_NDAPI auto ValidateLayerArrays(std::size_t components,
    std::span<const double> values, ReferenceMode reference_mode,
    std::span<const std::int32_t> indices) -> Result<void>;

  //! Resolves a mapping index to an element of the direct value array.
  FBXDOM_MESH_NDAPI auto ResolveDirectIndex(std::size_t components,
    std::span<const double> values, ReferenceMode reference_mode,
    std::span<const std::int32_t> indices, std::size_t mapping_index)
    -> Result<std::size_t>;
} // namespace detail

//! Per-vertex attribute channel of a mesh (normals, UVs, ...).
/*!
 Each channel stores a flat array of `N`-component values and, in
 index-to-direct mode, an array of indices into it. Looking up the value for
 a corner of the mesh goes through two steps:

 1. the mapping mode picks the index space: the corner's control point,
    polygon vertex or polygon, or always entry 0 for `AllSame`;
 2. the reference mode turns that mapping index into a value index, either
    as-is or through the index array.

 Lookups accept either a polygon vertex (with the PolygonVertices) or anything
 that converts to one through the triangulation, so the same channel serves
 polygon-based and triangle-based consumers.

 The value and index arrays are borrowed from the document tree.

 @tparam N Number of components per value (3 for normals, 2 for UVs).
*/
template <glm::length_t N> class LayerElement {
public:
  using Value = glm::vec<N, double, glm::defaultp>;
  static constexpr auto kComponents = static_cast<std::size_t>(N);

  //! Validates and wraps the channel arrays.
  /*!
   @return the element, or kMalformedNode when the value count is not a
   multiple of `N`, or when index-to-direct mode comes without indices.
  */
  [[nodiscard]] static auto Create(MappingMode mapping_mode,
    ReferenceMode reference_mode, std::span<const double> values,
    std::span<const std::int32_t> indices = {}) -> Result<LayerElement>
  {
    if (auto valid = detail::ValidateLayerArrays(
          kComponents, values, reference_mode, indices);
      !valid) {
      return std::unexpected(std::move(valid).error());
    }
    return LayerElement(mapping_mode, reference_mode, values, indices);
  }

  [[nodiscard]] auto GetMappingMode() const noexcept -> MappingMode
  {
    return mapping_mode_;
  }

  [[nodiscard]] auto GetReferenceMode() const noexcept -> ReferenceMode
  {
    return reference_mode_;
  }

  [[nodiscard]] auto ValueCount() const noexcept -> std::size_t
  {
    return values_.size() / kComponents;
  }

  //! Value for a corner addressed in polygon vertex space.
  [[nodiscard]] auto At(const PolygonVertexIndex vertex,
    const PolygonVertices& polygon_vertices) const -> Result<Value>
  {
    const auto polygon = polygon_vertices.PolygonOf(vertex);
    if (!polygon) {
      return MakeError(DomError::kIndexOutOfRange,
        "polygon vertex {} is out of range, the mesh has {} polygon vertices",
        vertex.get(), polygon_vertices.PolygonVertexCount());
    }

    std::size_t mapping_index = 0;
    switch (mapping_mode_) {
    case MappingMode::kByControlPoint:
      mapping_index = IntoCpi(vertex, polygon_vertices)->get();
      break;
    case MappingMode::kByPolygonVertex:
      mapping_index = vertex.get();
      break;
    case MappingMode::kByPolygon:
      mapping_index = polygon->get();
      break;
    case MappingMode::kAllSame:
      break;
    }
    return ValueAt(mapping_index);
  }

  //! Value for a corner addressed through the fan triangulation.
  template <IntoPvWithTriVert V>
  [[nodiscard]] auto At(
    const V& vertex, const TriangleVertices& triangle_vertices) const
    -> Result<Value>
  {
    const auto polygon_vertex = IntoPv(vertex, triangle_vertices);
    if (!polygon_vertex) {
      return MakeError(DomError::kIndexOutOfRange,
        "triangle vertex is out of range, the mesh has {} triangle vertices",
        triangle_vertices.TriangleVertexCount());
    }
    return At(*polygon_vertex, triangle_vertices.GetPolygonVertices());
  }

private:
  LayerElement(MappingMode mapping_mode, ReferenceMode reference_mode,
    std::span<const double> values,
    std::span<const std::int32_t> indices) noexcept
    : mapping_mode_(mapping_mode)
    , reference_mode_(reference_mode)
    , values_(values)
    , indices_(indices)
  {
  }

  [[nodiscard]] auto ValueAt(const std::size_t mapping_index) const
    -> Result<Value>
  {
    const auto direct = detail::ResolveDirectIndex(
      kComponents, values_, reference_mode_, indices_, mapping_index);
    if (!direct) {
      return std::unexpected(direct.error());
    }
    Value value {};
    for (glm::length_t c = 0; c < N; ++c) {
      value[c] = values_[*direct * kComponents + static_cast<std::size_t>(c)];
    }
    return value;
  }

  MappingMode mapping_mode_;
  ReferenceMode reference_mode_;
  std::span<const double> values_;
  std::span<const std::int32_t> indices_;
};

using NormalLayer = LayerElement<3>;
using UvLayer = LayerElement<2>;

} // namespace fbxdom::mesh
