//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Mesh/LayerElement.h>

using fbxdom::DomError;
using fbxdom::MakeError;
using fbxdom::Result;
using fbxdom::mesh::MappingMode;
using fbxdom::mesh::ReferenceMode;

auto fbxdom::mesh::to_string(const MappingMode value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case MappingMode::kByControlPoint:   return "ByControlPoint";
    case MappingMode::kByPolygonVertex:  return "ByPolygonVertex";
    case MappingMode::kByPolygon:        return "ByPolygon";
    case MappingMode::kAllSame:          return "AllSame";
    // clang-format on
  }

  return "__NotSupported__";
}

auto fbxdom::mesh::to_string(const ReferenceMode value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case ReferenceMode::kDirect:         return "Direct";
    case ReferenceMode::kIndexToDirect:  return "IndexToDirect";
    // clang-format on
  }

  return "__NotSupported__";
}

auto fbxdom::mesh::ParseMappingMode(const std::string_view name)
  -> Result<MappingMode>
{
  if (name == "ByControlPoint" || name == "ByVertice" || name == "ByVertex") {
    return MappingMode::kByControlPoint;
  }
  if (name == "ByPolygonVertex") {
    return MappingMode::kByPolygonVertex;
  }
  if (name == "ByPolygon") {
    return MappingMode::kByPolygon;
  }
  if (name == "AllSame") {
    return MappingMode::kAllSame;
  }
  return MakeError(DomError::kInvalidEnumValue,
    "unsupported layer element mapping mode `{}`", name);
}

auto fbxdom::mesh::ParseReferenceMode(const std::string_view name)
  -> Result<ReferenceMode>
{
  if (name == "Direct") {
    return ReferenceMode::kDirect;
  }
  if (name == "IndexToDirect" || name == "Index") {
    return ReferenceMode::kIndexToDirect;
  }
  return MakeError(DomError::kInvalidEnumValue,
    "unsupported layer element reference mode `{}`", name);
}

auto fbxdom::mesh::detail::ValidateLayerArrays(const std::size_t components,
  const std::span<const double> values, const ReferenceMode reference_mode,
  const std::span<const std::int32_t> indices) -> Result<void>
{
  if (values.size() % components != 0) {
    return MakeError(DomError::kMalformedNode,
      "layer element values must come in groups of {}, but got {} values",
      components, values.size());
  }
  if (reference_mode == ReferenceMode::kIndexToDirect && indices.empty()) {
    return MakeError(DomError::kMalformedNode,
      "layer element uses IndexToDirect reference mode but has no indices");
  }
  return {};
}

auto fbxdom::mesh::detail::ResolveDirectIndex(const std::size_t components,
  const std::span<const double> values, const ReferenceMode reference_mode,
  const std::span<const std::int32_t> indices, const std::size_t mapping_index)
  -> Result<std::size_t>
{
  auto direct = mapping_index;
  if (reference_mode == ReferenceMode::kIndexToDirect) {
    if (mapping_index >= indices.size()) {
      return MakeError(DomError::kMalformedNode,
        "layer element index array has {} entries, entry {} was requested",
        indices.size(), mapping_index);
    }
    const auto index = indices[mapping_index];
    if (index < 0) {
      return MakeError(DomError::kMalformedNode,
        "layer element index entry {} is negative ({})", mapping_index, index);
    }
    direct = static_cast<std::size_t>(index);
  }

  const auto value_count = values.size() / components;
  if (direct >= value_count) {
    return MakeError(DomError::kMalformedNode,
      "layer element has {} values, value {} was requested", value_count,
      direct);
  }
  return direct;
}
