//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/MeshHandle.h>

using fbxdom::DomError;
using fbxdom::MakeError;
using fbxdom::Result;
using fbxdom::dom::MeshHandle;
using fbxdom::dom::ObjectProperties;
using fbxdom::mesh::ControlPoints;
using fbxdom::mesh::LayerElement;
using fbxdom::mesh::NormalLayer;
using fbxdom::mesh::PolygonVertices;
using fbxdom::mesh::ReferenceMode;
using fbxdom::mesh::UvLayer;
using fbxdom::tree::NodeHandle;

namespace {

auto RequireChild(const NodeHandle& parent, std::string_view name)
  -> Result<NodeHandle>
{
  auto child = parent.FirstChildByName(name);
  if (!child) {
    return MakeError(DomError::kNodeNotFound,
      "expected `{}` node under `{}` node {} but not found", name,
      parent.Name(), parent.Id().get());
  }
  return *child;
}

//! First attribute of the named child, which must hold a `T`.
template <typename T>
auto FirstAttributeOf(const NodeHandle& parent, std::string_view name)
  -> Result<const T*>
{
  const auto child = RequireChild(parent, name);
  if (!child) {
    return std::unexpected(child.error());
  }
  const auto attributes = child->Attributes();
  const T* value
    = attributes.empty() ? nullptr : attributes.front().TryGet<T>();
  if (value == nullptr) {
    return MakeError(DomError::kMalformedNode,
      "`{}` node {} does not hold a value of the expected type", name,
      child->Id().get());
  }
  return value;
}

template <typename T>
auto ArrayOf(const NodeHandle& parent, std::string_view name)
  -> Result<std::span<const T>>
{
  return FirstAttributeOf<std::vector<T>>(parent, name).transform(
    [](const std::vector<T>* values) { return std::span<const T>(*values); });
}

auto StringOf(const NodeHandle& parent, std::string_view name)
  -> Result<std::string_view>
{
  return FirstAttributeOf<std::string>(parent, name).transform(
    [](const std::string* text) { return std::string_view(*text); });
}

auto FindLayer(const NodeHandle& mesh, std::string_view element,
  const std::size_t layer) -> Result<NodeHandle>
{
  for (const auto& candidate : mesh.ChildrenByName(element)) {
    const auto attributes = candidate.Attributes();
    const auto* index = attributes.empty()
      ? nullptr
      : attributes.front().TryGet<std::int32_t>();
    if (index == nullptr) {
      LOG_F(WARNING, "skipping `{}` node {} without a layer index", element,
        candidate.Id().get());
      continue;
    }
    if (*index >= 0 && static_cast<std::size_t>(*index) == layer) {
      return candidate;
    }
  }
  return MakeError(DomError::kNodeNotFound,
    "mesh node {} has no `{}` with layer index {}", mesh.Id().get(), element,
    layer);
}

template <glm::length_t N>
auto ReadLayer(const NodeHandle& mesh, std::string_view element,
  std::string_view values_name, std::string_view indices_name,
  const std::size_t layer) -> Result<LayerElement<N>>
{
  const auto node = FindLayer(mesh, element, layer);
  if (!node) {
    return std::unexpected(node.error());
  }

  const auto mapping = StringOf(*node, "MappingInformationType")
                         .and_then(fbxdom::mesh::ParseMappingMode);
  if (!mapping) {
    return std::unexpected(mapping.error());
  }
  const auto reference = StringOf(*node, "ReferenceInformationType")
                           .and_then(fbxdom::mesh::ParseReferenceMode);
  if (!reference) {
    return std::unexpected(reference.error());
  }
  const auto values = ArrayOf<double>(*node, values_name);
  if (!values) {
    return std::unexpected(values.error());
  }

  std::span<const std::int32_t> indices;
  if (*reference == ReferenceMode::kIndexToDirect) {
    const auto index_array = ArrayOf<std::int32_t>(*node, indices_name);
    if (!index_array) {
      return std::unexpected(index_array.error());
    }
    indices = *index_array;
  }

  DLOG_F(2, "`{}` {}: {} values, mapping {}, reference {}", element, layer,
    values->size() / LayerElement<N>::kComponents, to_string(*mapping),
    to_string(*reference));
  return LayerElement<N>::Create(*mapping, *reference, *values, indices);
}

} // namespace

auto MeshHandle::FromObject(const ObjectHandle& object) -> Result<MeshHandle>
{
  if (object.Class() != "Geometry" || object.Subclass() != "Mesh") {
    return MakeError(DomError::kInvalidObjectClass,
      "object {} is a `{}`/`{}`, expected a `Geometry`/`Mesh`",
      object.Id().get(), object.Class(), object.Subclass());
  }
  return MeshHandle(object);
}

auto MeshHandle::GetControlPoints() const -> Result<ControlPoints>
{
  return ArrayOf<double>(object_.Node(), "Vertices")
    .and_then(ControlPoints::FromCoordinates);
}

auto MeshHandle::GetPolygonVertices() const -> Result<PolygonVertices>
{
  const auto points = GetControlPoints();
  if (!points) {
    return std::unexpected(points.error());
  }
  const auto raw = ArrayOf<std::int32_t>(object_.Node(), "PolygonVertexIndex");
  if (!raw) {
    return std::unexpected(raw.error());
  }
  return PolygonVertices::Decode(*raw, points->Count());
}

auto MeshHandle::Normals(const std::size_t layer) const -> Result<NormalLayer>
{
  return ReadLayer<3>(
    object_.Node(), "LayerElementNormal", "Normals", "NormalsIndex", layer);
}

auto MeshHandle::Uvs(const std::size_t layer) const -> Result<UvLayer>
{
  return ReadLayer<2>(object_.Node(), "LayerElementUV", "UV", "UVIndex", layer);
}

auto MeshHandle::Properties() const -> ObjectProperties
{
  return object_.Properties("FbxMesh");
}
