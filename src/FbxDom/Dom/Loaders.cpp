//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <optional>
#include <utility>

#include <FbxDom/Dom/Loaders.h>

using fbxdom::Error;
using fbxdom::Result;
using fbxdom::dom::PropertyHandle;
using fbxdom::dom::Vec3Loader;

auto fbxdom::dom::detail::TypeMismatch(const PropertyHandle& property,
  const tree::AttributeValue& stored, const char* requested)
  -> std::unexpected<Error>
{
  return MakeError(DomError::kPropertyTypeMismatch,
    "property `{}` (type `{}`) holds {} but {} was requested", property.Name(),
    property.TypeName(), to_string(stored.Type()), requested);
}

auto fbxdom::dom::detail::ArityMismatch(
  const PropertyHandle& property, const std::size_t expected)
  -> std::unexpected<Error>
{
  return MakeError(DomError::kPropertyTypeMismatch,
    "property `{}` (type `{}`) has {} value attributes, expected {}",
    property.Name(), property.TypeName(), property.ValuePart().size(),
    expected);
}

auto fbxdom::dom::detail::StoredInteger(const tree::AttributeValue& value)
  -> std::optional<std::int64_t>
{
  if (const auto* v = value.TryGet<std::int16_t>()) {
    return *v;
  }
  if (const auto* v = value.TryGet<std::int32_t>()) {
    return *v;
  }
  if (const auto* v = value.TryGet<std::int64_t>()) {
    return *v;
  }
  return std::nullopt;
}

auto Vec3Loader::Load(const PropertyHandle& property) const
  -> Result<glm::dvec3>
{
  const auto values = property.ValuePart();
  if (values.size() != 3) {
    return detail::ArityMismatch(property, 3);
  }

  glm::dvec3 result {};
  for (glm::length_t i = 0; i < 3; ++i) {
    auto component = detail::ConvertAttribute<double>(
      property, values[static_cast<std::size_t>(i)], policy_);
    if (!component) {
      return std::unexpected(std::move(component).error());
    }
    result[i] = *component;
  }
  return result;
}
