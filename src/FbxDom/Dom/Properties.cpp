//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <optional>
#include <string_view>
#include <vector>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/Properties.h>

using fbxdom::dom::PropertiesHandle;
using fbxdom::dom::PropertyHandle;

namespace {

constexpr std::string_view kPropertyNodeName = "P";

void WarnMalformed(const fbxdom::tree::NodeHandle& node)
{
  LOG_F(WARNING,
    "skipping malformed property node {} ({} attributes, expected at least 4 "
    "leading strings)",
    node.Id().get(), node.Attributes().size());
}

} // namespace

auto PropertyHandle::FromNode(tree::NodeHandle node)
  -> std::optional<PropertyHandle>
{
  const auto attributes = node.Attributes();
  if (attributes.size() < kHeaderSize) {
    return std::nullopt;
  }
  const auto all_strings = std::all_of(attributes.begin(),
    attributes.begin() + kHeaderSize,
    [](const tree::AttributeValue& a) { return a.AsString().has_value(); });
  if (!all_strings) {
    return std::nullopt;
  }
  return PropertyHandle(node);
}

auto PropertiesHandle::Get(std::string_view key) const
  -> std::optional<PropertyHandle>
{
  for (const auto& child : Node().Children()) {
    if (child.Name() != kPropertyNodeName) {
      continue;
    }
    const auto property = PropertyHandle::FromNode(child);
    if (!property) {
      WarnMalformed(child);
      continue;
    }
    if (property->Name() == key) {
      return property;
    }
  }
  DLOG_F(3, "property `{}` not in properties node {}", key, id_.get().get());
  return std::nullopt;
}

auto PropertiesHandle::All() const -> std::vector<PropertyHandle>
{
  std::vector<PropertyHandle> properties;
  for (const auto& child : Node().ChildrenByName(kPropertyNodeName)) {
    if (auto property = PropertyHandle::FromNode(child)) {
      properties.push_back(*property);
    } else {
      WarnMalformed(child);
    }
  }
  return properties;
}
