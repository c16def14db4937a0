//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <optional>
#include <string_view>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/ObjectProperties.h>

using fbxdom::dom::ObjectProperties;

ObjectProperties::ObjectProperties(const tree::Tree& tree,
  std::optional<PropertiesNodeId> direct,
  std::optional<PropertiesNodeId> defaults, NumericConversion conversion)
  : conversion_(conversion)
{
  scopes_.reserve(2);
  if (direct) {
    scopes_.emplace_back(tree, *direct);
    has_direct_ = true;
  }
  if (defaults) {
    scopes_.emplace_back(tree, *defaults);
  }
}

auto ObjectProperties::Get(std::string_view key) const
  -> std::optional<PropertyHandle>
{
  for (const auto& scope : scopes_) {
    if (auto property = scope.Get(key)) {
      return property;
    }
  }
  return std::nullopt;
}

auto ObjectProperties::NotFound(std::string_view key) -> std::unexpected<Error>
{
  DLOG_F(2, "property `{}` not found in any scope", key);
  return MakeError(
    DomError::kPropertyNotFound, "expected `{}` property but not found", key);
}
