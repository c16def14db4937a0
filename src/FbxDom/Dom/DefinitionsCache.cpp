//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <optional>
#include <string>
#include <string_view>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/DefinitionsCache.h>

using fbxdom::dom::DefinitionsCache;
using fbxdom::dom::PropertiesNodeId;

namespace {

auto NameOf(const fbxdom::tree::NodeHandle& node)
  -> std::optional<std::string_view>
{
  const auto attributes = node.Attributes();
  if (attributes.empty()) {
    return std::nullopt;
  }
  return attributes.front().AsString();
}

} // namespace

auto DefinitionsCache::MakeKey(
  std::string_view class_name, std::string_view subclass_name) -> std::string
{
  // Names never contain NUL.
  std::string key;
  key.reserve(class_name.size() + 1 + subclass_name.size());
  key.append(class_name).push_back('\0');
  key.append(subclass_name);
  return key;
}

auto DefinitionsCache::FromTree(const tree::Tree& tree) -> DefinitionsCache
{
  DefinitionsCache cache;

  const auto definitions = tree.Root().FirstChildByName("Definitions");
  if (!definitions) {
    DLOG_F(1, "document has no Definitions section");
    return cache;
  }

  for (const auto& object_type : definitions->ChildrenByName("ObjectType")) {
    const auto class_name = NameOf(object_type);
    if (!class_name) {
      LOG_F(WARNING, "skipping ObjectType node {} without a class name",
        object_type.Id().get());
      continue;
    }

    for (const auto& property_template :
      object_type.ChildrenByName("PropertyTemplate")) {
      const auto native_type = NameOf(property_template);
      if (!native_type) {
        LOG_F(WARNING,
          "skipping PropertyTemplate node {} of `{}` without a native type "
          "name",
          property_template.Id().get(), *class_name);
        continue;
      }

      const auto properties
        = property_template.FirstChildByName("Properties70");
      if (!properties) {
        DLOG_F(2, "template `{}`/`{}` has no Properties70", *class_name,
          *native_type);
        continue;
      }

      const bool inserted = cache.templates_
                              .try_emplace(MakeKey(*class_name, *native_type),
                                PropertiesNodeId { properties->Id() })
                              .second;
      if (!inserted) {
        LOG_F(WARNING,
          "duplicate property template `{}`/`{}`, keeping the first one",
          *class_name, *native_type);
      }
    }
  }

  DLOG_F(1, "definitions cache holds {} property templates",
    cache.templates_.size());
  return cache;
}

auto DefinitionsCache::PropsNodeId(std::string_view class_name,
  std::string_view subclass_name) const -> std::optional<PropertiesNodeId>
{
  const auto it = templates_.find(MakeKey(class_name, subclass_name));
  if (it == templates_.end()) {
    return std::nullopt;
  }
  return it->second;
}
