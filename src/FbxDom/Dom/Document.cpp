//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/Document.h>

using fbxdom::Result;
using fbxdom::dom::Document;
using fbxdom::dom::GlobalSettings;
using fbxdom::dom::ObjectHandle;

Document::Document(tree::Tree tree, DocumentConfig config)
  : tree_(std::move(tree))
  , config_(std::move(config))
  , definitions_(DefinitionsCache::FromTree(tree_))
{
}

Document::~Document() = default;

auto Document::FromTree(tree::Tree tree, DocumentConfig config)
  -> Result<std::unique_ptr<Document>>
{
  LOG_SCOPE_F(INFO, "Load FBX document");

  const auto version = tree.FbxVersion();
  if (version < kMinVersion || version >= kMaxVersion) {
    if (config.EnforceVersionRange()) {
      LOG_F(ERROR, "unsupported FBX version {}", version);
      return MakeError(DomError::kUnsupportedVersion,
        "FBX version {} is not supported, expected a version in [{}, {})",
        version, kMinVersion, kMaxVersion);
    }
    LOG_F(WARNING, "loading FBX version {} outside of the 7.x range", version);
  }

  // Private constructor, hence no make_unique.
  std::unique_ptr<Document> document(
    new Document(std::move(tree), std::move(config)));
  if (auto indexed = document->IndexObjects(); !indexed) {
    LOG_F(ERROR, "{}", to_string(indexed.error()));
    return std::unexpected(std::move(indexed).error());
  }

  LOG_F(INFO, "version      : {}", version);
  LOG_F(INFO, "nodes        : {}", document->tree_.NodeCount());
  LOG_F(INFO, "templates    : {}", document->definitions_.Size());
  LOG_F(INFO, "objects      : {}", document->objects_.size());
  return document;
}

auto Document::IndexObjects() -> Result<void>
{
  const auto objects = tree_.Root().FirstChildByName("Objects");
  if (!objects) {
    DLOG_F(1, "document has no Objects section");
    return {};
  }

  for (const auto& node : objects->Children()) {
    const auto attributes = node.Attributes();
    const auto* raw_id = attributes.empty()
      ? nullptr
      : attributes.front().TryGet<std::int64_t>();
    if (raw_id == nullptr) {
      return MakeError(DomError::kMalformedNode,
        "object node {} (`{}`) has no int64 id attribute", node.Id().get(),
        node.Name());
    }

    const ObjectId id { *raw_id };
    const bool inserted = object_index_.try_emplace(id, node.Id()).second;
    if (!inserted) {
      return MakeError(DomError::kMalformedNode,
        "object id {} is used by more than one object (`{}` node {})", *raw_id,
        node.Name(), node.Id().get());
    }
    objects_.push_back(node.Id());
  }
  return {};
}

auto Document::GetGlobalSettings() const -> Result<GlobalSettings>
{
  return GlobalSettings::FromTree(tree_, definitions_, config_);
}

auto Document::Objects() const -> std::vector<ObjectHandle>
{
  std::vector<ObjectHandle> handles;
  handles.reserve(objects_.size());
  for (const auto id : objects_) {
    handles.emplace_back(*this, tree::NodeHandle(tree_, id));
  }
  return handles;
}

auto Document::ObjectById(const ObjectId id) const
  -> std::optional<ObjectHandle>
{
  const auto it = object_index_.find(id);
  if (it == object_index_.end()) {
    return std::nullopt;
  }
  return ObjectHandle(*this, tree::NodeHandle(tree_, it->second));
}
