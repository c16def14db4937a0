//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Base/Macros.h>
#include <FbxDom/Config/DocumentConfig.h>
#include <FbxDom/Dom/DefinitionsCache.h>
#include <FbxDom/Dom/GlobalSettings.h>
#include <FbxDom/Dom/Object.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/Tree.h>

namespace fbxdom::dom {

//! A loaded FBX document.
/*!
 Owns the node tree handed over by the decoder, together with the per-document
 Definitions cache and configuration. Every view obtained from a Document
 (settings, objects, properties, mesh indices) borrows from it; the Document
 is therefore neither copyable nor movable, and lives behind a unique_ptr.

 Loading is synchronous and does all of its work upfront: the Definitions
 cache is built and the `Objects` section indexed before FromTree() returns.
 Afterwards the document is read-only and safe to query from several threads.

 ### Usage Examples

 ```cpp
 auto doc = Document::FromTree(std::move(tree));
 if (!doc) {
   LOG_F(ERROR, "{}", to_string(doc.error()));
   return;
 }
 auto settings = (*doc)->GetGlobalSettings();
 ```
*/
class Document {
public:
  //! Minimum and one-past-maximum supported FBX versions (7.x).
  static constexpr std::uint32_t kMinVersion = 7000;
  static constexpr std::uint32_t kMaxVersion = 8000;

  //! Takes ownership of `tree` and indexes it.
  /*!
   @return the document, or
   - kUnsupportedVersion when the version is outside [7000, 8000) and the
     configuration enforces the range;
   - kMalformedNode when an object has no integer id, or two objects share
     the same id.
  */
  FBXDOM_DOM_NDAPI static auto FromTree(
    tree::Tree tree, DocumentConfig config = {})
    -> Result<std::unique_ptr<Document>>;

  FBXDOM_DOM_API ~Document();

  FBXDOM_MAKE_NON_COPYABLE(Document)
  FBXDOM_MAKE_NON_MOVABLE(Document)

  [[nodiscard]] auto GetTree() const noexcept -> const tree::Tree&
  {
    return tree_;
  }

  [[nodiscard]] auto GetConfig() const noexcept -> const DocumentConfig&
  {
    return config_;
  }

  [[nodiscard]] auto Definitions() const noexcept -> const DefinitionsCache&
  {
    return definitions_;
  }

  FBXDOM_DOM_NDAPI auto GetGlobalSettings() const -> Result<GlobalSettings>;

  //! All objects, in file order.
  FBXDOM_DOM_NDAPI auto Objects() const -> std::vector<ObjectHandle>;

  FBXDOM_DOM_NDAPI auto ObjectById(ObjectId id) const
    -> std::optional<ObjectHandle>;

  [[nodiscard]] auto ObjectCount() const noexcept -> std::size_t
  {
    return objects_.size();
  }

private:
  Document(tree::Tree tree, DocumentConfig config);

  [[nodiscard]] auto IndexObjects() -> Result<void>;

  tree::Tree tree_;
  DocumentConfig config_;
  DefinitionsCache definitions_;
  std::vector<tree::NodeId> objects_;
  std::unordered_map<ObjectId, tree::NodeId> object_index_;
};

} // namespace fbxdom::dom
