//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <FbxDom/Dom/Properties.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/Tree.h>

namespace fbxdom::dom {

//! Per-document table of class default property templates.
/*!
 FBX files declare, in their `Definitions` section, a property template for
 each object class and native type they use:

 ```text
 Definitions
   ObjectType "GlobalSettings"
     PropertyTemplate "FbxGlobalSettings"
       Properties70
         P "UpAxis" "int" "Integer" "" 1
 ```

 The cache maps (class name, native type name) to the `Properties70` node of
 the matching template. It is built once, when the document is loaded, and is
 read-only afterwards. A class without a template is not an error: lookups
 simply return nullopt.
*/
class DefinitionsCache {
public:
  //! Scans the `Definitions` section of `tree`.
  /*!
   ObjectType and PropertyTemplate nodes without a string name attribute are
   skipped with a warning. When the same (class, native type) pair is declared
   twice, the first declaration is kept.
  */
  FBXDOM_DOM_NDAPI static auto FromTree(const tree::Tree& tree)
    -> DefinitionsCache;

  FBXDOM_DOM_NDAPI auto PropsNodeId(std::string_view class_name,
    std::string_view subclass_name) const -> std::optional<PropertiesNodeId>;

  [[nodiscard]] auto Size() const noexcept -> std::size_t
  {
    return templates_.size();
  }

private:
  DefinitionsCache() = default;

  [[nodiscard]] static auto MakeKey(
    std::string_view class_name, std::string_view subclass_name) -> std::string;

  std::unordered_map<std::string, PropertiesNodeId> templates_;
};

} // namespace fbxdom::dom
