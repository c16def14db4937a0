//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Base/NamedType.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/Tree.h>

namespace fbxdom::dom {

//! Identifies a `Properties70` node. Distinct from a plain NodeId so that only
//! nodes known to hold properties can be used as property scopes.
using PropertiesNodeId = NamedType<tree::NodeId, struct PropertiesNodeIdTag,
  Comparable, Hashable, Printable>;

//! One `P` child of a properties node.
/*!
 Attribute layout: `[0]` key, `[1]` type name, `[2]` label, `[3]` flags, then
 the value part. Instances only exist for nodes whose first four attributes
 are strings, so the string accessors never fail.
*/
class PropertyHandle {
public:
  //! Wraps `node` if it has the layout of a property node.
  FBXDOM_DOM_NDAPI static auto FromNode(tree::NodeHandle node)
    -> std::optional<PropertyHandle>;

  [[nodiscard]] auto Node() const noexcept -> const tree::NodeHandle&
  {
    return node_;
  }

  [[nodiscard]] auto Name() const noexcept -> std::string_view
  {
    return StringAt(0);
  }

  //! Property type name as written by the exporter (`int`, `double`,
  //! `Vector3D`, `KString`...).
  [[nodiscard]] auto TypeName() const noexcept -> std::string_view
  {
    return StringAt(1);
  }

  [[nodiscard]] auto Label() const noexcept -> std::string_view
  {
    return StringAt(2);
  }

  [[nodiscard]] auto Flags() const noexcept -> std::string_view
  {
    return StringAt(3);
  }

  //! Attributes following the four header strings.
  [[nodiscard]] auto ValuePart() const noexcept
    -> std::span<const tree::AttributeValue>
  {
    return node_.Attributes().subspan(kHeaderSize);
  }

  //! Decodes the value part with `loader`.
  template <typename Loader>
  [[nodiscard]] auto Value(const Loader& loader) const
  {
    return loader.Load(*this);
  }

private:
  static constexpr std::size_t kHeaderSize = 4;

  explicit PropertyHandle(tree::NodeHandle node) noexcept
    : node_(node)
  {
  }

  [[nodiscard]] auto StringAt(std::size_t index) const noexcept
    -> std::string_view
  {
    return *node_.Attributes()[index].AsString();
  }

  tree::NodeHandle node_;
};

//! Decodes the value part of a property into a C++ type.
template <typename L>
concept PropertyLoader = requires(const L& loader, const PropertyHandle& p) {
  typename L::Output;
  { loader.Load(p) } -> std::same_as<Result<typename L::Output>>;
};

//! View of a `Properties70` node.
class PropertiesHandle {
public:
  PropertiesHandle(const tree::Tree& tree, PropertiesNodeId id) noexcept
    : tree_(&tree)
    , id_(id)
  {
  }

  [[nodiscard]] auto Id() const noexcept -> PropertiesNodeId { return id_; }

  //! Finds the property named `key`.
  /*!
   `P` children are scanned in order; the first one with a matching key wins.
   Children without the property layout are skipped with a warning.
  */
  FBXDOM_DOM_NDAPI auto Get(std::string_view key) const
    -> std::optional<PropertyHandle>;

  //! All well-formed properties, in node order.
  FBXDOM_DOM_NDAPI auto All() const -> std::vector<PropertyHandle>;

private:
  [[nodiscard]] auto Node() const noexcept -> tree::NodeHandle
  {
    return { *tree_, id_.get() };
  }

  const tree::Tree* tree_;
  PropertiesNodeId id_;
};

} // namespace fbxdom::dom
