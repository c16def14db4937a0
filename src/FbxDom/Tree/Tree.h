//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <FbxDom/Base/Macros.h>
#include <FbxDom/Base/NamedType.h>
#include <FbxDom/Tree/AttributeValue.h>
#include <FbxDom/Tree/api_export.h>

namespace fbxdom::tree {

//! Identifies a node within one Tree. The root is always `NodeId { 0 }`.
using NodeId = NamedType<std::uint32_t, struct NodeIdTag, Comparable,
  Hashable, Printable>;

class NodeHandle;
class TreeBuilder;

//! Immutable in-memory FBX node tree.
/*!
 This is the hand-off format between a binary FBX decoder and the document
 layer: every node has a name, an ordered list of typed attributes and an
 ordered list of children. The tree does not interpret any of them.

 Nodes live in a flat arena and are addressed by NodeId. Handles obtained from
 a tree borrow it, and must not outlive it.

 @see TreeBuilder, NodeHandle
*/
class Tree {
public:
  ~Tree() = default;

  FBXDOM_MAKE_NON_COPYABLE(Tree)
  FBXDOM_DEFAULT_MOVABLE(Tree)

  //! The unnamed root node. Top-level FBX nodes are its children.
  FBXDOM_TREE_NDAPI auto Root() const noexcept -> NodeHandle;

  //! Returns a handle to the node with the given id, if it exists.
  FBXDOM_TREE_NDAPI auto Node(NodeId id) const noexcept
    -> std::optional<NodeHandle>;

  [[nodiscard]] auto NodeCount() const noexcept -> std::size_t
  {
    return nodes_.size();
  }

  //! FBX version number from the file header (e.g. 7400 for FBX 7.4).
  [[nodiscard]] auto FbxVersion() const noexcept -> std::uint32_t
  {
    return fbx_version_;
  }

private:
  friend class NodeHandle;
  friend class TreeBuilder;

  struct NodeData {
    std::string name;
    std::vector<AttributeValue> attributes;
    std::optional<NodeId> parent;
    std::vector<NodeId> children;
  };

  explicit Tree(std::uint32_t fbx_version);

  std::vector<NodeData> nodes_;
  std::uint32_t fbx_version_;
};

//! Lightweight, copyable reference to one node of a Tree.
class NodeHandle {
public:
  NodeHandle(const Tree& tree, NodeId id) noexcept
    : tree_(&tree)
    , id_(id)
  {
  }

  [[nodiscard]] auto Id() const noexcept -> NodeId { return id_; }

  [[nodiscard]] auto GetTree() const noexcept -> const Tree& { return *tree_; }

  FBXDOM_TREE_NDAPI auto Name() const noexcept -> std::string_view;

  FBXDOM_TREE_NDAPI auto Attributes() const noexcept
    -> std::span<const AttributeValue>;

  FBXDOM_TREE_NDAPI auto Parent() const noexcept -> std::optional<NodeHandle>;

  FBXDOM_TREE_NDAPI auto Children() const -> std::vector<NodeHandle>;

  FBXDOM_TREE_NDAPI auto ChildrenByName(std::string_view name) const
    -> std::vector<NodeHandle>;

  FBXDOM_TREE_NDAPI auto FirstChildByName(std::string_view name) const
    -> std::optional<NodeHandle>;

  //! Visits this node and all of its descendants in depth-first pre-order.
  FBXDOM_TREE_API void VisitDepthFirst(
    const std::function<void(const NodeHandle&)>& visitor) const;

  friend auto operator==(const NodeHandle& lhs, const NodeHandle& rhs) noexcept
    -> bool
  {
    return lhs.tree_ == rhs.tree_ && lhs.id_ == rhs.id_;
  }

private:
  [[nodiscard]] auto Data() const noexcept -> const Tree::NodeData&
  {
    return tree_->nodes_[id_.get()];
  }

  const Tree* tree_;
  NodeId id_;
};

//! Incrementally constructs a Tree, parents before children.
/*!
 ### Usage Examples

 ```cpp
 TreeBuilder builder;
 const auto settings = builder.AddNode(builder.Root(), "GlobalSettings");
 const auto props = builder.AddNode(settings, "Properties70");
 builder.AddNode(props, "P",
   { AttributeValue("UpAxis"), AttributeValue("int"),
     AttributeValue("Integer"), AttributeValue(""),
     AttributeValue(std::int32_t { 1 }) });
 Tree tree = std::move(builder).Build();
 ```
*/
class TreeBuilder {
public:
  FBXDOM_TREE_API explicit TreeBuilder(std::uint32_t fbx_version = 7400);

  [[nodiscard]] auto Root() const noexcept -> NodeId { return NodeId { 0 }; }

  //! Appends a node as the last child of `parent`.
  /*!
   @throw std::out_of_range if `parent` does not name a node added so far.
  */
  FBXDOM_TREE_API auto AddNode(NodeId parent, std::string name,
    std::vector<AttributeValue> attributes = {}) -> NodeId;

  FBXDOM_TREE_NDAPI auto Build() && -> Tree;

private:
  Tree tree_;
};

} // namespace fbxdom::tree
