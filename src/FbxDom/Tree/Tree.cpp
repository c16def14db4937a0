//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <FbxDom/Tree/Tree.h>

using fbxdom::tree::NodeHandle;
using fbxdom::tree::NodeId;
using fbxdom::tree::Tree;
using fbxdom::tree::TreeBuilder;

Tree::Tree(const std::uint32_t fbx_version)
  : fbx_version_(fbx_version)
{
  nodes_.push_back(NodeData {});
}

auto Tree::Root() const noexcept -> NodeHandle
{
  return NodeHandle(*this, NodeId { 0 });
}

auto Tree::Node(const NodeId id) const noexcept -> std::optional<NodeHandle>
{
  if (id.get() >= nodes_.size()) {
    return std::nullopt;
  }
  return NodeHandle(*this, id);
}

auto NodeHandle::Name() const noexcept -> std::string_view
{
  return Data().name;
}

auto NodeHandle::Attributes() const noexcept -> std::span<const AttributeValue>
{
  return Data().attributes;
}

auto NodeHandle::Parent() const noexcept -> std::optional<NodeHandle>
{
  const auto& parent = Data().parent;
  if (!parent) {
    return std::nullopt;
  }
  return NodeHandle(*tree_, *parent);
}

auto NodeHandle::Children() const -> std::vector<NodeHandle>
{
  std::vector<NodeHandle> children;
  children.reserve(Data().children.size());
  for (const auto child : Data().children) {
    children.emplace_back(*tree_, child);
  }
  return children;
}

auto NodeHandle::ChildrenByName(const std::string_view name) const
  -> std::vector<NodeHandle>
{
  std::vector<NodeHandle> children;
  for (const auto child : Data().children) {
    if (tree_->nodes_[child.get()].name == name) {
      children.emplace_back(*tree_, child);
    }
  }
  return children;
}

auto NodeHandle::FirstChildByName(const std::string_view name) const
  -> std::optional<NodeHandle>
{
  for (const auto child : Data().children) {
    if (tree_->nodes_[child.get()].name == name) {
      return NodeHandle(*tree_, child);
    }
  }
  return std::nullopt;
}

void NodeHandle::VisitDepthFirst(
  const std::function<void(const NodeHandle&)>& visitor) const
{
  // Pre-order with an explicit stack, children pushed last-to-first.
  std::vector<NodeId> pending { id_ };
  while (!pending.empty()) {
    const auto current = pending.back();
    pending.pop_back();
    visitor(NodeHandle(*tree_, current));
    const auto& children = tree_->nodes_[current.get()].children;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      pending.push_back(*it);
    }
  }
}

TreeBuilder::TreeBuilder(const std::uint32_t fbx_version)
  : tree_(fbx_version)
{
}

auto TreeBuilder::AddNode(const NodeId parent, std::string name,
  std::vector<AttributeValue> attributes) -> NodeId
{
  auto& nodes = tree_.nodes_;
  if (parent.get() >= nodes.size()) {
    throw std::out_of_range(
      fmt::format("parent node {} does not exist (tree has {} nodes)",
        parent.get(), nodes.size()));
  }

  const NodeId id { static_cast<std::uint32_t>(nodes.size()) };
  nodes.push_back(Tree::NodeData {
    .name = std::move(name),
    .attributes = std::move(attributes),
    .parent = parent,
    .children = {},
  });
  nodes[parent.get()].children.push_back(id);
  return id;
}

auto TreeBuilder::Build() && -> Tree { return std::move(tree_); }
