//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Tree/Tree.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <FbxDom/Testing/GTest.h>

using fbxdom::tree::AttributeType;
using fbxdom::tree::AttributeValue;
using fbxdom::tree::NodeHandle;
using fbxdom::tree::NodeId;
using fbxdom::tree::Tree;
using fbxdom::tree::TreeBuilder;

namespace {

//! Names of nodes, in the order they are given.
auto NamesOf(const std::vector<NodeHandle>& nodes) -> std::vector<std::string>
{
  std::vector<std::string> names;
  for (const auto& node : nodes) {
    names.emplace_back(node.Name());
  }
  return names;
}

class TreeTest : public testing::Test {
protected:
  void SetUp() override
  {
    TreeBuilder builder { 7500 };
    settings_ = builder.AddNode(builder.Root(), "GlobalSettings",
      { AttributeValue(std::int32_t { 1000 }) });
    props_ = builder.AddNode(settings_, "Properties70");
    builder.AddNode(props_, "P",
      { AttributeValue("UpAxis"), AttributeValue("int"),
        AttributeValue("Integer"), AttributeValue(""),
        AttributeValue(std::int32_t { 1 }) });
    builder.AddNode(props_, "P",
      { AttributeValue("UnitScaleFactor"), AttributeValue("double"),
        AttributeValue("Number"), AttributeValue(""),
        AttributeValue(100.0) });
    objects_ = builder.AddNode(builder.Root(), "Objects");
    tree_ = std::make_unique<Tree>(std::move(builder).Build());
  }

  std::unique_ptr<Tree> tree_;
  NodeId settings_;
  NodeId props_;
  NodeId objects_;
};

//! Test: the root is node 0, unnamed, without parent, and the version is kept.
NOLINT_TEST_F(TreeTest, RootAndVersion)
{
  const auto root = tree_->Root();

  EXPECT_EQ(root.Id(), NodeId { 0 });
  EXPECT_TRUE(root.Name().empty());
  EXPECT_FALSE(root.Parent().has_value());
  EXPECT_EQ(tree_->FbxVersion(), 7500U);
  EXPECT_EQ(tree_->NodeCount(), 6U);
}

//! Test: children keep insertion order and parents link back.
NOLINT_TEST_F(TreeTest, ChildrenInOrder)
{
  const auto root = tree_->Root();
  EXPECT_THAT(NamesOf(root.Children()),
    testing::ElementsAre("GlobalSettings", "Objects"));

  const auto props = tree_->Node(props_);
  ASSERT_TRUE(props.has_value());
  EXPECT_EQ(props->Children().size(), 2U);
  ASSERT_TRUE(props->Parent().has_value());
  EXPECT_EQ(props->Parent()->Id(), settings_);
}

//! Test: lookup by name returns the first match, or nothing.
NOLINT_TEST_F(TreeTest, LookupByName)
{
  const auto root = tree_->Root();

  const auto settings = root.FirstChildByName("GlobalSettings");
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->Id(), settings_);
  EXPECT_FALSE(root.FirstChildByName("Definitions").has_value());

  const auto props = tree_->Node(props_);
  ASSERT_TRUE(props.has_value());
  EXPECT_EQ(props->ChildrenByName("P").size(), 2U);
  EXPECT_TRUE(props->ChildrenByName("Q").empty());
}

//! Test: attributes keep their type and value.
NOLINT_TEST_F(TreeTest, Attributes)
{
  const auto settings = tree_->Node(settings_);
  ASSERT_TRUE(settings.has_value());

  const auto attributes = settings->Attributes();
  ASSERT_EQ(attributes.size(), 1U);
  EXPECT_EQ(attributes[0].Type(), AttributeType::kI32);
  ASSERT_NE(attributes[0].TryGet<std::int32_t>(), nullptr);
  EXPECT_EQ(*attributes[0].TryGet<std::int32_t>(), 1000);
  EXPECT_EQ(attributes[0].TryGet<std::int64_t>(), nullptr);
  EXPECT_FALSE(attributes[0].AsString().has_value());
}

//! Test: depth-first traversal visits nodes in pre-order.
NOLINT_TEST_F(TreeTest, VisitDepthFirstIsPreOrder)
{
  std::vector<std::string> visited;
  tree_->Root().VisitDepthFirst([&visited](const NodeHandle& node) {
    visited.emplace_back(node.Name());
  });

  EXPECT_THAT(visited,
    testing::ElementsAre(
      "", "GlobalSettings", "Properties70", "P", "P", "Objects"));
}

//! Test: unknown node ids yield nothing.
NOLINT_TEST_F(TreeTest, UnknownNodeId)
{
  EXPECT_FALSE(tree_->Node(NodeId { 100 }).has_value());
}

//! Test: adding a node under an unknown parent throws.
NOLINT_TEST(TreeBuilderTest, UnknownParentThrows)
{
  TreeBuilder builder;
  NOLINT_EXPECT_THROW(
    builder.AddNode(NodeId { 3 }, "Orphan"), std::out_of_range);
}

//! Test: a default builder produces an FBX 7.4 tree with only the root.
NOLINT_TEST(TreeBuilderTest, DefaultTree)
{
  const auto tree = TreeBuilder {}.Build();

  EXPECT_EQ(tree.FbxVersion(), 7400U);
  EXPECT_EQ(tree.NodeCount(), 1U);
  EXPECT_TRUE(tree.Root().Children().empty());
}

//! Test: attribute values compare by type and payload.
NOLINT_TEST(AttributeValueTest, Equality)
{
  EXPECT_EQ(AttributeValue("a"), AttributeValue(std::string("a")));
  EXPECT_NE(AttributeValue(std::int32_t { 1 }),
    AttributeValue(std::int64_t { 1 }));
  EXPECT_EQ(AttributeValue(std::vector<double> { 1.0, 2.0 }).Type(),
    AttributeType::kArrF64);
  EXPECT_STREQ(to_string(AttributeType::kArrI32), "i32[]");
}

} // namespace
