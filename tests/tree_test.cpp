// Display tree projection, reconstruction and outline helpers

#include "json_formatter_core.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

TEST(TreeProjectionTest, MirrorsDocumentStructure)
{
    json v = parseJson(R"({"a":1,"b":[true,null]})");
    auto root = projectTree(v);

    EXPECT_EQ(root->kind, NodeKind::Object);
    EXPECT_FALSE(root->hasLabel());
    EXPECT_EQ(root->value, &v);
    EXPECT_TRUE(root->expanded);
    ASSERT_EQ(root->children.size(), 2u);

    const TreeNode &a = *root->children[0];
    EXPECT_EQ(a.kind, NodeKind::Scalar);
    EXPECT_EQ(a.keyKind, KeyKind::Key);
    EXPECT_EQ(a.label, "a");
    EXPECT_EQ(*a.value, json(1));
    EXPECT_TRUE(a.isLeaf());
    EXPECT_EQ(a.parent, root.get());

    const TreeNode &b = *root->children[1];
    EXPECT_EQ(b.kind, NodeKind::Array);
    EXPECT_TRUE(b.expanded);
    ASSERT_EQ(b.children.size(), 2u);
    EXPECT_EQ(b.children[0]->label, "[0]");
    EXPECT_EQ(b.children[0]->keyKind, KeyKind::Index);
    EXPECT_EQ(b.children[1]->label, "[1]");
    EXPECT_TRUE(b.children[1]->value->is_null());
    EXPECT_FALSE(b.children[0]->isLastChild);
    EXPECT_TRUE(b.children[1]->isLastChild);
}

TEST(TreeProjectionTest, ChildrenFollowInsertionOrder)
{
    json v = parseJson(R"({"z":1,"a":2,"m":3})");
    auto root = projectTree(v);
    std::vector<std::string> labels;
    for (const auto &child : root->children)
        labels.push_back(child->label);
    EXPECT_EQ(labels, (std::vector<std::string>{"z", "a", "m"}));
}

TEST(TreeProjectionTest, ScalarRootHasNoChildren)
{
    json v = json("text");
    auto root = projectTree(v);
    EXPECT_EQ(root->kind, NodeKind::Scalar);
    EXPECT_TRUE(root->isLeaf());
    EXPECT_FALSE(root->expanded);
}

TEST(TreeReconstructionTest, KeyedLeafIsWrapped)
{
    json v = parseJson(R"({"a":1,"b":[1,2,3]})");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root->children[0]), parseJson(R"({"a":1})"));
}

TEST(TreeReconstructionTest, ArrayElementLeafIsBare)
{
    json v = parseJson(R"([10,20])");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root->children[1]), json(20));
}

TEST(TreeReconstructionTest, SelectedSubtree)
{
    json v = parseJson(R"({"a":1,"b":[1,2,3]})");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root->children[1]), parseJson("[1,2,3]"));
}

TEST(TreeReconstructionTest, RoundTripsDocuments)
{
    const char *samples[] = {
        R"({"a":1,"b":[1,2,3]})",
        R"([{"x":1},{"y":[true,false]}])",
        R"({"outer":{"inner":{"deep":"v"}},"list":[[1,2],[3]]})",
        R"({"e":{},"f":[],"g":null})",
        R"({"":"empty key","n":1.5})",
        R"([])",
        R"(42)",
        R"("just text")",
    };
    for (const char *text : samples)
    {
        json v = parseJson(text);
        auto root = projectTree(v);
        EXPECT_EQ(reconstructJson(*root), v) << text;
    }
}

TEST(TreeReconstructionTest, BracketKeysAreReadAsArray)
{
    json v = parseJson(R"({"[x]":1,"[y]":2})");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root), parseJson(R"([{"[x]":1},{"[y]":2}])"));
}

TEST(TreeReconstructionTest, MixedLabelsStayObject)
{
    json v = parseJson(R"({"[x]":1,"y":2})");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root), v);
}

TEST(TreeReconstructionTest, KeyTextAfterColonIsDropped)
{
    json v = parseJson(R"({"a:b":1})");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root), parseJson(R"({"a":{"a:b":1}})"));
}

TEST(TreeReconstructionTest, SameKeyNestingCollapses)
{
    json v = parseJson(R"({"a":{"a":1}})");
    auto root = projectTree(v);
    EXPECT_EQ(reconstructJson(*root), parseJson(R"({"a":1})"));
}

TEST(TreeReconstructionTest, NodeWithoutValueThrows)
{
    TreeNode orphan;
    orphan.label = "orphan";
    EXPECT_THROW(reconstructJson(orphan), std::logic_error);
}

TEST(TreeLabelTest, DisplayLabels)
{
    json v = parseJson(R"({"a":1,"b":[1,2,3],"s":"hi\nthere","o":{"k":null}})");
    auto root = projectTree(v);
    EXPECT_EQ(displayLabel(*root), "(dictionary, 4 keys)");
    EXPECT_EQ(displayLabel(*root->children[0]), "a: 1");
    EXPECT_EQ(displayLabel(*root->children[1]), "b (list, 3 items)");
    EXPECT_EQ(displayLabel(*root->children[1]->children[0]), "[0]: 1");
    EXPECT_EQ(displayLabel(*root->children[2]), "s: \"hi\\nthere\"");
    EXPECT_EQ(displayLabel(*root->children[3]), "o (dictionary, 1 key)");
}

TEST(TreeLabelTest, BranchPrefixes)
{
    json v = parseJson(R"({"a":[1],"b":2})");
    auto root = projectTree(v);
    EXPECT_EQ(buildPrefix(root.get()), "");
    EXPECT_EQ(buildPrefix(root->children[0].get()), "├── ");
    EXPECT_EQ(buildPrefix(root->children[0]->children[0].get()), "│   └── ");
    EXPECT_EQ(buildPrefix(root->children[1].get()), "└── ");
}

TEST(TreeLayoutTest, ExpandAndCollapse)
{
    json v = parseJson(R"({"a":{"b":{"c":1}}})");
    auto root = projectTree(v);
    EXPECT_EQ(countNodes(*root), 4u);

    std::vector<const TreeNode *> visible;
    collectVisible(root.get(), visible);
    EXPECT_EQ(visible.size(), 4u);

    collapseAll(root.get(), true);
    visible.clear();
    collectVisible(root.get(), visible);
    EXPECT_EQ(visible.size(), 2u);

    expandAll(root.get());
    visible.clear();
    collectVisible(root.get(), visible);
    EXPECT_EQ(visible.size(), 4u);

    expandToLevel(root.get(), 2);
    visible.clear();
    collectVisible(root.get(), visible);
    EXPECT_EQ(visible.size(), 3u);

    expandToLevel(root.get(), 0);
    EXPECT_FALSE(root->expanded);
}
