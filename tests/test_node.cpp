/**
 * @file test_node.cpp
 * @brief Unit tests for the Node tree element (GoogleTest)
 */

#include <gtest/gtest.h>
#include "defpatch/Node.hpp"

#include <stdexcept>

using namespace defpatch;

// ============================================================================
// Attributes
// ============================================================================

TEST(NodeAttributes, SetReportsAddedOrOverwritten) {
    Node n("ThingDef");
    EXPECT_TRUE(n.set_attribute("Name", "BaseGun"));
    EXPECT_FALSE(n.set_attribute("Name", "BaseBow"));
    ASSERT_NE(n.attribute("Name"), nullptr);
    EXPECT_EQ(*n.attribute("Name"), "BaseBow");
    EXPECT_EQ(n.attributes().size(), 1u);
}

TEST(NodeAttributes, MissingAttributeIsNull) {
    Node n("ThingDef");
    EXPECT_EQ(n.attribute("ParentName"), nullptr);
    EXPECT_FALSE(n.has_attribute("ParentName"));
}

TEST(NodeAttributes, RemovePreservesOrderOfOthers) {
    Node n("a");
    n.set_attribute("x", "1");
    n.set_attribute("y", "2");
    n.set_attribute("z", "3");
    EXPECT_TRUE(n.remove_attribute("y"));
    EXPECT_FALSE(n.remove_attribute("y"));
    ASSERT_EQ(n.attributes().size(), 2u);
    EXPECT_EQ(n.attributes()[0].name, "x");
    EXPECT_EQ(n.attributes()[1].name, "z");
}

// ============================================================================
// Children
// ============================================================================

class NodeChildrenTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = make_node("Item");
        root->append_child(make_node("id", "1"));
        Node& tags = root->append_child(make_node("tags"));
        tags.append_child(make_node("li", "A"));
        tags.append_child(make_node("li", "B"));
    }

    NodePtr root;
};

TEST_F(NodeChildrenTest, ParentLinksAreSet) {
    Node* tags = root->child("tags");
    ASSERT_NE(tags, nullptr);
    EXPECT_EQ(tags->parent(), root.get());
    EXPECT_EQ(tags->children()[0]->parent(), tags);
    EXPECT_EQ(root->parent(), nullptr);
}

TEST_F(NodeChildrenTest, ChildrenNamedReturnsAllInOrder) {
    auto items = root->child("tags")->children_named("li");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0]->text(), "A");
    EXPECT_EQ(items[1]->text(), "B");
    EXPECT_TRUE(items[0]->is_list_item());
}

TEST_F(NodeChildrenTest, PrependAndInsert) {
    Node* tags = root->child("tags");
    tags->prepend_child(make_node("li", "Z"));
    tags->insert_child(2, make_node("li", "M"));
    ASSERT_EQ(tags->child_count(), 4u);
    EXPECT_EQ(tags->children()[0]->text(), "Z");
    EXPECT_EQ(tags->children()[1]->text(), "A");
    EXPECT_EQ(tags->children()[2]->text(), "M");
    EXPECT_EQ(tags->children()[3]->text(), "B");
}

TEST_F(NodeChildrenTest, InsertPastEndThrows) {
    EXPECT_THROW(root->insert_child(5, make_node("x")), std::out_of_range);
}

TEST_F(NodeChildrenTest, RemoveChildDetachesAndReturnsOwnership) {
    Node* id = root->child("id");
    NodePtr removed = root->remove_child(id);
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->parent(), nullptr);
    EXPECT_EQ(removed->text(), "1");
    EXPECT_EQ(root->child("id"), nullptr);
    EXPECT_EQ(root->child_count(), 1u);
}

TEST_F(NodeChildrenTest, RemoveNonChildReturnsNull) {
    Node stranger("x");
    EXPECT_EQ(root->remove_child(&stranger), nullptr);
    EXPECT_EQ(root->index_of(&stranger), Node::npos);
}

TEST_F(NodeChildrenTest, InnerTextConcatenatesDescendants) {
    EXPECT_EQ(root->child("tags")->inner_text(), "AB");
    EXPECT_EQ(root->child("id")->inner_text(), "1");
}

// ============================================================================
// Clone and equality
// ============================================================================

TEST_F(NodeChildrenTest, CloneIsDeepAndIndependent) {
    NodePtr copy = root->clone();
    EXPECT_TRUE(copy->equals(*root));
    EXPECT_EQ(copy->parent(), nullptr);

    copy->child("tags")->append_child(make_node("li", "C"));
    EXPECT_FALSE(copy->equals(*root));
    EXPECT_EQ(root->child("tags")->child_count(), 2u);
}

TEST(NodeEquality, AttributeOrderIsIgnored) {
    Node a("x");
    a.set_attribute("p", "1");
    a.set_attribute("q", "2");
    Node b("x");
    b.set_attribute("q", "2");
    b.set_attribute("p", "1");
    EXPECT_TRUE(a == b);
}

TEST(NodeEquality, ChildOrderMatters) {
    Node a("tags");
    a.append_child(make_node("li", "A"));
    a.append_child(make_node("li", "B"));
    Node b("tags");
    b.append_child(make_node("li", "B"));
    b.append_child(make_node("li", "A"));
    EXPECT_TRUE(a != b);
}

TEST(NodeEquality, TextAndTagCompared) {
    EXPECT_FALSE(make_node("a", "1")->equals(*make_node("a", "2")));
    EXPECT_FALSE(make_node("a", "1")->equals(*make_node("b", "1")));
    EXPECT_FALSE(make_node("a", "")->equals(*make_node("a")));
}
