/**
 * @file test_operations.cpp
 * @brief Tests for the built-in operation catalog (GoogleTest)
 *
 * Each test applies a one-operation patch through the Engine and checks
 * the resulting tree and outcome.
 */

#include <gtest/gtest.h>
#include "defpatch/Engine.hpp"
#include "defpatch/PatchLoader.hpp"
#include "defpatch/PathQuery.hpp"

using namespace defpatch;

namespace {

const char* kBase = R"(
<Defs>
  <ThingDef Name="BaseGun" Abstract="True">
    <statBases><Mass>1</Mass></statBases>
  </ThingDef>
  <ThingDef ParentName="BaseGun">
    <defName>X</defName>
    <label>revolver</label>
    <tags><li>A</li></tags>
    <comps/>
  </ThingDef>
  <ThingDef ParentName="BaseGun">
    <defName>Y</defName>
    <label>rifle</label>
    <tags><li>A</li></tags>
  </ThingDef>
</Defs>)";

std::string patch(const std::string& operations) {
    return "<Patch>" + operations + "</Patch>";
}

} // namespace

class OperationTest : public ::testing::Test {
protected:
    Document doc = Document::parse(kBase);
    Engine engine;

    /// Apply a single-operation patch and return its report entry
    OperationReport apply(const std::string& operation) {
        PatchUnit unit = load_patch_string(patch(operation), "test");
        UnitReport report = engine.apply(doc, unit);
        EXPECT_EQ(report.operations.size(), 1u);
        return report.operations.at(0);
    }

    std::vector<Node*> nodes(const std::string& path) {
        return select_nodes(doc, PathExpression::parse(path));
    }

    Node* one(const std::string& path) {
        auto found = nodes(path);
        EXPECT_EQ(found.size(), 1u) << path;
        return found.empty() ? nullptr : found[0];
    }
};

// ============================================================================
// Add
// ============================================================================

TEST_F(OperationTest, AddAppendsChildrenToEveryTarget) {
    auto r = apply(R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef/tags</xpath>
        <value><li>B</li><li>C</li></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);

    for (Node* tags : nodes("Defs/ThingDef/tags")) {
        EXPECT_EQ(to_compact_xml(*tags), "<tags><li>A</li><li>B</li><li>C</li></tags>");
    }
}

TEST_F(OperationTest, AddPrependKeepsPayloadOrder) {
    apply(R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef[defName="X"]/tags</xpath>
        <order>Prepend</order>
        <value><li>B</li><li>C</li></value>
    </Operation>)");
    EXPECT_EQ(to_compact_xml(*one("Defs/ThingDef[defName=\"X\"]/tags")),
              "<tags><li>B</li><li>C</li><li>A</li></tags>");
}

TEST_F(OperationTest, AddNonListChildTwiceCollides) {
    const std::string op = R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef[defName="X"]</xpath>
        <value><description>A gun</description></value>
    </Operation>)";
    EXPECT_EQ(apply(op).outcome.status, OutcomeStatus::Applied);

    auto second = apply(op);
    EXPECT_EQ(second.outcome.status, OutcomeStatus::Failed);
    EXPECT_EQ(second.outcome.error, ErrorKind::Collision);
    EXPECT_EQ(one("Defs/ThingDef[defName=\"X\"]")->children_named("description").size(), 1u);
}

TEST_F(OperationTest, AddListItemTwiceIsAllowed) {
    const std::string op = R"(<Operation Class="Add">
        <xpath>Defs/ThingDef[defName="X"]/tags</xpath>
        <value><li>B</li></value>
    </Operation>)";
    EXPECT_TRUE(apply(op).outcome.succeeded());
    EXPECT_TRUE(apply(op).outcome.succeeded());
    EXPECT_EQ(one("Defs/ThingDef[defName=\"X\"]/tags")->child_count(), 3u);
}

TEST_F(OperationTest, AddCollisionOnOneTargetLeavesAllUntouched) {
    one("Defs/ThingDef[defName=\"Y\"]")->append_child(make_node("description", "old"));
    Document before = doc.clone();

    auto r = apply(R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef[defName="X" or defName="Y"]</xpath>
        <value><description>new</description></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Collision);
    EXPECT_TRUE(doc.equals(before));
}

TEST_F(OperationTest, AddRecordUnderRootIsAllowed) {
    auto r = apply(R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs</xpath>
        <value><ThingDef><defName>W</defName></ThingDef></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_EQ(nodes("Defs/ThingDef").size(), 4u);
}

TEST_F(OperationTest, AddWithoutTargetsFailsAndLeavesTreeUnchanged) {
    Document before = doc.clone();
    auto r = apply(R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef[defName="Nope"]/tags</xpath>
        <value><li>B</li></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Failed);
    EXPECT_EQ(r.outcome.error, ErrorKind::EmptyTarget);
    EXPECT_NE(r.outcome.reason.find("defName=\"Nope\""), std::string::npos);
    EXPECT_TRUE(doc.equals(before));
}

TEST_F(OperationTest, AddWithoutValueIsPayloadError) {
    auto r = apply(R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef/tags</xpath>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);
}

// ============================================================================
// Insert
// ============================================================================

TEST_F(OperationTest, InsertDefaultsToBefore) {
    apply(R"(<Operation Class="PatchOperationInsert">
        <xpath>Defs/ThingDef[defName="X"]/label</xpath>
        <value><description>d</description></value>
    </Operation>)");
    Node* x = one("Defs/ThingDef[defName=\"X\"]");
    EXPECT_EQ(x->children()[1]->tag(), "description");
    EXPECT_EQ(x->children()[2]->tag(), "label");
}

TEST_F(OperationTest, InsertAppendGoesAfter) {
    apply(R"(<Operation Class="PatchOperationInsert">
        <xpath>Defs/ThingDef[defName="X"]/tags/li</xpath>
        <order>Append</order>
        <value><li>B</li><li>C</li></value>
    </Operation>)");
    EXPECT_EQ(to_compact_xml(*one("Defs/ThingDef[defName=\"X\"]/tags")),
              "<tags><li>A</li><li>B</li><li>C</li></tags>");
}

TEST_F(OperationTest, InsertNextToRootIsPayloadError) {
    auto r = apply(R"(<Operation Class="PatchOperationInsert">
        <xpath>Defs</xpath>
        <value><Other/></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);
}

// ============================================================================
// Remove
// ============================================================================

TEST_F(OperationTest, RemoveDeletesEveryTarget) {
    auto r = apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>Defs/ThingDef/label</xpath>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_TRUE(nodes("Defs/ThingDef/label").empty());
}

TEST_F(OperationTest, RemoveAttributeAndText) {
    apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>Defs/ThingDef/@ParentName</xpath>
    </Operation>)");
    EXPECT_TRUE(nodes("Defs/ThingDef[@ParentName]").empty());

    apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>Defs/ThingDef[defName="X"]/label/text()</xpath>
    </Operation>)");
    Node* label = one("Defs/ThingDef[defName=\"X\"]/label");
    EXPECT_FALSE(label->text().has_value());
}

TEST_F(OperationTest, RemoveUnionSyntaxIsPayloadError) {
    Document before = doc.clone();
    auto r = apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>//tags | //li</xpath>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);
    EXPECT_TRUE(doc.equals(before));
}

TEST_F(OperationTest, RemoveListItemsUnderMatchingParents) {
    auto r = apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>//*[li="A" or li="B"]//li</xpath>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_TRUE(nodes("//li").empty());
    EXPECT_EQ(nodes("//tags").size(), 2u);
}

TEST_F(OperationTest, RemoveAncestorAndDescendantInOneOperation) {
    auto r = apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>//*[@ParentName or li="A"]</xpath>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_EQ(nodes("Defs/ThingDef").size(), 1u);
    EXPECT_TRUE(nodes("//tags").empty());
}

TEST_F(OperationTest, RemoveRootIsPayloadError) {
    auto r = apply(R"(<Operation Class="PatchOperationRemove"><xpath>Defs</xpath></Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);
    ASSERT_FALSE(doc.empty());
}

TEST_F(OperationTest, RemoveWithoutMatchFailsUnlessAlways) {
    auto r = apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>Defs/ThingDef/nope</xpath>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::EmptyTarget);

    r = apply(R"(<Operation Class="PatchOperationRemove">
        <xpath>Defs/ThingDef/nope</xpath>
        <success>Always</success>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Skipped);
}

// ============================================================================
// Replace
// ============================================================================

TEST_F(OperationTest, ReplaceNodeKeepsSiblingOrder) {
    apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef[defName="X"]/label</xpath>
        <value><label Lang="en">six-shooter</label></value>
    </Operation>)");
    Node* x = one("Defs/ThingDef[defName=\"X\"]");
    EXPECT_EQ(x->children()[1]->tag(), "label");
    EXPECT_EQ(x->children()[1]->text(), "six-shooter");
    EXPECT_EQ(*x->children()[1]->attribute("Lang"), "en");
}

TEST_F(OperationTest, ReplaceWholeNodeReplacesTagAndAttributes) {
    apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef[defName="Y"]</xpath>
        <value><TerrainDef><defName>Y2</defName></TerrainDef></value>
    </Operation>)");
    EXPECT_TRUE(nodes("Defs/ThingDef[defName=\"Y\"]").empty());
    Node* t = one("Defs/TerrainDef");
    EXPECT_TRUE(t->attributes().empty());
    EXPECT_EQ(doc.root()->index_of(t), 2u);
}

TEST_F(OperationTest, ReplaceTextPreservesTagAndAttributes) {
    one("Defs/ThingDef[defName=\"X\"]/label")->set_attribute("Lang", "en");
    apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef[defName="X"]/label/text()</xpath>
        <value>six-shooter</value>
    </Operation>)");
    Node* label = one("Defs/ThingDef[defName=\"X\"]/label");
    EXPECT_EQ(label->text(), "six-shooter");
    EXPECT_EQ(*label->attribute("Lang"), "en");
}

TEST_F(OperationTest, ReplaceAttributeValue) {
    apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef[defName="X"]/@ParentName</xpath>
        <value>BaseRifle</value>
    </Operation>)");
    EXPECT_EQ(*one("Defs/ThingDef[defName=\"X\"]")->attribute("ParentName"), "BaseRifle");
}

TEST_F(OperationTest, ReplaceRootNeedsExactlyOneElement) {
    auto r = apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs</xpath>
        <value><A/><B/></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);

    r = apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs</xpath>
        <value><Defs><ThingDef/></Defs></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_EQ(to_compact_xml(*doc.root()), "<Defs><ThingDef/></Defs>");
}

TEST_F(OperationTest, ReplaceTextWithElementsIsPayloadError) {
    auto r = apply(R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef/label/text()</xpath>
        <value><b>x</b></value>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);
}

// ============================================================================
// Attributes
// ============================================================================

TEST_F(OperationTest, AttributeAddOnlyWhenAbsent) {
    auto r = apply(R"(<Operation Class="PatchOperationAttributeAdd">
        <xpath>Defs/ThingDef</xpath>
        <attribute>ParentName</attribute>
        <value>BaseMelee</value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_EQ(*one("Defs/ThingDef[@Name=\"BaseGun\"]")->attribute("ParentName"), "BaseMelee");
    EXPECT_EQ(*one("Defs/ThingDef[defName=\"X\"]")->attribute("ParentName"), "BaseGun");
}

TEST_F(OperationTest, AttributeAddEverywhereAlreadyPresentIsSkipped) {
    auto r = apply(R"(<Operation Class="PatchOperationAttributeAdd">
        <xpath>Defs/ThingDef[@ParentName]</xpath>
        <attribute>ParentName</attribute>
        <value>Other</value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Skipped);
    EXPECT_FALSE(r.outcome.failed());
}

TEST_F(OperationTest, AttributeSetOverwrites) {
    auto r = apply(R"(<Operation Class="PatchOperationAttributeSet">
        <xpath>Defs/ThingDef[defName="X"]</xpath>
        <attribute>ParentName</attribute>
        <value>BaseRifle</value>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_EQ(*one("Defs/ThingDef[defName=\"X\"]")->attribute("ParentName"), "BaseRifle");
}

TEST_F(OperationTest, AttributeRemoveAbsentIsSkipped) {
    auto r = apply(R"(<Operation Class="PatchOperationAttributeRemove">
        <xpath>Defs/ThingDef[defName="X"]</xpath>
        <attribute>Abstract</attribute>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Skipped);

    r = apply(R"(<Operation Class="PatchOperationAttributeRemove">
        <xpath>Defs/ThingDef</xpath>
        <attribute>Abstract</attribute>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_TRUE(nodes("Defs/ThingDef[@Abstract]").empty());
}

TEST_F(OperationTest, AttributeKindsRequireAttributeName) {
    auto r = apply(R"(<Operation Class="PatchOperationAttributeSet">
        <xpath>Defs/ThingDef</xpath>
        <value>x</value>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Payload);
}

// ============================================================================
// SetName
// ============================================================================

TEST_F(OperationTest, SetNamePreservesContent) {
    Node* before = one("Defs/ThingDef[defName=\"X\"]/tags");
    NodePtr snapshot = before->clone();

    auto r = apply(R"(<Operation Class="PatchOperationSetName">
        <xpath>Defs/ThingDef[defName="X"]/tags</xpath>
        <name>weaponTags</name>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);

    Node* after = one("Defs/ThingDef[defName=\"X\"]/weaponTags");
    snapshot->set_tag("weaponTags");
    EXPECT_TRUE(after->equals(*snapshot));
    EXPECT_EQ(one("Defs/ThingDef[defName=\"X\"]")->index_of(after), 2u);
}

TEST_F(OperationTest, SetNameIntoExistingSiblingCollides) {
    Document before = doc.clone();
    auto r = apply(R"(<Operation Class="PatchOperationSetName">
        <xpath>Defs/ThingDef[defName="X"]/tags</xpath>
        <name>label</name>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Collision);
    EXPECT_TRUE(doc.equals(before));
}

TEST_F(OperationTest, SetNameTwoSiblingsToSameTagCollides) {
    one("Defs/ThingDef[defName=\"X\"]/label")->set_attribute("Lang", "en");
    Document before = doc.clone();

    auto r = apply(R"(<Operation Class="PatchOperationSetName">
        <xpath>Defs/ThingDef[defName="X"]/*[@Lang or li="A"]</xpath>
        <name>same</name>
    </Operation>)");
    EXPECT_EQ(r.outcome.error, ErrorKind::Collision);
    EXPECT_TRUE(doc.equals(before));
}

TEST_F(OperationTest, SetNameToListItemNeverCollides) {
    auto r = apply(R"(<Operation Class="PatchOperationSetName">
        <xpath>Defs/ThingDef[defName="X"]/*[li="A" or defName="Q" or @Abstract]</xpath>
        <name>li</name>
    </Operation>)");
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Applied);
    EXPECT_TRUE(nodes("Defs/ThingDef[defName=\"X\"]/tags").empty());
}

// ============================================================================
// AddModExtension
// ============================================================================

TEST_F(OperationTest, AddModExtensionCreatesListOnce) {
    const std::string op = R"(<Operation Class="PatchOperationAddModExtension">
        <xpath>Defs/ThingDef[defName="X"]</xpath>
        <value><li Class="MyMod.Extension"><power>3</power></li></value>
    </Operation>)";
    EXPECT_EQ(apply(op).outcome.status, OutcomeStatus::Applied);
    EXPECT_EQ(apply(op).outcome.status, OutcomeStatus::Applied);

    Node* list = one("Defs/ThingDef[defName=\"X\"]/modExtensions");
    ASSERT_EQ(list->child_count(), 2u);
    EXPECT_EQ(*list->children()[0]->attribute("Class"), "MyMod.Extension");
}

TEST_F(OperationTest, AddModExtensionWrapsNonListPayload) {
    apply(R"(<Operation Class="PatchOperationAddModExtension">
        <xpath>Defs/ThingDef[defName="Y"]</xpath>
        <value><power>3</power></value>
    </Operation>)");
    EXPECT_EQ(to_compact_xml(*one("Defs/ThingDef[defName=\"Y\"]/modExtensions")),
              "<modExtensions><li><power>3</power></li></modExtensions>");
}

// ============================================================================
// Test
// ============================================================================

TEST_F(OperationTest, TestSucceedsWithoutMutating) {
    Document before = doc.clone();
    auto found = apply(R"(<Operation Class="PatchOperationTest">
        <xpath>Defs/ThingDef[defName="X"]</xpath>
    </Operation>)");
    EXPECT_EQ(found.outcome.status, OutcomeStatus::Skipped);

    auto missing = apply(R"(<Operation Class="PatchOperationTest">
        <xpath>Defs/ThingDef[defName="Nope"]</xpath>
    </Operation>)");
    EXPECT_EQ(missing.outcome.error, ErrorKind::EmptyTarget);
    EXPECT_TRUE(doc.equals(before));
}

// ============================================================================
// Empty target set
// ============================================================================

class EmptyTargetTest : public OperationTest,
                        public ::testing::WithParamInterface<const char*> {};

TEST_P(EmptyTargetTest, FailsAndLeavesTreeUnchanged) {
    Document before = doc.clone();
    auto r = apply(GetParam());
    EXPECT_EQ(r.outcome.status, OutcomeStatus::Failed);
    EXPECT_EQ(r.outcome.error, ErrorKind::EmptyTarget);
    EXPECT_FALSE(r.outcome.mutated);
    EXPECT_TRUE(doc.equals(before));
}

INSTANTIATE_TEST_SUITE_P(EveryTargetedKind, EmptyTargetTest, ::testing::Values(
    R"(<Operation Class="PatchOperationAdd">
        <xpath>Defs/ThingDef[defName="Nope"]/tags</xpath>
        <value><li>B</li></value>
    </Operation>)",
    R"(<Operation Class="PatchOperationInsert">
        <xpath>Defs/ThingDef[defName="Nope"]/label</xpath>
        <value><description>x</description></value>
    </Operation>)",
    R"(<Operation Class="PatchOperationRemove">
        <xpath>Defs/ThingDef/description</xpath>
    </Operation>)",
    R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef[defName="Nope"]/label</xpath>
        <value><label>x</label></value>
    </Operation>)",
    R"(<Operation Class="PatchOperationReplace">
        <xpath>Defs/ThingDef/comps/text()</xpath>
        <value>x</value>
    </Operation>)",
    R"(<Operation Class="PatchOperationAttributeAdd">
        <xpath>Defs/ThingDef[defName="Nope"]</xpath>
        <attribute>Flag</attribute>
        <value>1</value>
    </Operation>)",
    R"(<Operation Class="PatchOperationAttributeSet">
        <xpath>Defs/PawnKindDef</xpath>
        <attribute>Flag</attribute>
        <value>1</value>
    </Operation>)",
    R"(<Operation Class="PatchOperationAttributeRemove">
        <xpath>Defs/PawnKindDef</xpath>
        <attribute>ParentName</attribute>
    </Operation>)",
    R"(<Operation Class="PatchOperationSetName">
        <xpath>Defs/ThingDef[defName="Nope"]/label</xpath>
        <name>title</name>
    </Operation>)",
    R"(<Operation Class="PatchOperationAddModExtension">
        <xpath>Defs/ThingDef[defName="Nope"]</xpath>
        <value><li><power>3</power></li></value>
    </Operation>)"));
