/**
 * @file test_document.cpp
 * @brief Unit tests for Document parsing, identity and serialization (GoogleTest)
 *
 * Tests cover:
 * - well-formedness errors with location
 * - sibling uniqueness (li and root records exempt)
 * - text handling, clone, equality, contains()
 * - pretty and compact output, file round trip
 */

#include <gtest/gtest.h>
#include "defpatch/Document.hpp"
#include "defpatch/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace defpatch;

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& extension = ".xml")
        : path_(fs::temp_directory_path() /
                ("defpatch_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

const char* kItemXml =
    "<Root><Item><id>1</id><tags><li>A</li></tags></Item></Root>";

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(DocumentParse, BuildsTree) {
    Document doc = Document::parse(kItemXml);
    ASSERT_FALSE(doc.empty());
    EXPECT_EQ(doc.root()->tag(), "Root");
    Node* item = doc.root()->child("Item");
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->child("id")->text(), "1");
    EXPECT_EQ(item->child("tags")->child_count(), 1u);
}

TEST(DocumentParse, KeepsAttributesInOrder) {
    Document doc = Document::parse(
        R"(<Defs><ThingDef Name="BaseGun" Abstract="True"/></Defs>)");
    const Node* def = doc.root()->child("ThingDef");
    ASSERT_EQ(def->attributes().size(), 2u);
    EXPECT_EQ(def->attributes()[0].name, "Name");
    EXPECT_EQ(def->attributes()[1].value, "True");
}

TEST(DocumentParse, DropsCommentsAndIndentation) {
    Document doc = Document::parse(
        "<?xml version=\"1.0\"?>\n"
        "<Defs>\n"
        "  <!-- a comment -->\n"
        "  <ThingDef>\n"
        "    <label>gun</label>\n"
        "  </ThingDef>\n"
        "</Defs>\n");
    const Node* def = doc.root()->child("ThingDef");
    ASSERT_NE(def, nullptr);
    EXPECT_FALSE(def->text().has_value());
    EXPECT_EQ(def->child("label")->text(), "gun");
    EXPECT_FALSE(doc.root()->text().has_value());
}

TEST(DocumentParse, DecodesEntities) {
    Document doc = Document::parse("<a><b>x &amp; y &lt;z&gt;</b></a>");
    EXPECT_EQ(doc.root()->child("b")->text(), "x & y <z>");
}

TEST(DocumentParse, UnclosedTagIsMalformed) {
    try {
        Document::parse("<Root>\n  <Item>\n</Root>", ParseOptions{"base.xml", true});
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.source(), "base.xml");
        EXPECT_EQ(e.line(), 3);
        EXPECT_GT(e.column(), 0);
        EXPECT_NE(std::string(e.what()).find("base.xml"), std::string::npos);
    }
}

TEST(DocumentParse, EmptyInputIsMalformed) {
    EXPECT_THROW(Document::parse(""), MalformedDocumentError);
}

// ============================================================================
// Sibling uniqueness
// ============================================================================

TEST(DocumentUniqueness, DuplicateNonListSiblingsRejected) {
    EXPECT_THROW(
        Document::parse("<Defs><ThingDef><label>a</label><label>b</label></ThingDef></Defs>"),
        MalformedDocumentError);
}

TEST(DocumentUniqueness, ListItemsMayRepeat) {
    EXPECT_NO_THROW(Document::parse("<Root><Item><tags><li>A</li><li>A</li></tags></Item></Root>"));
}

TEST(DocumentUniqueness, RootRecordsMayRepeat) {
    Document doc = Document::parse(
        "<Defs><ThingDef><defName>X</defName></ThingDef>"
        "<ThingDef><defName>Y</defName></ThingDef></Defs>");
    EXPECT_EQ(doc.root()->child_count(), 2u);
}

TEST(DocumentUniqueness, CheckCanBeDisabled) {
    ParseOptions opts;
    opts.unique_siblings = false;
    EXPECT_NO_THROW(Document::parse("<a><b><c/><c/></b></a>", opts));
}

TEST(DocumentUniqueness, ValidateFindsDuplicatesAfterConstruction) {
    Document doc = Document::parse("<a><b><c/></b></a>");
    EXPECT_NO_THROW(doc.validate());
    doc.root()->child("b")->append_child(make_node("c"));
    EXPECT_THROW(doc.validate(), MalformedDocumentError);
}

TEST(DocumentUniqueness, AllowsDuplicate) {
    Document doc = Document::parse(kItemXml);
    Node* item = doc.root()->child("Item");
    EXPECT_TRUE(doc.allows_duplicate(*doc.root(), "Item"));
    EXPECT_TRUE(doc.allows_duplicate(*item, "li"));
    EXPECT_FALSE(doc.allows_duplicate(*item, "id"));
}

// ============================================================================
// Identity, clone, equality
// ============================================================================

TEST(DocumentIdentity, ContainsTracksAttachment) {
    Document doc = Document::parse(kItemXml);
    Node* item = doc.root()->child("Item");
    Node* id = item->child("id");
    EXPECT_TRUE(doc.contains(id));

    NodePtr detached = item->remove_child(id);
    EXPECT_FALSE(doc.contains(detached.get()));
    EXPECT_FALSE(doc.contains(nullptr));
}

TEST(DocumentIdentity, CloneDoesNotAlias) {
    Document doc = Document::parse(kItemXml);
    Document copy = doc.clone();
    EXPECT_TRUE(copy.equals(doc));
    EXPECT_FALSE(doc.contains(copy.root()->child("Item")));

    copy.root()->child("Item")->child("id")->set_text("2");
    EXPECT_FALSE(copy.equals(doc));
}

TEST(DocumentIdentity, SetRootReturnsPrevious) {
    Document doc = Document::parse("<a/>");
    NodePtr old = doc.set_root(make_node("b"));
    EXPECT_EQ(old->tag(), "a");
    EXPECT_EQ(doc.root()->tag(), "b");
}

// ============================================================================
// Serialization
// ============================================================================

TEST(DocumentWrite, CompactOutput) {
    Document doc = Document::parse("<tags>\n  <li>B</li>\n  <li>A</li>\n</tags>");
    EXPECT_EQ(to_compact_xml(*doc.root()), "<tags><li>B</li><li>A</li></tags>");
}

TEST(DocumentWrite, PrettyOutput) {
    Document doc = Document::parse(R"(<Root><Item k="v"><id>1</id><empty/></Item></Root>)");
    EXPECT_EQ(doc.to_xml(),
              "<Root>\n"
              "  <Item k=\"v\">\n"
              "    <id>1</id>\n"
              "    <empty />\n"
              "  </Item>\n"
              "</Root>\n");
}

TEST(DocumentWrite, MixedContentIsJoinedAndNotIndented) {
    Document doc = Document::parse("<Root><x>a<y/>b</x></Root>");
    Node* x = doc.root()->child("x");
    EXPECT_EQ(x->text(), "ab");
    EXPECT_EQ(x->child_count(), 1u);

    const std::string pretty = doc.to_xml();
    EXPECT_EQ(pretty,
              "<Root>\n"
              "  <x>ab<y/></x>\n"
              "</Root>\n");
    EXPECT_TRUE(Document::parse(pretty).equals(doc));
}

TEST(DocumentWrite, EscapesSpecialCharacters) {
    auto n = make_node("a", "x < y & z");
    n->set_attribute("q", "\"quoted\"");
    EXPECT_EQ(to_compact_xml(*n), "<a q=\"&quot;quoted&quot;\">x &lt; y &amp; z</a>");
}

TEST(DocumentWrite, Declaration) {
    Document doc = Document::parse("<a/>");
    WriteOptions opts;
    opts.declaration = true;
    opts.pretty = false;
    EXPECT_EQ(doc.to_xml(opts), "<?xml version=\"1.0\" encoding=\"utf-8\"?><a/>");
}

TEST(DocumentFile, SaveAndLoadRoundTrip) {
    Document doc = Document::parse(kItemXml);
    TempFile file("");
    doc.save_file(file.path());

    Document loaded = Document::load_file(file.path());
    EXPECT_TRUE(loaded.equals(doc));
}

TEST(DocumentFile, MissingFileThrows) {
    EXPECT_THROW(Document::load_file("/nonexistent/defpatch/base.xml"), FileNotFoundError);
}

TEST(DocumentFile, ErrorsNameTheFile) {
    TempFile file("<Root><a></Root>");
    try {
        Document::load_file(file.path());
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.source(), file.path());
    }
}
