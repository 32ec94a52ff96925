/**
 * @file Document.hpp
 * @brief Structural document: parsing, identity lookup, clone, serialization
 *
 * Documents are parsed from XML with expat. Comments, processing
 * instructions and the declaration are discarded.
 *
 * Mixed content is tolerated but not kept in place: all character data of
 * an element is joined into its single text value, which is written before
 * its children. `<x>a<y/>b</x>` reads back as text "ab" plus child `<y/>`.
 * Whitespace-only text next to child elements is dropped. The pretty
 * writer emits the children of an element that has text without
 * indentation, so the text is not altered.
 *
 * Sibling uniqueness rule (checked when ParseOptions::unique_siblings):
 * - `li` children may repeat freely
 * - children of the root element form a record collection and may repeat
 * - every other tag must be unique among its siblings
 */

#ifndef DEFPATCH_DOCUMENT_HPP
#define DEFPATCH_DOCUMENT_HPP

#include "defpatch/Node.hpp"
#include <string>

namespace defpatch {

/**
 * @brief Options for parsing a document
 */
struct ParseOptions {
    /// Name used in error messages (file path or label)
    std::string source_name = "<memory>";

    /// Reject duplicate non-list siblings below the root element
    bool unique_siblings = true;
};

/**
 * @brief Options for serializing a document
 */
struct WriteOptions {
    /// Indent nested elements on separate lines
    bool pretty = true;

    /// Spaces per nesting level when pretty
    int indent = 2;

    /// Emit `<?xml version="1.0" encoding="utf-8"?>`
    bool declaration = false;
};

class Document {
public:
    Document() = default;
    explicit Document(NodePtr root);

    Document(Document&&) noexcept = default;
    Document& operator=(Document&&) noexcept = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    /**
     * @brief Parse a document from XML text
     * @throws MalformedDocumentError on broken markup or duplicate siblings
     */
    static Document parse(const std::string& xml, const ParseOptions& opts = {});

    /**
     * @brief Parse a document from a file
     *
     * If opts.source_name is left at its default, the path is used.
     *
     * @throws FileNotFoundError if the file cannot be opened
     * @throws MalformedDocumentError on broken markup or duplicate siblings
     */
    static Document load_file(const std::string& path, ParseOptions opts = {});

    Node* root() const noexcept { return root_.get(); }
    bool empty() const noexcept { return root_ == nullptr; }

    /**
     * @brief Replace the root element
     * @return The previous root
     */
    NodePtr set_root(NodePtr root);

    /// Deep copy
    Document clone() const;

    /// Structural equality of the root elements
    bool equals(const Document& other) const;

    /**
     * @brief Identity lookup: is `node` part of this tree?
     */
    bool contains(const Node* node) const;

    /**
     * @brief Whether `parent` may hold several children tagged `tag`
     *
     * True for list items and for records directly under the root element.
     */
    bool allows_duplicate(const Node& parent, const std::string& tag) const;

    /**
     * @brief Check the sibling uniqueness rule over the whole tree
     * @throws MalformedDocumentError naming the first offending parent
     */
    void validate(const std::string& source_name = "<memory>") const;

    std::string to_xml(const WriteOptions& opts = {}) const;

    /**
     * @brief Write the document to a file
     * @throws PatchError if the file cannot be opened for writing
     */
    void save_file(const std::string& path, const WriteOptions& opts = {}) const;

private:
    NodePtr root_;
};

/**
 * @brief Serialize a single node and its subtree
 */
std::string to_xml(const Node& node, const WriteOptions& opts = {});

/**
 * @brief Serialize without whitespace: `<a><b>x</b></a>`
 */
std::string to_compact_xml(const Node& node);

} // namespace defpatch

#endif // DEFPATCH_DOCUMENT_HPP
