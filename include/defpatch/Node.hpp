/**
 * @file Node.hpp
 * @brief Element of the structural document tree
 *
 * A Node owns its children. It carries a tag name, ordered attributes,
 * ordered children and optional text. Mixed content (text plus children)
 * is tolerated.
 *
 * Nodes tagged `li` are list items: siblings sharing the `li` tag form an
 * ordered, repeatable list. All other sibling tags are expected to be
 * unique under their parent (see Document for where this is enforced).
 */

#ifndef DEFPATCH_NODE_HPP
#define DEFPATCH_NODE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace defpatch {

/// Tag name of list items
inline const std::string LIST_ITEM_TAG = "li";

/**
 * @brief Attribute name/value pair
 */
struct Attribute {
    std::string name;
    std::string value;

    bool operator==(const Attribute& other) const {
        return name == other.name && value == other.value;
    }
};

class Node;
using NodePtr = std::unique_ptr<Node>;

class Node {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit Node(std::string tag);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // ---- Tag ---------------------------------------------------------------

    const std::string& tag() const noexcept { return tag_; }
    void set_tag(std::string tag) { tag_ = std::move(tag); }

    /// True if this node is a list item (`li`)
    bool is_list_item() const noexcept { return tag_ == LIST_ITEM_TAG; }

    // ---- Attributes --------------------------------------------------------

    const std::vector<Attribute>& attributes() const noexcept { return attributes_; }

    /**
     * @brief Look up an attribute value
     * @return Pointer to the value, or nullptr if absent
     */
    const std::string* attribute(const std::string& name) const;

    bool has_attribute(const std::string& name) const {
        return attribute(name) != nullptr;
    }

    /**
     * @brief Add or overwrite an attribute
     * @return true if the attribute was newly added, false if overwritten
     */
    bool set_attribute(const std::string& name, std::string value);

    /**
     * @brief Remove an attribute
     * @return true if it was present
     */
    bool remove_attribute(const std::string& name);

    // ---- Text --------------------------------------------------------------

    const std::optional<std::string>& text() const noexcept { return text_; }
    void set_text(std::string text) { text_ = std::move(text); }
    void clear_text() { text_.reset(); }

    /**
     * @brief Concatenated text of this node and all its descendants
     *
     * Used for predicate comparisons; for a leaf node this is its own text.
     */
    std::string inner_text() const;

    // ---- Children ----------------------------------------------------------

    const std::vector<NodePtr>& children() const noexcept { return children_; }
    size_t child_count() const noexcept { return children_.size(); }
    bool has_children() const noexcept { return !children_.empty(); }

    Node* parent() const noexcept { return parent_; }

    /// First direct child with the given tag, or nullptr
    Node* child(const std::string& tag) const;

    /// All direct children with the given tag, in order
    std::vector<Node*> children_named(const std::string& tag) const;

    /**
     * @brief Position of a direct child
     * @return Index, or npos if `child` is not a direct child
     */
    size_t index_of(const Node* child) const noexcept;

    Node& append_child(NodePtr child);
    Node& prepend_child(NodePtr child);

    /**
     * @brief Insert a child at a position
     * @param index Position in [0, child_count()]
     * @throws std::out_of_range if index is past the end
     */
    Node& insert_child(size_t index, NodePtr child);

    /**
     * @brief Detach a direct child
     * @return Ownership of the detached node, or nullptr if not a child
     */
    NodePtr remove_child(const Node* child);

    void clear_children();

    // ---- Structure ---------------------------------------------------------

    /// Deep copy without parent link
    NodePtr clone() const;

    /**
     * @brief Structural equality
     *
     * Tags, attribute sets (order-insensitive), text and children
     * (order-sensitive) must match.
     */
    bool equals(const Node& other) const;

    bool operator==(const Node& other) const { return equals(other); }
    bool operator!=(const Node& other) const { return !equals(other); }

private:
    std::string tag_;
    std::vector<Attribute> attributes_;
    std::optional<std::string> text_;
    std::vector<NodePtr> children_;
    Node* parent_ = nullptr;
};

/// Convenience constructor
NodePtr make_node(std::string tag, std::optional<std::string> text = std::nullopt);

} // namespace defpatch

#endif // DEFPATCH_NODE_HPP
