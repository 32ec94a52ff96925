/**
 * @file Node.cpp
 * @brief Implementation of the document tree node
 */

#include "defpatch/Node.hpp"

#include <algorithm>
#include <stdexcept>

namespace defpatch {

Node::Node(std::string tag)
    : tag_(std::move(tag))
{}

NodePtr make_node(std::string tag, std::optional<std::string> text) {
    auto node = std::make_unique<Node>(std::move(tag));
    if (text.has_value()) {
        node->set_text(std::move(*text));
    }
    return node;
}

// ============================================================================
// Attributes
// ============================================================================

const std::string* Node::attribute(const std::string& name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) {
            return &attr.value;
        }
    }
    return nullptr;
}

bool Node::set_attribute(const std::string& name, std::string value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = std::move(value);
            return false;
        }
    }
    attributes_.push_back(Attribute{name, std::move(value)});
    return true;
}

bool Node::remove_attribute(const std::string& name) {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [&](const Attribute& a) { return a.name == name; });
    if (it == attributes_.end()) {
        return false;
    }
    attributes_.erase(it);
    return true;
}

// ============================================================================
// Text
// ============================================================================

std::string Node::inner_text() const {
    std::string result = text_.value_or("");
    for (const auto& c : children_) {
        result += c->inner_text();
    }
    return result;
}

// ============================================================================
// Children
// ============================================================================

Node* Node::child(const std::string& tag) const {
    for (const auto& c : children_) {
        if (c->tag_ == tag) {
            return c.get();
        }
    }
    return nullptr;
}

std::vector<Node*> Node::children_named(const std::string& tag) const {
    std::vector<Node*> result;
    for (const auto& c : children_) {
        if (c->tag_ == tag) {
            result.push_back(c.get());
        }
    }
    return result;
}

size_t Node::index_of(const Node* child) const noexcept {
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].get() == child) {
            return i;
        }
    }
    return npos;
}

Node& Node::append_child(NodePtr child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

Node& Node::prepend_child(NodePtr child) {
    return insert_child(0, std::move(child));
}

Node& Node::insert_child(size_t index, NodePtr child) {
    if (index > children_.size()) {
        throw std::out_of_range("child index " + std::to_string(index) +
                                " out of range for <" + tag_ + ">");
    }
    child->parent_ = this;
    auto it = children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index),
                               std::move(child));
    return **it;
}

NodePtr Node::remove_child(const Node* child) {
    size_t idx = index_of(child);
    if (idx == npos) {
        return nullptr;
    }
    NodePtr detached = std::move(children_[idx]);
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(idx));
    detached->parent_ = nullptr;
    return detached;
}

void Node::clear_children() {
    children_.clear();
}

// ============================================================================
// Structure
// ============================================================================

NodePtr Node::clone() const {
    auto copy = std::make_unique<Node>(tag_);
    copy->attributes_ = attributes_;
    copy->text_ = text_;
    copy->children_.reserve(children_.size());
    for (const auto& c : children_) {
        copy->append_child(c->clone());
    }
    return copy;
}

bool Node::equals(const Node& other) const {
    if (tag_ != other.tag_ || text_ != other.text_) {
        return false;
    }
    if (attributes_.size() != other.attributes_.size() ||
        children_.size() != other.children_.size()) {
        return false;
    }
    for (const auto& attr : attributes_) {
        const std::string* theirs = other.attribute(attr.name);
        if (theirs == nullptr || *theirs != attr.value) {
            return false;
        }
    }
    for (size_t i = 0; i < children_.size(); ++i) {
        if (!children_[i]->equals(*other.children_[i])) {
            return false;
        }
    }
    return true;
}

} // namespace defpatch
