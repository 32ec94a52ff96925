/**
 * @file Document.cpp
 * @brief Expat-based document parsing and XML serialization
 */

#include "defpatch/Document.hpp"
#include "defpatch/Errors.hpp"

#include <expat.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <vector>

namespace defpatch {

namespace {

// ============================================================================
// Expat tree builder
// ============================================================================

struct ParserDeleter {
    void operator()(XML_Parser p) const { XML_ParserFree(p); }
};
using ParserHandle = std::unique_ptr<XML_ParserStruct, ParserDeleter>;

/**
 * @brief State shared with the expat callbacks.
 *
 * Callbacks never throw through expat; they record the first error and
 * stop the parser, and parse() raises it afterwards.
 */
struct BuildState {
    XML_Parser parser = nullptr;
    const ParseOptions* opts = nullptr;
    NodePtr root;
    std::vector<Node*> stack;
    std::vector<std::string> pending_text;
    std::vector<std::set<std::string>> seen_tags;

    bool failed = false;
    int error_line = 0;
    int error_column = 0;
    std::string error;

    void fail(std::string message) {
        if (failed) return;
        failed = true;
        error = std::move(message);
        error_line = static_cast<int>(XML_GetCurrentLineNumber(parser));
        error_column = static_cast<int>(XML_GetCurrentColumnNumber(parser)) + 1;
        XML_StopParser(parser, XML_FALSE);
    }
};

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

void XMLCALL on_start(void* user, const XML_Char* name, const XML_Char** atts) {
    auto* st = static_cast<BuildState*>(user);
    if (st->failed) return;

    auto node = std::make_unique<Node>(name);
    for (size_t i = 0; atts[i] != nullptr; i += 2) {
        node->set_attribute(atts[i], atts[i + 1]);
    }

    Node* raw = nullptr;
    if (st->stack.empty()) {
        st->root = std::move(node);
        raw = st->root.get();
    } else {
        Node* parent = st->stack.back();
        // Records directly under the root element may repeat
        bool checked = st->opts->unique_siblings && st->stack.size() > 1;
        if (checked && node->tag() != LIST_ITEM_TAG) {
            auto& seen = st->seen_tags.back();
            if (!seen.insert(node->tag()).second) {
                st->fail("duplicate sibling <" + node->tag() + "> under <" + parent->tag() + ">");
                return;
            }
        }
        raw = &parent->append_child(std::move(node));
    }

    st->stack.push_back(raw);
    st->pending_text.emplace_back();
    st->seen_tags.emplace_back();
}

void XMLCALL on_end(void* user, const XML_Char* /*name*/) {
    auto* st = static_cast<BuildState*>(user);
    if (st->failed) return;

    Node* node = st->stack.back();
    std::string& text = st->pending_text.back();
    if (!text.empty() && !(node->has_children() && is_blank(text))) {
        node->set_text(std::move(text));
    }

    st->stack.pop_back();
    st->pending_text.pop_back();
    st->seen_tags.pop_back();
}

void XMLCALL on_text(void* user, const XML_Char* s, int len) {
    auto* st = static_cast<BuildState*>(user);
    if (st->failed || st->pending_text.empty()) return;
    st->pending_text.back().append(s, static_cast<size_t>(len));
}

// ============================================================================
// Serialization helpers
// ============================================================================

void escape_into(std::string& out, const std::string& s, bool attribute) {
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (attribute) out += "&quot;";
                else out += c;
                break;
            default: out += c; break;
        }
    }
}

void write_node(std::string& out, const Node& node, const WriteOptions& opts, int depth) {
    const std::string pad = opts.pretty ? std::string(static_cast<size_t>(depth * opts.indent), ' ') : "";
    out += pad;
    out += '<';
    out += node.tag();
    for (const auto& attr : node.attributes()) {
        out += ' ';
        out += attr.name;
        out += "=\"";
        escape_into(out, attr.value, true);
        out += '"';
    }

    const bool has_text = node.text().has_value() && !node.text()->empty();
    if (!has_text && !node.has_children()) {
        out += opts.pretty ? " />" : "/>";
        return;
    }

    out += '>';
    if (has_text) {
        escape_into(out, *node.text(), false);
    }
    if (node.has_children()) {
        // Indentation inside mixed content would change its text
        if (opts.pretty && has_text) {
            WriteOptions compact = opts;
            compact.pretty = false;
            for (const auto& c : node.children()) {
                write_node(out, *c, compact, 0);
            }
        } else {
            for (const auto& c : node.children()) {
                if (opts.pretty) out += '\n';
                write_node(out, *c, opts, depth + 1);
            }
        }
        if (opts.pretty && !has_text) {
            out += '\n';
            out += pad;
        }
    }
    out += "</";
    out += node.tag();
    out += '>';
}

void check_unique(const Node& node, const Document& doc, const std::string& source) {
    std::set<std::string> seen;
    for (const auto& c : node.children()) {
        if (doc.allows_duplicate(node, c->tag())) continue;
        if (!seen.insert(c->tag()).second) {
            throw MalformedDocumentError(
                source, 0, 0,
                "duplicate sibling <" + c->tag() + "> under <" + node.tag() + ">");
        }
    }
    for (const auto& c : node.children()) {
        check_unique(*c, doc, source);
    }
}

} // anonymous namespace

// ============================================================================
// Document
// ============================================================================

Document::Document(NodePtr root)
    : root_(std::move(root))
{}

Document Document::parse(const std::string& xml, const ParseOptions& opts) {
    ParserHandle parser(XML_ParserCreate(nullptr));
    if (!parser) {
        throw PatchError("Failed to allocate XML parser");
    }

    BuildState state;
    state.parser = parser.get();
    state.opts = &opts;

    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), on_start, on_end);
    XML_SetCharacterDataHandler(parser.get(), on_text);

    const XML_Status status = XML_Parse(parser.get(), xml.data(),
                                        static_cast<int>(xml.size()), XML_TRUE);

    if (state.failed) {
        throw MalformedDocumentError(opts.source_name, state.error_line,
                                     state.error_column, state.error);
    }
    if (status != XML_STATUS_OK) {
        throw MalformedDocumentError(
            opts.source_name,
            static_cast<int>(XML_GetCurrentLineNumber(parser.get())),
            static_cast<int>(XML_GetCurrentColumnNumber(parser.get())) + 1,
            XML_ErrorString(XML_GetErrorCode(parser.get())));
    }
    if (!state.root) {
        throw MalformedDocumentError(opts.source_name, 0, 0, "no root element");
    }

    return Document(std::move(state.root));
}

Document Document::load_file(const std::string& path, ParseOptions opts) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    if (opts.source_name == ParseOptions{}.source_name) {
        opts.source_name = path;
    }
    return parse(ss.str(), opts);
}

NodePtr Document::set_root(NodePtr root) {
    NodePtr old = std::move(root_);
    root_ = std::move(root);
    return old;
}

Document Document::clone() const {
    return Document(root_ ? root_->clone() : nullptr);
}

bool Document::equals(const Document& other) const {
    if (!root_ || !other.root_) {
        return !root_ && !other.root_;
    }
    return root_->equals(*other.root_);
}

bool Document::contains(const Node* node) const {
    if (node == nullptr || !root_) {
        return false;
    }
    const Node* top = node;
    while (top->parent() != nullptr) {
        top = top->parent();
    }
    return top == root_.get();
}

bool Document::allows_duplicate(const Node& parent, const std::string& tag) const {
    return tag == LIST_ITEM_TAG || &parent == root_.get();
}

void Document::validate(const std::string& source_name) const {
    if (root_) {
        check_unique(*root_, *this, source_name);
    }
}

std::string Document::to_xml(const WriteOptions& opts) const {
    std::string out;
    if (opts.declaration) {
        out += "<?xml version=\"1.0\" encoding=\"utf-8\"?>";
        if (opts.pretty) out += '\n';
    }
    if (root_) {
        write_node(out, *root_, opts, 0);
        if (opts.pretty) out += '\n';
    }
    return out;
}

void Document::save_file(const std::string& path, const WriteOptions& opts) const {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw PatchError("Failed to open for write: " + path);
    }
    ofs << to_xml(opts);
}

std::string to_xml(const Node& node, const WriteOptions& opts) {
    std::string out;
    write_node(out, node, opts, 0);
    return out;
}

std::string to_compact_xml(const Node& node) {
    WriteOptions opts;
    opts.pretty = false;
    return to_xml(node, opts);
}

} // namespace defpatch
