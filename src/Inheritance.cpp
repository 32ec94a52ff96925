/**
 * @file Inheritance.cpp
 * @brief Record merging for template inheritance
 */

#include "defpatch/Inheritance.hpp"
#include "defpatch/PathQuery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace defpatch {

namespace {

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool flag_set(const Node& node, const std::string& attr, const std::string& expected) {
    const std::string* v = node.attribute(attr);
    return v != nullptr && equals_ignore_case(*v, expected);
}

/**
 * @brief Resolution pass over one document's records
 */
class Resolution {
public:
    Resolution(const Node& root, const InheritanceMarkers& markers, InheritanceReport& report)
        : root_(root), markers_(markers), report_(report) {
        std::vector<std::string> duplicates;
        templates_ = template_index(root_, markers_, &duplicates);
        for (const auto& name : duplicates) {
            diagnose("duplicate template name '" + name + "'; first declaration wins");
        }
    }

    /// Record merged onto its template chain, or an unmerged copy if the chain is broken by a cycle
    NodePtr resolved(const Node& record) {
        NodePtr result = resolve_chain(record);
        return result ? std::move(result) : record.clone();
    }

private:
    const Node& root_;
    const InheritanceMarkers& markers_;
    InheritanceReport& report_;
    std::map<std::string, const Node*> templates_;
    std::set<const Node*> in_progress_;

    /// nullptr if the chain through `record` loops back on itself
    NodePtr resolve_chain(const Node& record) {
        const std::string* parent_name = record.attribute(markers_.parent_name);
        if (parent_name == nullptr) {
            return record.clone();
        }

        if (!in_progress_.insert(&record).second) {
            diagnose("inheritance cycle through '" + *parent_name + "'");
            return nullptr;
        }

        NodePtr result;
        auto it = templates_.find(*parent_name);
        if (it == templates_.end()) {
            diagnose("<" + record.tag() + "> references unknown template '" + *parent_name + "'");
            result = record.clone();
        } else {
            result = resolve_chain(*it->second);
            if (result) {
                result->set_tag(record.tag());
                result->remove_attribute(markers_.template_name);
                result->remove_attribute(markers_.abstract_flag);
                merge_into(*result, record);
                // Count records, not the intermediate templates they pass through
                if (in_progress_.size() == 1) ++report_.resolved;
            }
        }

        in_progress_.erase(&record);
        return result;
    }

    void diagnose(const std::string& message) {
        spdlog::warn("Inheritance: {}", message);
        report_.diagnostics.push_back(message);
    }

    NodePtr without_inherit_flag(const Node& node) const {
        NodePtr copy = node.clone();
        copy->remove_attribute(markers_.inherit_flag);
        return copy;
    }

    void merge_into(Node& target, const Node& source) {
        for (const auto& attr : source.attributes()) {
            if (attr.name == markers_.inherit_flag) continue;
            target.set_attribute(attr.name, attr.value);
        }

        if (source.text().has_value() && !source.has_children()) {
            target.clear_children();
            target.set_text(*source.text());
            return;
        }
        if (source.has_children()) {
            target.clear_text();
        }

        for (const auto& child : source.children()) {
            if (child->is_list_item()) {
                target.append_child(without_inherit_flag(*child));
                continue;
            }

            Node* existing = target.child(child->tag());
            if (existing == nullptr) {
                target.append_child(without_inherit_flag(*child));
            } else if (flag_set(*child, markers_.inherit_flag, "False")) {
                size_t at = target.index_of(existing);
                target.insert_child(at, without_inherit_flag(*child));
                target.remove_child(existing);
            } else {
                merge_into(*existing, *child);
            }
        }
    }
};

} // anonymous namespace

InheritanceResolver::InheritanceResolver(InheritanceMarkers markers)
    : markers_(std::move(markers))
{}

Document InheritanceResolver::resolve(const Document& patched, InheritanceReport* report) const {
    InheritanceReport local;
    InheritanceReport& out = report != nullptr ? *report : local;

    if (patched.empty()) {
        return Document();
    }

    const Node& root = *patched.root();
    Resolution pass(root, markers_, out);

    auto result_root = std::make_unique<Node>(root.tag());
    for (const auto& attr : root.attributes()) {
        result_root->set_attribute(attr.name, attr.value);
    }
    if (root.text().has_value()) {
        result_root->set_text(*root.text());
    }

    for (const auto& rec : root.children()) {
        if (flag_set(*rec, markers_.abstract_flag, "True")) {
            ++out.removed_abstract;
            continue;
        }
        result_root->append_child(pass.resolved(*rec));
    }

    spdlog::debug("Inheritance resolved {} record(s), dropped {} abstract template(s)",
                  out.resolved, out.removed_abstract);
    return Document(std::move(result_root));
}

} // namespace defpatch
