/**
 * @file PatchLoader.cpp
 * @brief Patch document to PatchUnit conversion
 */

#include "defpatch/PatchLoader.hpp"
#include "defpatch/Errors.hpp"

#include <spdlog/spdlog.h>

namespace defpatch {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/**
 * @brief Record the first problem found in a declaration
 */
void flag(Operation& op, const std::string& problem) {
    if (op.payload_error.empty()) {
        op.payload_error = problem;
    }
}

OpId read_operation(const Node& decl, PatchUnit& unit);

void read_field(const Node& field, Operation& op, PatchUnit& unit) {
    const std::string& tag = field.tag();

    if (tag == "xpath") {
        op.path_text = trim(field.inner_text());
        try {
            op.path = PathExpression::parse(op.path_text);
        } catch (const PayloadError& e) {
            flag(op, e.what());
        }
    } else if (tag == "value") {
        op.value = field.clone();
    } else if (tag == "order") {
        auto order = parse_order(trim(field.inner_text()));
        if (order) {
            op.order = *order;
        } else {
            flag(op, "invalid <order> '" + trim(field.inner_text()) + "' (expected Append or Prepend)");
        }
    } else if (tag == "success") {
        auto mode = parse_success_mode(trim(field.inner_text()));
        if (mode) {
            op.success = *mode;
        } else {
            flag(op, "invalid <success> '" + trim(field.inner_text()) +
                         "' (expected Normal, Always, Invert or Never)");
        }
    } else if (tag == "attribute") {
        op.attribute = trim(field.inner_text());
    } else if (tag == "name") {
        op.name = trim(field.inner_text());
    } else if (tag == "mods") {
        for (const auto& item : field.children()) {
            if (!item->is_list_item()) {
                flag(op, "<mods> entries must be <li>");
                continue;
            }
            op.mods.push_back(trim(item->inner_text()));
        }
    } else if (tag == "operations") {
        for (const auto& item : field.children()) {
            if (!item->is_list_item()) {
                flag(op, "<operations> entries must be <li>");
                continue;
            }
            op.operations.push_back(read_operation(*item, unit));
        }
    } else if (tag == "match") {
        op.match = read_operation(field, unit);
    } else if (tag == "nomatch") {
        op.nomatch = read_operation(field, unit);
    } else {
        flag(op, "unknown field <" + tag + ">");
    }
}

OpId read_operation(const Node& decl, PatchUnit& unit) {
    Operation op;

    const std::string* cls = decl.attribute(CLASS_ATTRIBUTE);
    if (cls == nullptr || trim(*cls).empty()) {
        flag(op, "<" + decl.tag() + "> is missing the Class attribute");
    } else {
        op.kind = canonical_kind(trim(*cls));
    }

    // Nested operations are stored before their parent
    for (const auto& field : decl.children()) {
        read_field(*field, op, unit);
    }

    if (!op.payload_error.empty()) {
        spdlog::warn("{}: malformed {} declaration: {}", unit.name(),
                     op.kind.empty() ? "operation" : short_kind(op.kind), op.payload_error);
    }
    return unit.add(std::move(op));
}

} // anonymous namespace

PatchUnit load_patch(const Document& doc, const std::string& name) {
    if (doc.empty() || doc.root()->tag() != PATCH_ROOT_TAG) {
        throw MalformedDocumentError(name, 0, 0,
                                     "patch document root must be <" + PATCH_ROOT_TAG + ">");
    }

    PatchUnit unit(name);
    for (const auto& decl : doc.root()->children()) {
        OpId id = read_operation(*decl, unit);
        if (decl->tag() != OPERATION_TAG) {
            // Keep it so the report stays complete
            Operation placeholder;
            placeholder.kind = unit.at(id).kind;
            placeholder.payload_error = "unexpected element <" + decl->tag() +
                                        "> (expected <" + OPERATION_TAG + ">)";
            id = unit.add(std::move(placeholder));
        }
        unit.add_root(id);
    }

    spdlog::debug("Loaded patch unit '{}': {} top-level operation(s), {} total",
                  name, unit.roots().size(), unit.size());
    return unit;
}

PatchUnit load_patch_string(const std::string& xml, const std::string& name) {
    ParseOptions opts;
    opts.source_name = name;
    opts.unique_siblings = false;
    return load_patch(Document::parse(xml, opts), name);
}

PatchUnit load_patch_file(const std::string& path) {
    ParseOptions opts;
    opts.unique_siblings = false;
    return load_patch(Document::load_file(path, opts), path);
}

} // namespace defpatch
