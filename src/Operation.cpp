/**
 * @file Operation.cpp
 * @brief Operation helpers and PatchUnit arena
 */

#include "defpatch/Operation.hpp"

namespace defpatch {

const std::vector<NodePtr>& Operation::payload() const {
    static const std::vector<NodePtr> none;
    return value ? value->children() : none;
}

std::string Operation::payload_text() const {
    if (!value || !value->text().has_value()) {
        return "";
    }
    return *value->text();
}

PatchUnit::PatchUnit(std::string name)
    : name_(std::move(name))
{}

OpId PatchUnit::add(Operation op) {
    arena_.push_back(std::move(op));
    return arena_.size() - 1;
}

void PatchUnit::add_root(OpId id) {
    roots_.push_back(id);
}

std::string to_string(Order order) {
    switch (order) {
        case Order::Append: return "Append";
        case Order::Prepend: return "Prepend";
        case Order::Default: break;
    }
    return "Default";
}

std::string to_string(SuccessMode mode) {
    switch (mode) {
        case SuccessMode::Always: return "Always";
        case SuccessMode::Invert: return "Invert";
        case SuccessMode::Never: return "Never";
        case SuccessMode::Normal: break;
    }
    return "Normal";
}

std::optional<Order> parse_order(const std::string& text) {
    if (text == "Append") return Order::Append;
    if (text == "Prepend") return Order::Prepend;
    return std::nullopt;
}

std::optional<SuccessMode> parse_success_mode(const std::string& text) {
    if (text == "Normal") return SuccessMode::Normal;
    if (text == "Always") return SuccessMode::Always;
    if (text == "Invert") return SuccessMode::Invert;
    if (text == "Never") return SuccessMode::Never;
    return std::nullopt;
}

std::string canonical_kind(const std::string& kind) {
    if (kind.empty() || kind.rfind(KIND_PREFIX, 0) == 0) {
        return kind;
    }
    return KIND_PREFIX + kind;
}

std::string short_kind(const std::string& kind) {
    if (kind.rfind(KIND_PREFIX, 0) == 0 && kind.size() > KIND_PREFIX.size()) {
        return kind.substr(KIND_PREFIX.size());
    }
    return kind;
}

} // namespace defpatch
