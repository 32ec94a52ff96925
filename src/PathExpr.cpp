/**
 * @file PathExpr.cpp
 * @brief Recursive-descent parser for the path subset
 */

#include "defpatch/PathExpr.hpp"
#include "defpatch/Errors.hpp"

#include <cctype>

namespace defpatch {

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '-' || c == '.' || c == ':';
}

/**
 * @brief Character cursor over the expression text
 */
class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {}

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }
    size_t pos() const { return pos_; }

    bool starts_with(const std::string& s) const {
        return text_.compare(pos_, s.size(), s) == 0;
    }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    bool consume(const std::string& s) {
        if (!starts_with(s)) return false;
        pos_ += s.size();
        return true;
    }

    void skip_space() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
    }

    std::string name() {
        size_t start = pos_;
        while (!at_end() && is_name_char(peek())) ++pos_;
        return text_.substr(start, pos_ - start);
    }

    std::string literal() {
        char quote = peek();
        if (quote != '"' && quote != '\'') {
            fail("expected quoted literal");
        }
        ++pos_;
        size_t start = pos_;
        while (!at_end() && peek() != quote) ++pos_;
        if (at_end()) {
            fail("unterminated literal");
        }
        std::string value = text_.substr(start, pos_ - start);
        ++pos_;
        return value;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw PayloadError("Invalid path '" + text_ + "' at position " +
                           std::to_string(pos_) + ": " + what);
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
};

PredicateClause parse_clause(Cursor& cur) {
    cur.skip_space();
    PredicateClause clause;

    if (cur.consume('@')) {
        clause.name = cur.name();
        if (clause.name.empty()) cur.fail("expected attribute name");
        cur.skip_space();
        if (cur.starts_with("!=")) cur.fail("'!=' is not supported");
        if (cur.consume('=')) {
            cur.skip_space();
            clause.kind = PredicateKind::AttributeEquals;
            clause.value = cur.literal();
        } else {
            clause.kind = PredicateKind::AttributePresent;
        }
        return clause;
    }

    if (cur.consume("inherits(")) {
        cur.skip_space();
        clause.kind = PredicateKind::InheritsFrom;
        clause.value = cur.literal();
        cur.skip_space();
        if (!cur.consume(')')) cur.fail("expected ')'");
        return clause;
    }

    clause.name = cur.name();
    if (clause.name.empty()) cur.fail("expected predicate");
    if (std::isdigit(static_cast<unsigned char>(clause.name[0]))) {
        cur.fail("positional predicates are not supported");
    }
    if (cur.peek() == '(') cur.fail("function '" + clause.name + "' is not supported");
    if (cur.peek() == '/') cur.fail("nested paths in predicates are not supported");
    cur.skip_space();
    if (cur.starts_with("!=")) cur.fail("'!=' is not supported");
    if (!cur.consume('=')) cur.fail("expected '=' after '" + clause.name + "'");
    cur.skip_space();
    clause.kind = PredicateKind::ChildText;
    clause.value = cur.literal();
    return clause;
}

Predicate parse_predicate(Cursor& cur) {
    Predicate pred;
    pred.any_of.push_back(parse_clause(cur));

    while (true) {
        cur.skip_space();
        if (cur.peek() == ']') break;
        std::string word = cur.name();
        if (word == "or") {
            pred.any_of.push_back(parse_clause(cur));
        } else if (word == "and") {
            cur.fail("'and' predicates are not supported");
        } else {
            cur.fail("expected 'or' or ']'");
        }
    }
    return pred;
}

} // anonymous namespace

PathExpression PathExpression::parse(const std::string& text) {
    PathExpression expr;
    expr.source_ = text;

    Cursor cur(text);
    cur.skip_space();
    if (cur.at_end()) {
        cur.fail("empty path");
    }

    Axis axis = Axis::Child;
    if (cur.consume("//")) {
        axis = Axis::Descendant;
    } else {
        cur.consume('/');
    }

    while (true) {
        if (!expr.steps_.empty() && axis == Axis::Child) {
            if (cur.consume("text()")) {
                if (!cur.at_end()) cur.fail("text() must be the last step");
                expr.selector_ = Selector::Text;
                break;
            }
            if (cur.consume('@')) {
                expr.attribute_ = cur.name();
                if (expr.attribute_.empty()) cur.fail("expected attribute name");
                if (!cur.at_end()) cur.fail("attribute selector must be the last step");
                expr.selector_ = Selector::Attribute;
                break;
            }
        }

        Step step;
        step.axis = axis;
        if (cur.consume('*')) {
            step.tag = "*";
        } else {
            step.tag = cur.name();
            if (step.tag.empty()) cur.fail("expected step name");
            if (cur.peek() == '(') cur.fail("function '" + step.tag + "' is not supported here");
        }

        cur.skip_space();
        if (cur.consume('[')) {
            step.predicate = parse_predicate(cur);
            if (!cur.consume(']')) cur.fail("expected ']'");
            cur.skip_space();
            if (cur.peek() == '[') cur.fail("multiple predicates on one step are not supported");
        }
        expr.steps_.push_back(std::move(step));

        if (cur.at_end()) break;
        if (cur.consume("//")) {
            axis = Axis::Descendant;
        } else if (cur.consume('/')) {
            axis = Axis::Child;
        } else {
            cur.fail(std::string("unexpected character '") + cur.peek() + "'");
        }
        if (cur.at_end()) cur.fail("path ends with a separator");
    }

    return expr;
}

} // namespace defpatch
