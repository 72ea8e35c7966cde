#include "kiln/syntax_tree.hpp"

#include "kiln/collector.hpp"

#include <array>
#include <format>
#include <optional>

namespace kiln {

namespace {

constexpr NodeId NONE = static_cast<NodeId>(-1);

constexpr std::array BINARY_OPERATORS = {
    "+", "-", "*", "/", "%", "**", "==", "!=", "===", "!==", "<", ">", "<=", ">=",
    "<<", ">>", ">>>", "&", "|", "^", "&&", "||", "??",
};

constexpr std::array ASSIGNMENT_OPERATORS = {
    "=", "+=", "-=", "*=", "/=", "%=", "**=", "<<=", ">>=", ">>>=", "&=", "|=", "^=", "&&=", "||=", "?\?=",
};

constexpr std::array PREFIX_OPERATORS = {"!", "~", "+", "-", "++", "--"};

template <size_t N>
bool one_of(const Token &tok, const std::array<const char *, N> &ops) {
    if (tok.kind != TokenKind::Punct)
        return false;
    for (const char *op : ops) {
        if (tok.text == op)
            return true;
    }
    return false;
}

} // namespace

size_t SyntaxTree::param_count(const TokenStream &ts, const Node &fn) const {
    if (fn.params == TokenStream::npos)
        return 0;
    return ts.at(fn.params).is("(") ? count_params(ts, fn.params) : 1;
}

class TreeParser {
public:
    explicit TreeParser(const TokenStream &ts) : ts_(ts) {
    }

    std::expected<SyntaxTree, SyntaxError> run() {
        NodeId root = make(NodeKind::Module);
        parse_statements(root, ts_.size() - 1);
        if (error_)
            return std::unexpected(*error_);
        finish(root);
        return std::move(tree_);
    }

private:
    const Token &peek(size_t ahead = 0) const {
        return ts_.at(pos_ + ahead);
    }

    bool failed() const {
        return error_.has_value();
    }

    NodeId fail(std::string message) {
        if (!error_)
            error_ = SyntaxError{pos_, std::move(message)};
        return NONE;
    }

    NodeId make(NodeKind kind) {
        Node n;
        n.kind = kind;
        n.first = pos_;
        n.last = pos_;
        tree_.nodes_.push_back(std::move(n));
        return static_cast<NodeId>(tree_.nodes_.size() - 1);
    }

    Node &node(NodeId id) {
        return tree_.nodes_[id];
    }

    void finish(NodeId id) {
        Node &n = node(id);
        n.last = pos_ > n.first ? pos_ - 1 : n.first;
    }

    void add(NodeId parent, NodeId child) {
        if (child != NONE && parent != NONE)
            node(parent).children.push_back(child);
    }

    bool expect(std::string_view punct) {
        if (!peek().is(punct)) {
            fail(std::format("expected '{}' but found '{}'", punct, peek().text));
            return false;
        }
        ++pos_;
        return true;
    }

    // Statements up to (not including) token `end`.
    void parse_statements(NodeId parent, size_t end) {
        while (!failed() && pos_ < end && peek().kind != TokenKind::End)
            add(parent, parse_statement());
    }

    NodeId parse_block(size_t open) {
        pos_ = open;
        NodeId block = make(NodeKind::Block);
        size_t close = ts_.partner(open);
        ++pos_;
        parse_statements(block, close);
        if (failed())
            return NONE;
        if (pos_ != close)
            return fail("unbalanced block");
        ++pos_;
        finish(block);
        return block;
    }

    bool at_terminator() const {
        const Token &tok = peek();
        return tok.is(";") || tok.is("}") || tok.kind == TokenKind::End || tok.newline_before;
    }

    NodeId end_statement(NodeId stmt) {
        if (failed())
            return NONE;
        if (!at_terminator())
            return fail(std::format("unexpected '{}'", peek().text));
        if (peek().is(";"))
            ++pos_;
        finish(stmt);
        return stmt;
    }

    NodeId expression_statement() {
        NodeId stmt = make(NodeKind::Statement);
        add(stmt, parse_expression());
        return end_statement(stmt);
    }

    NodeId parse_statement() {
        const Token &tok = peek();
        const Token &next = peek(1);

        if (tok.is(";") || tok.is(",") || tok.is(":")) {
            ++pos_;
            return NONE;
        }
        if (tok.is("@")) {
            pos_ = skip_decorator(ts_, pos_);
            return NONE;
        }
        if (tok.is("{"))
            return parse_block(pos_);
        if (!tok.is_identifier())
            return expression_statement();

        if (is_type_declaration(ts_, pos_)) {
            pos_ = type_declaration_end(ts_, pos_);
            return NONE;
        }
        size_t body = 0;
        if (is_namespace_block(ts_, pos_, body))
            return parse_block(body);

        std::string_view word = tok.text;
        if (word == "import" && !next.is("(") && !next.is(".")) {
            pos_ = import_declaration_end(ts_, pos_);
            return NONE;
        }
        if (word == "export")
            return parse_export();
        if ((word == "const" || word == "var" || word == "let") &&
            (next.is_identifier() || next.is("{") || next.is("[")))
            return end_statement(parse_declarations());
        if (word == "function")
            return parse_function(true);
        if (word == "async" && next.is_word("function") && !next.newline_before) {
            ++pos_;
            return parse_function(true);
        }
        if (word == "class")
            return parse_class(true);
        if (word == "abstract" && next.is_word("class")) {
            ++pos_;
            return parse_class(true);
        }
        if (word == "if" || word == "while" || word == "switch" || word == "with")
            return parse_conditional_statement();
        if (word == "for")
            return parse_for();
        if (word == "do")
            return parse_do();
        if (word == "try")
            return parse_try();
        if (word == "return" || word == "throw") {
            NodeId stmt = make(NodeKind::Statement);
            ++pos_;
            if (!at_terminator())
                add(stmt, parse_expression());
            return end_statement(stmt);
        }
        if (word == "case") {
            NodeId stmt = make(NodeKind::Statement);
            ++pos_;
            add(stmt, parse_expression());
            if (!failed() && !expect(":"))
                return NONE;
            finish(stmt);
            return stmt;
        }
        if (word == "default" && next.is(":")) {
            pos_ += 2;
            return NONE;
        }
        if (word == "break" || word == "continue") {
            ++pos_;
            if (peek().is_identifier() && !peek().newline_before)
                ++pos_;
            NodeId stmt = make(NodeKind::Statement);
            return end_statement(stmt);
        }
        if (word == "debugger" || word == "else" || word == "finally" || word == "catch") {
            ++pos_;
            return NONE;
        }
        if (next.is(":") && !is_reserved_word(word)) {
            pos_ += 2; // label
            return NONE;
        }
        return expression_statement();
    }

    NodeId parse_export() {
        size_t n = pos_ + 1;
        const Token &tok = ts_.at(n);
        if (tok.is_word("default")) {
            pos_ = n + 1;
            size_t decl = pos_;
            if (ts_.at(decl).is_word("async") && ts_.at(decl + 1).is_word("function"))
                ++decl;
            if (ts_.at(decl).is_word("abstract") && ts_.at(decl + 1).is_word("class"))
                ++decl;
            if (ts_.at(decl).is_word("function")) {
                pos_ = decl;
                return parse_function(true);
            }
            if (ts_.at(decl).is_word("class")) {
                pos_ = decl;
                return parse_class(true);
            }
            NodeId stmt = make(NodeKind::Statement);
            add(stmt, parse_assignment());
            return end_statement(stmt);
        }
        if (tok.is("{") || tok.is("*") || (tok.is_word("type") && (ts_.at(n + 1).is("{") || ts_.at(n + 1).is("*")))) {
            pos_ = export_clause_end(ts_, n);
            return NONE;
        }
        if (tok.is_word("import")) {
            pos_ = import_declaration_end(ts_, n);
            return NONE;
        }
        if (tok.is("=")) {
            pos_ = n + 1;
            return expression_statement();
        }
        if (tok.is_word("as") && ts_.at(n + 1).is_word("namespace")) {
            pos_ = n + 3;
            if (peek().is(";"))
                ++pos_;
            return NONE;
        }
        pos_ = n;
        return parse_statement();
    }

    // `const a = 1, { b } = c` with the cursor on the keyword.
    NodeId parse_declarations() {
        NodeId stmt = make(NodeKind::Statement);
        ++pos_;
        while (!failed()) {
            NodeId decl = make(NodeKind::Declarator);
            if (peek().is_identifier()) {
                node(decl).name = peek().text;
                ++pos_;
            } else if (peek().is("{") || peek().is("[")) {
                pos_ = group_end(ts_, pos_);
            } else {
                tree_.nodes_.pop_back();
                break;
            }
            if (peek().is("!"))
                ++pos_;
            if (peek().is(":"))
                pos_ = skip_type(ts_, pos_ + 1);
            if (peek().is("=")) {
                ++pos_;
                node(decl).has_body = true;
                NodeId init = parse_assignment();
                add(decl, init);
            }
            finish(decl);
            add(stmt, decl);
            if (!peek().is(","))
                break;
            ++pos_;
        }
        if (failed())
            return NONE;
        finish(stmt);
        return stmt;
    }

    // `if (...)`, `while (...)`, `switch (...)`, `with (...)` followed by their body.
    NodeId parse_conditional_statement() {
        NodeId stmt = make(NodeKind::Statement);
        bool is_if = peek().is_word("if");
        ++pos_;
        add(stmt, parse_header());
        if (failed())
            return NONE;
        add(stmt, parse_statement());
        if (is_if && peek().is_word("else")) {
            ++pos_;
            add(stmt, parse_statement());
        }
        finish(stmt);
        return stmt;
    }

    NodeId parse_header() {
        if (!peek().is("("))
            return fail("expected '('");
        size_t close = ts_.partner(pos_);
        NodeId header = make(NodeKind::Block);
        ++pos_;
        if (pos_ < close)
            add(header, parse_expression());
        if (failed())
            return NONE;
        if (pos_ != close)
            return fail(std::format("unexpected '{}'", peek().text));
        ++pos_;
        finish(header);
        return header;
    }

    NodeId parse_for() {
        NodeId stmt = make(NodeKind::Statement);
        ++pos_;
        if (peek().is_word("await"))
            ++pos_;
        if (!peek().is("("))
            return fail("expected '(' after for");
        size_t close = ts_.partner(pos_);
        NodeId header = make(NodeKind::Block);
        ++pos_;
        while (!failed() && pos_ < close) {
            const Token &tok = peek();
            if (tok.is(";")) {
                ++pos_;
            } else if ((tok.is_word("const") || tok.is_word("let") || tok.is_word("var")) &&
                       (peek(1).is_identifier() || peek(1).is("{") || peek(1).is("["))) {
                add(header, parse_declarations());
            } else if (tok.is_word("of") || tok.is_word("in")) {
                ++pos_;
                add(header, parse_assignment());
            } else {
                add(header, parse_expression());
            }
            if (!failed() && pos_ < close && !peek().is(";") && !peek().is_word("of") && !peek().is_word("in"))
                return fail(std::format("unexpected '{}' in for header", peek().text));
        }
        if (failed())
            return NONE;
        pos_ = close + 1;
        finish(header);
        add(stmt, header);
        add(stmt, parse_statement());
        finish(stmt);
        return stmt;
    }

    NodeId parse_do() {
        NodeId stmt = make(NodeKind::Statement);
        ++pos_;
        add(stmt, parse_statement());
        if (failed())
            return NONE;
        if (peek().is_word("while")) {
            ++pos_;
            add(stmt, parse_header());
        }
        if (peek().is(";"))
            ++pos_;
        finish(stmt);
        return stmt;
    }

    NodeId parse_try() {
        NodeId stmt = make(NodeKind::Statement);
        ++pos_;
        if (!peek().is("{"))
            return fail("expected '{' after try");
        add(stmt, parse_block(pos_));
        if (!failed() && peek().is_word("catch")) {
            ++pos_;
            if (peek().is("("))
                pos_ = group_end(ts_, pos_);
            if (!peek().is("{"))
                return fail("expected '{' after catch");
            add(stmt, parse_block(pos_));
        }
        if (!failed() && peek().is_word("finally")) {
            ++pos_;
            if (!peek().is("{"))
                return fail("expected '{' after finally");
            add(stmt, parse_block(pos_));
        }
        if (failed())
            return NONE;
        finish(stmt);
        return stmt;
    }

    // Cursor on `function`.
    NodeId parse_function(bool declaration) {
        NodeId fn = make(declaration ? NodeKind::FunctionDecl : NodeKind::FunctionExpr);
        ++pos_;
        if (peek().is("*"))
            ++pos_;
        if (peek().is_identifier()) {
            node(fn).name = peek().text;
            ++pos_;
        }
        if (peek().is("<")) {
            size_t after = skip_angles(ts_, pos_);
            pos_ = after == TokenStream::npos ? pos_ + 1 : after;
        }
        if (!peek().is("(")) {
            finish(fn);
            return fn;
        }
        node(fn).params = pos_;
        pos_ = after_signature(ts_, pos_);
        if (peek().is("{")) {
            node(fn).has_body = true;
            add(fn, parse_block(pos_));
        } else if (declaration && peek().is(";")) {
            ++pos_;
        }
        if (failed())
            return NONE;
        finish(fn);
        return fn;
    }

    // Cursor on `class`.
    NodeId parse_class(bool declaration) {
        NodeId cls = make(declaration ? NodeKind::ClassDecl : NodeKind::ClassExpr);
        ++pos_;
        if (peek().is_identifier() && !peek().is_word("extends") && !peek().is_word("implements")) {
            node(cls).name = peek().text;
            ++pos_;
        }
        size_t body = class_body_start(ts_, pos_);
        if (body == TokenStream::npos) {
            finish(cls);
            return cls;
        }
        node(cls).has_body = true;
        size_t close = ts_.partner(body);
        pos_ = body + 1;
        while (!failed() && pos_ < close)
            add(cls, parse_member(true));
        if (failed())
            return NONE;
        pos_ = close + 1;
        finish(cls);
        return cls;
    }

    // One class member (`in_class`) or object literal member.
    NodeId parse_member(bool in_class) {
        const Token &tok = peek();
        if (tok.is(",") || tok.is(";") || tok.is("*")) {
            ++pos_;
            return NONE;
        }
        if (tok.is("...")) {
            NodeId spread = make(NodeKind::Spread);
            ++pos_;
            add(spread, parse_assignment());
            finish(spread);
            return failed() ? NONE : spread;
        }
        if (in_class && tok.is("@")) {
            pos_ = skip_decorator(ts_, pos_);
            return NONE;
        }
        if (in_class && tok.is_word("static") && peek(1).is("{")) {
            ++pos_;
            return parse_block(pos_);
        }
        if (is_member_modifier(ts_, pos_, in_class)) {
            ++pos_;
            return NONE;
        }

        NodeId key = NONE;
        std::string_view name;
        size_t first = pos_;
        if (tok.is("[")) {
            if (in_class && is_index_signature(ts_, pos_)) {
                pos_ = group_end(ts_, pos_);
                if (peek().is(":"))
                    pos_ = skip_type(ts_, pos_ + 1);
                return NONE;
            }
            size_t close = ts_.partner(pos_);
            ++pos_;
            key = parse_expression();
            if (failed())
                return NONE;
            if (pos_ != close)
                return fail("unbalanced computed key");
            ++pos_;
        } else if (is_key_token(tok)) {
            name = key_text(tok);
            ++pos_;
        } else {
            ++pos_;
            return NONE;
        }

        if (peek().is("?") || peek().is("!"))
            ++pos_;

        if (peek().is("(") || peek().is("<")) {
            NodeId method = make(NodeKind::Method);
            node(method).first = first;
            node(method).name = name;
            node(method).computed = key != NONE;
            add(method, key);
            if (peek().is("<")) {
                size_t after = skip_angles(ts_, pos_);
                pos_ = after == TokenStream::npos ? pos_ + 1 : after;
            }
            if (peek().is("(")) {
                node(method).params = pos_;
                pos_ = after_signature(ts_, pos_);
            }
            if (peek().is("{")) {
                node(method).has_body = true;
                add(method, parse_block(pos_));
            }
            if (failed())
                return NONE;
            finish(method);
            return method;
        }

        if (in_class && peek().is(":"))
            pos_ = skip_type(ts_, pos_ + 1);
        bool assigns = in_class ? peek().is("=") : (peek().is(":") || peek().is("="));
        if (!assigns && key == NONE)
            return NONE; // shorthand or bodiless field

        NodeId prop = make(NodeKind::Property);
        node(prop).first = first;
        node(prop).computed = key != NONE;
        add(prop, key);
        if (assigns) {
            if (in_class || peek().is(":"))
                node(prop).name = name;
            node(prop).has_body = true;
            ++pos_;
            add(prop, parse_assignment());
        }
        if (failed())
            return NONE;
        finish(prop);
        return prop;
    }

    NodeId parse_expression() {
        NodeId first = parse_assignment();
        if (!peek().is(",") || failed())
            return first;
        NodeId seq = make(NodeKind::Binary);
        node(seq).first = node(first).first;
        add(seq, first);
        while (!failed() && peek().is(",")) {
            ++pos_;
            add(seq, parse_assignment());
        }
        if (failed())
            return NONE;
        finish(seq);
        return seq;
    }

    NodeId parse_assignment() {
        if (failed())
            return NONE;
        NodeId left = parse_conditional();
        if (failed())
            return NONE;
        if (one_of(peek(), ASSIGNMENT_OPERATORS)) {
            NodeId assign = make(NodeKind::Binary);
            node(assign).first = node(left).first;
            add(assign, left);
            ++pos_;
            add(assign, parse_assignment());
            if (failed())
                return NONE;
            finish(assign);
            return assign;
        }
        return left;
    }

    NodeId parse_conditional() {
        NodeId test = parse_binary();
        if (failed() || !peek().is("?"))
            return test;
        NodeId cond = make(NodeKind::Conditional);
        node(cond).first = node(test).first;
        add(cond, test);
        ++pos_;
        add(cond, parse_assignment());
        if (failed() || !expect(":"))
            return NONE;
        add(cond, parse_assignment());
        if (failed())
            return NONE;
        finish(cond);
        return cond;
    }

    NodeId parse_binary() {
        NodeId left = parse_unary();
        while (!failed()) {
            const Token &tok = peek();
            if ((tok.is_word("as") || tok.is_word("satisfies")) && !tok.newline_before) {
                pos_ = skip_type(ts_, pos_ + 1);
                continue;
            }
            if (!one_of(tok, BINARY_OPERATORS) && !tok.is_word("in") && !tok.is_word("instanceof"))
                break;
            NodeId bin = make(NodeKind::Binary);
            node(bin).first = node(left).first;
            add(bin, left);
            ++pos_;
            add(bin, parse_unary());
            finish(bin);
            left = bin;
        }
        return failed() ? NONE : left;
    }

    NodeId parse_unary() {
        const Token &tok = peek();
        bool word_operator = tok.is_word("typeof") || tok.is_word("void") || tok.is_word("delete") ||
                             (tok.is_word("await") && starts_operand(peek(1))) ||
                             (tok.is_word("yield") && !peek(1).newline_before && starts_operand(peek(1)));
        if (one_of(tok, PREFIX_OPERATORS) || word_operator) {
            NodeId unary = make(NodeKind::Unary);
            ++pos_;
            add(unary, parse_unary());
            if (failed())
                return NONE;
            finish(unary);
            return unary;
        }
        if (tok.is_word("yield")) {
            NodeId id = make(NodeKind::Identifier);
            node(id).name = tok.text;
            ++pos_;
            return id;
        }
        if (tok.is_word("new") && !peek(1).is("."))
            return parse_postfix(parse_new());
        NodeId expr = parse_postfix(parse_primary());
        if (!failed() && (peek().is("++") || peek().is("--")) && !peek().newline_before) {
            NodeId unary = make(NodeKind::Unary);
            node(unary).first = node(expr).first;
            add(unary, expr);
            ++pos_;
            finish(unary);
            return unary;
        }
        return expr;
    }

    static bool starts_operand(const Token &tok) {
        if (tok.kind == TokenKind::End)
            return false;
        if (tok.kind != TokenKind::Punct)
            return tok.kind != TokenKind::Identifier || !(tok.text == "in" || tok.text == "of" || tok.text == "instanceof");
        return tok.is("(") || tok.is("[") || tok.is("{") || tok.is("!") || tok.is("~") || tok.is("+") ||
               tok.is("-") || tok.is("++") || tok.is("--") || tok.is("<") || tok.is("...");
    }

    // Cursor on `new`.
    NodeId parse_new() {
        NodeId expr = make(NodeKind::New);
        ++pos_;
        NodeId callee = peek().is_word("new") && !peek(1).is(".") ? parse_new() : parse_primary();
        add(expr, callee);
        while (!failed()) {
            const Token &tok = peek();
            if (tok.is(".") && (peek(1).is_identifier() || peek(1).kind == TokenKind::PrivateName)) {
                pos_ += 2;
            } else if (tok.is("[")) {
                size_t close = ts_.partner(pos_);
                ++pos_;
                add(expr, parse_expression());
                if (!failed() && pos_ != close)
                    return fail("unbalanced index");
                pos_ = close + 1;
            } else if (tok.is("<")) {
                size_t after = type_arguments_end(ts_, pos_);
                if (after == TokenStream::npos)
                    break;
                pos_ = after;
            } else {
                break;
            }
        }
        if (!failed() && peek().is("(")) {
            node(expr).args = pos_;
            parse_arguments(expr);
        }
        if (failed())
            return NONE;
        finish(expr);
        return expr;
    }

    void parse_arguments(NodeId call) {
        size_t close = ts_.partner(pos_);
        ++pos_;
        while (!failed() && pos_ < close) {
            if (peek().is("...")) {
                NodeId spread = make(NodeKind::Spread);
                ++pos_;
                add(spread, parse_assignment());
                finish(spread);
                add(call, spread);
            } else {
                add(call, parse_assignment());
            }
            if (failed())
                return;
            if (peek().is(","))
                ++pos_;
            else if (pos_ != close)
                fail(std::format("unexpected '{}' in argument list", peek().text));
        }
        pos_ = close + 1;
    }

    NodeId wrap(NodeKind kind, NodeId inner) {
        NodeId outer = make(kind);
        node(outer).first = node(inner).first;
        add(outer, inner);
        return outer;
    }

    NodeId parse_postfix(NodeId expr) {
        while (!failed() && expr != NONE) {
            const Token &tok = peek();
            if (tok.is(".") || tok.is("?.")) {
                bool optional = tok.is("?.");
                const Token &next = peek(1);
                if (optional && (next.is("(") || next.is("["))) {
                    ++pos_;
                    NodeId inner = expr;
                    expr = wrap(next.is("(") ? NodeKind::Call : NodeKind::Index, inner);
                    node(expr).optional = true;
                    if (peek().is("(")) {
                        node(expr).args = pos_;
                        parse_arguments(expr);
                    } else {
                        size_t close = ts_.partner(pos_);
                        ++pos_;
                        add(expr, parse_expression());
                        pos_ = close + 1;
                    }
                    finish(expr);
                    continue;
                }
                if (!next.is_identifier() && next.kind != TokenKind::PrivateName) {
                    fail(std::format("expected property name after '{}'", tok.text));
                    return NONE;
                }
                expr = wrap(NodeKind::Member, expr);
                node(expr).optional = optional;
                node(expr).name = next.text;
                pos_ += 2;
                finish(expr);
            } else if (tok.is("(")) {
                expr = wrap(NodeKind::Call, expr);
                node(expr).args = pos_;
                parse_arguments(expr);
                finish(expr);
            } else if (tok.is("[")) {
                expr = wrap(NodeKind::Index, expr);
                size_t close = ts_.partner(pos_);
                ++pos_;
                add(expr, parse_expression());
                if (!failed() && pos_ != close)
                    return fail("unbalanced index");
                pos_ = close + 1;
                finish(expr);
            } else if (tok.kind == TokenKind::Template || tok.kind == TokenKind::TemplateHead) {
                expr = wrap(NodeKind::TaggedTemplate, expr);
                add(expr, parse_template());
                finish(expr);
            } else if (tok.is("!") && !tok.newline_before) {
                expr = wrap(NodeKind::NonNull, expr);
                ++pos_;
                finish(expr);
            } else if (tok.is("<")) {
                size_t after = type_arguments_end(ts_, pos_);
                if (after == TokenStream::npos)
                    break;
                pos_ = after;
            } else {
                break;
            }
        }
        return failed() ? NONE : expr;
    }

    NodeId parse_template() {
        NodeId tpl = make(NodeKind::Template);
        if (peek().kind == TokenKind::Template) {
            ++pos_;
            return tpl;
        }
        while (!failed()) {
            ++pos_; // head or middle
            add(tpl, parse_expression());
            if (failed())
                return NONE;
            if (peek().kind == TokenKind::TemplateMiddle)
                continue;
            if (peek().kind != TokenKind::TemplateTail)
                return fail("unterminated template substitution");
            ++pos_;
            break;
        }
        finish(tpl);
        return tpl;
    }

    // `params` is '(' or the bare parameter; `arrow` is the "=>" token.
    NodeId parse_arrow(size_t first, size_t params, size_t arrow) {
        NodeId fn = make(NodeKind::Arrow);
        node(fn).first = first;
        node(fn).params = params;
        node(fn).has_body = true;
        pos_ = arrow + 1;
        if (peek().is("{"))
            add(fn, parse_block(pos_));
        else
            add(fn, parse_assignment());
        if (failed())
            return NONE;
        finish(fn);
        return fn;
    }

    std::optional<NodeId> try_arrow() {
        size_t k = pos_;
        size_t first = k;
        if (peek().is_word("async") && !peek(1).newline_before &&
            (peek(1).is("(") || peek(1).is("<") || (peek(1).is_identifier() && peek(2).is("=>"))))
            ++k;
        const Token &tok = ts_.at(k);
        if (tok.is_identifier() && !is_reserved_word(tok.text) && ts_.at(k + 1).is("=>") &&
            !ts_.at(k + 1).newline_before)
            return parse_arrow(first, k, k + 1);
        size_t params = k;
        if (tok.is("<")) {
            params = skip_angles(ts_, k);
            if (params == TokenStream::npos)
                return std::nullopt;
        }
        if (!ts_.at(params).is("("))
            return std::nullopt;
        size_t arrow = arrow_after_params(ts_, params);
        if (arrow == TokenStream::npos)
            return std::nullopt;
        return parse_arrow(first, params, arrow);
    }

    NodeId parse_primary() {
        if (failed())
            return NONE;
        if (std::optional<NodeId> arrow = try_arrow())
            return *arrow;

        const Token &tok = peek();
        switch (tok.kind) {
        case TokenKind::Identifier: {
            if (tok.text == "function")
                return parse_function(false);
            if (tok.text == "class")
                return parse_class(false);
            if (tok.text == "async" && peek(1).is_word("function") && !peek(1).newline_before) {
                ++pos_;
                return parse_function(false);
            }
            NodeId id = make(NodeKind::Identifier);
            node(id).name = tok.text;
            ++pos_;
            return id;
        }
        case TokenKind::PrivateName:
        case TokenKind::String:
        case TokenKind::Number:
        case TokenKind::Regex: {
            NodeId lit = make(NodeKind::Literal);
            ++pos_;
            return lit;
        }
        case TokenKind::Template:
        case TokenKind::TemplateHead:
            return parse_template();
        case TokenKind::JsxTagOpen:
            return parse_jsx();
        default:
            break;
        }

        if (tok.is("(")) {
            NodeId paren = make(NodeKind::Paren);
            size_t close = ts_.partner(pos_);
            ++pos_;
            add(paren, parse_expression());
            if (failed())
                return NONE;
            if (pos_ != close)
                return fail(std::format("unexpected '{}'", peek().text));
            ++pos_;
            finish(paren);
            return paren;
        }
        if (tok.is("[")) {
            NodeId array = make(NodeKind::ArrayLiteral);
            size_t close = ts_.partner(pos_);
            ++pos_;
            while (!failed() && pos_ < close) {
                if (peek().is(",")) {
                    ++pos_;
                    continue;
                }
                if (peek().is("...")) {
                    NodeId spread = make(NodeKind::Spread);
                    ++pos_;
                    add(spread, parse_assignment());
                    finish(spread);
                    add(array, spread);
                } else {
                    add(array, parse_assignment());
                }
                if (!failed() && pos_ < close && !peek().is(","))
                    return fail(std::format("unexpected '{}' in array literal", peek().text));
            }
            if (failed())
                return NONE;
            pos_ = close + 1;
            finish(array);
            return array;
        }
        if (tok.is("{")) {
            NodeId object = make(NodeKind::ObjectLiteral);
            size_t close = ts_.partner(pos_);
            ++pos_;
            while (!failed() && pos_ < close)
                add(object, parse_member(false));
            if (failed())
                return NONE;
            pos_ = close + 1;
            finish(object);
            return object;
        }
        if (tok.is("<")) {
            size_t after = skip_angles(ts_, pos_);
            if (after == TokenStream::npos)
                return fail("unbalanced '<'");
            pos_ = after; // type assertion
            return parse_unary();
        }
        if (tok.is("@")) {
            pos_ = skip_decorator(ts_, pos_);
            return parse_primary();
        }
        if (tok.is_word("new"))
            return parse_new();
        return fail(tok.kind == TokenKind::End ? std::string("unexpected end of input")
                                               : std::format("unexpected '{}'", tok.text));
    }

    NodeId parse_jsx() {
        NodeId jsx = make(NodeKind::Jsx);
        size_t last = ts_.partner(pos_);
        size_t k = pos_ + 1;
        while (!failed() && k < last) {
            if (!ts_.at(k).is("{")) {
                ++k;
                continue;
            }
            size_t close = ts_.partner(k);
            pos_ = k + 1;
            if (pos_ < close) {
                if (peek().is("...")) {
                    NodeId spread = make(NodeKind::Spread);
                    ++pos_;
                    add(spread, parse_assignment());
                    finish(spread);
                    add(jsx, spread);
                } else {
                    add(jsx, parse_expression());
                }
                if (!failed() && pos_ != close)
                    return fail(std::format("unexpected '{}' in JSX expression", peek().text));
            }
            k = close + 1;
        }
        if (failed())
            return NONE;
        pos_ = last + 1;
        finish(jsx);
        return jsx;
    }

    const TokenStream &ts_;
    size_t pos_ = 0;
    SyntaxTree tree_;
    std::optional<SyntaxError> error_;
};

std::expected<SyntaxTree, SyntaxError> parse_syntax_tree(const TokenStream &ts) {
    TreeParser parser(ts);
    return parser.run();
}

std::optional<SyntaxError> check_syntax(const TokenStream &ts) {
    auto tree = parse_syntax_tree(ts);
    if (!tree)
        return std::move(tree.error());
    return std::nullopt;
}

} // namespace kiln
