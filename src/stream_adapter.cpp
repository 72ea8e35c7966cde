#include "kiln/collector.hpp"
#include "kiln/lexer.hpp"
#include "kiln/parser.hpp"
#include "kiln/path_tracker.hpp"
#include "kiln/syntax_tree.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

namespace {

enum class Mode : uint8_t { Statements, Expression, ObjectBody, ClassBody, Jsx };

struct ScopeSpec {
    std::optional<std::string> segment; ///< Empty for auto-named scopes.
    ScopeKind kind = ScopeKind::Variable;
    AnonymousKind anonymous = AnonymousKind::Arrow;
    bool binding = false;

    static ScopeSpec named(std::string_view segment, ScopeKind kind, bool binding = false) {
        return {std::string(segment), kind, AnonymousKind::Arrow, binding};
    }
    static ScopeSpec unnamed(AnonymousKind kind) {
        return {std::nullopt, ScopeKind::Arrow, kind, false};
    }
};

/**
 * One pending region of the token stream. A frame's scope is entered when the frame first
 * reaches the top of the stack and exited when its cursor reaches `end`, so scope events
 * follow source order even when sibling frames are pushed in reverse.
 */
struct Frame {
    Mode mode;
    size_t pos;
    size_t end;
    std::optional<ScopeSpec> scope;
    bool entered = false;
};

// Matches `NS.MEMBER(factory)` starting at the namespace identifier `ns`.
std::optional<CallSite> match_call(const TokenStream &ts, size_t ns) {
    if (ns > 0) {
        const Token &prev = ts.at(ns - 1);
        if (prev.is(".") || prev.is("?.") || prev.is_word("new"))
            return std::nullopt;
    }
    if (!ts.at(ns + 1).is(".") || !ts.at(ns + 2).is_identifier())
        return std::nullopt;
    size_t open = ns + 3;
    if (ts.at(open).is("<")) {
        open = type_arguments_end(ts, open);
        if (open == TokenStream::npos)
            return std::nullopt;
    }
    if (!ts.at(open).is("("))
        return std::nullopt;
    size_t close = ts.partner(open);

    size_t k = open + 1;
    if (ts.at(k).is_word("async") && !ts.at(k + 1).newline_before &&
        (ts.at(k + 1).is("(") || ts.at(k + 1).is("<") || ts.at(k + 1).is_word("function") ||
         (ts.at(k + 1).is_identifier() && ts.at(k + 2).is("=>"))))
        ++k;

    size_t end = TokenStream::npos;
    if (ts.at(k).is_word("function")) {
        size_t n = k + 1;
        if (ts.at(n).is("*"))
            ++n;
        if (ts.at(n).is_identifier())
            ++n;
        if (ts.at(n).is("<")) {
            n = skip_angles(ts, n);
            if (n == TokenStream::npos)
                return std::nullopt;
        }
        if (!ts.at(n).is("(") || count_params(ts, n) != 1)
            return std::nullopt;
        size_t body = after_signature(ts, n);
        if (!ts.at(body).is("{"))
            return std::nullopt;
        end = group_end(ts, body);
    } else {
        size_t arrow = TokenStream::npos;
        if (ts.at(k).is_identifier() && !is_reserved_word(ts.at(k).text) && ts.at(k + 1).is("=>") &&
            !ts.at(k + 1).newline_before) {
            arrow = k + 1;
        } else {
            size_t params = k;
            if (ts.at(params).is("<"))
                params = skip_angles(ts, params);
            if (params == TokenStream::npos || !ts.at(params).is("("))
                return std::nullopt;
            arrow = arrow_after_params(ts, params);
            if (arrow == TokenStream::npos || count_params(ts, params) != 1)
                return std::nullopt;
        }
        size_t body = arrow + 1;
        end = ts.at(body).is("{") ? group_end(ts, body) : expression_end(ts, body);
    }

    if (end == close || (ts.at(end).is(",") && end + 1 == close))
        return CallSite{.ns = ns, .open = open, .close = close};
    return std::nullopt;
}

class StreamWalker {
public:
    StreamWalker(const TokenStream &ts, ModuleCollector &collector) : ts_(ts), collector_(collector) {
    }

    void run() {
        push(Mode::Statements, 0, ts_.size() - 1);
        while (!frames_.empty()) {
            Frame &top = frames_.back();
            if (!top.entered) {
                top.entered = true;
                if (top.scope)
                    enter(*top.scope);
            }
            if (top.pos >= top.end) {
                bool scoped = top.scope.has_value();
                frames_.pop_back();
                if (scoped)
                    collector_.paths().exit();
                continue;
            }
            switch (top.mode) {
            case Mode::Statements:
                step_statement();
                break;
            case Mode::Expression:
                step_expression();
                break;
            case Mode::ObjectBody:
                step_member(false);
                break;
            case Mode::ClassBody:
                step_member(true);
                break;
            case Mode::Jsx:
                step_jsx();
                break;
            }
        }
    }

private:
    void enter(const ScopeSpec &spec) {
        if (spec.segment)
            collector_.paths().enter(*spec.segment, spec.kind, spec.binding);
        else
            collector_.paths().enter_anonymous(spec.anonymous);
    }

    void push(Mode mode, size_t begin, size_t end, std::optional<ScopeSpec> scope = std::nullopt) {
        frames_.push_back({mode, begin, end, std::move(scope)});
    }

    // Pushes the body of the group opening at `open` and moves the current frame past it.
    void push_group(Mode mode, size_t open, std::optional<ScopeSpec> scope = std::nullopt) {
        frames_.back().pos = group_end(ts_, open);
        size_t close = ts_.partner(open);
        push(mode, open + 1, close, std::move(scope));
    }

    void push_expression(size_t begin, std::optional<ScopeSpec> scope = std::nullopt) {
        size_t end = expression_end(ts_, begin);
        frames_.back().pos = std::max(end, begin + 1);
        push(Mode::Expression, begin, end, std::move(scope));
    }

    void function_at(size_t k, bool declaration) {
        size_t n = k + 1;
        if (ts_.at(n).is("*"))
            ++n;
        std::optional<std::string_view> name;
        if (ts_.at(n).is_identifier()) {
            name = ts_.at(n).text;
            ++n;
        }
        if (ts_.at(n).is("<")) {
            size_t after = skip_angles(ts_, n);
            n = after == TokenStream::npos ? n + 1 : after;
        }
        if (!ts_.at(n).is("(")) {
            frames_.back().pos = n;
            return;
        }
        size_t body = after_signature(ts_, n);
        if (!ts_.at(body).is("{")) {
            frames_.back().pos = body;
            return;
        }
        push_group(Mode::Statements, body,
                   name ? ScopeSpec::named(*name, ScopeKind::Function, declaration)
                        : ScopeSpec::unnamed(AnonymousKind::Function));
    }

    void class_at(size_t k, bool declaration) {
        size_t n = k + 1;
        std::optional<std::string_view> name;
        if (ts_.at(n).is_identifier() && !ts_.at(n).is_word("extends") && !ts_.at(n).is_word("implements")) {
            name = ts_.at(n).text;
            ++n;
        }
        size_t body = class_body_start(ts_, n);
        if (body == TokenStream::npos) {
            frames_.back().pos = n;
            return;
        }
        push_group(Mode::ClassBody, body,
                   name ? ScopeSpec::named(*name, ScopeKind::Class, declaration)
                        : ScopeSpec::unnamed(AnonymousKind::Class));
    }

    // `arrow` is the index of "=>".
    void arrow_body(size_t arrow) {
        size_t body = arrow + 1;
        if (ts_.at(body).is("{"))
            push_group(Mode::Statements, body, ScopeSpec::unnamed(AnonymousKind::Arrow));
        else
            push_expression(body, ScopeSpec::unnamed(AnonymousKind::Arrow));
    }

    void declarators(size_t k) {
        std::vector<Frame> inits;
        size_t n = k;
        while (true) {
            std::optional<std::string_view> name;
            if (ts_.at(n).is_identifier()) {
                name = ts_.at(n).text;
                ++n;
            } else if (ts_.at(n).is("{") || ts_.at(n).is("[")) {
                n = group_end(ts_, n);
            } else {
                break;
            }
            if (ts_.at(n).is("!"))
                ++n;
            if (ts_.at(n).is(":"))
                n = skip_type(ts_, n + 1);
            if (ts_.at(n).is("=")) {
                size_t init = n + 1;
                n = expression_end(ts_, init);
                std::optional<ScopeSpec> scope;
                if (name)
                    scope = ScopeSpec::named(*name, ScopeKind::Variable, true);
                inits.push_back({Mode::Expression, init, n, std::move(scope)});
            }
            if (!ts_.at(n).is(","))
                break;
            ++n;
        }
        frames_.back().pos = std::max(n, k);
        for (auto it = inits.rbegin(); it != inits.rend(); ++it)
            frames_.push_back(std::move(*it));
    }

    void step_statement() {
        size_t k = frames_.back().pos;
        const Token &tok = ts_.at(k);
        const Token &next = ts_.at(k + 1);

        if (tok.is(";") || tok.is(",") || tok.is(":")) {
            frames_.back().pos = k + 1;
            return;
        }
        if (tok.is("@")) {
            frames_.back().pos = skip_decorator(ts_, k);
            return;
        }
        if (tok.is("{")) {
            push_group(Mode::Statements, k);
            return;
        }
        if (tok.is_identifier() && !(k > 0 && (ts_.at(k - 1).is(".") || ts_.at(k - 1).is("?.")))) {
            if (is_type_declaration(ts_, k)) {
                frames_.back().pos = type_declaration_end(ts_, k);
                return;
            }
            size_t body = 0;
            if (is_namespace_block(ts_, k, body)) {
                push_group(Mode::Statements, body);
                return;
            }
            std::string_view word = tok.text;
            if (word == "import" && !next.is("(") && !next.is(".")) {
                frames_.back().pos = import_declaration_end(ts_, k);
                return;
            }
            if (word == "export") {
                export_at(k);
                return;
            }
            if ((word == "const" || word == "var" || word == "let") &&
                (next.is_identifier() || next.is("{") || next.is("["))) {
                declarators(k + 1);
                return;
            }
            if (word == "function") {
                function_at(k, true);
                return;
            }
            if (word == "async" && next.is_word("function") && !next.newline_before) {
                function_at(k + 1, true);
                return;
            }
            if (word == "class") {
                class_at(k, true);
                return;
            }
            if (word == "abstract" && next.is_word("class")) {
                class_at(k + 1, true);
                return;
            }
            if (word == "if" || word == "while" || word == "for" || word == "switch" || word == "with") {
                size_t header = next.is_word("await") ? k + 2 : k + 1;
                if (ts_.at(header).is("("))
                    push_group(Mode::Statements, header);
                else
                    frames_.back().pos = k + 1;
                return;
            }
            if (word == "catch") {
                frames_.back().pos = next.is("(") ? group_end(ts_, k + 1) : k + 1;
                return;
            }
            if (word == "return" || word == "throw") {
                if (next.newline_before || next.is(";") || next.is("}") || next.kind == TokenKind::End)
                    frames_.back().pos = k + 1;
                else
                    push_expression(k + 1);
                return;
            }
            if (word == "case") {
                push_expression(k + 1);
                return;
            }
            if (word == "default" && next.is(":")) {
                frames_.back().pos = k + 2;
                return;
            }
            if (word == "else" || word == "do" || word == "try" || word == "finally" || word == "break" ||
                word == "continue" || word == "debugger") {
                frames_.back().pos = k + 1;
                return;
            }
            if (next.is(":") && !is_reserved_word(word)) {
                frames_.back().pos = k + 2; // label
                return;
            }
        }
        push_expression(k);
    }

    void export_at(size_t k) {
        size_t n = k + 1;
        const Token &tok = ts_.at(n);
        if (tok.is_word("default")) {
            ++n;
            size_t decl = n;
            if (ts_.at(decl).is_word("async") && ts_.at(decl + 1).is_word("function"))
                ++decl;
            if (ts_.at(decl).is_word("abstract") && ts_.at(decl + 1).is_word("class"))
                ++decl;
            if (ts_.at(decl).is_word("function"))
                function_at(decl, true);
            else if (ts_.at(decl).is_word("class"))
                class_at(decl, true);
            else
                push_expression(n);
            return;
        }
        if (tok.is("{") || tok.is("*") || (tok.is_word("type") && (ts_.at(n + 1).is("{") || ts_.at(n + 1).is("*")))) {
            frames_.back().pos = export_clause_end(ts_, n);
            return;
        }
        if (tok.is_word("import")) {
            frames_.back().pos = import_declaration_end(ts_, n);
            return;
        }
        if (tok.is("=")) {
            push_expression(n + 1);
            return;
        }
        frames_.back().pos = n;
    }

    void step_expression() {
        size_t k = frames_.back().pos;
        const Token &tok = ts_.at(k);
        const Token &next = ts_.at(k + 1);
        bool after_operand = k > 0 && ends_operand(ts_.at(k - 1));

        if (tok.is_identifier()) {
            if (tok.is_word("function")) {
                function_at(k, false);
                return;
            }
            if (tok.is_word("class")) {
                class_at(k, false);
                return;
            }
            if (tok.is_word("async") && !next.newline_before) {
                if (next.is_word("function")) {
                    function_at(k + 1, false);
                    return;
                }
                if (next.is_identifier() && ts_.at(k + 2).is("=>")) {
                    arrow_body(k + 2);
                    return;
                }
                if (next.is("(") || next.is("<")) {
                    size_t params = next.is("<") ? skip_angles(ts_, k + 1) : k + 1;
                    if (params != TokenStream::npos && ts_.at(params).is("(")) {
                        if (size_t arrow = arrow_after_params(ts_, params); arrow != TokenStream::npos) {
                            arrow_body(arrow);
                            return;
                        }
                    }
                }
            }
            if (next.is("=>") && !next.newline_before) {
                arrow_body(k + 1);
                return;
            }
            if ((tok.text == "as" || tok.text == "satisfies") && after_operand && !tok.newline_before) {
                frames_.back().pos = skip_type(ts_, k + 1);
                return;
            }
            if (collector_.is_namespace(tok.text)) {
                if (std::optional<CallSite> site = match_call(ts_, k)) {
                    collector_.record(*site);
                    frames_.back().pos = skip_postfix_chain(ts_, site->close);
                    return;
                }
            }
            frames_.back().pos = k + 1;
            return;
        }

        if (tok.is("(")) {
            if (size_t arrow = arrow_after_params(ts_, k); arrow != TokenStream::npos) {
                arrow_body(arrow);
                return;
            }
            push_group(Mode::Expression, k);
            return;
        }
        if (tok.is("<")) {
            if (after_operand) {
                size_t after = type_arguments_end(ts_, k);
                frames_.back().pos = after == TokenStream::npos ? k + 1 : after;
                return;
            }
            size_t after = skip_angles(ts_, k);
            if (after == TokenStream::npos) {
                frames_.back().pos = k + 1;
                return;
            }
            if (ts_.at(after).is("(")) {
                if (size_t arrow = arrow_after_params(ts_, after); arrow != TokenStream::npos) {
                    arrow_body(arrow);
                    return;
                }
            }
            frames_.back().pos = after;
            return;
        }
        if (tok.is("{")) {
            push_group(Mode::ObjectBody, k);
            return;
        }
        if (tok.is("[")) {
            push_group(Mode::Expression, k);
            return;
        }
        if (tok.kind == TokenKind::JsxTagOpen) {
            size_t last = ts_.partner(k);
            frames_.back().pos = last + 1;
            push(Mode::Jsx, k + 1, last);
            return;
        }
        frames_.back().pos = k + 1;
    }

    // Object literal members (`in_class` false) and class members.
    void step_member(bool in_class) {
        size_t k = frames_.back().pos;
        const Token &tok = ts_.at(k);

        if (tok.is(",") || tok.is(";") || tok.is("*")) {
            frames_.back().pos = k + 1;
            return;
        }
        if (tok.is("...")) {
            push_expression(k + 1);
            return;
        }
        if (in_class && tok.is("@")) {
            frames_.back().pos = skip_decorator(ts_, k);
            return;
        }
        if (in_class && tok.is_word("static") && ts_.at(k + 1).is("{")) {
            push_group(Mode::Statements, k + 1);
            return;
        }
        if (is_member_modifier(ts_, k, in_class)) {
            frames_.back().pos = k + 1;
            return;
        }

        std::optional<std::string_view> name;
        size_t key_open = TokenStream::npos;
        size_t n = k + 1;
        if (tok.is("[")) {
            if (in_class && is_index_signature(ts_, k)) {
                n = group_end(ts_, k);
                if (ts_.at(n).is(":"))
                    n = skip_type(ts_, n + 1);
                frames_.back().pos = n;
                return;
            }
            key_open = k;
            n = group_end(ts_, k);
        } else if (is_key_token(tok)) {
            name = key_text(tok);
        } else {
            frames_.back().pos = k + 1;
            return;
        }

        if (ts_.at(n).is("?") || ts_.at(n).is("!"))
            ++n;

        std::optional<Frame> value;
        if (ts_.at(n).is("(") || ts_.at(n).is("<")) {
            size_t params = n;
            if (ts_.at(params).is("<")) {
                size_t after = skip_angles(ts_, params);
                params = after == TokenStream::npos ? params + 1 : after;
            }
            size_t body = ts_.at(params).is("(") ? after_signature(ts_, params) : params;
            if (ts_.at(body).is("{")) {
                n = group_end(ts_, body);
                std::optional<ScopeSpec> scope;
                if (name)
                    scope = ScopeSpec::named(*name, ScopeKind::Method);
                value = Frame{Mode::Statements, body + 1, ts_.partner(body), std::move(scope)};
            } else {
                n = body;
            }
        } else {
            if (in_class && ts_.at(n).is(":"))
                n = skip_type(ts_, n + 1);
            bool assigns = in_class ? ts_.at(n).is("=") : (ts_.at(n).is(":") || ts_.at(n).is("="));
            if (assigns) {
                bool scoped = name && (in_class || ts_.at(n).is(":"));
                size_t init = n + 1;
                n = expression_end(ts_, init);
                std::optional<ScopeSpec> scope;
                if (scoped)
                    scope = ScopeSpec::named(*name, ScopeKind::Property);
                value = Frame{Mode::Expression, init, n, std::move(scope)};
            }
        }

        frames_.back().pos = std::max(n, k + 1);
        if (value)
            frames_.push_back(std::move(*value));
        if (key_open != TokenStream::npos)
            push(Mode::Expression, key_open + 1, ts_.partner(key_open));
    }

    void step_jsx() {
        size_t k = frames_.back().pos;
        if (ts_.at(k).is("{")) {
            push_group(Mode::Expression, k);
            return;
        }
        frames_.back().pos = k + 1;
    }

    const TokenStream &ts_;
    ModuleCollector &collector_;
    std::vector<Frame> frames_;
};

class StreamAdapter final : public ParserAdapter {
public:
    explicit StreamAdapter(AnalyzerOptions options) : options_(std::move(options)) {
    }

    std::string_view name() const override {
        return "stream";
    }

    std::expected<ModuleAnalysis, ParseError> analyze(std::string_view file_path,
                                                      std::string_view source) const override {
        auto tokens = tokenize(source, is_jsx_path(file_path));
        if (!tokens)
            return std::unexpected(to_parse_error(file_path, tokens.error()));
        if (std::optional<SyntaxError> err = check_syntax(*tokens))
            return std::unexpected(to_parse_error(file_path, *tokens, *err));

        ModuleCollector collector(*tokens, file_path, options_);
        StreamWalker walker(*tokens, collector);
        walker.run();
        return collector.finish();
    }

private:
    AnalyzerOptions options_;
};

} // namespace

std::unique_ptr<ParserAdapter> make_stream_adapter(AnalyzerOptions options) {
    return std::make_unique<StreamAdapter>(std::move(options));
}

} // namespace kiln
