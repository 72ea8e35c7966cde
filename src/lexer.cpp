#include "kiln/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace kiln {

namespace {

constexpr std::array PUNCTUATORS = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "?\?=", "=>", "==", "!=", "<=", ">=",
    "&&",   "||",  "??",  "?.",  "++",  "--",  "+=",  "-=",  "*=",  "/=",  "%=",  "&=", "|=", "^=", "**", "<<",
    ">>",   "{",   "}",   "(",   ")",   "[",   "]",   ";",   ",",   "<",   ">",   "+",  "-",  "*",  "/",  "%",
    "&",    "|",   "^",   "!",   "~",   "?",   ":",   "=",   ".",   "@",   "#",
};

constexpr std::array RESERVED = {
    "break",  "case",   "catch",  "class",      "const",  "continue", "debugger", "default", "delete",
    "do",     "else",   "export", "extends",    "false",  "finally",  "for",      "function", "if",
    "import", "in",     "instanceof", "new",    "null",   "return",   "super",    "switch",  "this",
    "throw",  "true",   "try",    "typeof",     "var",    "void",     "while",    "with",
};

// Words after which '/' starts a regular expression rather than a division.
constexpr std::array REGEX_PREFIX_WORDS = {
    "return", "typeof", "case", "do", "else", "in", "instanceof", "new", "delete", "void", "throw", "yield", "await", "of",
};

bool is_ident_start(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool is_ident_part(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

enum class Frame : uint8_t { Paren, Bracket, Brace, TemplateSub, JsxTag, JsxChildren };

struct Open {
    Frame frame;
    size_t token;   ///< Opener token index.
    size_t element; ///< For JSX frames: index of the element's JsxTagOpen.
    bool closing = false;
};

class Lexer {
public:
    Lexer(std::string_view src, bool jsx) : src_(src), jsx_(jsx) {
    }

    std::expected<void, LexError> run();

    std::vector<Token> take_tokens() {
        return std::move(tokens_);
    }
    std::vector<size_t> take_partners() {
        return std::move(partners_);
    }

private:
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    void advance(size_t n = 1) {
        for (size_t k = 0; k < n && pos_ < src_.size(); ++k) {
            if (src_[pos_] == '\n') {
                ++line_;
                line_start_ = pos_ + 1;
            }
            ++pos_;
        }
    }

    std::unexpected<LexError> fail(std::string message) const {
        return std::unexpected(LexError{line_, static_cast<uint32_t>(pos_ - line_start_ + 1), std::move(message)});
    }

    size_t emit(TokenKind kind, size_t start, uint32_t line, uint32_t column) {
        Token tok;
        tok.kind = kind;
        tok.text = src_.substr(start, pos_ - start);
        tok.offset = static_cast<uint32_t>(start);
        tok.line = line;
        tok.column = column;
        tok.newline_before = newline_pending_;
        newline_pending_ = false;
        tokens_.push_back(tok);
        partners_.push_back(TokenStream::npos);
        return tokens_.size() - 1;
    }

    bool regex_allowed() const;
    bool jsx_tag_ahead() const;
    std::expected<void, LexError> skip_trivia();
    std::expected<void, LexError> lex_code();
    std::expected<void, LexError> lex_string(char quote);
    std::expected<void, LexError> lex_template_chars(size_t start, uint32_t line, uint32_t column, bool head);
    std::expected<void, LexError> lex_regex();
    std::expected<void, LexError> lex_jsx_tag();
    std::expected<void, LexError> lex_jsx_children();
    std::expected<void, LexError> close_bracket(char c, size_t idx);

    std::string_view src_;
    bool jsx_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    size_t line_start_ = 0;
    bool newline_pending_ = false;
    std::vector<Token> tokens_;
    std::vector<size_t> partners_;
    std::vector<Open> stack_;
};

bool Lexer::regex_allowed() const {
    if (tokens_.empty())
        return true;
    const Token &prev = tokens_.back();
    switch (prev.kind) {
    case TokenKind::Identifier:
        return std::ranges::find(REGEX_PREFIX_WORDS, prev.text) != REGEX_PREFIX_WORDS.end();
    case TokenKind::Punct:
        return !(prev.text == ")" || prev.text == "]" || prev.text == "}" || prev.text == "++" || prev.text == "--");
    case TokenKind::TemplateHead:
    case TokenKind::TemplateMiddle:
    case TokenKind::JsxTagEnd:
    case TokenKind::JsxText:
        return true;
    default:
        return false;
    }
}

// '<' in operand position starts JSX when followed by a tag name or '>' (fragment), but
// not when it opens type parameters of a generic arrow (`<T,>` / `<T extends U>`).
bool Lexer::jsx_tag_ahead() const {
    size_t p = pos_ + 1;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t'))
        ++p;
    if (p >= src_.size())
        return false;
    if (src_[p] == '>')
        return true;
    if (!is_ident_start(static_cast<unsigned char>(src_[p])))
        return false;
    size_t q = p;
    while (q < src_.size() && (is_ident_part(static_cast<unsigned char>(src_[q])) || src_[q] == '-' || src_[q] == '.' ||
                               src_[q] == ':'))
        ++q;
    std::string_view name = src_.substr(p, q - p);
    while (q < src_.size() && std::isspace(static_cast<unsigned char>(src_[q])))
        ++q;
    if (q < src_.size() && src_[q] == ',')
        return false;
    if (src_.substr(q).starts_with("extends ") && name.find('-') == std::string_view::npos)
        return false;
    return true;
}

std::expected<void, LexError> Lexer::skip_trivia() {
    while (pos_ < src_.size()) {
        char c = peek();
        if (c == '\n') {
            newline_pending_ = true;
            advance();
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (pos_ < src_.size() && peek() != '\n')
                advance();
        } else if (c == '/' && peek(1) == '*') {
            size_t end = src_.find("*/", pos_ + 2);
            if (end == std::string_view::npos)
                return fail("unterminated block comment");
            while (pos_ < end + 2) {
                if (peek() == '\n')
                    newline_pending_ = true;
                advance();
            }
        } else if (c == '#' && peek(1) == '!' && pos_ == 0) {
            while (pos_ < src_.size() && peek() != '\n')
                advance();
        } else {
            break;
        }
    }
    return {};
}

std::expected<void, LexError> Lexer::lex_string(char quote) {
    size_t start = pos_;
    uint32_t line = line_;
    uint32_t column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    advance();
    while (true) {
        if (pos_ >= src_.size())
            return fail("unterminated string literal");
        char c = peek();
        if (c == '\\') {
            advance(2);
            continue;
        }
        if (c == '\n' && stack_.empty() == false && stack_.back().frame == Frame::JsxTag) {
            advance();
            continue;
        }
        if (c == '\n')
            return fail("unterminated string literal");
        advance();
        if (c == quote)
            break;
    }
    emit(TokenKind::String, start, line, column);
    return {};
}

// Scans template characters up to '`' or "${". `head` is true when the scan started at
// the opening backtick rather than at the '}' closing a substitution.
std::expected<void, LexError> Lexer::lex_template_chars(size_t start, uint32_t line, uint32_t column, bool head) {
    while (true) {
        if (pos_ >= src_.size())
            return fail("unterminated template literal");
        char c = peek();
        if (c == '\\') {
            advance(2);
            continue;
        }
        if (c == '`') {
            advance();
            size_t idx = emit(head ? TokenKind::Template : TokenKind::TemplateTail, start, line, column);
            if (!head) {
                partners_[stack_.back().token] = idx;
                stack_.pop_back();
            }
            return {};
        }
        if (c == '$' && peek(1) == '{') {
            advance(2);
            size_t idx = emit(head ? TokenKind::TemplateHead : TokenKind::TemplateMiddle, start, line, column);
            if (!head) {
                partners_[stack_.back().token] = idx;
                stack_.pop_back();
            }
            stack_.push_back({Frame::TemplateSub, idx, 0});
            return {};
        }
        advance();
    }
}

std::expected<void, LexError> Lexer::lex_regex() {
    size_t start = pos_;
    uint32_t line = line_;
    uint32_t column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    advance();
    bool in_class = false;
    while (true) {
        if (pos_ >= src_.size() || peek() == '\n')
            return fail("unterminated regular expression literal");
        char c = peek();
        if (c == '\\') {
            advance(2);
            continue;
        }
        advance();
        if (c == '[')
            in_class = true;
        else if (c == ']')
            in_class = false;
        else if (c == '/' && !in_class)
            break;
    }
    while (pos_ < src_.size() && is_ident_part(static_cast<unsigned char>(peek())))
        advance();
    emit(TokenKind::Regex, start, line, column);
    return {};
}

std::expected<void, LexError> Lexer::close_bracket(char c, size_t idx) {
    Frame want = c == ')' ? Frame::Paren : c == ']' ? Frame::Bracket : Frame::Brace;
    if (stack_.empty() || stack_.back().frame != want)
        return std::unexpected(LexError{tokens_[idx].line, tokens_[idx].column, std::format("unexpected '{}'", c)});
    partners_[stack_.back().token] = idx;
    stack_.pop_back();
    return {};
}

std::expected<void, LexError> Lexer::lex_code() {
    size_t start = pos_;
    uint32_t line = line_;
    uint32_t column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    unsigned char c = static_cast<unsigned char>(peek());

    if (is_ident_start(c) || c == '\\') {
        while (pos_ < src_.size() && (is_ident_part(static_cast<unsigned char>(peek())) || peek() == '\\'))
            advance();
        emit(TokenKind::Identifier, start, line, column);
        return {};
    }
    if (c == '#' && is_ident_start(static_cast<unsigned char>(peek(1)))) {
        advance();
        while (pos_ < src_.size() && is_ident_part(static_cast<unsigned char>(peek())))
            advance();
        emit(TokenKind::PrivateName, start, line, column);
        return {};
    }
    if (std::isdigit(c) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
        while (pos_ < src_.size()) {
            char d = peek();
            if (std::isalnum(static_cast<unsigned char>(d)) || d == '.' || d == '_') {
                advance();
            } else if ((d == '+' || d == '-') && (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E') &&
                       !(src_[start] == '0' && (start + 1 < pos_) && (src_[start + 1] == 'x' || src_[start + 1] == 'X'))) {
                advance();
            } else {
                break;
            }
        }
        emit(TokenKind::Number, start, line, column);
        return {};
    }
    if (c == '"' || c == '\'')
        return lex_string(static_cast<char>(c));
    if (c == '`') {
        advance();
        return lex_template_chars(start, line, column, true);
    }
    if (c == '/' && regex_allowed())
        return lex_regex();
    if (c == '<' && jsx_ && regex_allowed() && jsx_tag_ahead()) {
        advance();
        size_t idx = emit(TokenKind::JsxTagOpen, start, line, column);
        stack_.push_back({Frame::JsxTag, idx, idx});
        return {};
    }
    if (c == '}' && !stack_.empty() && stack_.back().frame == Frame::TemplateSub) {
        advance();
        return lex_template_chars(start, line, column, false);
    }

    for (std::string_view p : PUNCTUATORS) {
        if (src_.substr(pos_).starts_with(p)) {
            // "?." followed by a digit is a conditional, not optional chaining.
            if (p == "?." && std::isdigit(static_cast<unsigned char>(peek(2))))
                continue;
            advance(p.size());
            size_t idx = emit(TokenKind::Punct, start, line, column);
            if (p == "(")
                stack_.push_back({Frame::Paren, idx, 0});
            else if (p == "[")
                stack_.push_back({Frame::Bracket, idx, 0});
            else if (p == "{")
                stack_.push_back({Frame::Brace, idx, 0});
            else if (p == ")" || p == "]" || p == "}")
                return close_bracket(p[0], idx);
            return {};
        }
    }
    return fail(std::format("unexpected character '{}'", static_cast<char>(c)));
}

std::expected<void, LexError> Lexer::lex_jsx_tag() {
    size_t start = pos_;
    uint32_t line = line_;
    uint32_t column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    char c = peek();
    Open &top = stack_.back();

    if (c == '/' && peek(1) == '>') {
        advance(2);
        size_t idx = emit(TokenKind::JsxSelfClose, start, line, column);
        partners_[top.element] = idx;
        stack_.pop_back();
        return {};
    }
    if (c == '>') {
        advance();
        size_t idx = emit(TokenKind::JsxTagEnd, start, line, column);
        Open done = top;
        stack_.pop_back();
        if (done.closing)
            partners_[done.element] = idx;
        else
            stack_.push_back({Frame::JsxChildren, idx, done.element});
        return {};
    }
    if (is_ident_start(static_cast<unsigned char>(c))) {
        while (pos_ < src_.size() && (is_ident_part(static_cast<unsigned char>(peek())) || peek() == '-' || peek() == ':'))
            advance();
        emit(TokenKind::Identifier, start, line, column);
        return {};
    }
    if (c == '"' || c == '\'')
        return lex_string(c);
    if (c == '{' || c == '.' || c == '=') {
        advance();
        size_t idx = emit(TokenKind::Punct, start, line, column);
        if (c == '{')
            stack_.push_back({Frame::Brace, idx, 0});
        return {};
    }
    return fail(std::format("unexpected character '{}' in JSX tag", c));
}

std::expected<void, LexError> Lexer::lex_jsx_children() {
    size_t start = pos_;
    uint32_t line = line_;
    uint32_t column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    while (pos_ < src_.size() && peek() != '<' && peek() != '{')
        advance();
    if (pos_ > start) {
        newline_pending_ = false;
        emit(TokenKind::JsxText, start, line, column);
        return {};
    }
    if (pos_ >= src_.size())
        return fail("unterminated JSX element");

    line = line_;
    column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    if (peek() == '{') {
        advance();
        size_t idx = emit(TokenKind::Punct, start, line, column);
        stack_.push_back({Frame::Brace, idx, 0});
        return {};
    }
    if (peek(1) == '/') {
        advance(2);
        emit(TokenKind::JsxCloseOpen, start, line, column);
        size_t element = stack_.back().element;
        stack_.pop_back();
        stack_.push_back({Frame::JsxTag, tokens_.size() - 1, element, true});
        return {};
    }
    advance();
    size_t idx = emit(TokenKind::JsxTagOpen, start, line, column);
    stack_.push_back({Frame::JsxTag, idx, idx});
    return {};
}

std::expected<void, LexError> Lexer::run() {
    while (true) {
        bool in_children = !stack_.empty() && stack_.back().frame == Frame::JsxChildren;
        if (!in_children) {
            if (auto res = skip_trivia(); !res)
                return std::unexpected(res.error());
        }
        if (pos_ >= src_.size())
            break;

        std::expected<void, LexError> res;
        if (in_children)
            res = lex_jsx_children();
        else if (!stack_.empty() && stack_.back().frame == Frame::JsxTag)
            res = lex_jsx_tag();
        else
            res = lex_code();
        if (!res)
            return std::unexpected(res.error());
    }

    if (!stack_.empty()) {
        const Token &open = tokens_[stack_.back().token];
        return std::unexpected(LexError{open.line, open.column, std::format("unclosed '{}'", open.text.substr(0, 2))});
    }

    Token end;
    end.kind = TokenKind::End;
    end.offset = static_cast<uint32_t>(src_.size());
    end.line = line_;
    end.column = static_cast<uint32_t>(pos_ - line_start_ + 1);
    end.newline_before = true;
    tokens_.push_back(end);
    partners_.push_back(TokenStream::npos);
    return {};
}

bool is_type_operand_start(const Token &tok) {
    switch (tok.kind) {
    case TokenKind::Identifier:
    case TokenKind::String:
    case TokenKind::Number:
    case TokenKind::Template:
    case TokenKind::TemplateHead:
        return true;
    case TokenKind::Punct:
        return tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "<" || tok.text == "-";
    default:
        return false;
    }
}

size_t skip_type_operand(const TokenStream &ts, size_t i) {
    while (ts.at(i).is_word("keyof") || ts.at(i).is_word("readonly") || ts.at(i).is_word("unique") ||
           ts.at(i).is_word("infer") || ts.at(i).is_word("abstract")) {
        if (!is_type_operand_start(ts.at(i + 1)))
            break;
        ++i;
    }
    if (ts.at(i).is_word("asserts") && ts.at(i + 1).is_identifier() && !ts.at(i + 1).newline_before)
        ++i;

    const Token &tok = ts.at(i);
    if (tok.is_word("typeof")) {
        ++i;
        while (ts.at(i).is_identifier() || ts.at(i).is(".") || ts.at(i).kind == TokenKind::PrivateName) {
            if (ts.at(i).is_word("import") && ts.at(i + 1).is("(")) {
                i = ts.partner(i + 1) + 1;
                continue;
            }
            ++i;
        }
    } else if (tok.is_word("new") && ts.at(i + 1).is("(")) {
        return skip_type_operand(ts, i + 1);
    } else if (tok.is("(")) {
        size_t after = ts.partner(i) + 1;
        if (ts.at(after).is("=>"))
            return skip_type(ts, after + 1);
        i = after;
    } else if (tok.is("<")) {
        size_t after = skip_angles(ts, i);
        if (after == TokenStream::npos)
            return i;
        return skip_type_operand(ts, after);
    } else if (tok.is("[") || tok.is("{")) {
        i = ts.partner(i) + 1;
    } else if (tok.kind == TokenKind::TemplateHead) {
        i = ts.partner(i) + 1;
        while (ts.at(i - 1).kind == TokenKind::TemplateMiddle)
            i = ts.partner(i - 1) + 1;
    } else if (tok.kind == TokenKind::String || tok.kind == TokenKind::Number || tok.kind == TokenKind::Template) {
        ++i;
    } else if (tok.is("-") && ts.at(i + 1).kind == TokenKind::Number) {
        i += 2;
    } else if (tok.is_identifier()) {
        if (tok.is_word("import") && ts.at(i + 1).is("("))
            i = ts.partner(i + 1) + 1;
        else
            ++i;
        while (ts.at(i).is(".") && ts.at(i + 1).is_identifier())
            i += 2;
        if (ts.at(i).is("<") && !ts.at(i).newline_before) {
            size_t after = skip_angles(ts, i);
            if (after != TokenStream::npos)
                i = after;
        }
        if (ts.at(i).is_word("is") && !ts.at(i).newline_before)
            return skip_type(ts, i + 1);
    } else {
        return i;
    }

    while (ts.at(i).is("[") && !ts.at(i).newline_before)
        i = ts.partner(i) + 1;
    return i;
}

bool type_argument_token(const Token &tok) {
    switch (tok.kind) {
    case TokenKind::Identifier:
    case TokenKind::String:
    case TokenKind::Number:
    case TokenKind::Template:
    case TokenKind::TemplateHead:
    case TokenKind::TemplateMiddle:
    case TokenKind::TemplateTail:
        return true;
    case TokenKind::Punct:
        return tok.text == "." || tok.text == "," || tok.text == "|" || tok.text == "&" || tok.text == "[" ||
               tok.text == "]" || tok.text == "(" || tok.text == ")" || tok.text == "{" || tok.text == "}" ||
               tok.text == ":" || tok.text == "?" || tok.text == "=>" || tok.text == "<" || tok.text == ">" ||
               tok.text == ">>" || tok.text == ">>>" || tok.text == "..." || tok.text == "-" || tok.text == ";";
    default:
        return false;
    }
}

} // namespace

std::string_view TokenStream::slice(size_t first, size_t last) const {
    const Token &a = at(first);
    const Token &b = at(last);
    return source_.substr(a.offset, b.offset + b.text.size() - a.offset);
}

std::expected<TokenStream, LexError> tokenize(std::string_view source, bool jsx) {
    Lexer lexer(source, jsx);
    if (auto res = lexer.run(); !res)
        return std::unexpected(res.error());
    return TokenStream(source, lexer.take_tokens(), lexer.take_partners());
}

bool is_reserved_word(std::string_view word) {
    return std::ranges::find(RESERVED, word) != RESERVED.end();
}

size_t skip_type(const TokenStream &ts, size_t i) {
    if (ts.at(i).is("|") || ts.at(i).is("&"))
        ++i;
    i = skip_type_operand(ts, i);
    while (true) {
        const Token &tok = ts.at(i);
        if (tok.is("|") || tok.is("&")) {
            i = skip_type_operand(ts, i + 1);
        } else if (tok.is_word("extends") && !tok.newline_before) {
            i = skip_type_operand(ts, i + 1);
            if (!ts.at(i).is("?"))
                break;
            i = skip_type(ts, i + 1);
            if (!ts.at(i).is(":"))
                break;
            i = skip_type(ts, i + 1);
        } else {
            break;
        }
    }
    return i;
}

size_t skip_angles(const TokenStream &ts, size_t i) {
    int depth = 0;
    for (size_t k = i; k < ts.size(); ++k) {
        const Token &tok = ts.at(k);
        if (tok.kind == TokenKind::End)
            return TokenStream::npos;
        if (tok.is("<")) {
            ++depth;
        } else if (tok.is(">") || tok.is(">>") || tok.is(">>>")) {
            depth -= static_cast<int>(tok.text.size());
            if (depth <= 0)
                return depth == 0 ? k + 1 : TokenStream::npos;
        } else if (tok.is("(") || tok.is("[") || tok.is("{")) {
            k = ts.partner(k);
            if (k == TokenStream::npos)
                return TokenStream::npos;
        } else if (tok.is(";") || tok.is(")") || tok.is("]") || tok.is("}")) {
            return TokenStream::npos;
        }
    }
    return TokenStream::npos;
}

size_t type_arguments_end(const TokenStream &ts, size_t i) {
    size_t end = skip_angles(ts, i);
    if (end == TokenStream::npos)
        return TokenStream::npos;
    for (size_t k = i + 1; k + 1 < end; ++k) {
        const Token &tok = ts.at(k);
        if (tok.is("(") || tok.is("[") || tok.is("{")) {
            size_t close = ts.partner(k);
            for (size_t inner = k + 1; inner < close; ++inner) {
                if (!type_argument_token(ts.at(inner)))
                    return TokenStream::npos;
            }
            k = close;
            continue;
        }
        if (!type_argument_token(tok) || tok.is(";"))
            return TokenStream::npos;
    }
    const Token &next = ts.at(end);
    if (next.is("(") || next.kind == TokenKind::Template || next.kind == TokenKind::TemplateHead)
        return end;
    return TokenStream::npos;
}

size_t arrow_after_params(const TokenStream &ts, size_t open) {
    size_t close = ts.partner(open);
    if (close == TokenStream::npos)
        return TokenStream::npos;
    size_t next = close + 1;
    if (ts.at(next).is("=>") && !ts.at(next).newline_before)
        return next;
    if (ts.at(next).is(":")) {
        size_t after = skip_type(ts, next + 1);
        if (after > next + 1 && ts.at(after).is("=>") && !ts.at(after).newline_before)
            return after;
    }
    return TokenStream::npos;
}

size_t count_params(const TokenStream &ts, size_t open) {
    size_t close = ts.partner(open);
    size_t count = 0;
    bool pending = false;
    bool this_param = false;
    for (size_t k = open + 1; k < close; ++k) {
        const Token &tok = ts.at(k);
        if (tok.is(",")) {
            if (pending && !this_param)
                ++count;
            pending = false;
            this_param = false;
            continue;
        }
        if (!pending)
            this_param = tok.is_word("this") && ts.at(k + 1).is(":");
        pending = true;
        if (size_t partner = ts.partner(k); partner != TokenStream::npos) {
            k = partner;
            while (ts.at(k).kind == TokenKind::TemplateMiddle)
                k = ts.partner(k);
        } else if (tok.is("<")) {
            size_t after = skip_angles(ts, k);
            if (after != TokenStream::npos)
                k = after - 1;
        }
    }
    if (pending && !this_param)
        ++count;
    return count;
}

bool continues_expression(const TokenStream &ts, size_t i, bool in_ternary) {
    static constexpr std::array BINARY = {
        "+",  "-",  "*",  "/",  "%",   "**",  "==",   "!=",  "===", "!==", "<",   ">",   "<=",  ">=",  "<<",
        ">>", ">>>", "&", "|",  "^",   "&&",  "||",   "??",  "=",   "+=",  "-=",  "*=",  "/=",  "%=",  "**=",
        "<<=", ">>=", ">>>=", "&=", "|=", "^=", "&&=", "||=", "?\?=", "?", ".", "?.", "(", "[",
    };
    const Token &tok = ts.at(i);
    switch (tok.kind) {
    case TokenKind::Template:
    case TokenKind::TemplateHead:
        return true;
    case TokenKind::Identifier:
        if (tok.text == "in" || tok.text == "instanceof")
            return true;
        return (tok.text == "as" || tok.text == "satisfies") && !tok.newline_before;
    case TokenKind::Punct:
        if (tok.text == ":")
            return in_ternary;
        if (tok.text == "!" || tok.text == "++" || tok.text == "--")
            return !tok.newline_before;
        return std::ranges::find(BINARY, tok.text) != BINARY.end();
    default:
        return false;
    }
}

bool starts_statement(const Token &tok) {
    static constexpr std::array WORDS = {
        "var",   "let",  "const", "function", "class",  "if",     "for",   "while",     "do",
        "return", "throw", "try", "switch",   "break",  "continue", "import", "export", "debugger",
        "interface", "enum", "declare", "namespace", "module", "abstract",
    };
    return tok.kind == TokenKind::Identifier && std::ranges::find(WORDS, tok.text) != WORDS.end();
}

bool ends_operand(const Token &tok) {
    switch (tok.kind) {
    case TokenKind::Identifier:
        return std::ranges::find(REGEX_PREFIX_WORDS, tok.text) == REGEX_PREFIX_WORDS.end();
    case TokenKind::PrivateName:
    case TokenKind::String:
    case TokenKind::Number:
    case TokenKind::Regex:
    case TokenKind::Template:
    case TokenKind::TemplateTail:
    case TokenKind::JsxTagEnd:
    case TokenKind::JsxSelfClose:
        return true;
    case TokenKind::Punct:
        return tok.text == ")" || tok.text == "]" || tok.text == "}";
    default:
        return false;
    }
}

bool at_statement_start(const TokenStream &ts, size_t i) {
    if (i == 0)
        return true;
    const Token &prev = ts.at(i - 1);
    if (prev.is(";") || prev.is("}") || prev.is("{"))
        return true;
    return ts.at(i).newline_before && ends_operand(prev);
}

size_t group_end(const TokenStream &ts, size_t open) {
    size_t close = ts.partner(open);
    if (close == TokenStream::npos)
        return open + 1;
    while (ts.at(close).kind == TokenKind::TemplateMiddle)
        close = ts.partner(close);
    return close + 1;
}

size_t expression_end(const TokenStream &ts, size_t i) {
    int ternary = 0;
    size_t k = i;
    while (true) {
        const Token &tok = ts.at(k);
        if (tok.kind == TokenKind::End)
            return k;
        if (k > i) {
            const Token &prev = ts.at(k - 1);
            if (tok.is(",") || tok.is(";") || tok.is(")") || tok.is("]") || tok.is("}"))
                return k;
            if (tok.is(":") && ternary == 0)
                return k;
            if (tok.newline_before && ends_operand(prev) && !continues_expression(ts, k, ternary > 0))
                return k;
            if (tok.is("<") && ends_operand(prev)) {
                if (size_t after = type_arguments_end(ts, k); after != TokenStream::npos) {
                    k = after;
                    continue;
                }
            }
        }
        if (tok.is("?"))
            ++ternary;
        else if (tok.is(":"))
            --ternary;
        if (ts.partner(k) != TokenStream::npos) {
            k = group_end(ts, k);
            continue;
        }
        ++k;
    }
}

size_t skip_decorator(const TokenStream &ts, size_t i) {
    size_t k = i + 1;
    if (ts.at(k).is("("))
        return group_end(ts, k);
    if (ts.at(k).is_identifier())
        ++k;
    while (ts.at(k).is(".") && ts.at(k + 1).is_identifier())
        k += 2;
    if (ts.at(k).is("<")) {
        if (size_t after = type_arguments_end(ts, k); after != TokenStream::npos)
            k = after;
    }
    if (ts.at(k).is("(") && !ts.at(k).newline_before)
        k = group_end(ts, k);
    return k;
}

size_t class_body_start(const TokenStream &ts, size_t i) {
    size_t k = i;
    while (true) {
        const Token &tok = ts.at(k);
        if (tok.is("{"))
            return k;
        if (tok.kind == TokenKind::End || tok.is(";") || tok.is(")") || tok.is("]") || tok.is("}"))
            return TokenStream::npos;
        if (tok.is("<")) {
            size_t after = skip_angles(ts, k);
            k = after == TokenStream::npos ? k + 1 : after;
        } else if (tok.is("(") || tok.is("[")) {
            k = group_end(ts, k);
        } else {
            ++k;
        }
    }
}

bool is_type_declaration(const TokenStream &ts, size_t i) {
    const Token &tok = ts.at(i);
    const Token &next = ts.at(i + 1);
    if (!tok.is_identifier() || next.newline_before)
        return false;
    if (tok.text == "type")
        return next.is_identifier() && (ts.at(i + 2).is("=") || ts.at(i + 2).is("<"));
    if (tok.text == "interface" || tok.text == "enum")
        return next.is_identifier();
    if (tok.text == "declare")
        return next.is_identifier() || next.kind == TokenKind::String;
    if (tok.text == "const")
        return next.is_word("enum");
    return false;
}

size_t type_declaration_end(const TokenStream &ts, size_t i) {
    size_t k = i + 1;
    while (true) {
        const Token &tok = ts.at(k);
        if (tok.kind == TokenKind::End)
            return k;
        if (tok.is("{"))
            return group_end(ts, k);
        if (tok.is(";"))
            return k + 1;
        if (tok.newline_before && k > i + 1 && ends_operand(ts.at(k - 1)) && !continues_expression(ts, k, false))
            return k;
        if (tok.is(":") || tok.is("=")) {
            k = skip_type(ts, k + 1);
        } else if (tok.is("<")) {
            size_t after = skip_angles(ts, k);
            k = after == TokenStream::npos ? k + 1 : after;
        } else if (tok.is("(") || tok.is("[")) {
            k = group_end(ts, k);
        } else {
            ++k;
        }
    }
}

bool is_namespace_block(const TokenStream &ts, size_t i, size_t &body) {
    const Token &tok = ts.at(i);
    if (!(tok.is_word("namespace") || tok.is_word("module")) || !ts.at(i + 1).is_identifier() ||
        ts.at(i + 1).newline_before)
        return false;
    size_t k = i + 2;
    while (ts.at(k).is(".") && ts.at(k + 1).is_identifier())
        k += 2;
    if (!ts.at(k).is("{"))
        return false;
    body = k;
    return true;
}

size_t import_declaration_end(const TokenStream &ts, size_t i) {
    size_t k = i + 1;
    while (true) {
        const Token &tok = ts.at(k);
        if (tok.kind == TokenKind::End || tok.is(";"))
            return k;
        if (tok.kind == TokenKind::String)
            return k + 1;
        if (tok.is("="))
            return expression_end(ts, k + 1);
        k = ts.partner(k) != TokenStream::npos ? group_end(ts, k) : k + 1;
    }
}

size_t export_clause_end(const TokenStream &ts, size_t i) {
    size_t k = i;
    if (ts.at(k).is_word("type"))
        ++k;
    if (ts.at(k).is("{")) {
        k = group_end(ts, k);
    } else if (ts.at(k).is("*")) {
        ++k;
        if (ts.at(k).is_word("as"))
            k += 2;
    }
    if (ts.at(k).is_word("from") && ts.at(k + 1).kind == TokenKind::String)
        k += 2;
    return k;
}

} // namespace kiln
