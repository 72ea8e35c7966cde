#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kiln {

enum class TokenKind : uint8_t {
    Identifier, ///< Identifiers and keywords alike.
    PrivateName,
    Punct,
    String,
    Number,
    Regex,
    Template,     ///< Template literal without substitutions.
    TemplateHead, ///< "`...${"
    TemplateMiddle,
    TemplateTail,
    JsxTagOpen,  ///< '<' starting a JSX opening tag.
    JsxCloseOpen, ///< "</" starting a JSX closing tag.
    JsxTagEnd,   ///< '>' ending a JSX tag.
    JsxSelfClose, ///< "/>"
    JsxText,
    End,
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string_view text;
    uint32_t offset = 0;
    uint32_t line = 1;
    uint32_t column = 1;
    bool newline_before = false;

    bool is(std::string_view punct) const {
        return kind == TokenKind::Punct && text == punct;
    }
    bool is_word(std::string_view word) const {
        return kind == TokenKind::Identifier && text == word;
    }
    bool is_identifier() const {
        return kind == TokenKind::Identifier;
    }
};

struct LexError {
    uint32_t line = 0;
    uint32_t column = 0;
    std::string message;
};

/**
 * @brief Token sequence of one module plus bracket pairing.
 *
 * `partner(i)` maps every opener ('(', '[', '{', template heads and middles, JSX tag
 * openers) to the index of the token that closes it. For a JSX opening tag the partner
 * is the last token of the whole element. The sequence always ends with an End token.
 */
class TokenStream {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    const Token &at(size_t i) const {
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }
    size_t partner(size_t i) const {
        return i < partners_.size() ? partners_[i] : npos;
    }
    size_t size() const {
        return tokens_.size();
    }
    std::string_view source() const {
        return source_;
    }

    /** @brief Source text from the start of token `first` to the end of token `last`. */
    std::string_view slice(size_t first, size_t last) const;

    friend std::expected<TokenStream, LexError> tokenize(std::string_view source, bool jsx);

private:
    TokenStream(std::string_view source, std::vector<Token> tokens, std::vector<size_t> partners)
        : source_(source), tokens_(std::move(tokens)), partners_(std::move(partners)) {
    }

    std::string_view source_;
    std::vector<Token> tokens_;
    std::vector<size_t> partners_;
};

/**
 * @brief Tokenizes TypeScript/JavaScript source.
 *
 * Regular expression literals are told apart from division by the preceding token. With
 * `jsx` set, '<' in operand position followed by a tag name starts a JSX element.
 *
 * @return The token stream, or the position of the first unterminated construct or
 *         unbalanced bracket.
 */
std::expected<TokenStream, LexError> tokenize(std::string_view source, bool jsx);

bool is_reserved_word(std::string_view word);

// Shared syntax helpers. Both parser backends rely on these so that every ambiguity in
// the grammar is settled the same way.

/** @brief Skips a type annotation starting at `i`; returns the index after it. */
size_t skip_type(const TokenStream &ts, size_t i);

/**
 * @brief Skips a balanced '<...>' group starting at `i`.
 * @return Index after the closing '>', or npos if the group is not balanced.
 */
size_t skip_angles(const TokenStream &ts, size_t i);

/**
 * @brief Tests whether '<' at `i` opens explicit type arguments of a call
 * (`f<T>(x)`, "tag<T>`...`").
 * @return Index after '>' or npos.
 */
size_t type_arguments_end(const TokenStream &ts, size_t i);

/**
 * @brief Tests whether the parenthesized group opening at `open` is an arrow
 * function's parameter list, allowing a return type annotation.
 * @return Index of the "=>" token or npos.
 */
size_t arrow_after_params(const TokenStream &ts, size_t open);

/** @brief Number of parameters in the list opening at `open`, ignoring a `this` parameter. */
size_t count_params(const TokenStream &ts, size_t open);

/** @brief True for tokens after which an expression cannot end (binary operators etc.). */
bool continues_expression(const TokenStream &ts, size_t i, bool in_ternary);

/** @brief Keywords that start a statement that is not an expression statement. */
bool starts_statement(const Token &tok);

/** @brief True for tokens that can be the last token of an operand (`x`, `1`, `)`, "`...`"). */
bool ends_operand(const Token &tok);

/**
 * @brief True if token `i` begins a new statement at its nesting level: it follows `;`,
 * `}` or a line break after a complete operand, or it is the first token.
 */
bool at_statement_start(const TokenStream &ts, size_t i);

/**
 * @brief Finds the end of the assignment expression starting at `i`.
 *
 * Groups are skipped whole. The expression ends before a `,`, `;` or closing bracket at its
 * own level, or before a token on a new line that cannot continue it.
 *
 * @return Index of the first token after the expression.
 */
size_t expression_end(const TokenStream &ts, size_t i);

/** @brief Index after an opener's whole group, following template middles to the tail. */
size_t group_end(const TokenStream &ts, size_t open);

/** @brief Index after a decorator (`@name`, `@a.b(args)`) starting at `i`. */
size_t skip_decorator(const TokenStream &ts, size_t i);

/**
 * @brief Finds the '{' opening a class body, skipping `extends` and `implements` clauses
 * from `i` on.
 * @return Index of the '{' or npos.
 */
size_t class_body_start(const TokenStream &ts, size_t i);

/**
 * @brief True if the statement at `i` declares only types or ambient declarations
 * (`type X =`, `interface`, `declare`, `enum`, `const enum`).
 */
bool is_type_declaration(const TokenStream &ts, size_t i);

/** @brief Index after the type-level declaration starting at `i`. */
size_t type_declaration_end(const TokenStream &ts, size_t i);

/**
 * @brief True if `i` starts a `namespace X {` or `module X {` block. `body` receives the
 * index of the '{'.
 */
bool is_namespace_block(const TokenStream &ts, size_t i, size_t &body);

/** @brief Index after an import declaration (`import ... from "x"`, `import "x"`, `import x = y`). */
size_t import_declaration_end(const TokenStream &ts, size_t i);

/** @brief Index after an `export {...} [from "x"]` or `export * ... from "x"` clause starting at `i`. */
size_t export_clause_end(const TokenStream &ts, size_t i);

} // namespace kiln
