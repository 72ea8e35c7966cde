#pragma once

#include "kiln/lexer.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class NodeKind : uint8_t {
    Module,
    Block,      ///< Statement list: blocks, function bodies, namespace bodies, control headers.
    Statement,  ///< Any other statement; children in source order.
    Declarator, ///< `name = init` or `pattern = init`.
    FunctionDecl,
    FunctionExpr,
    Arrow,
    ClassDecl,
    ClassExpr,
    Method,   ///< Class or object method, accessor or constructor.
    Property, ///< Class field or `key: value` object property.
    ObjectLiteral,
    ArrayLiteral,
    Call,
    New,
    Member,
    Index,
    TaggedTemplate,
    NonNull,
    Template,
    Jsx,
    Identifier,
    Literal,
    Unary,
    Binary,
    Conditional,
    Paren,
    Spread,
};

/** @brief Index of a node inside its SyntaxTree. */
using NodeId = uint32_t;

struct Node {
    NodeKind kind = NodeKind::Statement;
    size_t first = 0; ///< First token.
    size_t last = 0;  ///< Last token (inclusive).
    std::string_view name;  ///< Declared name, member name or property key; empty if anonymous.
    bool computed = false;  ///< Key is a computed `[expr]`; children[0] is the key expression.
    bool has_body = false;  ///< Functions and methods with a body; declarators and fields with an initializer.
    bool optional = false;  ///< `?.` member access or call.
    size_t params = TokenStream::npos; ///< '(' of the parameter list, or the single bare parameter.
    size_t args = TokenStream::npos;   ///< '(' of a call's argument list.
    std::vector<NodeId> children;      ///< Source order.
};

/**
 * @brief Syntax tree of one module. Nodes live in one vector and refer to each other by index.
 */
class SyntaxTree {
public:
    const Node &node(NodeId id) const {
        return nodes_[id];
    }
    NodeId root() const {
        return 0;
    }
    size_t size() const {
        return nodes_.size();
    }

    /** @brief Number of parameters of a function-like node. */
    size_t param_count(const TokenStream &ts, const Node &fn) const;

    friend class TreeParser;

private:
    std::vector<Node> nodes_;
};

struct SyntaxError {
    size_t token = 0;
    std::string message;
};

/**
 * @brief Parses a token stream into a SyntaxTree.
 *
 * Type annotations, type arguments and ambient declarations are recognized and dropped; only
 * runtime structure is kept.
 */
std::expected<SyntaxTree, SyntaxError> parse_syntax_tree(const TokenStream &ts);

/**
 * @brief Checks `ts` against the grammar of parse_syntax_tree without keeping the tree.
 *
 * Every backend runs this check, so a module is rejected by all of them or by none.
 *
 * @return The first syntax error, if any.
 */
std::optional<SyntaxError> check_syntax(const TokenStream &ts);

} // namespace kiln
