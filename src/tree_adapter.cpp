#include "kiln/collector.hpp"
#include "kiln/lexer.hpp"
#include "kiln/parser.hpp"
#include "kiln/path_tracker.hpp"
#include "kiln/syntax_tree.hpp"

#include <optional>
#include <string>

namespace kiln {

namespace {

bool is_chain(NodeKind kind) {
    switch (kind) {
    case NodeKind::Call:
    case NodeKind::Member:
    case NodeKind::Index:
    case NodeKind::TaggedTemplate:
    case NodeKind::NonNull:
        return true;
    default:
        return false;
    }
}

/**
 * Walks a SyntaxTree in source order, mirroring the scope rules of the stream walker: a
 * declarator or field opens a scope only with an initializer, functions and classes only
 * with a body, and computed keys are visited before the member they name.
 */
class TreeVisitor {
public:
    TreeVisitor(const TokenStream &ts, const SyntaxTree &tree, ModuleCollector &collector)
        : ts_(ts), tree_(tree), collector_(collector) {
    }

    void run() {
        visit(tree_.root());
    }

private:
    void visit_children(const Node &n, size_t from = 0) {
        for (size_t i = from; i < n.children.size(); ++i)
            visit(n.children[i]);
    }

    void scoped(const Node &n, std::string_view segment, ScopeKind kind, bool binding, size_t from = 0) {
        collector_.paths().enter(segment, kind, binding);
        visit_children(n, from);
        collector_.paths().exit();
    }

    void anonymous(const Node &n, AnonymousKind kind) {
        collector_.paths().enter_anonymous(kind);
        visit_children(n);
        collector_.paths().exit();
    }

    void visit(NodeId id) {
        const Node &n = tree_.node(id);
        switch (n.kind) {
        case NodeKind::Declarator:
            if (!n.name.empty() && n.has_body)
                scoped(n, n.name, ScopeKind::Variable, true);
            else
                visit_children(n);
            return;
        case NodeKind::FunctionDecl:
        case NodeKind::FunctionExpr:
            if (!n.has_body)
                return;
            if (n.name.empty())
                anonymous(n, AnonymousKind::Function);
            else
                scoped(n, n.name, ScopeKind::Function, n.kind == NodeKind::FunctionDecl);
            return;
        case NodeKind::ClassDecl:
        case NodeKind::ClassExpr:
            if (!n.has_body)
                return;
            if (n.name.empty())
                anonymous(n, AnonymousKind::Class);
            else
                scoped(n, n.name, ScopeKind::Class, n.kind == NodeKind::ClassDecl);
            return;
        case NodeKind::Arrow:
            anonymous(n, AnonymousKind::Arrow);
            return;
        case NodeKind::Method:
            if (n.computed || !n.has_body)
                visit_children(n);
            else
                scoped(n, n.name, ScopeKind::Method, false);
            return;
        case NodeKind::Property:
            if (n.computed || n.name.empty() || !n.has_body)
                visit_children(n);
            else
                scoped(n, n.name, ScopeKind::Property, false);
            return;
        default:
            break;
        }
        if (is_chain(n.kind) && try_record(n))
            return;
        visit_children(n);
    }

    // Records the innermost call of a postfix chain if it is a qualifying
    // `NS.MEMBER(factory)` call; the rest of the chain is not visited.
    bool try_record(const Node &outer) {
        const Node *call = nullptr;
        for (const Node *cur = &outer; is_chain(cur->kind) && !cur->children.empty();
             cur = &tree_.node(cur->children.front())) {
            if (cur->kind == NodeKind::Call)
                call = cur;
        }
        if (call == nullptr || call->optional || call->children.size() != 2)
            return false;

        const Node &callee = tree_.node(call->children[0]);
        if (callee.kind != NodeKind::Member || callee.optional || callee.children.size() != 1)
            return false;
        const Node &ns = tree_.node(callee.children[0]);
        if (ns.kind != NodeKind::Identifier || !collector_.is_namespace(ns.name))
            return false;

        const Node &factory = tree_.node(call->children[1]);
        bool function_like = factory.kind == NodeKind::Arrow ||
                             (factory.kind == NodeKind::FunctionExpr && factory.has_body);
        if (!function_like || tree_.param_count(ts_, factory) != 1)
            return false;

        collector_.record(CallSite{.ns = ns.first, .open = call->args, .close = ts_.partner(call->args)});
        return true;
    }

    const TokenStream &ts_;
    const SyntaxTree &tree_;
    ModuleCollector &collector_;
};

class TreeAdapter final : public ParserAdapter {
public:
    explicit TreeAdapter(AnalyzerOptions options) : options_(std::move(options)) {
    }

    std::string_view name() const override {
        return "tree";
    }

    std::expected<ModuleAnalysis, ParseError> analyze(std::string_view file_path,
                                                      std::string_view source) const override {
        auto tokens = tokenize(source, is_jsx_path(file_path));
        if (!tokens)
            return std::unexpected(to_parse_error(file_path, tokens.error()));

        auto tree = parse_syntax_tree(*tokens);
        if (!tree)
            return std::unexpected(to_parse_error(file_path, *tokens, tree.error()));

        ModuleCollector collector(*tokens, file_path, options_);
        TreeVisitor visitor(*tokens, *tree, collector);
        visitor.run();
        return collector.finish();
    }

private:
    AnalyzerOptions options_;
};

} // namespace

std::unique_ptr<ParserAdapter> make_tree_adapter(AnalyzerOptions options) {
    return std::make_unique<TreeAdapter>(std::move(options));
}

} // namespace kiln
