#include "kiln/evaluator.hpp"

#include "kiln/lexer.hpp"

#include <memory>

namespace kiln {

namespace {

std::string_view kind_of(std::string_view builder) {
    if (builder == "fragment")
        return "fragment";
    if (builder == "query" || builder == "mutation" || builder == "subscription")
        return "operation";
    return {};
}

class SummaryEvaluator final : public ElementEvaluator {
public:
    FactoryResult<ElementResult> evaluate(const GraphNode &node, const std::vector<ElementResult> &) override {
        const Definition &def = node.summary.definition;
        return ElementResult{
            .id = node.id,
            .file_path = node.file_path,
            .ast_path = def.ast_path,
            .schema = def.schema,
            .kind = std::string(classify_expression(def.expression)),
            .expression = def.expression,
            .export_binding = def.export_binding,
            .dependencies = node.dependencies,
        };
    }
};

} // namespace

std::string_view classify_expression(std::string_view expression) {
    auto tokens = tokenize(expression, false);
    if (!tokens)
        return "unknown";

    // Skip `NS.MEMBER(` and look at the factory body for `builder.X(` or `builder(`.
    for (size_t i = 3; i + 1 < tokens->size(); ++i) {
        const Token &tok = tokens->at(i);
        if (!tok.is_identifier() || tokens->at(i - 1).is(".") || tokens->at(i - 1).is("?."))
            continue;
        const Token &next = tokens->at(i + 1);
        if (!next.is(".") && !next.is("("))
            continue;
        if (std::string_view kind = kind_of(tok.text); !kind.empty())
            return kind;
    }
    return "unknown";
}

std::unique_ptr<ElementEvaluator> make_summary_evaluator() {
    return std::make_unique<SummaryEvaluator>();
}

} // namespace kiln
