#pragma once

#include "kiln/artifact.hpp"
#include "kiln/graph.hpp"
#include "kiln/lazy.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief Produces the ElementResult of one graph node.
 *
 * Called once per node and build, after every dependency present in the graph has been
 * evaluated. `dependencies` follows the order of `node.dependencies`, skipping ids absent
 * from the graph. May return a pending value; may throw to signal failure.
 */
class ElementEvaluator {
public:
    virtual ~ElementEvaluator() = default;

    virtual FactoryResult<ElementResult> evaluate(const GraphNode &node,
                                                  const std::vector<ElementResult> &dependencies) = 0;
};

/**
 * @brief Element kind of a factory from the first builder it calls: "fragment" for
 * `fragment`, "operation" for `query`, `mutation` and `subscription`, "unknown" otherwise.
 */
std::string_view classify_expression(std::string_view expression);

/** @brief Synchronous evaluator that summarises a definition without running it. */
std::unique_ptr<ElementEvaluator> make_summary_evaluator();

} // namespace kiln
