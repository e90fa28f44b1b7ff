#ifndef OPGRAPH_RUNTIME_GRAPH_EVALUATION_H
#define OPGRAPH_RUNTIME_GRAPH_EVALUATION_H

#include <opgraph/opgraph_base.h>

namespace opgraph {

    /**
     * The operators of ``store`` ordered so that every operator follows the operators it reads from (see
     * Operator::upstream_paths). Independent operators keep their store order. Operators on a cycle cannot be
     * ordered, they are appended in store order and a warning is logged.
     */
    [[nodiscard]] OPGRAPH_EXPORT std::vector<operator_s_ptr> topological_order(const OperatorStore &store);

    struct OPGRAPH_EXPORT EvaluationSummary {
        size_t evaluated{0};
        // Skipped because their inputs were unchanged
        size_t cached{0};
        std::vector<std::string> failed{};
    };

    /**
     * Evaluate every operator once, in topological order.
     */
    OPGRAPH_EXPORT EvaluationSummary evaluate_graph(const OperatorStore &store);

} // namespace opgraph

#endif // OPGRAPH_RUNTIME_GRAPH_EVALUATION_H
