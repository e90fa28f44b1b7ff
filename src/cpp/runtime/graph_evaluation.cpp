#include <opgraph/runtime/graph_evaluation.h>
#include <opgraph/types/operator.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/log.h>

#include <deque>

namespace opgraph {
    std::vector<operator_s_ptr> topological_order(const OperatorStore &store) {
        std::vector<operator_s_ptr> operators;
        operators.reserve(store.size());
        StringMap<size_t> index;
        for (const auto &[path, op] : store) {
            index.emplace(path, operators.size());
            operators.push_back(op);
        }

        // Kahn's algorithm, edges from source to dependent
        std::vector<size_t> in_degree(operators.size(), 0);
        std::vector<std::vector<size_t>> dependents(operators.size());
        for (size_t i = 0; i < operators.size(); ++i) {
            for (const auto &source : operators[i]->upstream_paths(store)) {
                auto it = index.find(source);
                if (it == index.end() || it->second == i) { continue; }
                dependents[it->second].push_back(i);
                ++in_degree[i];
            }
        }

        std::deque<size_t> ready;
        for (size_t i = 0; i < operators.size(); ++i) {
            if (in_degree[i] == 0) { ready.push_back(i); }
        }

        std::vector<operator_s_ptr> result;
        result.reserve(operators.size());
        std::vector<bool> placed(operators.size(), false);
        while (!ready.empty()) {
            auto i = ready.front();
            ready.pop_front();
            placed[i] = true;
            result.push_back(operators[i]);
            for (auto dependent : dependents[i]) {
                if (--in_degree[dependent] == 0) { ready.push_back(dependent); }
            }
        }

        if (result.size() != operators.size()) {
            std::vector<std::string> cyclic;
            for (size_t i = 0; i < operators.size(); ++i) {
                if (placed[i]) { continue; }
                cyclic.push_back(operators[i]->path());
                result.push_back(operators[i]);
            }
            log_warning("Cycle between operators: {}", fmt::join(cyclic, ", "));
        }
        return result;
    }

    EvaluationSummary evaluate_graph(const OperatorStore &store) {
        EvaluationSummary summary;
        for (const auto &op : topological_order(store)) {
            if (op->evaluate(store)) {
                ++summary.evaluated;
            } else if (op->last_error().has_value()) {
                summary.failed.push_back(op->path());
            } else {
                ++summary.cached;
            }
        }
        log_debug("Evaluated {} operators, {} cached, {} failed", summary.evaluated, summary.cached,
                  summary.failed.size());
        return summary;
    }
} // namespace opgraph
