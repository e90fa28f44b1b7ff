#include <opgraph/runtime/observers/reconcile_trace.h>
#include <opgraph/types/operator.h>
#include <opgraph/util/log.h>

#include <fmt/format.h>

namespace opgraph {

    // Static member initialization
    bool ReconcileTrace::_print_literals = false;
    bool ReconcileTrace::_use_logger = true;

    ReconcileTrace::ReconcileTrace(const std::optional<std::string> &filter, bool pass, bool operators,
                                   bool subscriptions, bool edges)
        : _filter(filter), _pass(pass), _operators(operators), _subscriptions(subscriptions), _edges(edges) {}

    void ReconcileTrace::set_print_literals(bool value) { _print_literals = value; }

    void ReconcileTrace::set_use_logger(bool value) { _use_logger = value; }

    void ReconcileTrace::_print(const std::string &msg) const {
        if (_use_logger) {
            // Bypasses the level threshold
            write_log(LogLevel::INFO, msg);
        } else {
            fmt::print("{}\n", msg);
        }
    }

    void ReconcileTrace::_print_operator(const Operator &op, std::string_view msg) const {
        if (_print_literals) {
            _print(fmt::format("[{}] {} {}", op.path(), msg, op.to_string()));
        } else {
            _print(fmt::format("[{}] {} {}", op.path(), msg, op.type_name()));
        }
    }

    bool ReconcileTrace::_should_log(std::string_view path) const {
        if (!_filter.has_value()) { return true; }
        return path.find(_filter.value()) != std::string_view::npos;
    }

    void ReconcileTrace::on_before_reconcile(const GraphDocument &document) {
        if (_pass) {
            _print(fmt::format(">> {} Reconciling {} nodes, {} edges {}", std::string(15, '.'),
                               document.nodes.size(), document.edges.size(), std::string(15, '.')));
        }
    }

    void ReconcileTrace::on_operator_created(const Operator &op) {
        if (_operators && _should_log(op.path())) { _print_operator(op, "Created"); }
    }

    void ReconcileTrace::on_operator_reused(const Operator &op) {
        if (_operators && _should_log(op.path())) { _print_operator(op, "Reused"); }
    }

    void ReconcileTrace::on_operator_removed(const Operator &op) {
        if (_operators && _should_log(op.path())) { _print_operator(op, "Removed"); }
    }

    void ReconcileTrace::on_subscription_added(const Operator &target, std::string_view field_name,
                                               const Subscription &subscription) {
        if (_subscriptions && _should_log(target.path())) {
            _print(fmt::format("[{}] par.{} <- {}", target.path(), field_name, subscription.to_string()));
        }
    }

    void ReconcileTrace::on_subscription_removed(const Operator &target, std::string_view field_name,
                                                 const Subscription &subscription) {
        if (_subscriptions && _should_log(target.path())) {
            _print(fmt::format("[{}] par.{} -x {}", target.path(), field_name, subscription.to_string()));
        }
    }

    void ReconcileTrace::on_edge_rejected(const GraphEdge &edge, EdgeRejection reason) {
        if (_edges && (_should_log(edge.source) || _should_log(edge.target))) {
            _print(fmt::format("Rejected edge {}: {}", edge.id, to_string(reason)));
        }
    }

    void ReconcileTrace::on_after_reconcile(const ReconcileReport &report) {
        if (_pass) {
            _print(fmt::format("<< {} Reconciled {} {}", std::string(15, '.'), report.to_string(),
                               std::string(15, '.')));
        }
    }
} // namespace opgraph
