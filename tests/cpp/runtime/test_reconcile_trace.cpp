#include <opgraph/runtime/graph_reconciler.h>
#include <opgraph/runtime/observers/reconcile_trace.h>
#include <opgraph/types/builtin_operators.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/log.h>

#include <catch2/catch_test_macros.hpp>

namespace opgraph::test {

TEST_CASE("ReconcileTrace can be attached to a reconciler", "[reconciler][trace]") {
    auto registry = OperatorTypeRegistry::with_builtin_types();
    OperatorStore store;
    GraphReconciler reconciler{store, registry};

    ReconcileTrace::set_use_logger(false);
    ReconcileTrace::set_print_literals(true);
    auto trace = std::make_shared<ReconcileTrace>(std::string{"/num"}, false, true, true, true);
    reconciler.add_observer(trace);

    GraphDocument document{
        .nodes = {{.id = "/num", .type = "NumberOp"}, {.id = "/math", .type = "MathOp"}},
        .edges = {make_edge("/num", "val", "/math", "a"), make_edge("/num", "bad", "/math", "a")},
    };
    REQUIRE(reconciler.transform_graph(document).size() == 2);
    REQUIRE(reconciler.last_report().rejected_edges.size() == 1);

    reconciler.remove_observer(trace);
    ReconcileTrace::set_use_logger(true);
    ReconcileTrace::set_print_literals(false);
}

TEST_CASE("Log level threshold", "[log]") {
    auto previous = log_level();

    set_log_level(LogLevel::ERROR);
    REQUIRE(is_log_enabled(LogLevel::ERROR));
    REQUIRE_FALSE(is_log_enabled(LogLevel::WARNING));

    set_log_level(LogLevel::OFF);
    REQUIRE_FALSE(is_log_enabled(LogLevel::ERROR));
    REQUIRE_FALSE(is_log_enabled(LogLevel::OFF));

    set_log_level(previous);
    REQUIRE(to_string(LogLevel::DEBUG) == "DEBUG");
}

} // namespace opgraph::test
