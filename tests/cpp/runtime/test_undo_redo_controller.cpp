#include <opgraph/runtime/graph_reconciler.h>
#include <opgraph/runtime/undo_redo_controller.h>
#include <opgraph/types/builtin_operators.h>
#include <opgraph/types/operator_store.h>

#include <catch2/catch_test_macros.hpp>

namespace opgraph::test {

namespace {

GraphDocument numbers(std::initializer_list<int> values) {
    GraphDocument document;
    int index = 0;
    for (auto value : values) {
        document.nodes.push_back(
            GraphNode{.id = fmt::format("/num{}", index++), .type = "NumberOp", .inputs = {{"val", value}}});
    }
    return document;
}

// Restores into a plain vector so the state machine can be tested on its own
struct Recorder {
    std::vector<GraphDocument> restored;
    bool fail{false};

    UndoRedoController::restore_fn restore_fn() {
        return [this](const GraphDocument &state) {
            if (fail) { throw std::runtime_error("restore failed"); }
            restored.push_back(state);
        };
    }
};

struct StateLog : UndoRedoObserver {
    std::vector<UndoRedoState> states;

    void on_state_changed(const UndoRedoState &state) override { states.push_back(state); }
};

} // namespace

TEST_CASE("An empty history cannot undo or redo", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};

    REQUIRE_FALSE(controller.can_undo());
    REQUIRE_FALSE(controller.can_redo());
    REQUIRE_FALSE(controller.undo());
    REQUIRE_FALSE(controller.redo());
    REQUIRE(controller.get_state() == UndoRedoState{});
    REQUIRE(controller.current() == nullptr);
    REQUIRE(recorder.restored.empty());
}

TEST_CASE("record, undo and redo move through the history", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};

    REQUIRE(controller.record(numbers({1}), "first"));
    REQUIRE_FALSE(controller.can_undo());
    REQUIRE(controller.record(numbers({1, 2}), "second"));
    REQUIRE(controller.record(numbers({1, 2, 3}), "third"));
    REQUIRE(controller.history().size() == 3);

    REQUIRE(controller.undo());
    REQUIRE(recorder.restored.back() == numbers({1, 2}));
    REQUIRE(controller.undo());
    REQUIRE(recorder.restored.back() == numbers({1}));
    REQUIRE_FALSE(controller.undo());

    REQUIRE(controller.redo());
    REQUIRE(recorder.restored.back() == numbers({1, 2}));
    REQUIRE(controller.redo());
    REQUIRE_FALSE(controller.redo());
    REQUIRE(recorder.restored.size() == 4);
}

TEST_CASE("get_state describes the undo and redo targets", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};
    controller.record(numbers({1}), "first");
    controller.record(numbers({2}), "second");
    controller.record(numbers({3}), "third");
    controller.undo();

    auto state = controller.get_state();
    REQUIRE(state.cursor == 1);
    REQUIRE(state.history_size == 3);
    REQUIRE(state.can_undo);
    REQUIRE(state.can_redo);
    REQUIRE(state.undo_description == "first");
    REQUIRE(state.redo_description == "third");
}

TEST_CASE("Recording after an undo discards the redo history", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};
    controller.record(numbers({1}), "first");
    controller.record(numbers({2}), "second");
    controller.record(numbers({3}), "third");
    controller.undo();
    controller.undo();

    REQUIRE(controller.record(numbers({4}), "branch"));
    REQUIRE_FALSE(controller.can_redo());
    REQUIRE(controller.history().size() == 2);
    REQUIRE(controller.history()[1].description == "branch");
}

TEST_CASE("Duplicate snapshots are not recorded", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};

    REQUIRE(controller.record(numbers({1}), "first"));
    REQUIRE_FALSE(controller.record(numbers({1}), "again"));
    REQUIRE(controller.history().size() == 1);
}

TEST_CASE("History is capped at max_history", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn(), {}, 3};
    for (int i = 0; i < 5; ++i) { controller.record(numbers({i}), fmt::format("step {}", i)); }

    REQUIRE(controller.history().size() == 3);
    REQUIRE(controller.history().front().description == "step 2");
    REQUIRE(controller.get_state().cursor == 2);
    REQUIRE(controller.history().front().id < controller.history().back().id);

    REQUIRE_THROWS_AS(UndoRedoController(recorder.restore_fn(), {}, 0), std::invalid_argument);
    REQUIRE(UndoRedoController{recorder.restore_fn()}.max_history() == 50);
}

TEST_CASE("Recording is suppressed while restoring", "[undo_redo]") {
    UndoRedoController *self = nullptr;
    bool restoring_seen = false;
    bool recorded_while_restoring = true;
    UndoRedoController controller{[&](const GraphDocument &state) {
        restoring_seen = self->is_restoring();
        recorded_while_restoring = self->record(state, "echo");
    }};
    self = &controller;

    controller.record(numbers({1}), "first");
    controller.record(numbers({2}), "second");
    REQUIRE_FALSE(controller.is_restoring());
    REQUIRE(controller.undo());

    REQUIRE(restoring_seen);
    REQUIRE_FALSE(recorded_while_restoring);
    REQUIRE_FALSE(controller.is_restoring());
    REQUIRE(controller.history().size() == 2);
}

TEST_CASE("A failed restore leaves the cursor in place", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};
    controller.record(numbers({1}), "first");
    controller.record(numbers({2}), "second");

    recorder.fail = true;
    REQUIRE_THROWS_AS(controller.undo(), std::runtime_error);
    REQUIRE(controller.get_state().cursor == 1);
    REQUIRE_FALSE(controller.is_restoring());

    recorder.fail = false;
    REQUIRE(controller.undo());
    REQUIRE(controller.get_state().cursor == 0);
}

TEST_CASE("clear empties the history", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};
    controller.record(numbers({1}), "first");
    controller.record(numbers({2}), "second");

    controller.clear();
    REQUIRE(controller.history().empty());
    REQUIRE(controller.get_state().cursor == -1);
    REQUIRE_FALSE(controller.can_undo());
}

TEST_CASE("Observers are notified of state changes", "[undo_redo][observer]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};
    auto log = std::make_shared<StateLog>();
    controller.subscribe(log);

    controller.record(numbers({1}), "first");
    controller.record(numbers({2}), "second");
    controller.undo();
    controller.record(numbers({3}), "branch");

    REQUIRE(log->states.size() == 4);
    REQUIRE(log->states[1].can_undo);
    REQUIRE(log->states[2].redo_description == "second");
    REQUIRE_FALSE(log->states[3].can_redo);

    controller.unsubscribe(log);
    controller.clear();
    REQUIRE(log->states.size() == 4);
}

TEST_CASE("A controller bound to a reconciler restores the store", "[undo_redo][reconciler]") {
    auto registry = OperatorTypeRegistry::with_builtin_types();
    OperatorStore store;
    GraphReconciler reconciler{store, registry};
    UndoRedoController controller{reconciler};

    reconciler.transform_graph(numbers({1}));
    REQUIRE(controller.take_snapshot("one number"));
    auto num0 = store.get("/num0");

    reconciler.transform_graph(numbers({1, 2}));
    REQUIRE(controller.take_snapshot("two numbers"));
    REQUIRE_FALSE(controller.take_snapshot("unchanged"));

    REQUIRE(controller.undo());
    REQUIRE(store.size() == 1);
    // Undo goes through the reconciler, so surviving operators are reused
    REQUIRE(store.get("/num0") == num0);

    REQUIRE(controller.redo());
    REQUIRE(store.size() == 2);
    REQUIRE(store.get("/num1")->input("val")->literal() == Value{2});
}

TEST_CASE("An unchanged store is not recorded again after an undo", "[undo_redo][reconciler]") {
    auto registry = OperatorTypeRegistry::with_builtin_types();
    OperatorStore store;
    GraphReconciler reconciler{store, registry};
    UndoRedoController controller{reconciler};

    reconciler.transform_graph(numbers({0, 1, 2}));
    REQUIRE(controller.take_snapshot("three numbers"));

    // Dropping the first operator reorders the store
    auto without_first = numbers({0, 1, 2});
    without_first.nodes.erase(without_first.nodes.begin());
    reconciler.transform_graph(without_first);
    REQUIRE(controller.take_snapshot("two numbers"));

    REQUIRE(controller.undo());
    REQUIRE(store.size() == 3);
    REQUIRE_FALSE(controller.take_snapshot("unchanged"));
    REQUIRE(controller.can_redo());
    REQUIRE(controller.get_state().history_size == 2);
}

TEST_CASE("take_snapshot requires a capture function", "[undo_redo]") {
    Recorder recorder;
    UndoRedoController controller{recorder.restore_fn()};
    REQUIRE_THROWS_AS(controller.take_snapshot("no capture"), std::logic_error);
}

} // namespace opgraph::test
