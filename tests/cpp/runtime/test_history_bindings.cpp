#include <opgraph/runtime/history_bindings.h>
#include <opgraph/runtime/undo_redo_controller.h>

#include <catch2/catch_test_macros.hpp>

namespace opgraph::test {

TEST_CASE("Key chords map to history commands", "[bindings]") {
    REQUIRE(history_command_for({'z', true, false}) == HistoryCommand::UNDO);
    REQUIRE(history_command_for({'Z', true, false}) == HistoryCommand::UNDO);
    REQUIRE(history_command_for({'z', true, true}) == HistoryCommand::REDO);
    REQUIRE(history_command_for({'Z', true, true}) == HistoryCommand::REDO);
    REQUIRE(history_command_for({'y', true, false}) == HistoryCommand::REDO);
    REQUIRE(history_command_for({'y', true, true}) == HistoryCommand::REDO);

    REQUIRE_FALSE(history_command_for({'z', false, false}).has_value());
    REQUIRE_FALSE(history_command_for({'y', false, true}).has_value());
    REQUIRE_FALSE(history_command_for({'x', true, false}).has_value());
}

TEST_CASE("Commands are dispatched to the controller", "[bindings]") {
    int restores = 0;
    UndoRedoController controller{[&](const GraphDocument &) { ++restores; }};
    controller.record(GraphDocument{.nodes = {{.id = "/a", .type = "NumberOp"}}}, "a");
    controller.record(GraphDocument{.nodes = {{.id = "/b", .type = "NumberOp"}}}, "b");

    REQUIRE(handle_key_chord(controller, {'z', true, false}));
    REQUIRE_FALSE(controller.can_undo());
    REQUIRE_FALSE(handle_key_chord(controller, {'z', true, false}));
    REQUIRE(handle_key_chord(controller, {'y', true, false}));
    REQUIRE_FALSE(handle_key_chord(controller, {'q', true, false}));

    REQUIRE(dispatch(controller, HistoryCommand::UNDO));
    REQUIRE(dispatch(controller, HistoryCommand::REDO));
    REQUIRE(restores == 4);
    REQUIRE(to_string(HistoryCommand::REDO) == "redo");
}

} // namespace opgraph::test
