#include <opgraph/runtime/history_bindings.h>
#include <opgraph/runtime/undo_redo_controller.h>
#include <opgraph/util/log.h>

#include <cctype>

namespace opgraph {
    std::string_view to_string(HistoryCommand command) {
        return command == HistoryCommand::UNDO ? "undo" : "redo";
    }

    std::optional<HistoryCommand> history_command_for(const KeyChord &chord) {
        if (!chord.primary_modifier) { return std::nullopt; }
        auto key = static_cast<char>(std::tolower(static_cast<unsigned char>(chord.key)));
        if (key == 'z') { return chord.shift ? HistoryCommand::REDO : HistoryCommand::UNDO; }
        if (key == 'y') { return HistoryCommand::REDO; }
        return std::nullopt;
    }

    bool dispatch(UndoRedoController &controller, HistoryCommand command) {
        log_debug("{} triggered", to_string(command));
        return command == HistoryCommand::UNDO ? controller.undo() : controller.redo();
    }

    bool handle_key_chord(UndoRedoController &controller, const KeyChord &chord) {
        auto command = history_command_for(chord);
        return command.has_value() && dispatch(controller, *command);
    }
} // namespace opgraph
