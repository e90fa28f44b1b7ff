#ifndef OPGRAPH_RUNTIME_HISTORY_BINDINGS_H
#define OPGRAPH_RUNTIME_HISTORY_BINDINGS_H

#include <opgraph/opgraph_base.h>

namespace opgraph {

    enum class HistoryCommand : char8_t {
        UNDO = 0,
        REDO = 1
    };

    [[nodiscard]] OPGRAPH_EXPORT std::string_view to_string(HistoryCommand command);

    /**
     * A key press as reported by the host. ``primary_modifier`` is Ctrl, or Cmd on macOS.
     */
    struct OPGRAPH_EXPORT KeyChord {
        char key;
        bool primary_modifier{false};
        bool shift{false};
    };

    /**
     * primary+Z is undo, primary+Shift+Z and primary+Y are redo. Keys are case insensitive.
     */
    [[nodiscard]] OPGRAPH_EXPORT std::optional<HistoryCommand> history_command_for(const KeyChord &chord);

    // Returns whether the command changed the history cursor
    OPGRAPH_EXPORT bool dispatch(UndoRedoController &controller, HistoryCommand command);

    /**
     * Map ``chord`` and dispatch it. Returns false for chords that are not bound and commands that had no effect.
     */
    OPGRAPH_EXPORT bool handle_key_chord(UndoRedoController &controller, const KeyChord &chord);

} // namespace opgraph

#endif // OPGRAPH_RUNTIME_HISTORY_BINDINGS_H
