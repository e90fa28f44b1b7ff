#ifndef OPGRAPH_RUNTIME_UNDO_REDO_CONTROLLER_H
#define OPGRAPH_RUNTIME_UNDO_REDO_CONTROLLER_H

#include <opgraph/opgraph_base.h>
#include <opgraph/runtime/graph_document.h>

#include <chrono>
#include <functional>

namespace opgraph {

    struct OPGRAPH_EXPORT UndoRedoSnapshot {
        uint64_t id;
        std::chrono::system_clock::time_point timestamp;
        std::string description;
        GraphDocument state;
    };

    struct OPGRAPH_EXPORT UndoRedoState {
        // -1 when the history is empty
        int64_t cursor{-1};
        size_t history_size{0};
        bool can_undo{false};
        bool can_redo{false};
        std::optional<std::string> undo_description{};
        std::optional<std::string> redo_description{};

        bool operator==(const UndoRedoState &other) const = default;
    };

    struct OPGRAPH_EXPORT UndoRedoObserver {
        using ptr = std::shared_ptr<UndoRedoObserver>;

        virtual ~UndoRedoObserver() = default;

        virtual void on_state_changed(const UndoRedoState &state) = 0;
    };

    /**
     * A linear history of declarative graph snapshots with a cursor pointing at the snapshot that reflects the
     * current graph.
     *
     * Undo and redo move the cursor and re-apply the snapshot through the restore function. Calls to ``record`` made
     * while a restore is running (typically from the host reacting to the store changing) are ignored.
     */
    struct OPGRAPH_EXPORT UndoRedoController {
        using restore_fn = std::function<void(const GraphDocument &)>;
        using capture_fn = std::function<GraphDocument()>;

        static constexpr size_t DEFAULT_MAX_HISTORY = 50;

        /**
         * @param restore Applies a snapshot, an exception leaves the cursor where it was
         * @param capture Produces the current state for ``take_snapshot``, optional
         * @param max_history Number of snapshots kept, must be at least 1
         */
        explicit UndoRedoController(restore_fn restore, capture_fn capture = {},
                                    size_t max_history = DEFAULT_MAX_HISTORY);

        /**
         * Restores through ``reconciler.transform_graph`` and captures the reconciler's store.
         */
        explicit UndoRedoController(GraphReconciler &reconciler, size_t max_history = DEFAULT_MAX_HISTORY);

        /**
         * Append ``state`` after the cursor, discarding any redo history. Returns false when suppressed: while
         * restoring or when ``state`` equals the snapshot at the cursor.
         */
        bool record(GraphDocument state, std::string description = {});

        /**
         * Record the state produced by the capture function, throws std::logic_error if there is none.
         */
        bool take_snapshot(std::string description = {});

        bool undo();

        bool redo();

        [[nodiscard]] bool can_undo() const;

        [[nodiscard]] bool can_redo() const;

        [[nodiscard]] bool is_restoring() const;

        [[nodiscard]] UndoRedoState get_state() const;

        [[nodiscard]] const std::vector<UndoRedoSnapshot> &history() const;

        [[nodiscard]] const UndoRedoSnapshot *current() const;

        [[nodiscard]] size_t max_history() const;

        void clear();

        void subscribe(UndoRedoObserver::ptr observer);

        void unsubscribe(const UndoRedoObserver::ptr &observer);

    private:
        bool move_to(int64_t cursor);

        void notify_state_changed();

        restore_fn _restore;
        capture_fn _capture;
        size_t _max_history;
        std::vector<UndoRedoSnapshot> _history;
        int64_t _cursor{-1};
        uint64_t _next_id{1};
        bool _restoring{false};
        std::vector<UndoRedoObserver::ptr> _observers;
    };

} // namespace opgraph

#endif // OPGRAPH_RUNTIME_UNDO_REDO_CONTROLLER_H
