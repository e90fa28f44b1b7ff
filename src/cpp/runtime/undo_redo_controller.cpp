#include <opgraph/runtime/graph_reconciler.h>
#include <opgraph/runtime/undo_redo_controller.h>
#include <opgraph/util/errors.h>
#include <opgraph/util/log.h>

#include <algorithm>

namespace opgraph {
    namespace {
        struct RestoringGuard {
            explicit RestoringGuard(bool &restoring) : _restoring{restoring} { _restoring = true; }

            RestoringGuard(const RestoringGuard &) = delete;

            RestoringGuard &operator=(const RestoringGuard &) = delete;

            ~RestoringGuard() { _restoring = false; }

        private:
            bool &_restoring;
        };
    } // namespace

    UndoRedoController::UndoRedoController(restore_fn restore, capture_fn capture, size_t max_history)
        : _restore{std::move(restore)}, _capture{std::move(capture)}, _max_history{max_history} {
        if (!_restore) { throw_error<std::invalid_argument>("Undo/redo requires a restore function"); }
        if (_max_history == 0) {
            throw_error<std::invalid_argument>("Undo/redo history must hold at least one entry");
        }
    }

    UndoRedoController::UndoRedoController(GraphReconciler &reconciler, size_t max_history)
        : UndoRedoController(
              [&reconciler](const GraphDocument &state) { reconciler.transform_graph(state); },
              [&reconciler]() { return capture_document(reconciler.store()); },
              max_history) {}

    bool UndoRedoController::record(GraphDocument state, std::string description) {
        if (_restoring) {
            log_debug("Ignoring snapshot '{}' recorded while restoring", description);
            return false;
        }
        if (auto c = current(); c != nullptr && c->state == state) {
            log_debug("Skipping duplicate snapshot '{}'", description);
            return false;
        }

        _history.erase(_history.begin() + (_cursor + 1), _history.end());
        _history.push_back(UndoRedoSnapshot{
            .id = _next_id++,
            .timestamp = std::chrono::system_clock::now(),
            .description = std::move(description),
            .state = std::move(state),
        });
        if (_history.size() > _max_history) {
            auto excess = static_cast<int64_t>(_history.size() - _max_history);
            _history.erase(_history.begin(), _history.begin() + excess);
        }
        _cursor = static_cast<int64_t>(_history.size()) - 1;

        log_info("Snapshot '{}' added, history length: {}", _history.back().description, _history.size());
        notify_state_changed();
        return true;
    }

    bool UndoRedoController::take_snapshot(std::string description) {
        if (!_capture) { throw_error<std::logic_error>("No capture function to take a snapshot with"); }
        if (_restoring) { return false; }
        return record(_capture(), std::move(description));
    }

    bool UndoRedoController::undo() {
        if (_restoring || !can_undo()) {
            log_debug("Cannot undo, cursor: {}, history length: {}", _cursor, _history.size());
            return false;
        }
        return move_to(_cursor - 1);
    }

    bool UndoRedoController::redo() {
        if (_restoring || !can_redo()) { return false; }
        return move_to(_cursor + 1);
    }

    bool UndoRedoController::can_undo() const { return _cursor > 0; }

    bool UndoRedoController::can_redo() const { return _cursor < static_cast<int64_t>(_history.size()) - 1; }

    bool UndoRedoController::is_restoring() const { return _restoring; }

    UndoRedoState UndoRedoController::get_state() const {
        UndoRedoState state{
            .cursor = _cursor,
            .history_size = _history.size(),
            .can_undo = can_undo(),
            .can_redo = can_redo(),
        };
        if (state.can_undo) { state.undo_description = _history[_cursor - 1].description; }
        if (state.can_redo) { state.redo_description = _history[_cursor + 1].description; }
        return state;
    }

    const std::vector<UndoRedoSnapshot> &UndoRedoController::history() const { return _history; }

    const UndoRedoSnapshot *UndoRedoController::current() const {
        return _cursor < 0 ? nullptr : &_history[_cursor];
    }

    size_t UndoRedoController::max_history() const { return _max_history; }

    void UndoRedoController::clear() {
        _history.clear();
        _cursor = -1;
        notify_state_changed();
    }

    void UndoRedoController::subscribe(UndoRedoObserver::ptr observer) {
        if (!observer) { throw_error<std::invalid_argument>("Cannot subscribe a null undo/redo observer"); }
        _observers.emplace_back(std::move(observer));
    }

    void UndoRedoController::unsubscribe(const UndoRedoObserver::ptr &observer) {
        auto it{std::find(_observers.begin(), _observers.end(), observer)};
        if (it != _observers.end()) { _observers.erase(it); }
    }

    bool UndoRedoController::move_to(int64_t cursor) {
        const auto &snapshot = _history[cursor];
        log_info("Restoring snapshot '{}' ({} of {})", snapshot.description, cursor + 1, _history.size());
        {
            RestoringGuard guard{_restoring};
            _restore(snapshot.state);
        }
        _cursor = cursor;
        notify_state_changed();
        return true;
    }

    void UndoRedoController::notify_state_changed() {
        if (_observers.empty()) { return; }
        auto state = get_state();
        for (auto &observer : _observers) { observer->on_state_changed(state); }
    }
} // namespace opgraph
