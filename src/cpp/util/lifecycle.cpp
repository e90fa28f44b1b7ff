#include <opgraph/util/lifecycle.h>

namespace opgraph {
    bool ComponentLifeCycle::is_initialised() const { return _initialised && !_disposed; }

    bool ComponentLifeCycle::is_initialising() const { return _transitioning && !_initialised; }

    bool ComponentLifeCycle::is_disposing() const { return _transitioning && _initialised; }

    bool ComponentLifeCycle::is_disposed() const { return _disposed; }

    struct TransitionGuard {
        TransitionGuard(ComponentLifeCycle &component) : _component{component} { _component._transitioning = true; }
        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    void initialise_component(ComponentLifeCycle &component) {
        if (component._initialised || component._disposed || component._transitioning) { return; }
        TransitionGuard guard{component};
        component.initialise();
        // If initialise throws the flag is not set, the guard still resets the transitioning state.
        component._initialised = true;
    }

    void dispose_component(ComponentLifeCycle &component) {
        if (component._disposed || component._transitioning) { return; }
        TransitionGuard guard{component};
        component.dispose();
        component._disposed = true;
    }
} // namespace opgraph
