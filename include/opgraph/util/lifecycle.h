#ifndef OPGRAPH_UTIL_LIFECYCLE_H
#define OPGRAPH_UTIL_LIFECYCLE_H

#include <opgraph/opgraph_base.h>

namespace opgraph {
    struct ComponentLifeCycle;

    void OPGRAPH_EXPORT initialise_component(ComponentLifeCycle &component);

    void OPGRAPH_EXPORT dispose_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * The Life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, additional properties may be set after this (for example literal values
     *   supplied by the declarative graph).
     *
     * * The component will have initialise called once it has been registered, i.e. once it is visible to the rest
     *   of the graph. This is called at most once.
     *
     * * The dispose method is called once the component is no longer referenced by the declarative graph. It is
     *   expected the component will be released after this call completes. A disposed component is never
     *   re-initialised, a path that re-appears gets a fresh instance.
     *
     * NOTE: These methods are expected to be called on a single thread, the simple guard clauses used are sufficient
     *       to ensure we don't initialise or dispose more than once.
     */
    struct OPGRAPH_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        [[nodiscard]] bool is_initialised() const;

        [[nodiscard]] bool is_initialising() const;

        [[nodiscard]] bool is_disposing() const;

        [[nodiscard]] bool is_disposed() const;

    protected:
        /**
         * Called once the component has been constructed and registered. Use this to prepare cached data, etc.
         */
        virtual void initialise() = 0;

        /**
         * Release everything this component holds. The component must not reach into other components, they are
         * responsible for their own clean-up.
         */
        virtual void dispose() = 0;

    private:
        bool _initialised{false};
        bool _disposed{false};
        bool _transitioning{false};

        friend TransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace opgraph

#endif // OPGRAPH_UTIL_LIFECYCLE_H
