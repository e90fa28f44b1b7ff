#ifndef OPGRAPH_RUNTIME_RECONCILE_OBSERVER_H
#define OPGRAPH_RUNTIME_RECONCILE_OBSERVER_H

#include <opgraph/opgraph_base.h>
#include <opgraph/runtime/graph_document.h>
#include <opgraph/types/subscription.h>

namespace opgraph {

    /**
     * Why a declarative edge was not wired.
     */
    enum class EdgeRejection : char8_t {
        INVALID_SOURCE_HANDLE = 0,  // unparsable, or not in the ``out`` namespace
        INVALID_TARGET_HANDLE = 1,  // unparsable, or not in the ``par`` namespace
        UNKNOWN_SOURCE = 2,
        UNKNOWN_TARGET = 3,
        UNKNOWN_SOURCE_FIELD = 4,
        UNKNOWN_TARGET_FIELD = 5,
        FAN_IN_EXCEEDED = 6,
        DUPLICATE = 7
    };

    [[nodiscard]] OPGRAPH_EXPORT std::string_view to_string(EdgeRejection reason);

    struct OPGRAPH_EXPORT RejectedEdge {
        GraphEdge edge;
        EdgeRejection reason;

        bool operator==(const RejectedEdge &other) const = default;
    };

    /**
     * What a reconciliation pass did to the store. Paths are listed in the order they were processed.
     */
    struct OPGRAPH_EXPORT ReconcileReport {
        std::vector<std::string> created{};
        std::vector<std::string> reused{};
        // Paths whose occupant changed type, these are also listed in ``created``
        std::vector<std::string> replaced{};
        std::vector<std::string> removed{};
        std::vector<RejectedEdge> rejected_edges{};
        size_t subscriptions_added{0};
        size_t subscriptions_removed{0};

        // Operators or subscriptions were added or removed, literal updates are not counted
        [[nodiscard]] bool has_changes() const;

        [[nodiscard]] std::string to_string() const;
    };

    /**
     * Hooks into a reconciliation pass, all default to no-ops. Notifications are delivered synchronously in the
     * order the changes are applied, ``on_after_reconcile`` is only delivered for a pass that completed.
     */
    struct OPGRAPH_EXPORT ReconcileObserver {
        using ptr = std::shared_ptr<ReconcileObserver>;

        virtual ~ReconcileObserver() = default;

        virtual void on_before_reconcile(const GraphDocument &document) {}

        virtual void on_operator_created(const Operator &op) {}

        virtual void on_operator_reused(const Operator &op) {}

        // Called after the operator was disposed and erased from the store
        virtual void on_operator_removed(const Operator &op) {}

        virtual void on_subscription_added(const Operator &target, std::string_view field_name,
                                           const Subscription &subscription) {}

        virtual void on_subscription_removed(const Operator &target, std::string_view field_name,
                                             const Subscription &subscription) {}

        virtual void on_edge_rejected(const GraphEdge &edge, EdgeRejection reason) {}

        virtual void on_after_reconcile(const ReconcileReport &report) {}
    };

} // namespace opgraph

#endif // OPGRAPH_RUNTIME_RECONCILE_OBSERVER_H
