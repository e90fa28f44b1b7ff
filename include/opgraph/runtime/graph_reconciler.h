#ifndef OPGRAPH_RUNTIME_GRAPH_RECONCILER_H
#define OPGRAPH_RUNTIME_GRAPH_RECONCILER_H

#include <opgraph/opgraph_base.h>
#include <opgraph/runtime/graph_document.h>
#include <opgraph/runtime/reconcile_observer.h>

namespace opgraph {

    /**
     * Applies a declarative graph to an operator store in place, preserving every operator whose path and type are
     * unchanged.
     *
     * A pass runs in four phases:
     *
     * 0. Validate: node ids must be valid, unique paths and every type must be registered. The new operators are
     *    constructed here, so a failure (IdentityError, UnknownOperatorTypeError) leaves the store untouched.
     * 1. Materialize: reuse operators with a matching path and type (literals reset from the node data), register
     *    the new ones, disposing anything they replace.
     * 2. Wire: edges are processed in order, malformed ones are rejected with a warning. Each input slot then holds
     *    exactly the subscriptions of its accepted edges.
     * 3. Prune: operators without a node are disposed and erased, subscriptions to missing sources are dropped.
     *
     * The store and registry must outlive the reconciler.
     */
    struct OPGRAPH_EXPORT GraphReconciler {
        GraphReconciler(OperatorStore &store, const OperatorTypeRegistry &registry);

        /**
         * Make the store reflect ``document``, returning the operators in node order.
         */
        std::vector<operator_s_ptr> transform_graph(const GraphDocument &document);

        [[nodiscard]] const ReconcileReport &last_report() const;

        [[nodiscard]] OperatorStore &store() const;

        [[nodiscard]] const OperatorTypeRegistry &registry() const;

        void add_observer(ReconcileObserver::ptr observer);

        void remove_observer(const ReconcileObserver::ptr &observer);

    private:
        struct PendingOperator;

        [[nodiscard]] std::vector<PendingOperator> prepare(const GraphDocument &document) const;

        void materialize(std::vector<PendingOperator> &pending, ReconcileReport &report);

        void wire(const GraphDocument &document, ReconcileReport &report);

        void prune(const GraphDocument &document, ReconcileReport &report);

        void reject(const GraphEdge &edge, EdgeRejection reason, ReconcileReport &report);

        template<typename Fn>
        void notify(Fn &&fn) {
            for (auto &observer : _observers) { fn(*observer); }
        }

        OperatorStore &_store;
        const OperatorTypeRegistry &_registry;
        ReconcileReport _last_report;
        std::vector<ReconcileObserver::ptr> _observers;
    };

} // namespace opgraph

#endif // OPGRAPH_RUNTIME_GRAPH_RECONCILER_H
