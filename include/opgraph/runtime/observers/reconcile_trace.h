#pragma once

#include <opgraph/runtime/reconcile_observer.h>

#include <optional>
#include <string>

namespace opgraph {

    /**
     * @brief Logs out the changes a reconciliation pass applies to the store.
     *
     * This is voluminous but can be helpful tracing down why an operator was recreated or an edge did not appear.
     */
    class OPGRAPH_EXPORT ReconcileTrace : public ReconcileObserver {
    public:
        /**
         * @brief Construct a new Reconcile Trace object
         *
         * @param filter Used to restrict which operator events to report (substring match on the path)
         * @param pass Log the start and end of each pass
         * @param operators Log operators created, reused and removed
         * @param subscriptions Log subscriptions added and removed
         * @param edges Log rejected edges
         */
        explicit ReconcileTrace(const std::optional<std::string> &filter = std::nullopt, bool pass = true,
                                bool operators = true, bool subscriptions = true, bool edges = true);

        void on_before_reconcile(const GraphDocument &document) override;
        void on_operator_created(const Operator &op) override;
        void on_operator_reused(const Operator &op) override;
        void on_operator_removed(const Operator &op) override;
        void on_subscription_added(const Operator &target, std::string_view field_name,
                                   const Subscription &subscription) override;
        void on_subscription_removed(const Operator &target, std::string_view field_name,
                                     const Subscription &subscription) override;
        void on_edge_rejected(const GraphEdge &edge, EdgeRejection reason) override;
        void on_after_reconcile(const ReconcileReport &report) override;

        // Static configuration
        static void set_print_literals(bool value);
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _pass;
        bool _operators;
        bool _subscriptions;
        bool _edges;

        static bool _print_literals;
        static bool _use_logger;

        void _print(const std::string &msg) const;
        void _print_operator(const Operator &op, std::string_view msg) const;
        [[nodiscard]] bool _should_log(std::string_view path) const;
    };

} // namespace opgraph
