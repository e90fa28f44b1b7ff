#include <opgraph/runtime/graph_reconciler.h>
#include <opgraph/types/operator.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/errors.h>
#include <opgraph/util/log.h>
#include <opgraph/util/path.h>

#include <algorithm>

namespace opgraph {
    struct GraphReconciler::PendingOperator {
        const GraphNode *node;
        // Exactly one of these is set: the operator to reuse or the replacement constructed in prepare
        operator_s_ptr existing;
        operator_s_ptr created;
    };

    GraphReconciler::GraphReconciler(OperatorStore &store, const OperatorTypeRegistry &registry)
        : _store{store}, _registry{registry} {}

    std::vector<operator_s_ptr> GraphReconciler::transform_graph(const GraphDocument &document) {
        log_debug("Reconciling {} nodes and {} edges", document.nodes.size(), document.edges.size());
        notify([&](ReconcileObserver &observer) { observer.on_before_reconcile(document); });

        // Everything that can fail is done before the store is touched
        auto pending = prepare(document);

        ReconcileReport report;
        materialize(pending, report);
        wire(document, report);
        prune(document, report);

        std::vector<operator_s_ptr> result;
        result.reserve(pending.size());
        for (const auto &p : pending) { result.push_back(p.existing ? p.existing : p.created); }

        log_info("Reconciled graph, {}", report.to_string());
        _last_report = std::move(report);
        notify([&](ReconcileObserver &observer) { observer.on_after_reconcile(_last_report); });
        return result;
    }

    const ReconcileReport &GraphReconciler::last_report() const { return _last_report; }

    OperatorStore &GraphReconciler::store() const { return _store; }

    const OperatorTypeRegistry &GraphReconciler::registry() const { return _registry; }

    void GraphReconciler::add_observer(ReconcileObserver::ptr observer) {
        if (!observer) { throw_error<std::invalid_argument>("Cannot add a null reconcile observer"); }
        _observers.emplace_back(std::move(observer));
    }

    void GraphReconciler::remove_observer(const ReconcileObserver::ptr &observer) {
        auto it{std::find(_observers.begin(), _observers.end(), observer)};
        if (it != _observers.end()) { _observers.erase(it); }
    }

    std::vector<GraphReconciler::PendingOperator> GraphReconciler::prepare(const GraphDocument &document) const {
        std::vector<PendingOperator> pending;
        pending.reserve(document.nodes.size());
        StringSet seen;

        for (const auto &node : document.nodes) {
            if (!is_valid_path(node.id) || normalize_path(node.id) != node.id) {
                throw_error<IdentityError>("Invalid operator id '{}'", node.id);
            }
            if (!seen.insert(node.id).second) { throw_error<IdentityError>("Duplicate operator id '{}'", node.id); }

            auto type = _registry.find(node.type);
            if (!type) {
                throw_error<UnknownOperatorTypeError>("Unknown operator type '{}' for '{}'", node.type, node.id);
            }

            auto existing = _store.get(node.id);
            if (existing && existing->type_name() == node.type) {
                pending.push_back(PendingOperator{.node = &node, .existing = std::move(existing), .created = nullptr});
            } else {
                pending.push_back(PendingOperator{
                    .node = &node, .existing = nullptr, .created = _registry.make_operator(type, node.id, node.inputs)
                });
            }
        }
        return pending;
    }

    void GraphReconciler::materialize(std::vector<PendingOperator> &pending, ReconcileReport &report) {
        for (auto &p : pending) {
            const auto &path = p.node->id;
            if (p.existing) {
                p.existing->apply_input_values(p.node->inputs);
                report.reused.push_back(path);
                notify([&](ReconcileObserver &observer) { observer.on_operator_reused(*p.existing); });
                continue;
            }

            auto previous = _store.get(path);
            _store.set(path, p.created);
            if (previous) {
                log_debug("{}: replacing {} with {}", path, previous->type_name(), p.created->type_name());
                dispose_component(*previous);
                report.replaced.push_back(path);
                notify([&](ReconcileObserver &observer) { observer.on_operator_removed(*previous); });
            }
            initialise_component(*p.created);
            report.created.push_back(path);
            notify([&](ReconcileObserver &observer) { observer.on_operator_created(*p.created); });
        }
    }

    void GraphReconciler::wire(const GraphDocument &document, ReconcileReport &report) {
        StringSet declared;
        for (const auto &node : document.nodes) { declared.insert(node.id); }

        // target path -> input field -> subscriptions in edge order
        StringMap<StringMap<std::vector<Subscription>>> desired;

        for (const auto &edge : document.edges) {
            auto source_handle = parse_handle_id(edge.source_handle);
            if (!source_handle || source_handle->ns != HandleNamespace::OUTPUT) {
                reject(edge, EdgeRejection::INVALID_SOURCE_HANDLE, report);
                continue;
            }
            auto target_handle = parse_handle_id(edge.target_handle);
            if (!target_handle || target_handle->ns != HandleNamespace::PARAMETER) {
                reject(edge, EdgeRejection::INVALID_TARGET_HANDLE, report);
                continue;
            }

            auto source = declared.contains(edge.source) ? _store.get(edge.source) : nullptr;
            if (!source) {
                reject(edge, EdgeRejection::UNKNOWN_SOURCE, report);
                continue;
            }
            auto target = declared.contains(edge.target) ? _store.get(edge.target) : nullptr;
            if (!target) {
                reject(edge, EdgeRejection::UNKNOWN_TARGET, report);
                continue;
            }
            if (source->output(source_handle->field_name) == nullptr) {
                reject(edge, EdgeRejection::UNKNOWN_SOURCE_FIELD, report);
                continue;
            }
            auto spec = target->type().input(target_handle->field_name);
            if (spec == nullptr) {
                reject(edge, EdgeRejection::UNKNOWN_TARGET_FIELD, report);
                continue;
            }

            auto &subscriptions = desired[edge.target][target_handle->field_name];
            Subscription subscription{edge.source, source_handle->field_name};
            if (std::ranges::find(subscriptions, subscription) != subscriptions.end()) {
                reject(edge, EdgeRejection::DUPLICATE, report);
                continue;
            }
            if (spec->fan_in == FanInPolicy::SINGLE && !subscriptions.empty()) {
                reject(edge, EdgeRejection::FAN_IN_EXCEEDED, report);
                continue;
            }
            subscriptions.push_back(std::move(subscription));
        }

        const std::vector<Subscription> none;
        for (const auto &node : document.nodes) {
            auto op = _store.get(node.id);
            auto fields = desired.find(node.id);
            for (const auto &entry : op->inputs()) {
                const auto &field_name = entry.first;
                const std::vector<Subscription> *wanted = &none;
                if (fields != desired.end()) {
                    auto it = fields->second.find(field_name);
                    if (it != fields->second.end()) { wanted = &it->second; }
                }

                auto slot = op->input(field_name);
                if (slot->subscriptions() == *wanted) { continue; }

                auto current = slot->subscriptions();
                slot->assign_subscriptions(*wanted);

                for (const auto &subscription : current) {
                    if (std::ranges::find(*wanted, subscription) != wanted->end()) { continue; }
                    ++report.subscriptions_removed;
                    log_debug("{}.par.{}: unsubscribed from {}", node.id, field_name, subscription.to_string());
                    notify([&](ReconcileObserver &observer) {
                        observer.on_subscription_removed(*op, field_name, subscription);
                    });
                }
                for (const auto &subscription : *wanted) {
                    if (std::ranges::find(current, subscription) != current.end()) { continue; }
                    ++report.subscriptions_added;
                    log_debug("{}.par.{}: subscribed to {}", node.id, field_name, subscription.to_string());
                    notify([&](ReconcileObserver &observer) {
                        observer.on_subscription_added(*op, field_name, subscription);
                    });
                }
            }
        }
    }

    void GraphReconciler::prune(const GraphDocument &document, ReconcileReport &report) {
        StringSet declared;
        for (const auto &node : document.nodes) { declared.insert(node.id); }

        std::vector<std::string> stale;
        for (const auto &[path, _] : _store) {
            if (!declared.contains(path)) { stale.push_back(path); }
        }

        for (const auto &path : stale) {
            auto op = _store.erase(path);
            dispose_component(*op);
            report.removed.push_back(path);
            log_debug("{}: removed", path);
            notify([&](ReconcileObserver &observer) { observer.on_operator_removed(*op); });
        }

        report.subscriptions_removed += _store.drop_dangling_subscriptions(
            [&](const Operator &target, std::string_view field_name, const Subscription &subscription) {
                notify([&](ReconcileObserver &observer) {
                    observer.on_subscription_removed(target, field_name, subscription);
                });
            });
    }

    void GraphReconciler::reject(const GraphEdge &edge, EdgeRejection reason, ReconcileReport &report) {
        log_warning("Skipping edge '{}': {}", edge.id, to_string(reason));
        report.rejected_edges.push_back(RejectedEdge{.edge = edge, .reason = reason});
        notify([&](ReconcileObserver &observer) { observer.on_edge_rejected(edge, reason); });
    }
} // namespace opgraph
