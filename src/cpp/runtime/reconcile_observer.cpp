#include <opgraph/runtime/reconcile_observer.h>

namespace opgraph {
    std::string_view to_string(EdgeRejection reason) {
        switch (reason) {
            case EdgeRejection::INVALID_SOURCE_HANDLE: return "invalid source handle";
            case EdgeRejection::INVALID_TARGET_HANDLE: return "invalid target handle";
            case EdgeRejection::UNKNOWN_SOURCE: return "unknown source operator";
            case EdgeRejection::UNKNOWN_TARGET: return "unknown target operator";
            case EdgeRejection::UNKNOWN_SOURCE_FIELD: return "unknown source field";
            case EdgeRejection::UNKNOWN_TARGET_FIELD: return "unknown target field";
            case EdgeRejection::FAN_IN_EXCEEDED: return "target accepts a single source";
            case EdgeRejection::DUPLICATE: return "duplicate edge";
        }
        return "unknown";
    }

    bool ReconcileReport::has_changes() const {
        return !created.empty() || !removed.empty() || subscriptions_added > 0 || subscriptions_removed > 0;
    }

    std::string ReconcileReport::to_string() const {
        return fmt::format("created: {}, reused: {}, replaced: {}, removed: {}, rejected edges: {}, "
                           "subscriptions +{} -{}",
                           created.size(), reused.size(), replaced.size(), removed.size(), rejected_edges.size(),
                           subscriptions_added, subscriptions_removed);
    }
} // namespace opgraph
