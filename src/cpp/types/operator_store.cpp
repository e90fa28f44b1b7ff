#include <opgraph/types/operator.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/errors.h>
#include <opgraph/util/log.h>
#include <opgraph/util/path.h>

namespace opgraph {
    operator_s_ptr OperatorStore::get(std::string_view path) const {
        auto it = _operators.find(path);
        return it == _operators.end() ? nullptr : it->second;
    }

    void OperatorStore::set(std::string_view path, operator_s_ptr op) {
        if (!is_valid_path(path)) {
            throw_error<IdentityError>("Cannot register an operator at invalid path '{}'", path);
        }
        if (!op) { throw_error<IdentityError>("Cannot register a null operator at '{}'", path); }
        if (op->path() != path) {
            throw_error<IdentityError>("Operator '{}' cannot be registered under '{}'", op->path(), path);
        }
        auto it = _operators.find(path);
        if (it != _operators.end()) {
            it->second = std::move(op);
        } else {
            _operators.emplace(std::string{path}, std::move(op));
        }
    }

    operator_s_ptr OperatorStore::erase(std::string_view path) {
        auto it = _operators.find(path);
        if (it == _operators.end()) { return nullptr; }
        auto op = std::move(it->second);
        _operators.erase(it);
        return op;
    }

    bool OperatorStore::has(std::string_view path) const { return _operators.contains(path); }

    void OperatorStore::clear() { _operators.clear(); }

    size_t OperatorStore::size() const { return _operators.size(); }

    bool OperatorStore::empty() const { return _operators.empty(); }

    std::vector<std::string> OperatorStore::paths() const {
        std::vector<std::string> result;
        result.reserve(_operators.size());
        for (const auto &[path, _] : _operators) { result.push_back(path); }
        return result;
    }

    OperatorStore::const_iterator OperatorStore::begin() const { return _operators.begin(); }

    OperatorStore::const_iterator OperatorStore::end() const { return _operators.end(); }

    operator_s_ptr OperatorStore::get_op(std::string_view reference,
                                         std::optional<std::string_view> context_path) const {
        if (reference.empty()) { return nullptr; }
        if (is_absolute_path(reference)) { return get(normalize_path(reference)); }
        // A relative reference needs a context to resolve against
        if (!context_path.has_value()) { return nullptr; }

        auto resolved = resolve_path(reference, *context_path);
        if (!resolved) {
            log_debug("Could not resolve '{}' from '{}'", reference, *context_path);
            return nullptr;
        }
        return get(*resolved);
    }

    std::vector<operator_s_ptr> OperatorStore::dependents_of(std::string_view path) const {
        std::vector<operator_s_ptr> result;
        for (const auto &[_, op] : _operators) {
            if (op->depends_on(path)) { result.push_back(op); }
        }
        return result;
    }

    std::vector<operator_s_ptr> OperatorStore::direct_children(std::string_view container_path) const {
        std::vector<operator_s_ptr> result;
        for (const auto &[path, op] : _operators) {
            if (is_direct_child(path, container_path)) { result.push_back(op); }
        }
        return result;
    }

    std::vector<operator_s_ptr> OperatorStore::descendants_of(std::string_view container_path) const {
        std::vector<operator_s_ptr> result;
        for (const auto &[path, op] : _operators) {
            if (is_within_container(path, container_path)) { result.push_back(op); }
        }
        return result;
    }

    std::string OperatorStore::unique_path(std::string_view base_name, std::string_view container_path) const {
        auto candidate = generate_qualified_path(base_name, container_path);
        for (size_t suffix = 1; has(candidate); ++suffix) {
            candidate = generate_qualified_path(fmt::format("{}-{}", base_name, suffix), container_path);
        }
        return candidate;
    }

    size_t OperatorStore::drop_dangling_subscriptions(const dropped_subscription_fn &on_dropped) {
        size_t removed{0};
        for (const auto &[path, op] : _operators) {
            for (auto &[field_name, _] : op->inputs()) {
                auto dropped = op->input(field_name)->remove_subscriptions_if([&](const Subscription &subscription) {
                    auto source = get(subscription.source_path);
                    return !source || source->output(subscription.source_field) == nullptr;
                });
                for (const auto &subscription : dropped) {
                    log_debug("{}.par.{}: dropped dangling subscription {}", path, field_name,
                              subscription.to_string());
                    if (on_dropped) { on_dropped(*op, field_name, subscription); }
                }
                removed += dropped.size();
            }
        }
        return removed;
    }
} // namespace opgraph
