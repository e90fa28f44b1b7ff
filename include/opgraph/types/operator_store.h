#ifndef OPGRAPH_TYPES_OPERATOR_STORE_H
#define OPGRAPH_TYPES_OPERATOR_STORE_H

#include <opgraph/opgraph_base.h>
#include <opgraph/util/string_map.h>

#include <functional>

namespace opgraph {

    /**
     * The live registry: path to operator. Owned by the host and passed by reference to the reconciler and to
     * evaluation, there is no global instance.
     *
     * Access is single threaded, callers serialize. Iteration follows insertion order until an operator is erased.
     */
    struct OPGRAPH_EXPORT OperatorStore {
        using operator_map = StringMap<operator_s_ptr>;
        using const_iterator = operator_map::const_iterator;

        OperatorStore() = default;

        OperatorStore(const OperatorStore &) = delete;

        OperatorStore &operator=(const OperatorStore &) = delete;

        OperatorStore(OperatorStore &&) = default;

        OperatorStore &operator=(OperatorStore &&) = default;

        // Null when absent
        [[nodiscard]] operator_s_ptr get(std::string_view path) const;

        /**
         * Register ``op`` under ``path``, replacing any existing occupant. Throws IdentityError if the path is not
         * valid, the operator is null or its own path differs from ``path``.
         */
        void set(std::string_view path, operator_s_ptr op);

        /**
         * Remove and return the operator at ``path`` (null if there was none). The operator is not disposed, that is
         * the caller's responsibility.
         */
        operator_s_ptr erase(std::string_view path);

        [[nodiscard]] bool has(std::string_view path) const;

        void clear();

        [[nodiscard]] size_t size() const;

        [[nodiscard]] bool empty() const;

        [[nodiscard]] std::vector<std::string> paths() const;

        [[nodiscard]] const_iterator begin() const;

        [[nodiscard]] const_iterator end() const;

        /**
         * Look up an operator by reference. An absolute reference is a direct lookup of the normalized path,
         * a relative reference is resolved against the container of ``context_path``.
         * Null for a relative reference without a context, when the reference cannot be resolved, or when
         * nothing is registered there.
         */
        [[nodiscard]] operator_s_ptr get_op(std::string_view reference,
                                            std::optional<std::string_view> context_path = std::nullopt) const;

        // Operators holding at least one subscription whose source is ``path``
        [[nodiscard]] std::vector<operator_s_ptr> dependents_of(std::string_view path) const;

        [[nodiscard]] std::vector<operator_s_ptr> direct_children(std::string_view container_path) const;

        [[nodiscard]] std::vector<operator_s_ptr> descendants_of(std::string_view container_path) const;

        /**
         * A free path for ``base_name`` inside ``container_path``: the qualified path itself if unused, otherwise the
         * first of ``base-1``, ``base-2``, ... that is.
         */
        [[nodiscard]] std::string unique_path(std::string_view base_name, std::string_view container_path) const;

        using dropped_subscription_fn =
            std::function<void(const Operator &target, std::string_view field_name, const Subscription &subscription)>;

        /**
         * Remove every subscription whose source operator or source output field no longer exists, calling
         * ``on_dropped`` for each. Returns the number of subscriptions removed.
         */
        size_t drop_dangling_subscriptions(const dropped_subscription_fn &on_dropped = {});

    private:
        operator_map _operators;
    };

} // namespace opgraph

#endif // OPGRAPH_TYPES_OPERATOR_STORE_H
