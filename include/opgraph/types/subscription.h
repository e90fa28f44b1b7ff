#ifndef OPGRAPH_TYPES_SUBSCRIPTION_H
#define OPGRAPH_TYPES_SUBSCRIPTION_H

#include <opgraph/opgraph_base.h>

#include <compare>

namespace opgraph {
    /**
     * A directed edge from an upstream output field into the input slot that owns the subscription.
     * The upstream operator holds no reference back, dependents are found by scanning the store.
     */
    struct OPGRAPH_EXPORT Subscription {
        std::string source_path;
        std::string source_field;

        Subscription(std::string source_path_, std::string source_field_);

        // e.g. "/num1.out.val"
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Subscription &other) const = default;

        auto operator<=>(const Subscription &other) const = default;
    };
} // namespace opgraph

#endif // OPGRAPH_TYPES_SUBSCRIPTION_H
