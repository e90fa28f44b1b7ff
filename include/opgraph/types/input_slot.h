#ifndef OPGRAPH_TYPES_INPUT_SLOT_H
#define OPGRAPH_TYPES_INPUT_SLOT_H

#include <opgraph/opgraph_base.h>
#include <opgraph/types/operator_type.h>
#include <opgraph/types/subscription.h>
#include <opgraph/types/value.h>

namespace opgraph {

    /**
     * A parameter of an operator. Holds the literal value used while unconnected and the subscriptions feeding it.
     *
     * While at least one subscription exists the literal is inert, the effective value is derived from upstream. The
     * subscriptions are kept in the order they were established, which is the aggregation order for COLLECT slots.
     */
    struct OPGRAPH_EXPORT InputSlot {
        using subscription_list = std::vector<Subscription>;

        explicit InputSlot(const InputFieldSpec &spec);

        [[nodiscard]] const std::string &name() const;

        [[nodiscard]] const InputFieldSpec &spec() const;

        [[nodiscard]] const Value &literal() const;

        /**
         * Set the literal. Returns false (and leaves the literal untouched) when the value does not conform to the
         * declared kind of the field.
         */
        bool set_literal(Value value);

        void reset_literal();

        [[nodiscard]] const subscription_list &subscriptions() const;

        [[nodiscard]] bool is_connected() const;

        [[nodiscard]] bool accepts_subscription() const;

        [[nodiscard]] bool is_subscribed_to(const Subscription &subscription) const;

        /**
         * Returns false if the subscription is already present or the fan-in policy does not allow another source.
         */
        bool subscribe(Subscription subscription);

        bool unsubscribe(const Subscription &subscription);

        /**
         * Replace the subscriptions wholesale, used by the reconciler once it has validated the list against the
         * fan-in policy.
         */
        void assign_subscriptions(subscription_list subscriptions);

        /**
         * Remove every subscription matching ``predicate``, returning the removed subscriptions.
         */
        template<typename Predicate>
        subscription_list remove_subscriptions_if(Predicate &&predicate) {
            subscription_list removed;
            std::erase_if(_subscriptions, [&](const Subscription &subscription) {
                if (!predicate(subscription)) { return false; }
                removed.push_back(subscription);
                return true;
            });
            return removed;
        }

        void clear_subscriptions();

        /**
         * The effective value: the upstream output value(s) when connected, otherwise the literal.
         */
        [[nodiscard]] Value value(const OperatorStore &store) const;

    private:
        const InputFieldSpec *_spec;
        Value _literal;
        subscription_list _subscriptions;
    };

    /**
     * The value cell of an output field, written by evaluation and read by downstream subscriptions.
     */
    struct OPGRAPH_EXPORT OutputCell {
        explicit OutputCell(const OutputFieldSpec &spec);

        [[nodiscard]] const std::string &name() const;

        [[nodiscard]] const OutputFieldSpec &spec() const;

        [[nodiscard]] const Value &value() const;

        bool set_value(Value value);

        void reset();

    private:
        const OutputFieldSpec *_spec;
        Value _value;
    };

} // namespace opgraph

#endif // OPGRAPH_TYPES_INPUT_SLOT_H
