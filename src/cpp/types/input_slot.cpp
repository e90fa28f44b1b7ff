#include <opgraph/types/input_slot.h>
#include <opgraph/types/operator.h>
#include <opgraph/types/operator_store.h>

#include <algorithm>

namespace opgraph {
    namespace {
        [[nodiscard]] const Value *upstream_value(const OperatorStore &store, const Subscription &subscription) {
            auto source = store.get(subscription.source_path);
            if (!source) { return nullptr; }
            auto cell = source->output(subscription.source_field);
            return cell == nullptr ? nullptr : &cell->value();
        }
    } // namespace

    InputSlot::InputSlot(const InputFieldSpec &spec) : _spec{&spec}, _literal{spec.default_value} {}

    const std::string &InputSlot::name() const { return _spec->name; }

    const InputFieldSpec &InputSlot::spec() const { return *_spec; }

    const Value &InputSlot::literal() const { return _literal; }

    bool InputSlot::set_literal(Value value) {
        if (!value.conforms_to(_spec->kind)) { return false; }
        _literal = std::move(value);
        return true;
    }

    void InputSlot::reset_literal() { _literal = _spec->default_value; }

    const InputSlot::subscription_list &InputSlot::subscriptions() const { return _subscriptions; }

    bool InputSlot::is_connected() const { return !_subscriptions.empty(); }

    bool InputSlot::accepts_subscription() const {
        return _spec->fan_in == FanInPolicy::COLLECT || _subscriptions.empty();
    }

    bool InputSlot::is_subscribed_to(const Subscription &subscription) const {
        return std::ranges::find(_subscriptions, subscription) != _subscriptions.end();
    }

    bool InputSlot::subscribe(Subscription subscription) {
        if (is_subscribed_to(subscription) || !accepts_subscription()) { return false; }
        _subscriptions.push_back(std::move(subscription));
        return true;
    }

    bool InputSlot::unsubscribe(const Subscription &subscription) {
        return std::erase(_subscriptions, subscription) > 0;
    }

    void InputSlot::assign_subscriptions(subscription_list subscriptions) { _subscriptions = std::move(subscriptions); }

    void InputSlot::clear_subscriptions() { _subscriptions.clear(); }

    Value InputSlot::value(const OperatorStore &store) const {
        if (_subscriptions.empty()) { return _literal; }

        if (_spec->fan_in == FanInPolicy::COLLECT) {
            ValueList values;
            values.reserve(_subscriptions.size());
            for (const auto &subscription : _subscriptions) {
                if (auto v = upstream_value(store, subscription)) { values.push_back(*v); }
            }
            return values;
        }

        auto v = upstream_value(store, _subscriptions.front());
        // Only reachable between passes if the store was edited by hand, the next pass drops the subscription
        return v == nullptr ? _literal : *v;
    }

    OutputCell::OutputCell(const OutputFieldSpec &spec) : _spec{&spec} {}

    const std::string &OutputCell::name() const { return _spec->name; }

    const OutputFieldSpec &OutputCell::spec() const { return *_spec; }

    const Value &OutputCell::value() const { return _value; }

    bool OutputCell::set_value(Value value) {
        if (!value.conforms_to(_spec->kind)) { return false; }
        _value = std::move(value);
        return true;
    }

    void OutputCell::reset() { _value = Value{}; }
} // namespace opgraph
