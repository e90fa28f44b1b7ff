#include <opgraph/types/operator.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/errors.h>
#include <opgraph/util/log.h>
#include <opgraph/util/path.h>

#include <algorithm>

namespace opgraph {
    Operator::Operator(std::string path, operator_type_s_ptr type, const ValueMap &initial_inputs)
        : _path{std::move(path)}, _type{std::move(type)} {
        if (!is_valid_path(_path)) { throw_error<IdentityError>("Invalid operator path '{}'", _path); }
        if (!_type) { throw_error<std::invalid_argument>("Operator '{}' requires a type", _path); }

        _inputs.reserve(_type->inputs.size());
        for (const auto &spec : _type->inputs) { _inputs.emplace(spec.name, InputSlot{spec}); }
        _outputs.reserve(_type->outputs.size());
        for (const auto &spec : _type->outputs) { _outputs.emplace(spec.name, OutputCell{spec}); }

        for (const auto &[field_name, value] : initial_inputs) { set_input_value(field_name, value); }
    }

    const std::string &Operator::path() const { return _path; }

    const OperatorType &Operator::type() const { return *_type; }

    const operator_type_s_ptr &Operator::type_ptr() const { return _type; }

    const std::string &Operator::type_name() const { return _type->name; }

    std::string Operator::container_id() const { return get_parent_path(_path).value_or(std::string{ROOT_PATH}); }

    const Operator::input_map &Operator::inputs() const { return _inputs; }

    InputSlot *Operator::input(std::string_view field_name) {
        auto it = _inputs.find(field_name);
        return it == _inputs.end() ? nullptr : &it->second;
    }

    const InputSlot *Operator::input(std::string_view field_name) const {
        auto it = _inputs.find(field_name);
        return it == _inputs.end() ? nullptr : &it->second;
    }

    const Operator::output_map &Operator::outputs() const { return _outputs; }

    const OutputCell *Operator::output(std::string_view field_name) const {
        auto it = _outputs.find(field_name);
        return it == _outputs.end() ? nullptr : &it->second;
    }

    bool Operator::set_input_value(std::string_view field_name, Value value) {
        auto slot = input(field_name);
        if (slot == nullptr) {
            log_warning("{}: ignoring value for unknown input '{}'", _path, field_name);
            return false;
        }
        if (!slot->set_literal(value)) {
            log_warning("{}: input '{}' expects {}, got {}", _path, field_name,
                        opgraph::to_string(slot->spec().kind), value);
            return false;
        }
        return true;
    }

    void Operator::apply_input_values(const ValueMap &values) {
        for (auto &[field_name, slot] : _inputs) {
            auto it = values.find(field_name);
            if (it == values.end() || !slot.set_literal(it->second)) {
                if (it != values.end()) {
                    log_warning("{}: input '{}' expects {}, got {}", _path, field_name,
                                opgraph::to_string(slot.spec().kind), it->second);
                }
                slot.reset_literal();
            }
        }
        for (const auto &[field_name, _] : values) {
            if (!_inputs.contains(field_name)) {
                log_warning("{}: ignoring value for unknown input '{}'", _path, field_name);
            }
        }
    }

    ValueMap Operator::literal_values() const {
        ValueMap values;
        values.reserve(_inputs.size());
        for (const auto &[field_name, slot] : _inputs) { values.emplace(field_name, slot.literal()); }
        return values;
    }

    Value Operator::input_value(std::string_view field_name, const OperatorStore &store) const {
        auto slot = input(field_name);
        if (slot == nullptr) {
            throw std::out_of_range(fmt::format("Operator '{}' has no input '{}'", _path, field_name));
        }
        return slot->value(store);
    }

    ValueMap Operator::input_values(const OperatorStore &store) const {
        ValueMap values;
        values.reserve(_inputs.size());
        for (const auto &[field_name, slot] : _inputs) { values.emplace(field_name, slot.value(store)); }
        return values;
    }

    ValueMap Operator::output_values() const {
        ValueMap values;
        values.reserve(_outputs.size());
        for (const auto &[field_name, cell] : _outputs) { values.emplace(field_name, cell.value()); }
        return values;
    }

    std::vector<std::string> Operator::upstream_paths(const OperatorStore &) const {
        std::vector<std::string> paths;
        for (const auto &[_, slot] : _inputs) {
            for (const auto &subscription : slot.subscriptions()) {
                if (std::ranges::find(paths, subscription.source_path) == paths.end()) {
                    paths.push_back(subscription.source_path);
                }
            }
        }
        return paths;
    }

    bool Operator::depends_on(std::string_view source_path) const {
        return std::ranges::any_of(_inputs, [&](const auto &entry) {
            return std::ranges::any_of(entry.second.subscriptions(), [&](const Subscription &subscription) {
                return subscription.source_path == source_path;
            });
        });
    }

    bool Operator::evaluate(const OperatorStore &store) {
        auto inputs = input_values(store);
        if (_type->cacheable && _cached_inputs.has_value() && *_cached_inputs == inputs) {
            log_debug("{}: inputs unchanged, skipping execution", _path);
            return false;
        }

        try {
            execute(inputs, store);
        } catch (const std::exception &e) {
            log_warning("{}: execution failed: {}", _path, e.what());
            _last_error = e.what();
            _cached_inputs.reset();
            return false;
        }

        _last_error.reset();
        _cached_inputs = std::move(inputs);
        ++_execution_count;
        return true;
    }

    size_t Operator::execution_count() const { return _execution_count; }

    const std::optional<std::string> &Operator::last_error() const { return _last_error; }

    void Operator::invalidate_cache() { _cached_inputs.reset(); }

    std::string Operator::to_string() const {
        std::vector<std::string> args;
        args.reserve(_inputs.size());
        for (const auto &[field_name, slot] : _inputs) {
            if (slot.is_connected()) {
                std::vector<std::string> sources;
                for (const auto &subscription : slot.subscriptions()) { sources.push_back(subscription.to_string()); }
                args.push_back(fmt::format("{}=<{}>", field_name, fmt::join(sources, ", ")));
            } else {
                args.push_back(fmt::format("{}={}", field_name, slot.literal()));
            }
        }
        return fmt::format("{}:{}({})", _path, _type->name, fmt::join(args, ", "));
    }

    void Operator::set_output(std::string_view field_name, Value value) {
        auto it = _outputs.find(field_name);
        if (it == _outputs.end()) {
            throw std::out_of_range(fmt::format("Operator '{}' has no output '{}'", _path, field_name));
        }
        if (!it->second.set_value(value)) {
            throw_error<std::invalid_argument>("Output '{}' of '{}' expects {}, got {}", field_name, _path,
                                               opgraph::to_string(it->second.spec().kind), value);
        }
    }

    void Operator::initialise() { log_debug("{}: initialised", _path); }

    void Operator::dispose() {
        for (auto &[_, slot] : _inputs) { slot.clear_subscriptions(); }
        for (auto &[_, cell] : _outputs) { cell.reset(); }
        _cached_inputs.reset();
        log_debug("{}: disposed", _path);
    }
} // namespace opgraph
