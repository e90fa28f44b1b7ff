#include <opgraph/types/builtin_operators.h>
#include <opgraph/types/operator.h>
#include <opgraph/types/operator_type.h>
#include <opgraph/util/errors.h>
#include <opgraph/util/path.h>

#include <algorithm>

namespace opgraph {
    std::string_view to_string(FanInPolicy policy) {
        switch (policy) {
            case FanInPolicy::SINGLE: return "single";
            case FanInPolicy::COLLECT: return "collect";
        }
        return "unknown";
    }

    const InputFieldSpec *OperatorType::input(std::string_view field_name) const {
        auto it = std::ranges::find_if(inputs, [&](const InputFieldSpec &spec) { return spec.name == field_name; });
        return it == inputs.end() ? nullptr : &*it;
    }

    const OutputFieldSpec *OperatorType::output(std::string_view field_name) const {
        auto it = std::ranges::find_if(outputs, [&](const OutputFieldSpec &spec) { return spec.name == field_name; });
        return it == outputs.end() ? nullptr : &*it;
    }

    std::string OperatorType::signature() const {
        std::vector<std::string> args;
        args.reserve(inputs.size());
        for (const auto &spec : inputs) {
            args.push_back(spec.fan_in == FanInPolicy::COLLECT
                               ? fmt::format("{}: {}[]", spec.name, opgraph::to_string(spec.kind))
                               : fmt::format("{}: {}", spec.name, opgraph::to_string(spec.kind)));
        }
        std::vector<std::string> results;
        results.reserve(outputs.size());
        for (const auto &spec : outputs) {
            results.push_back(fmt::format("{}: {}", spec.name, opgraph::to_string(spec.kind)));
        }
        return fmt::format("{}({}) -> ({})", name, fmt::join(args, ", "), fmt::join(results, ", "));
    }

    OperatorTypeRegistry OperatorTypeRegistry::with_builtin_types() {
        OperatorTypeRegistry registry;
        register_builtin_operator_types(registry);
        return registry;
    }

    operator_type_s_ptr OperatorTypeRegistry::register_type(OperatorType type) {
        if (type.name.empty()) { throw_error<std::invalid_argument>("Operator type requires a name"); }
        if (!type.factory) { throw_error<std::invalid_argument>("Operator type '{}' has no factory", type.name); }
        if (_types.contains(type.name)) {
            throw_error<std::invalid_argument>("Operator type '{}' is already registered", type.name);
        }
        auto name = type.name;
        auto ptr = std::make_shared<const OperatorType>(std::move(type));
        _types.emplace(std::move(name), ptr);
        return ptr;
    }

    operator_type_s_ptr OperatorTypeRegistry::find(std::string_view type_name) const {
        auto it = _types.find(type_name);
        return it == _types.end() ? nullptr : it->second;
    }

    bool OperatorTypeRegistry::contains(std::string_view type_name) const { return _types.contains(type_name); }

    std::vector<std::string> OperatorTypeRegistry::type_names() const {
        std::vector<std::string> names;
        names.reserve(_types.size());
        for (const auto &[name, _] : _types) { names.push_back(name); }
        return names;
    }

    size_t OperatorTypeRegistry::size() const { return _types.size(); }

    operator_s_ptr OperatorTypeRegistry::make_operator(const operator_type_s_ptr &type, std::string path,
                                                       const ValueMap &initial_inputs) const {
        if (!type) { throw_error<std::invalid_argument>("Cannot make an operator without a type"); }
        if (!is_valid_path(path)) {
            throw_error<IdentityError>("Invalid operator path '{}' for type '{}'", path, type->name);
        }
        auto op = type->factory(std::move(path), type, initial_inputs);
        if (!op) { throw_error<std::runtime_error>("Factory for operator type '{}' returned null", type->name); }
        return op;
    }
} // namespace opgraph
