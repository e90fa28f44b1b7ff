#ifndef OPGRAPH_TYPES_OPERATOR_TYPE_H
#define OPGRAPH_TYPES_OPERATOR_TYPE_H

#include <opgraph/opgraph_base.h>
#include <opgraph/types/value.h>
#include <opgraph/util/string_map.h>

#include <functional>

namespace opgraph {

    /**
     * How many upstream subscriptions an input slot accepts.
     *
     * SINGLE  - at most one, the effective value is the upstream value.
     * COLLECT - any number, the effective value is the list of upstream values in subscription order.
     */
    enum class FanInPolicy : char8_t {
        SINGLE = 0,
        COLLECT = 1
    };

    [[nodiscard]] OPGRAPH_EXPORT std::string_view to_string(FanInPolicy policy);

    struct OPGRAPH_EXPORT InputFieldSpec {
        std::string name;
        ValueKind kind{ValueKind::ANY};
        Value default_value{};
        FanInPolicy fan_in{FanInPolicy::SINGLE};
    };

    struct OPGRAPH_EXPORT OutputFieldSpec {
        std::string name;
        ValueKind kind{ValueKind::ANY};
    };

    /**
     * Immutable description of an operator type: the fields it declares and how to construct an instance.
     * Instances share the descriptor, so it outlives every operator of the type.
     */
    struct OPGRAPH_EXPORT OperatorType {
        using factory_fn = std::function<operator_s_ptr(std::string path, operator_type_s_ptr type,
                                                        const ValueMap &initial_inputs)>;

        std::string name;
        std::string description{};
        std::vector<InputFieldSpec> inputs{};
        std::vector<OutputFieldSpec> outputs{};
        // Skip execution when the effective inputs are unchanged since the last evaluation
        bool cacheable{true};
        factory_fn factory{};

        [[nodiscard]] const InputFieldSpec *input(std::string_view field_name) const;

        [[nodiscard]] const OutputFieldSpec *output(std::string_view field_name) const;

        // e.g. "MathOp(operator: string, a: number, b: number) -> (result: number)"
        [[nodiscard]] std::string signature() const;
    };

    template<typename OperatorT>
    [[nodiscard]] OperatorType::factory_fn make_operator_factory() {
        return [](std::string path, operator_type_s_ptr type, const ValueMap &initial_inputs) -> operator_s_ptr {
            return std::make_shared<OperatorT>(std::move(path), std::move(type), initial_inputs);
        };
    }

    /**
     * The set of operator types known to a reconciler. Owned explicitly by the host and passed by reference, there is
     * no process wide registry.
     */
    struct OPGRAPH_EXPORT OperatorTypeRegistry {
        OperatorTypeRegistry() = default;

        /**
         * Registry pre-populated with the built-in operator types (see builtin_operators.h).
         */
        [[nodiscard]] static OperatorTypeRegistry with_builtin_types();

        /**
         * Register a type, throws std::invalid_argument if the type has no name, no factory or the name is taken.
         */
        operator_type_s_ptr register_type(OperatorType type);

        [[nodiscard]] operator_type_s_ptr find(std::string_view type_name) const;

        [[nodiscard]] bool contains(std::string_view type_name) const;

        [[nodiscard]] std::vector<std::string> type_names() const;

        [[nodiscard]] size_t size() const;

        /**
         * Construct an operator of ``type``. Throws IdentityError when ``path`` is not a valid path.
         */
        [[nodiscard]] operator_s_ptr make_operator(const operator_type_s_ptr &type, std::string path,
                                                   const ValueMap &initial_inputs = {}) const;

    private:
        StringMap<operator_type_s_ptr> _types;
    };

} // namespace opgraph

#endif // OPGRAPH_TYPES_OPERATOR_TYPE_H
