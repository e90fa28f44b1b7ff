#ifndef OPGRAPH_TYPES_OPERATOR_H
#define OPGRAPH_TYPES_OPERATOR_H

#include <opgraph/opgraph_base.h>
#include <opgraph/types/input_slot.h>
#include <opgraph/types/operator_type.h>
#include <opgraph/types/value.h>
#include <opgraph/util/lifecycle.h>
#include <opgraph/util/string_map.h>

namespace opgraph {

    /**
     * A live node of the graph. The path and type are fixed for the lifetime of the instance, the literals and
     * subscriptions of its input slots are updated in place by the reconciler.
     *
     * Concrete operator types derive from this and implement ``execute``, writing results with ``set_output``.
     */
    struct OPGRAPH_EXPORT Operator : ComponentLifeCycle {
        using input_map = StringMap<InputSlot>;
        using output_map = StringMap<OutputCell>;

        /**
         * Throws IdentityError when ``path`` is not a valid path. Unknown fields in ``initial_inputs`` are ignored
         * and mistyped values fall back to the type default, both with a warning.
         */
        Operator(std::string path, operator_type_s_ptr type, const ValueMap &initial_inputs = {});

        Operator(const Operator &) = delete;

        Operator &operator=(const Operator &) = delete;

        [[nodiscard]] const std::string &path() const;

        [[nodiscard]] const OperatorType &type() const;

        [[nodiscard]] const operator_type_s_ptr &type_ptr() const;

        [[nodiscard]] const std::string &type_name() const;

        /**
         * The path of the container this operator lives in, the root for top-level operators.
         */
        [[nodiscard]] std::string container_id() const;

        [[nodiscard]] const input_map &inputs() const;

        [[nodiscard]] InputSlot *input(std::string_view field_name);

        [[nodiscard]] const InputSlot *input(std::string_view field_name) const;

        [[nodiscard]] const output_map &outputs() const;

        [[nodiscard]] const OutputCell *output(std::string_view field_name) const;

        /**
         * Set the literal of ``field_name``. Allowed while the slot is subscribed, the literal is simply inert until
         * the last subscription is removed. Returns false, with a warning, for an unknown field or a value that does
         * not conform to the declared kind.
         */
        bool set_input_value(std::string_view field_name, Value value);

        /**
         * Reset every literal from ``values``; fields absent from ``values`` take the type default. Subscriptions are
         * left untouched.
         */
        void apply_input_values(const ValueMap &values);

        [[nodiscard]] ValueMap literal_values() const;

        /**
         * The effective value of an input, throws std::out_of_range for an unknown field.
         */
        [[nodiscard]] Value input_value(std::string_view field_name, const OperatorStore &store) const;

        [[nodiscard]] ValueMap input_values(const OperatorStore &store) const;

        [[nodiscard]] ValueMap output_values() const;

        /**
         * Paths of the operators whose outputs this operator reads. By default the sources of its subscriptions,
         * operators that read the store directly add the paths they read from.
         */
        [[nodiscard]] virtual std::vector<std::string> upstream_paths(const OperatorStore &store) const;

        [[nodiscard]] bool depends_on(std::string_view source_path) const;

        /**
         * Compute the outputs from the effective inputs. For cacheable types the execution is skipped when the
         * inputs are unchanged since the last successful execution. Returns true if ``execute`` ran and completed.
         *
         * An exception thrown by ``execute`` is logged and recorded in ``last_error``, the outputs keep their
         * previous values.
         */
        bool evaluate(const OperatorStore &store);

        [[nodiscard]] size_t execution_count() const;

        [[nodiscard]] const std::optional<std::string> &last_error() const;

        void invalidate_cache();

        [[nodiscard]] std::string to_string() const;

    protected:
        virtual void execute(const ValueMap &inputs, const OperatorStore &store) = 0;

        /**
         * Write an output value. Throws std::out_of_range for an unknown output and std::invalid_argument for a value
         * that does not conform to the declared kind.
         */
        void set_output(std::string_view field_name, Value value);

        void initialise() override;

        void dispose() override;

    private:
        std::string _path;
        operator_type_s_ptr _type;
        input_map _inputs;
        output_map _outputs;
        std::optional<ValueMap> _cached_inputs;
        size_t _execution_count{0};
        std::optional<std::string> _last_error;
    };

} // namespace opgraph

template<>
struct fmt::formatter<opgraph::Operator> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const opgraph::Operator &op, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(op.to_string(), ctx);
    }
};

#endif // OPGRAPH_TYPES_OPERATOR_H
