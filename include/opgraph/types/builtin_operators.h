#ifndef OPGRAPH_TYPES_BUILTIN_OPERATORS_H
#define OPGRAPH_TYPES_BUILTIN_OPERATORS_H

#include <opgraph/types/operator.h>

namespace opgraph {

    // Passes its ``val`` literal through to the ``val`` output
    struct OPGRAPH_EXPORT NumberOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    struct OPGRAPH_EXPORT StringOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    struct OPGRAPH_EXPORT BooleanOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    /**
     * Applies ``operator`` to ``a`` and ``b``.
     *
     * Binary: add, subtract, multiply, divide, modulo, power, min, max.
     * Unary (``b`` is ignored): sine, cosine, tan, log, sqrt, round, floor, ceil, abs, rad, deg.
     *
     * An unknown operator name fails the execution.
     */
    struct OPGRAPH_EXPORT MathOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

        [[nodiscard]] static bool is_unary(std::string_view operation);

        [[nodiscard]] static double apply(std::string_view operation, double a, double b);

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    /**
     * Concatenates every upstream value of ``values`` into ``data``, flattening nested lists ``depth`` levels deep.
     */
    struct OPGRAPH_EXPORT MergeOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

        [[nodiscard]] static ValueList flatten(const ValueList &values, int depth);

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    /**
     * Groups a sub-graph. ``out`` mirrors the ``propagatedValue`` of the first GraphOutputOp directly inside the
     * container, found by scanning the store on every execution.
     */
    struct OPGRAPH_EXPORT ContainerOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

        [[nodiscard]] std::vector<std::string> upstream_paths(const OperatorStore &store) const override;

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    /**
     * Exposes the ``in`` value of the enclosing ContainerOp inside the container. A subscription on ``parentValue``
     * takes precedence over the container.
     */
    struct OPGRAPH_EXPORT GraphInputOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

        [[nodiscard]] std::vector<std::string> upstream_paths(const OperatorStore &store) const override;

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;

    private:
        [[nodiscard]] const Operator *enclosing_container(const OperatorStore &store) const;
    };

    struct OPGRAPH_EXPORT GraphOutputOp : Operator {
        using Operator::Operator;

        static OperatorType make_type();

    protected:
        void execute(const ValueMap &inputs, const OperatorStore &store) override;
    };

    /**
     * Register every type above, named after the struct (``NumberOp``, ``MathOp``, ...).
     */
    OPGRAPH_EXPORT void register_builtin_operator_types(OperatorTypeRegistry &registry);

} // namespace opgraph

#endif // OPGRAPH_TYPES_BUILTIN_OPERATORS_H
