#include <opgraph/types/builtin_operators.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/errors.h>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace opgraph {
    namespace {
        [[nodiscard]] const Value &field(const ValueMap &inputs, std::string_view name) {
            auto it = inputs.find(name);
            if (it == inputs.end()) { throw std::out_of_range(fmt::format("Missing input '{}'", name)); }
            return it->second;
        }

        [[nodiscard]] double number_field(const ValueMap &inputs, std::string_view name) {
            const auto &value = field(inputs, name);
            if (value.is_null()) { return 0.0; }
            if (!value.is<double>() && !value.is<bool>()) {
                throw_error<std::invalid_argument>("Input '{}' expects a number, got {}", name, value);
            }
            return value.as_number_or(0.0);
        }

        void flatten_into(ValueList &result, const Value &value, int depth) {
            auto list = value.try_as<ValueList>();
            if (list == nullptr || depth < 0) {
                result.push_back(value);
                return;
            }
            for (const auto &item : *list) {
                if (depth > 0 && item.is<ValueList>()) {
                    flatten_into(result, item, depth - 1);
                } else {
                    result.push_back(item);
                }
            }
        }
    } // namespace

    OperatorType NumberOp::make_type() {
        return OperatorType{
            .name = "NumberOp",
            .description = "A number",
            .inputs = {{.name = "val", .kind = ValueKind::NUMBER, .default_value = 0.0}},
            .outputs = {{.name = "val", .kind = ValueKind::NUMBER}},
            .factory = make_operator_factory<NumberOp>(),
        };
    }

    void NumberOp::execute(const ValueMap &inputs, const OperatorStore &) { set_output("val", field(inputs, "val")); }

    OperatorType StringOp::make_type() {
        return OperatorType{
            .name = "StringOp",
            .description = "A string",
            .inputs = {{.name = "val", .kind = ValueKind::STRING, .default_value = ""}},
            .outputs = {{.name = "val", .kind = ValueKind::STRING}},
            .factory = make_operator_factory<StringOp>(),
        };
    }

    void StringOp::execute(const ValueMap &inputs, const OperatorStore &) { set_output("val", field(inputs, "val")); }

    OperatorType BooleanOp::make_type() {
        return OperatorType{
            .name = "BooleanOp",
            .description = "A boolean",
            .inputs = {{.name = "val", .kind = ValueKind::BOOLEAN, .default_value = false}},
            .outputs = {{.name = "val", .kind = ValueKind::BOOLEAN}},
            .factory = make_operator_factory<BooleanOp>(),
        };
    }

    void BooleanOp::execute(const ValueMap &inputs, const OperatorStore &) { set_output("val", field(inputs, "val")); }

    OperatorType MathOp::make_type() {
        return OperatorType{
            .name = "MathOp",
            .description = "Perform a mathematical operation",
            .inputs = {
                {.name = "operator", .kind = ValueKind::STRING, .default_value = "add"},
                {.name = "a", .kind = ValueKind::NUMBER, .default_value = 0.0},
                {.name = "b", .kind = ValueKind::NUMBER, .default_value = 0.0},
            },
            .outputs = {{.name = "result", .kind = ValueKind::NUMBER}},
            .factory = make_operator_factory<MathOp>(),
        };
    }

    bool MathOp::is_unary(std::string_view operation) {
        static constexpr std::string_view unary[] = {
            "sine", "cosine", "tan", "log", "sqrt", "round", "floor", "ceil", "abs", "rad", "deg"
        };
        return std::ranges::find(unary, operation) != std::end(unary);
    }

    double MathOp::apply(std::string_view operation, double a, double b) {
        if (operation == "add") { return a + b; }
        if (operation == "subtract") { return a - b; }
        if (operation == "multiply") { return a * b; }
        if (operation == "divide") { return a / b; }
        if (operation == "modulo") { return std::fmod(a, b); }
        if (operation == "power") { return std::pow(a, b); }
        if (operation == "min") { return std::min(a, b); }
        if (operation == "max") { return std::max(a, b); }
        if (operation == "sine") { return std::sin(a); }
        if (operation == "cosine") { return std::cos(a); }
        if (operation == "tan") { return std::tan(a); }
        if (operation == "log") { return std::log(a); }
        if (operation == "sqrt") { return std::sqrt(a); }
        // Halves round towards positive infinity
        if (operation == "round") { return std::floor(a + 0.5); }
        if (operation == "floor") { return std::floor(a); }
        if (operation == "ceil") { return std::ceil(a); }
        if (operation == "abs") { return std::abs(a); }
        if (operation == "rad") { return a * (std::numbers::pi / 180.0); }
        if (operation == "deg") { return a * (180.0 / std::numbers::pi); }
        throw_error<std::invalid_argument>("Unknown math operator: '{}'", operation);
    }

    void MathOp::execute(const ValueMap &inputs, const OperatorStore &) {
        const auto &operation = field(inputs, "operator");
        auto name = operation.try_as<std::string>();
        if (name == nullptr) {
            throw_error<std::invalid_argument>("Math operator must be a string, got {}", operation);
        }

        auto a = number_field(inputs, "a");
        auto b = is_unary(*name) ? 0.0 : number_field(inputs, "b");
        set_output("result", apply(*name, a, b));
    }

    OperatorType MergeOp::make_type() {
        return OperatorType{
            .name = "MergeOp",
            .description = "Concatenate multiple lists into one, nested lists are flattened up to depth levels",
            .inputs = {
                {.name = "values", .kind = ValueKind::ANY, .default_value = ValueList{},
                 .fan_in = FanInPolicy::COLLECT},
                {.name = "depth", .kind = ValueKind::NUMBER, .default_value = 1.0},
            },
            .outputs = {{.name = "data", .kind = ValueKind::LIST}},
            .factory = make_operator_factory<MergeOp>(),
        };
    }

    ValueList MergeOp::flatten(const ValueList &values, int depth) {
        ValueList result;
        flatten_into(result, Value{values}, depth);
        return result;
    }

    void MergeOp::execute(const ValueMap &inputs, const OperatorStore &) {
        auto requested = number_field(inputs, "depth");
        if (!std::isfinite(requested)) { requested = 1.0; }
        auto depth = static_cast<int>(std::clamp(requested, 0.0, 2.0));
        const auto &values = field(inputs, "values");
        if (values.is_null()) {
            set_output("data", ValueList{});
        } else if (auto list = values.try_as<ValueList>()) {
            set_output("data", flatten(*list, depth));
        } else {
            set_output("data", ValueList{values});
        }
    }

    OperatorType ContainerOp::make_type() {
        return OperatorType{
            .name = "ContainerOp",
            .description = "Encapsulates a sub-graph of operators",
            .inputs = {{.name = "in", .kind = ValueKind::ANY}},
            .outputs = {{.name = "out", .kind = ValueKind::ANY}},
            // Reads the outputs of its children directly from the store
            .cacheable = false,
            .factory = make_operator_factory<ContainerOp>(),
        };
    }

    std::vector<std::string> ContainerOp::upstream_paths(const OperatorStore &store) const {
        auto paths = Operator::upstream_paths(store);
        for (const auto &child : store.direct_children(path())) {
            if (dynamic_cast<const GraphOutputOp *>(child.get()) != nullptr) { paths.push_back(child->path()); }
        }
        return paths;
    }

    void ContainerOp::execute(const ValueMap &, const OperatorStore &store) {
        Value result{};
        for (const auto &child : store.direct_children(path())) {
            if (dynamic_cast<const GraphOutputOp *>(child.get()) != nullptr) {
                // First one wins
                result = child->output("propagatedValue")->value();
                break;
            }
        }
        set_output("out", std::move(result));
    }

    OperatorType GraphInputOp::make_type() {
        return OperatorType{
            .name = "GraphInputOp",
            .description = "Receives input from the parent container",
            .inputs = {{.name = "parentValue", .kind = ValueKind::ANY}},
            .outputs = {{.name = "value", .kind = ValueKind::ANY}},
            .cacheable = false,
            .factory = make_operator_factory<GraphInputOp>(),
        };
    }

    const Operator *GraphInputOp::enclosing_container(const OperatorStore &store) const {
        auto container = store.get(container_id());
        return dynamic_cast<const ContainerOp *>(container.get());
    }

    std::vector<std::string> GraphInputOp::upstream_paths(const OperatorStore &store) const {
        auto paths = Operator::upstream_paths(store);
        if (auto container = enclosing_container(store)) {
            for (const auto &subscription : container->input("in")->subscriptions()) {
                paths.push_back(subscription.source_path);
            }
        }
        return paths;
    }

    void GraphInputOp::execute(const ValueMap &inputs, const OperatorStore &store) {
        if (input("parentValue")->is_connected()) {
            set_output("value", field(inputs, "parentValue"));
            return;
        }
        auto container = enclosing_container(store);
        set_output("value", container != nullptr ? container->input_value("in", store) : field(inputs, "parentValue"));
    }

    OperatorType GraphOutputOp::make_type() {
        return OperatorType{
            .name = "GraphOutputOp",
            .description = "Provides output to the parent container",
            .inputs = {{.name = "value", .kind = ValueKind::ANY}},
            .outputs = {{.name = "propagatedValue", .kind = ValueKind::ANY}},
            .factory = make_operator_factory<GraphOutputOp>(),
        };
    }

    void GraphOutputOp::execute(const ValueMap &inputs, const OperatorStore &) {
        set_output("propagatedValue", field(inputs, "value"));
    }

    void register_builtin_operator_types(OperatorTypeRegistry &registry) {
        registry.register_type(NumberOp::make_type());
        registry.register_type(StringOp::make_type());
        registry.register_type(BooleanOp::make_type());
        registry.register_type(MathOp::make_type());
        registry.register_type(MergeOp::make_type());
        registry.register_type(ContainerOp::make_type());
        registry.register_type(GraphInputOp::make_type());
        registry.register_type(GraphOutputOp::make_type());
    }
} // namespace opgraph
