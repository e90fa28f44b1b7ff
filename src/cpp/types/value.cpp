#include <opgraph/types/value.h>

namespace opgraph {
    std::string_view to_string(ValueKind kind) {
        switch (kind) {
            case ValueKind::NONE: return "null";
            case ValueKind::BOOLEAN: return "boolean";
            case ValueKind::NUMBER: return "number";
            case ValueKind::STRING: return "string";
            case ValueKind::LIST: return "list";
            case ValueKind::ANY: return "any";
        }
        return "unknown";
    }

    ValueKind Value::kind() const {
        switch (_data.index()) {
            case 1: return ValueKind::BOOLEAN;
            case 2: return ValueKind::NUMBER;
            case 3: return ValueKind::STRING;
            case 4: return ValueKind::LIST;
            default: return ValueKind::NONE;
        }
    }

    double Value::as_number_or(double default_value) const {
        if (auto v = try_as<double>()) { return *v; }
        if (auto v = try_as<bool>()) { return *v ? 1.0 : 0.0; }
        return default_value;
    }

    bool Value::conforms_to(ValueKind kind) const {
        return kind == ValueKind::ANY || is_null() || this->kind() == kind;
    }

    std::string Value::to_string() const {
        return std::visit(
            [](const auto &v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "null";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, double>) {
                    return fmt::format("{}", v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format("\"{}\"", v);
                } else {
                    std::vector<std::string> items;
                    items.reserve(v.size());
                    for (const auto &item : v) { items.push_back(item.to_string()); }
                    return fmt::format("[{}]", fmt::join(items, ", "));
                }
            },
            _data);
    }
} // namespace opgraph
