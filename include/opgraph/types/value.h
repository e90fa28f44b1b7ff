#ifndef OPGRAPH_TYPES_VALUE_H
#define OPGRAPH_TYPES_VALUE_H

#include <opgraph/opgraph_base.h>

#include <opgraph/util/string_map.h>

#include <variant>

namespace opgraph {

    enum class ValueKind : char8_t {
        NONE = 0,
        BOOLEAN = 1,
        NUMBER = 2,
        STRING = 3,
        LIST = 4,
        ANY = 5
    };

    [[nodiscard]] OPGRAPH_EXPORT std::string_view to_string(ValueKind kind);

    using ValueList = std::vector<Value>;

    /**
     * The literal carried by input slots and output cells: null, boolean, number, string or a list of values.
     * Numbers are held as double, matching the declarative graph representation produced by the editor.
     */
    struct OPGRAPH_EXPORT Value {
        using variant_type = std::variant<std::monostate, bool, double, std::string, ValueList>;

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool value) : _data{value} {}
        Value(int value) : _data{static_cast<double>(value)} {}
        Value(int64_t value) : _data{static_cast<double>(value)} {}
        Value(double value) : _data{value} {}
        Value(const char *value) : _data{std::string{value}} {}
        Value(std::string value) : _data{std::move(value)} {}
        Value(ValueList value) : _data{std::move(value)} {}

        [[nodiscard]] ValueKind kind() const;

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(_data); }

        template<typename T>
        [[nodiscard]] bool is() const { return std::holds_alternative<T>(_data); }

        // Throws std::bad_variant_access when the value holds a different kind
        template<typename T>
        [[nodiscard]] const T &as() const { return std::get<T>(_data); }

        template<typename T>
        [[nodiscard]] const T *try_as() const { return std::get_if<T>(&_data); }

        [[nodiscard]] double as_number_or(double default_value) const;

        /**
         * True when the value may be stored in a field declared with ``kind``. Null is accepted by every kind.
         */
        [[nodiscard]] bool conforms_to(ValueKind kind) const;

        [[nodiscard]] const variant_type &data() const { return _data; }

        [[nodiscard]] std::string to_string() const;

        bool operator==(const Value &other) const = default;

    private:
        variant_type _data{};
    };

    // Field name to value, insertion ordered so declarative data keeps its authored order
    using ValueMap = StringMap<Value>;

} // namespace opgraph

template<>
struct fmt::formatter<opgraph::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const opgraph::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};

#endif // OPGRAPH_TYPES_VALUE_H
