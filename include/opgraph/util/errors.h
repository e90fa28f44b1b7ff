#ifndef OPGRAPH_UTIL_ERRORS
#define OPGRAPH_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace opgraph {

    /**
     * Raised when an operator identity is malformed (not a valid absolute path), duplicated within a single
     * declarative graph, or does not match the key it is being registered under.
     */
    struct IdentityError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * Raised when a declarative node names a type that is not registered. Fatal for the whole reconciliation pass.
     */
    struct UnknownOperatorTypeError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace opgraph

#endif // OPGRAPH_UTIL_ERRORS
