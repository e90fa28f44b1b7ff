#ifndef OPGRAPH_UTIL_PATH_H
#define OPGRAPH_UTIL_PATH_H

#include <opgraph/opgraph_base.h>

#include <initializer_list>

namespace opgraph {

    /**
     * Operator identities are POSIX style absolute paths (``/container/operator``). The functions in this header are
     * pure, they never touch an operator store and never throw for malformed input; failures are reported as
     * ``false``, an empty string or ``std::nullopt`` as documented per function.
     */

    constexpr char PATH_SEPARATOR = '/';
    constexpr std::string_view ROOT_PATH = "/";

    /**
     * Non-empty, starts with '/', contains no control characters, no empty segments (``//``) and no trailing slash
     * unless the whole path is the root.
     */
    [[nodiscard]] OPGRAPH_EXPORT bool is_valid_path(std::string_view path);

    // A null pointer is an absent path, which is invalid rather than an error.
    [[nodiscard]] OPGRAPH_EXPORT bool is_valid_path(const char *path);

    [[nodiscard]] OPGRAPH_EXPORT bool is_absolute_path(std::string_view path);

    /**
     * Resolves '.' and '..' against the path's own segments ('..' is clamped at the root), collapses repeated
     * separators and removes the trailing slash. The result is always absolute, an empty input yields the root.
     */
    [[nodiscard]] OPGRAPH_EXPORT std::string normalize_path(std::string_view path);

    [[nodiscard]] OPGRAPH_EXPORT std::string join_path(std::initializer_list<std::string_view> segments);

    template<typename... Segments>
    [[nodiscard]] std::string join_path(const Segments &... segments) {
        return join_path({std::string_view{segments}...});
    }

    /**
     * The path with its final segment removed. The parent of the root and of a top-level operator is the root.
     * Returns nullopt for an empty or relative path.
     */
    [[nodiscard]] OPGRAPH_EXPORT std::optional<std::string> get_parent_path(std::string_view path);

    [[nodiscard]] OPGRAPH_EXPORT std::string get_base_name(std::string_view path);

    [[nodiscard]] OPGRAPH_EXPORT std::vector<std::string> split_path(std::string_view path);

    [[nodiscard]] OPGRAPH_EXPORT std::string generate_qualified_path(std::string_view base_name,
                                                                     std::string_view container_id);

    /**
     * Resolve ``reference`` as seen from the operator at ``context_path``.
     *
     * Absolute references are normalized. Relative references ('./x', '../x' or a bare 'x') are resolved against the
     * container of the context operator, i.e. a bare name addresses a sibling. Any defined result is a valid absolute
     * path.
     */
    [[nodiscard]] OPGRAPH_EXPORT std::optional<std::string> resolve_path(std::string_view reference,
                                                                         std::string_view context_path);

    // Root level operators are not considered children of any container, including '/'.
    [[nodiscard]] OPGRAPH_EXPORT bool is_direct_child(std::string_view child_path, std::string_view container_path);

    [[nodiscard]] OPGRAPH_EXPORT bool is_within_container(std::string_view path, std::string_view container_path);

    enum class HandleNamespace : char8_t {
        PARAMETER = 0,
        OUTPUT = 1
    };

    [[nodiscard]] OPGRAPH_EXPORT std::string_view to_string(HandleNamespace ns);

    struct OPGRAPH_EXPORT HandleId {
        HandleNamespace ns;
        std::string field_name;

        [[nodiscard]] std::string to_string() const;

        bool operator==(const HandleId &other) const = default;
    };

    /**
     * Parse ``par.<field>`` or ``out.<field>``. Everything after the first dot is the field name, so field names may
     * contain further dots.
     */
    [[nodiscard]] OPGRAPH_EXPORT std::optional<HandleId> parse_handle_id(std::string_view handle_id);

    [[nodiscard]] OPGRAPH_EXPORT std::string format_handle_id(HandleNamespace ns, std::string_view field_name);

} // namespace opgraph

#endif // OPGRAPH_UTIL_PATH_H
