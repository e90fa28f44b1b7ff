#include <opgraph/util/path.h>

namespace opgraph {
    namespace {
        constexpr std::string_view PARAMETER_NAMESPACE = "par";
        constexpr std::string_view OUTPUT_NAMESPACE = "out";

        [[nodiscard]] bool is_control_character(char c) {
            auto uc = static_cast<unsigned char>(c);
            return uc < 0x20 || uc == 0x7f;
        }

        template<typename Fn>
        void for_each_segment(std::string_view path, Fn &&fn) {
            size_t start = 0;
            while (start <= path.size()) {
                auto end = path.find(PATH_SEPARATOR, start);
                if (end == std::string_view::npos) { end = path.size(); }
                if (end > start) { fn(path.substr(start, end - start)); }
                start = end + 1;
            }
        }

        [[nodiscard]] std::string_view strip_trailing_separator(std::string_view path) {
            if (path.size() > 1 && path.back() == PATH_SEPARATOR) { path.remove_suffix(1); }
            return path;
        }
    } // namespace

    bool is_valid_path(std::string_view path) {
        if (path.empty() || path.front() != PATH_SEPARATOR) { return false; }
        for (char c : path) {
            if (is_control_character(c)) { return false; }
        }
        if (path.find("//") != std::string_view::npos) { return false; }
        return path.size() == 1 || path.back() != PATH_SEPARATOR;
    }

    bool is_valid_path(const char *path) {
        return path != nullptr && is_valid_path(std::string_view{path});
    }

    bool is_absolute_path(std::string_view path) { return is_valid_path(path); }

    std::string normalize_path(std::string_view path) {
        std::vector<std::string_view> segments;
        for_each_segment(path, [&segments](std::string_view segment) {
            if (segment == ".") { return; }
            if (segment == "..") {
                // Clamped at the root
                if (!segments.empty()) { segments.pop_back(); }
                return;
            }
            segments.push_back(segment);
        });
        return fmt::format("/{}", fmt::join(segments, "/"));
    }

    std::string join_path(std::initializer_list<std::string_view> segments) {
        std::vector<std::string_view> parts;
        parts.reserve(segments.size());
        for (auto segment : segments) {
            if (!segment.empty()) { parts.push_back(segment); }
        }
        return normalize_path(fmt::format("{}", fmt::join(parts, "/")));
    }

    std::optional<std::string> get_parent_path(std::string_view path) {
        if (path.empty() || path.front() != PATH_SEPARATOR) { return std::nullopt; }
        if (path == ROOT_PATH) { return std::string{ROOT_PATH}; }

        auto clean = strip_trailing_separator(path);
        auto pos = clean.rfind(PATH_SEPARATOR);
        if (pos == 0) { return std::string{ROOT_PATH}; }

        auto parent = clean.substr(0, pos);
        while (parent.size() > 1 && parent.back() == PATH_SEPARATOR) { parent.remove_suffix(1); }
        return std::string{parent};
    }

    std::string get_base_name(std::string_view path) {
        if (path.empty() || path == ROOT_PATH) { return {}; }
        auto clean = strip_trailing_separator(path);
        auto pos = clean.rfind(PATH_SEPARATOR);
        return std::string{pos == std::string_view::npos ? clean : clean.substr(pos + 1)};
    }

    std::vector<std::string> split_path(std::string_view path) {
        std::vector<std::string> segments{std::string{ROOT_PATH}};
        for_each_segment(path, [&segments](std::string_view segment) { segments.emplace_back(segment); });
        return segments;
    }

    std::string generate_qualified_path(std::string_view base_name, std::string_view container_id) {
        if (container_id.empty() || container_id.front() != PATH_SEPARATOR) {
            return join_path(ROOT_PATH, container_id, base_name);
        }
        return join_path(container_id, base_name);
    }

    std::optional<std::string> resolve_path(std::string_view reference, std::string_view context_path) {
        if (reference.empty()) { return std::nullopt; }

        std::string resolved;
        if (reference.front() == PATH_SEPARATOR) {
            resolved = normalize_path(reference);
        } else {
            // Relative references are resolved from the context's container, not from the context itself
            auto container = get_parent_path(context_path);
            if (!container) { return std::nullopt; }
            resolved = normalize_path(fmt::format("{}/{}", *container, reference));
        }

        if (!is_valid_path(resolved)) { return std::nullopt; }
        return resolved;
    }

    bool is_direct_child(std::string_view child_path, std::string_view container_path) {
        if (child_path.empty() || container_path.empty()) { return false; }
        auto parent = get_parent_path(child_path);
        if (!parent || *parent == ROOT_PATH) { return false; }
        return *parent == container_path;
    }

    bool is_within_container(std::string_view path, std::string_view container_path) {
        if (path.empty() || container_path.empty()) { return false; }
        if (container_path == ROOT_PATH) { return path.size() > 1 && path.front() == PATH_SEPARATOR; }
        return path.size() > container_path.size() + 1 && path.starts_with(container_path) &&
               path[container_path.size()] == PATH_SEPARATOR;
    }

    std::string_view to_string(HandleNamespace ns) {
        return ns == HandleNamespace::PARAMETER ? PARAMETER_NAMESPACE : OUTPUT_NAMESPACE;
    }

    std::string HandleId::to_string() const { return format_handle_id(ns, field_name); }

    std::optional<HandleId> parse_handle_id(std::string_view handle_id) {
        if (handle_id.empty()) { return std::nullopt; }

        auto dot = handle_id.find('.');
        if (dot == std::string_view::npos) { return std::nullopt; }

        auto ns = handle_id.substr(0, dot);
        auto field_name = handle_id.substr(dot + 1);
        if (field_name.empty()) { return std::nullopt; }

        if (ns == PARAMETER_NAMESPACE) { return HandleId{HandleNamespace::PARAMETER, std::string{field_name}}; }
        if (ns == OUTPUT_NAMESPACE) { return HandleId{HandleNamespace::OUTPUT, std::string{field_name}}; }
        return std::nullopt;
    }

    std::string format_handle_id(HandleNamespace ns, std::string_view field_name) {
        return fmt::format("{}.{}", to_string(ns), field_name);
    }
} // namespace opgraph
