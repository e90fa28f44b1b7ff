#pragma once

/**
 * @file string_map.h
 * @brief String keyed map and set aliases used for paths and field names.
 *
 * Centralizes the container choice so the store and the slot maps share one type. The hash is transparent so
 * lookups by std::string_view do not allocate.
 */

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace opgraph {

    struct string_hash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
            return ankerl::unordered_dense::hash<std::string_view>{}(str);
        }
    };

    /**
     * @brief Insertion ordered map keyed by string.
     *
     * ankerl::unordered_dense keeps its values in a dense vector, so iteration follows insertion order until an
     * element is erased.
     */
    template<typename V>
    using StringMap = ankerl::unordered_dense::map<std::string, V, string_hash, std::equal_to<>>;

    using StringSet = ankerl::unordered_dense::set<std::string, string_hash, std::equal_to<>>;

} // namespace opgraph
