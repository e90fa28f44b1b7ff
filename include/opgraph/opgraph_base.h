/*
 * The core imports for opgraph. Use this to ensure the formatting support and the export macros are
 * always available in the same order.
 */

#ifndef OPGRAPH_BASE_H
#define OPGRAPH_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <opgraph/opgraph_export.h>
#include <opgraph/opgraph_forward_declarations.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#endif // OPGRAPH_BASE_H
