#include <opgraph/types/subscription.h>
#include <opgraph/util/path.h>

namespace opgraph {
    Subscription::Subscription(std::string source_path_, std::string source_field_)
        : source_path{std::move(source_path_)}, source_field{std::move(source_field_)} {}

    std::string Subscription::to_string() const {
        return fmt::format("{}.{}", source_path, format_handle_id(HandleNamespace::OUTPUT, source_field));
    }
} // namespace opgraph

