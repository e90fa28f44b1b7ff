#include <opgraph/runtime/graph_document.h>
#include <opgraph/types/operator.h>
#include <opgraph/types/operator_store.h>
#include <opgraph/util/path.h>

#include <algorithm>

namespace opgraph {
    const GraphNode *GraphDocument::find_node(std::string_view id) const {
        auto it = std::ranges::find_if(nodes, [&](const GraphNode &node) { return node.id == id; });
        return it == nodes.end() ? nullptr : &*it;
    }

    std::string edge_id(std::string_view source, std::string_view source_handle, std::string_view target,
                        std::string_view target_handle) {
        return fmt::format("{}.{}->{}.{}", source, source_handle, target, target_handle);
    }

    GraphEdge make_edge(std::string_view source, std::string_view source_field, std::string_view target,
                        std::string_view target_field) {
        auto source_handle = format_handle_id(HandleNamespace::OUTPUT, source_field);
        auto target_handle = format_handle_id(HandleNamespace::PARAMETER, target_field);
        return GraphEdge{
            .id = edge_id(source, source_handle, target, target_handle),
            .source = std::string{source},
            .source_handle = std::move(source_handle),
            .target = std::string{target},
            .target_handle = std::move(target_handle),
        };
    }

    GraphDocument capture_document(const OperatorStore &store) {
        // Store order shifts after an erase, so nodes are emitted by path. Edges keep slot order per target.
        auto paths = store.paths();
        std::ranges::sort(paths);

        GraphDocument document;
        document.nodes.reserve(paths.size());
        for (const auto &path : paths) {
            auto op = store.get(path);
            document.nodes.push_back(GraphNode{.id = path, .type = op->type_name(), .inputs = op->literal_values()});
            for (const auto &[field_name, slot] : op->inputs()) {
                for (const auto &subscription : slot.subscriptions()) {
                    document.edges.push_back(
                        make_edge(subscription.source_path, subscription.source_field, path, field_name));
                }
            }
        }
        return document;
    }
} // namespace opgraph
