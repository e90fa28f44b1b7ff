#ifndef OPGRAPH_RUNTIME_GRAPH_DOCUMENT_H
#define OPGRAPH_RUNTIME_GRAPH_DOCUMENT_H

#include <opgraph/opgraph_base.h>
#include <opgraph/types/value.h>

namespace opgraph {

    /**
     * A declarative operator: the path it lives at, the name of its type and the literal values of its inputs.
     */
    struct OPGRAPH_EXPORT GraphNode {
        std::string id;
        std::string type;
        ValueMap inputs{};

        bool operator==(const GraphNode &other) const = default;
    };

    /**
     * A declarative connection, ``source_handle`` is expected to be ``out.<field>`` and ``target_handle``
     * ``par.<field>``.
     */
    struct OPGRAPH_EXPORT GraphEdge {
        std::string id;
        std::string source;
        std::string source_handle;
        std::string target;
        std::string target_handle;

        bool operator==(const GraphEdge &other) const = default;
    };

    /**
     * The declarative description of a whole graph as produced by the editor, the input of the reconciler and the
     * unit of the undo history.
     */
    struct OPGRAPH_EXPORT GraphDocument {
        std::vector<GraphNode> nodes{};
        std::vector<GraphEdge> edges{};

        [[nodiscard]] const GraphNode *find_node(std::string_view id) const;

        bool operator==(const GraphDocument &other) const = default;
    };

    // "<source>.<source_handle>-><target>.<target_handle>"
    [[nodiscard]] OPGRAPH_EXPORT std::string edge_id(std::string_view source, std::string_view source_handle,
                                                     std::string_view target, std::string_view target_handle);

    /**
     * Build an edge with handles in canonical form, i.e. ``out.<source_field>`` and ``par.<target_field>``.
     */
    [[nodiscard]] OPGRAPH_EXPORT GraphEdge make_edge(std::string_view source, std::string_view source_field,
                                                     std::string_view target, std::string_view target_field);

    /**
     * Describe the current content of ``store`` declaratively: one node per operator (ordered by path) with its
     * literals, one edge per subscription. Equal stores capture equal documents. Reconciling the result against the same store is a no-op.
     */
    [[nodiscard]] OPGRAPH_EXPORT GraphDocument capture_document(const OperatorStore &store);

} // namespace opgraph

#endif // OPGRAPH_RUNTIME_GRAPH_DOCUMENT_H
