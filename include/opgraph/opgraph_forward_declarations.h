#ifndef OPGRAPH_FORWARD_DECLARATIONS_H
#define OPGRAPH_FORWARD_DECLARATIONS_H

#include <memory>
#include <string>

namespace opgraph {
    // Value - held by value everywhere
    struct Value;

    // OperatorType - immutable, shared between the registry and every instance of the type
    struct OperatorType;
    using operator_type_s_ptr = std::shared_ptr<const OperatorType>;

    struct OperatorTypeRegistry;

    // Operator - shared_ptr, the store and the reconciler output share ownership
    struct Operator;
    using operator_s_ptr = std::shared_ptr<Operator>;

    struct InputSlot;
    struct OutputCell;
    struct Subscription;

    // OperatorStore - explicitly owned, passed by reference
    struct OperatorStore;

    struct GraphNode;
    struct GraphEdge;
    struct GraphDocument;

    struct GraphReconciler;
    struct ReconcileObserver;
    struct ReconcileReport;

    struct UndoRedoController;
    struct UndoRedoObserver;
} // namespace opgraph

#endif // OPGRAPH_FORWARD_DECLARATIONS_H
