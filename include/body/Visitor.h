#pragma once

#include "body/Nodes.h"

namespace pullup::body {

template <typename V>
void dispatch(Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::This: v.visit(static_cast<ThisExpr&>(n)); break;
        case NodeKind::Super: v.visit(static_cast<SuperExpr&>(n)); break;
        case NodeKind::Name: v.visit(static_cast<NameExpr&>(n)); break;
        case NodeKind::Literal: v.visit(static_cast<LiteralExpr&>(n)); break;
        case NodeKind::FieldAccess: v.visit(static_cast<FieldAccessExpr&>(n)); break;
        case NodeKind::Call: v.visit(static_cast<CallExpr&>(n)); break;
        case NodeKind::New: v.visit(static_cast<NewExpr&>(n)); break;
        case NodeKind::Cast: v.visit(static_cast<CastExpr&>(n)); break;
        case NodeKind::Binary: v.visit(static_cast<BinaryExpr&>(n)); break;
        case NodeKind::ExprStmt: v.visit(static_cast<ExprStmt&>(n)); break;
        case NodeKind::ReturnStmt: v.visit(static_cast<ReturnStmt&>(n)); break;
        case NodeKind::LocalVarStmt: v.visit(static_cast<LocalVarStmt&>(n)); break;
        case NodeKind::IfStmt: v.visit(static_cast<IfStmt&>(n)); break;
        case NodeKind::ThrowStmt: v.visit(static_cast<ThrowStmt&>(n)); break;
        case NodeKind::CommentStmt: v.visit(static_cast<CommentStmt&>(n)); break;
        default: break;
    }
}

template <typename V>
void dispatch(const Node& n, V& v) {
    dispatch(const_cast<Node&>(n), v);
}

} // namespace pullup::body
