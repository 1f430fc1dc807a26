#pragma once

namespace pullup::body {
    enum class NodeKind {
        // Expressions
        This,
        Super,
        Name,
        Literal,
        FieldAccess,
        Call,
        New,
        Cast,
        Binary,
        // Statements
        ExprStmt,
        ReturnStmt,
        LocalVarStmt,
        IfStmt,
        ThrowStmt,
        CommentStmt
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::This: return "This";
            case NodeKind::Super: return "Super";
            case NodeKind::Name: return "Name";
            case NodeKind::Literal: return "Literal";
            case NodeKind::FieldAccess: return "FieldAccess";
            case NodeKind::Call: return "Call";
            case NodeKind::New: return "New";
            case NodeKind::Cast: return "Cast";
            case NodeKind::Binary: return "Binary";
            case NodeKind::ExprStmt: return "ExprStmt";
            case NodeKind::ReturnStmt: return "ReturnStmt";
            case NodeKind::LocalVarStmt: return "LocalVarStmt";
            case NodeKind::IfStmt: return "IfStmt";
            case NodeKind::ThrowStmt: return "ThrowStmt";
            case NodeKind::CommentStmt: return "CommentStmt";
            default: return "unknown";
        }
    }

    inline bool isExpression(const NodeKind k) {
        return k == NodeKind::This || k == NodeKind::Super || k == NodeKind::Name ||
               k == NodeKind::Literal || k == NodeKind::FieldAccess || k == NodeKind::Call ||
               k == NodeKind::New || k == NodeKind::Cast || k == NodeKind::Binary;
    }
} // namespace pullup::body
