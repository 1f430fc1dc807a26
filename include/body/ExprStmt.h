/**
 * @file
 * @brief Expression evaluated for its effect.
 */
#pragma once

#include <memory>
#include "body/Node.h"

namespace pullup::body {
    struct ExprStmt final : Stmt {
        std::unique_ptr<Expr> expr;
        explicit ExprStmt(std::unique_ptr<Expr> e) : Stmt(NodeKind::ExprStmt), expr(std::move(e)) {}
    };
} // namespace pullup::body
