/**
 * @file
 * @brief Return statement; value is null for a bare `return;`.
 */
#pragma once

#include <memory>
#include "body/Node.h"

namespace pullup::body {
    struct ReturnStmt final : Stmt {
        std::unique_ptr<Expr> value;
        explicit ReturnStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
    };
} // namespace pullup::body
