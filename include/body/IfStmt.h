/**
 * @file
 * @brief Conditional with then/else blocks.
 */
#pragma once

#include <memory>
#include "body/Block.h"
#include "body/Node.h"

namespace pullup::body {
    struct IfStmt final : Stmt {
        std::unique_ptr<Expr> cond;
        Block thenBody;
        Block elseBody;
        IfStmt(std::unique_ptr<Expr> c, Block t, Block e)
            : Stmt(NodeKind::IfStmt), cond(std::move(c)), thenBody(std::move(t)), elseBody(std::move(e)) {}
    };
} // namespace pullup::body
