/**
 * @file
 * @brief Binary operator expression; the operator is kept as source text.
 */
#pragma once

#include <memory>
#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct BinaryExpr final : Expr {
        std::string op;
        std::unique_ptr<Expr> lhs;
        std::unique_ptr<Expr> rhs;
        BinaryExpr(std::string o, std::unique_ptr<Expr> l, std::unique_ptr<Expr> r)
            : Expr(NodeKind::Binary), op(std::move(o)), lhs(std::move(l)), rhs(std::move(r)) {}
    };
} // namespace pullup::body
