/**
 * @file
 * @brief Explicit cast `(type) operand`.
 */
#pragma once

#include <memory>
#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct CastExpr final : Expr {
        std::string type;
        std::unique_ptr<Expr> operand;
        CastExpr(std::string t, std::unique_ptr<Expr> o)
            : Expr(NodeKind::Cast), type(std::move(t)), operand(std::move(o)) {}
    };
} // namespace pullup::body
