/**
 * @file
 * @brief Literal expression kept as source text plus its type.
 */
#pragma once

#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct LiteralExpr final : Expr {
        std::string text;
        std::string type;
        LiteralExpr(std::string tx, std::string ty)
            : Expr(NodeKind::Literal), text(std::move(tx)), type(std::move(ty)) {}
    };
} // namespace pullup::body
