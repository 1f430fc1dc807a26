/**
 * @file
 * @brief Self-reference expression (`this`).
 */
#pragma once

#include "body/Node.h"

namespace pullup::body {
    struct ThisExpr final : Expr {
        ThisExpr() : Expr(NodeKind::This) {}
    };
} // namespace pullup::body
