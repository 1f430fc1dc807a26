/**
 * @file
 * @brief Explicit-supertype receiver (`super`); only valid as a call or field target.
 */
#pragma once

#include "body/Node.h"

namespace pullup::body {
    struct SuperExpr final : Expr {
        SuperExpr() : Expr(NodeKind::Super) {}
    };
} // namespace pullup::body
