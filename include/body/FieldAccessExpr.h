/**
 * @file
 * @brief Field read or write. A null target means the implicit `this` receiver.
 */
#pragma once

#include <memory>
#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct FieldAccessExpr final : Expr {
        std::unique_ptr<Expr> target;
        std::string name;
        FieldAccessExpr(std::unique_ptr<Expr> t, std::string n)
            : Expr(NodeKind::FieldAccess), target(std::move(t)), name(std::move(n)) {}
    };
} // namespace pullup::body
