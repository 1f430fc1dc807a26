/**
 * @file
 * @brief Method invocation. A null target means the implicit `this` receiver.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "body/Node.h"

namespace pullup::body {
    struct CallExpr final : Expr {
        std::unique_ptr<Expr> target;
        std::string name;
        std::vector<std::unique_ptr<Expr>> args;
        CallExpr(std::unique_ptr<Expr> t, std::string n, std::vector<std::unique_ptr<Expr>> a)
            : Expr(NodeKind::Call), target(std::move(t)), name(std::move(n)), args(std::move(a)) {}
    };
} // namespace pullup::body
