/**
 * @file
 * @brief Constructor call. Constructors are not part of the class model, so the
 *        builder records the selected constructor's parameter types here.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "body/Node.h"

namespace pullup::body {
    struct NewExpr final : Expr {
        std::string type;
        std::vector<std::unique_ptr<Expr>> args;
        std::vector<std::string> paramTypes;
        NewExpr(std::string t, std::vector<std::unique_ptr<Expr>> a, std::vector<std::string> p)
            : Expr(NodeKind::New), type(std::move(t)), args(std::move(a)), paramTypes(std::move(p)) {}
    };
} // namespace pullup::body
