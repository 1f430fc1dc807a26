/**
 * @file
 * @brief Local variable declaration with optional initializer.
 */
#pragma once

#include <memory>
#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct LocalVarStmt final : Stmt {
        std::string type;
        std::string name;
        std::unique_ptr<Expr> init;
        LocalVarStmt(std::string t, std::string n, std::unique_ptr<Expr> i)
            : Stmt(NodeKind::LocalVarStmt), type(std::move(t)), name(std::move(n)), init(std::move(i)) {}
    };
} // namespace pullup::body
