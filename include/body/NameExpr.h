/**
 * @file
 * @brief Local variable or parameter reference together with its static type.
 */
#pragma once

#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct NameExpr final : Expr {
        std::string id;
        std::string type; // static type as resolved by the model builder; may be empty
        NameExpr(std::string i, std::string t)
            : Expr(NodeKind::Name), id(std::move(i)), type(std::move(t)) {}
    };
} // namespace pullup::body
