/**
 * @file
 * @brief Throw of a freshly constructed exception with a message.
 */
#pragma once

#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct ThrowStmt final : Stmt {
        std::string type;
        std::string message;
        ThrowStmt(std::string t, std::string m)
            : Stmt(NodeKind::ThrowStmt), type(std::move(t)), message(std::move(m)) {}
    };
} // namespace pullup::body
