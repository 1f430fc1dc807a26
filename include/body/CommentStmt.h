/**
 * @file
 * @brief Line comment kept in statement position (used for rewrite markers).
 */
#pragma once

#include <string>
#include "body/Node.h"

namespace pullup::body {
    struct CommentStmt final : Stmt {
        std::string text;
        explicit CommentStmt(std::string t) : Stmt(NodeKind::CommentStmt), text(std::move(t)) {}
    };
} // namespace pullup::body
