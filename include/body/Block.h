/**
 * @file
 * @brief Ordered statement list owned by a method body or an if branch.
 */
#pragma once

#include <memory>
#include <vector>
#include "body/Node.h"

namespace pullup::body {

struct Block {
    std::vector<std::unique_ptr<Stmt>> stmts;

    bool empty() const { return stmts.empty(); }
};

} // namespace pullup::body
