#pragma once

#include <memory>
#include "body/Nodes.h"

namespace pullup::body {

// Deep copies; a null input yields null.
std::unique_ptr<Expr> cloneExpr(const Expr* e);
std::unique_ptr<Stmt> cloneStmt(const Stmt& s);
Block cloneBlock(const Block& b);

} // namespace pullup::body
