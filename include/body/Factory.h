/**
 * @file
 * @brief Free functions that build body trees for the source-model builder and tests.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "body/Nodes.h"

namespace pullup::body {

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

ExprPtr self();
ExprPtr super_();
ExprPtr name(std::string id, std::string type = {});
ExprPtr lit(std::string text, std::string type);
ExprPtr field(std::string name);
ExprPtr field(ExprPtr target, std::string name);
ExprPtr call(std::string name, std::vector<ExprPtr> args = {});
ExprPtr call(ExprPtr target, std::string name, std::vector<ExprPtr> args = {});
ExprPtr superCall(std::string name, std::vector<ExprPtr> args = {});
ExprPtr newObj(std::string type, std::vector<ExprPtr> args = {}, std::vector<std::string> paramTypes = {});
ExprPtr cast(std::string type, ExprPtr operand);
ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs);

StmtPtr exprStmt(ExprPtr e);
StmtPtr ret(ExprPtr value = nullptr);
StmtPtr local(std::string type, std::string name, ExprPtr init = nullptr);
StmtPtr ifStmt(ExprPtr cond, Block thenBody, Block elseBody = {});
StmtPtr throwStmt(std::string type, std::string message);
StmtPtr comment(std::string text);

// Variadic helpers because initializer lists cannot hold move-only elements.
template <typename... S>
Block block(S&&... stmts) {
  Block b;
  b.stmts.reserve(sizeof...(stmts));
  (b.stmts.push_back(std::forward<S>(stmts)), ...);
  return b;
}

template <typename... E>
std::vector<ExprPtr> args(E&&... exprs) {
  std::vector<ExprPtr> out;
  out.reserve(sizeof...(exprs));
  (out.push_back(std::forward<E>(exprs)), ...);
  return out;
}

} // namespace pullup::body
