/**
 * @file
 * @brief Scanner default traversal: recurse into every child node.
 */
#include "body/Scanner.h"
#include "body/Visitor.h"

namespace pullup::body {

void Scanner::scan(Block& b) {
  for (auto& s : b.stmts) {
    if (s) { scan(*s); }
  }
}

void Scanner::scan(Node& n) { dispatch(n, *this); }

void Scanner::visit(FieldAccessExpr& n) {
  if (n.target) { scan(*n.target); }
}

void Scanner::visit(CallExpr& n) {
  if (n.target) { scan(*n.target); }
  for (auto& a : n.args) {
    if (a) { scan(*a); }
  }
}

void Scanner::visit(NewExpr& n) {
  for (auto& a : n.args) {
    if (a) { scan(*a); }
  }
}

void Scanner::visit(CastExpr& n) {
  if (n.operand) { scan(*n.operand); }
}

void Scanner::visit(BinaryExpr& n) {
  if (n.lhs) { scan(*n.lhs); }
  if (n.rhs) { scan(*n.rhs); }
}

void Scanner::visit(ExprStmt& n) {
  if (n.expr) { scan(*n.expr); }
}

void Scanner::visit(ReturnStmt& n) {
  if (n.value) { scan(*n.value); }
}

void Scanner::visit(LocalVarStmt& n) {
  if (n.init) { scan(*n.init); }
}

void Scanner::visit(IfStmt& n) {
  if (n.cond) { scan(*n.cond); }
  scan(n.thenBody);
  scan(n.elseBody);
}

} // namespace pullup::body
