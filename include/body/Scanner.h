/***
 * Name: pullup::body::Scanner
 * Purpose: Recursive traversal base for method bodies with typed callbacks.
 * Inputs:
 *   - A Block or a single node
 * Outputs:
 *   - Whatever the derived pass records
 * Theory of Operation:
 *   scan() routes each node through dispatch() to the matching visit()
 *   overload. The default overloads recurse into children, so a derived
 *   pass overrides only the kinds it cares about and calls Scanner::visit
 *   to keep descending.
 */
#pragma once

#include "body/Nodes.h"

namespace pullup::body {

class Scanner {
 public:
  virtual ~Scanner() = default;

  void scan(Block& b);
  void scan(const Block& b) { scan(const_cast<Block&>(b)); }
  void scan(Node& n);
  void scan(const Node& n) { scan(const_cast<Node&>(n)); }

  virtual void visit(ThisExpr&) {}
  virtual void visit(SuperExpr&) {}
  virtual void visit(NameExpr&) {}
  virtual void visit(LiteralExpr&) {}
  virtual void visit(FieldAccessExpr& n);
  virtual void visit(CallExpr& n);
  virtual void visit(NewExpr& n);
  virtual void visit(CastExpr& n);
  virtual void visit(BinaryExpr& n);
  virtual void visit(ExprStmt& n);
  virtual void visit(ReturnStmt& n);
  virtual void visit(LocalVarStmt& n);
  virtual void visit(IfStmt& n);
  virtual void visit(ThrowStmt&) {}
  virtual void visit(CommentStmt&) {}
};

} // namespace pullup::body
