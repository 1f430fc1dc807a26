/***
 * Name: pullup::body clone (impl)
 * Purpose: Deep-copy body trees so a migrated method never shares nodes with its source.
 * Theory of Operation:
 *   A visitor builds the copy of each node into `out`; children are copied
 *   by recursive calls. Statements and expressions use separate entry
 *   points so the result keeps its static node category.
 */
#include "body/Clone.h"
#include "body/Visitor.h"

namespace pullup::body {

namespace {

std::vector<std::unique_ptr<Expr>> cloneArgs(const std::vector<std::unique_ptr<Expr>>& in) {
  std::vector<std::unique_ptr<Expr>> out;
  out.reserve(in.size());
  for (const auto& a : in) { out.push_back(cloneExpr(a.get())); }
  return out;
}

struct Cloner {
  std::unique_ptr<Node> out;

  void visit(ThisExpr&) { out = std::make_unique<ThisExpr>(); }
  void visit(SuperExpr&) { out = std::make_unique<SuperExpr>(); }
  void visit(NameExpr& n) { out = std::make_unique<NameExpr>(n.id, n.type); }
  void visit(LiteralExpr& n) { out = std::make_unique<LiteralExpr>(n.text, n.type); }
  void visit(FieldAccessExpr& n) { out = std::make_unique<FieldAccessExpr>(cloneExpr(n.target.get()), n.name); }
  void visit(CallExpr& n) { out = std::make_unique<CallExpr>(cloneExpr(n.target.get()), n.name, cloneArgs(n.args)); }
  void visit(NewExpr& n) { out = std::make_unique<NewExpr>(n.type, cloneArgs(n.args), n.paramTypes); }
  void visit(CastExpr& n) { out = std::make_unique<CastExpr>(n.type, cloneExpr(n.operand.get())); }
  void visit(BinaryExpr& n) {
    out = std::make_unique<BinaryExpr>(n.op, cloneExpr(n.lhs.get()), cloneExpr(n.rhs.get()));
  }
  void visit(ExprStmt& n) { out = std::make_unique<ExprStmt>(cloneExpr(n.expr.get())); }
  void visit(ReturnStmt& n) { out = std::make_unique<ReturnStmt>(cloneExpr(n.value.get())); }
  void visit(LocalVarStmt& n) { out = std::make_unique<LocalVarStmt>(n.type, n.name, cloneExpr(n.init.get())); }
  void visit(IfStmt& n) {
    out = std::make_unique<IfStmt>(cloneExpr(n.cond.get()), cloneBlock(n.thenBody), cloneBlock(n.elseBody));
  }
  void visit(ThrowStmt& n) { out = std::make_unique<ThrowStmt>(n.type, n.message); }
  void visit(CommentStmt& n) { out = std::make_unique<CommentStmt>(n.text); }
};

} // namespace

std::unique_ptr<Expr> cloneExpr(const Expr* e) {
  if (e == nullptr) { return nullptr; }
  Cloner c;
  dispatch(*e, c);
  return std::unique_ptr<Expr>(static_cast<Expr*>(c.out.release()));
}

std::unique_ptr<Stmt> cloneStmt(const Stmt& s) {
  Cloner c;
  dispatch(s, c);
  return std::unique_ptr<Stmt>(static_cast<Stmt*>(c.out.release()));
}

Block cloneBlock(const Block& b) {
  Block out;
  out.stmts.reserve(b.stmts.size());
  for (const auto& s : b.stmts) {
    if (s) { out.stmts.push_back(cloneStmt(*s)); }
  }
  return out;
}

} // namespace pullup::body
