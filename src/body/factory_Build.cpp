/**
 * @file
 * @brief body::Factory node constructors.
 */
#include "body/Factory.h"

namespace pullup::body {

ExprPtr self() { return std::make_unique<ThisExpr>(); }
ExprPtr super_() { return std::make_unique<SuperExpr>(); }
ExprPtr name(std::string id, std::string type) { return std::make_unique<NameExpr>(std::move(id), std::move(type)); }
ExprPtr lit(std::string text, std::string type) { return std::make_unique<LiteralExpr>(std::move(text), std::move(type)); }
ExprPtr field(std::string name) { return std::make_unique<FieldAccessExpr>(nullptr, std::move(name)); }
ExprPtr field(ExprPtr target, std::string name) {
  return std::make_unique<FieldAccessExpr>(std::move(target), std::move(name));
}
ExprPtr call(std::string name, std::vector<ExprPtr> args) {
  return std::make_unique<CallExpr>(nullptr, std::move(name), std::move(args));
}
ExprPtr call(ExprPtr target, std::string name, std::vector<ExprPtr> args) {
  return std::make_unique<CallExpr>(std::move(target), std::move(name), std::move(args));
}
ExprPtr superCall(std::string name, std::vector<ExprPtr> args) {
  return std::make_unique<CallExpr>(super_(), std::move(name), std::move(args));
}
ExprPtr newObj(std::string type, std::vector<ExprPtr> args, std::vector<std::string> paramTypes) {
  return std::make_unique<NewExpr>(std::move(type), std::move(args), std::move(paramTypes));
}
ExprPtr cast(std::string type, ExprPtr operand) { return std::make_unique<CastExpr>(std::move(type), std::move(operand)); }
ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs) {
  return std::make_unique<BinaryExpr>(std::move(op), std::move(lhs), std::move(rhs));
}

StmtPtr exprStmt(ExprPtr e) { return std::make_unique<ExprStmt>(std::move(e)); }
StmtPtr ret(ExprPtr value) { return std::make_unique<ReturnStmt>(std::move(value)); }
StmtPtr local(std::string type, std::string name, ExprPtr init) {
  return std::make_unique<LocalVarStmt>(std::move(type), std::move(name), std::move(init));
}
StmtPtr ifStmt(ExprPtr cond, Block thenBody, Block elseBody) {
  return std::make_unique<IfStmt>(std::move(cond), std::move(thenBody), std::move(elseBody));
}
StmtPtr throwStmt(std::string type, std::string message) {
  return std::make_unique<ThrowStmt>(std::move(type), std::move(message));
}
StmtPtr comment(std::string text) { return std::make_unique<CommentStmt>(std::move(text)); }

} // namespace pullup::body
