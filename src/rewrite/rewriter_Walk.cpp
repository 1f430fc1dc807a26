/**
 * @file
 * @brief CallSiteRewriter traversal over statement slots and expression slots.
 */
#include "rewrite/CallSiteRewriter.h"
#include "body/Factory.h"
#include "body/Printer.h"

namespace pullup::rewrite {

RewriteStats CallSiteRewriter::rewrite(body::Block& body, const model::ClassId context, const RewriteRules rules) {
  context_ = context;
  rules_ = rules;
  stats_ = RewriteStats{};
  rewriteBlock(body);
  if (metrics_ != nullptr) {
    metrics_->incCounter("migrate.casts", stats_.casts);
    metrics_->incCounter("migrate.supercalls", stats_.superKept + stats_.superForwarded + stats_.superRemoved);
    metrics_->incCounter("migrate.supercalls.forwarded", stats_.superForwarded);
    metrics_->incCounter("migrate.supercalls.removed", stats_.superRemoved);
  }
  return stats_;
}

void CallSiteRewriter::rewriteBlock(body::Block& b) {
  std::vector<std::unique_ptr<body::Stmt>> out;
  out.reserve(b.stmts.size());
  for (auto& slot : b.stmts) {
    if (!slot) { continue; }
    std::vector<std::unique_ptr<body::Stmt>> extra;
    rewriteStmt(slot, extra);
    out.push_back(std::move(slot));
    for (auto& e : extra) { out.push_back(std::move(e)); }
  }
  b.stmts = std::move(out);
}

void CallSiteRewriter::rewriteStmt(std::unique_ptr<body::Stmt>& slot,
                                   std::vector<std::unique_ptr<body::Stmt>>& extra) {
  removeCurrent_ = false;
  removedNested_ = false;
  removedCall_.clear();
  bool isReturnValue = false;
  switch (slot->kind) {
    case body::NodeKind::ExprStmt: {
      auto& s = static_cast<body::ExprStmt&>(*slot);
      if (s.expr) { rewriteExpr(s.expr, true); }
      break;
    }
    case body::NodeKind::ReturnStmt: {
      auto& s = static_cast<body::ReturnStmt&>(*slot);
      if (s.value) { rewriteExpr(s.value, true); }
      isReturnValue = s.value != nullptr;
      break;
    }
    case body::NodeKind::LocalVarStmt: {
      auto& s = static_cast<body::LocalVarStmt&>(*slot);
      if (s.init) { rewriteExpr(s.init, false); }
      break;
    }
    case body::NodeKind::IfStmt: {
      auto& s = static_cast<body::IfStmt&>(*slot);
      if (s.cond) { rewriteExpr(s.cond, false); }
      const bool condRemoved = removeCurrent_;
      const bool condNested = removedNested_;
      const std::string condCall = removedCall_;
      rewriteBlock(s.thenBody);
      rewriteBlock(s.elseBody);
      removeCurrent_ = condRemoved;
      removedNested_ = condNested;
      removedCall_ = condCall;
      break;
    }
    default:
      break;
  }
  if (!removeCurrent_) { return; }

  const auto& where = model_.cls(context_).qualifiedName;
  const std::string text = removedCall_ + " removed: no concrete implementation above " + where;
  if (slot->kind == body::NodeKind::IfStmt) {
    plan_.warn("if statement containing " + removedCall_ + " in " + where +
               " was removed with both of its branches because the super call was in its condition");
  } else if (removedNested_) {
    plan_.warn("statement containing " + removedCall_ + " in " + where +
               " was removed because the super call was nested in an expression");
  } else {
    plan_.warn(text);
  }
  slot = body::comment(text);
  if (isReturnValue) {
    extra.push_back(body::throwStmt(settings_.notImplementedType, removedCall_ + " has no implementation"));
  }
}

void CallSiteRewriter::rewriteExpr(std::unique_ptr<body::Expr>& slot, const bool topLevel) {
  if (!slot) { return; }
  switch (slot->kind) {
    case body::NodeKind::Call: {
      auto& call = static_cast<body::CallExpr&>(*slot);
      std::vector<std::string> paramTypes;
      if (rules_.castSelf) {
        if (const auto target = resolver_.resolveCall(call, context_)) {
          paramTypes = model_.method(*target).paramTypes();
        }
      }
      if (call.target) { rewriteExpr(call.target, false); }
      for (auto& a : call.args) { rewriteExpr(a, false); }
      if (rules_.castSelf && !paramTypes.empty()) { castSelfArgs(call.args, paramTypes); }
      if (rules_.repairSuper && call.target && call.target->kind == body::NodeKind::Super) {
        if (repairSuperCall(call) == SuperAction::Remove) {
          removeCurrent_ = true;
          removedNested_ = removedNested_ || !topLevel;
          if (removedCall_.empty()) { removedCall_ = body::printExpr(call); }
        }
      }
      break;
    }
    case body::NodeKind::New: {
      auto& n = static_cast<body::NewExpr&>(*slot);
      for (auto& a : n.args) { rewriteExpr(a, false); }
      if (rules_.castSelf) { castSelfArgs(n.args, n.paramTypes); }
      break;
    }
    case body::NodeKind::FieldAccess: {
      auto& f = static_cast<body::FieldAccessExpr&>(*slot);
      if (f.target) { rewriteExpr(f.target, false); }
      break;
    }
    case body::NodeKind::Cast: {
      auto& c = static_cast<body::CastExpr&>(*slot);
      rewriteExpr(c.operand, false);
      break;
    }
    case body::NodeKind::Binary: {
      auto& b = static_cast<body::BinaryExpr&>(*slot);
      rewriteExpr(b.lhs, false);
      rewriteExpr(b.rhs, false);
      break;
    }
    default:
      break;
  }
}

} // namespace pullup::rewrite
