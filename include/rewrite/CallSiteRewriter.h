/***
 * Name: pullup::rewrite::CallSiteRewriter
 * Purpose: Repair self-typed arguments and super calls in moved or co-moved bodies.
 * Inputs:
 *   - A body, the class used as resolution context, and the rules to apply
 * Outputs:
 *   - The body edited in place; RewriteStats; plan warnings for removals
 * Theory of Operation:
 *   One walk over the statement slots of the body. Expressions are
 *   visited through their owning pointers so a node can be replaced.
 *   castSelf: a bare `this` passed where the parameter type accepts the
 *   origin class but not the destination becomes `(Origin) this`.
 *   repairSuper: a `super.m(...)` call is re-bound from the context's
 *   superclass; a concrete target is kept; a declaration introduced as
 *   abstract on the destination is given a forwarding body when a
 *   concrete implementation exists above the destination; otherwise the
 *   enclosing statement is replaced by a comment marker. Unresolvable
 *   super calls are only removed from relocated bodies.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "analysis/MemberResolver.h"
#include "body/Nodes.h"
#include "hierarchy/Navigator.h"
#include "migrate/MigrationPlan.h"
#include "migrate/Settings.h"
#include "model/Model.h"
#include "observability/Metrics.h"

namespace pullup::rewrite {

struct RewriteRules {
  bool castSelf{false};
  bool repairSuper{false};
  // The body now lives in another class, so an unresolvable super call is removed
  // instead of being left for code the model does not cover.
  bool relocated{false};
};

struct RewriteStats {
  std::size_t casts{0};
  std::size_t superKept{0};
  std::size_t superForwarded{0};
  std::size_t superRemoved{0};
};

class CallSiteRewriter {
 public:
  CallSiteRewriter(model::Model& model, const hierarchy::Navigator& nav, const migrate::Settings& settings,
                   migrate::MigrationPlan& plan, obs::Metrics* metrics = nullptr)
      : model_(model), nav_(nav), resolver_(model), settings_(settings), plan_(plan), metrics_(metrics) {}

  RewriteStats rewrite(body::Block& body, model::ClassId context, RewriteRules rules);

 private:
  enum class SuperAction { Keep, Forward, Remove };

  void rewriteBlock(body::Block& b);
  void rewriteStmt(std::unique_ptr<body::Stmt>& slot, std::vector<std::unique_ptr<body::Stmt>>& extra);
  void rewriteExpr(std::unique_ptr<body::Expr>& slot, bool topLevel);
  void castSelfArgs(std::vector<std::unique_ptr<body::Expr>>& args, const std::vector<std::string>& paramTypes);
  SuperAction repairSuperCall(const body::CallExpr& call);
  bool needsCast(const std::string& paramType) const;
  void forwardToSuper(model::MethodId decl);

  model::Model& model_;
  const hierarchy::Navigator& nav_;
  analysis::MemberResolver resolver_;
  const migrate::Settings& settings_;
  migrate::MigrationPlan& plan_;
  obs::Metrics* metrics_;

  model::ClassId context_{};
  RewriteRules rules_{};
  RewriteStats stats_{};
  bool removeCurrent_{false};
  bool removedNested_{false};
  std::string removedCall_;
};

} // namespace pullup::rewrite
