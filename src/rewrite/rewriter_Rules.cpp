/**
 * @file
 * @brief CallSiteRewriter rules: self-reference downcast and super-call repair.
 */
#include "rewrite/CallSiteRewriter.h"
#include "body/Factory.h"
#include "model/Signature.h"
#include <algorithm>

namespace pullup::rewrite {

bool CallSiteRewriter::needsCast(const std::string& paramType) const {
  const auto& dest = model_.cls(plan_.destination).qualifiedName;
  const auto& origin = model_.cls(plan_.origin).qualifiedName;
  return !model_.isSubtype(dest, paramType) && model_.isSubtype(origin, paramType);
}

void CallSiteRewriter::castSelfArgs(std::vector<std::unique_ptr<body::Expr>>& args,
                                    const std::vector<std::string>& paramTypes) {
  const auto n = std::min(args.size(), paramTypes.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (!args[i] || args[i]->kind != body::NodeKind::This) { continue; }
    if (!needsCast(paramTypes[i])) { continue; }
    args[i] = body::cast(model_.cls(plan_.origin).qualifiedName, std::move(args[i]));
    ++stats_.casts;
    plan_.note("downcast self-reference argument to " + model_.cls(plan_.origin).qualifiedName);
  }
}

void CallSiteRewriter::forwardToSuper(const model::MethodId decl) {
  auto& m = model_.method(decl);
  std::vector<body::ExprPtr> fwdArgs;
  fwdArgs.reserve(m.params.size());
  for (const auto& p : m.params) { fwdArgs.push_back(body::name(p.name, p.type)); }
  auto fwd = body::superCall(m.name, std::move(fwdArgs));
  m.body = model_.types().isVoid(m.returnType) ? body::block(body::exprStmt(std::move(fwd)))
                                               : body::block(body::ret(std::move(fwd)));
  m.isAbstract = false;
  plan_.forwarded.push_back(decl);
  plan_.touch(m.owner);
  plan_.note("gave " + model::signatureText(m) + " in " + model_.cls(m.owner).qualifiedName +
             " a body forwarding to its superclass");
}

CallSiteRewriter::SuperAction CallSiteRewriter::repairSuperCall(const body::CallExpr& call) {
  const auto resolved = resolver_.resolveCall(call, context_);
  if (resolved && !model_.method(*resolved).isAbstract) {
    ++stats_.superKept;
    return SuperAction::Keep;
  }
  if (!resolved && settings_.declaredByTop(call.name, call.args.size())) {
    ++stats_.superKept;
    return SuperAction::Keep;
  }
  const auto& introduced = plan_.introducedAbstracts;
  if (resolved && std::find(introduced.begin(), introduced.end(), *resolved) != introduced.end()) {
    const auto& decl = model_.method(*resolved);
    bool concreteAbove = settings_.declaredByTop(decl.name, decl.params.size());
    if (const auto above = nav_.superclassOf(plan_.destination)) {
      const auto concrete = resolver_.lookupMethod(*above, decl.name, decl.paramTypes());
      concreteAbove = concrete ? !model_.method(*concrete).isAbstract : concreteAbove;
    }
    if (concreteAbove) {
      forwardToSuper(*resolved);
      ++stats_.superForwarded;
      return SuperAction::Forward;
    }
  }
  if (!resolved && !rules_.relocated) {
    ++stats_.superKept;
    return SuperAction::Keep;
  }
  ++stats_.superRemoved;
  return SuperAction::Remove;
}

} // namespace pullup::rewrite
