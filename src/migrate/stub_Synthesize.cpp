/**
 * @file
 * @brief StubSynthesizer: stub bodies and placement over the destination's descendants.
 */
#include "migrate/StubSynthesizer.h"
#include "body/Factory.h"
#include "model/Signature.h"

namespace pullup::migrate {

std::string StubSynthesizer::defaultValue(const std::string& type) const {
  if (type == "boolean") { return "false"; }
  if (type == "char") { return "'\\0'"; }
  if (type == "float") { return "0.0f"; }
  if (type == "double") { return "0.0"; }
  if (type == "long") { return "0L"; }
  if (model_.types().isPrimitive(type)) { return "0"; }
  return "null";
}

body::Block StubSynthesizer::stubBody(const model::MethodNode& decl) const {
  if (model_.types().isVoid(decl.returnType)) { return body::Block{}; }
  if (settings_.stubPolicy == StubPolicy::ReturnDefault) {
    return body::block(body::ret(body::lit(defaultValue(decl.returnType), decl.returnType)));
  }
  return body::block(body::throwStmt(settings_.notImplementedType,
                                     model::signatureText(decl) + " is not implemented"));
}

bool StubSynthesizer::providedAlongChain(const model::ClassId cls, const model::MethodNode& decl,
                                         const model::ClassId destination) const {
  std::vector<model::ClassId> chain{cls};
  for (const auto mid : nav_.pathBetween(cls, destination)) { chain.push_back(mid); }
  for (const auto c : chain) {
    const auto found = model_.findMethod(c, decl.name, decl.paramTypes());
    if (found && !model_.method(*found).isAbstract) { return true; }
  }
  return false;
}

std::vector<model::MethodId> StubSynthesizer::synthesize(const model::MethodId abstractDecl, MigrationPlan& plan) {
  std::vector<model::MethodId> out;
  for (const auto sub : nav_.descendantsOf(plan.destination)) {
    const auto& c = model_.cls(sub);
    if (c.isAbstract || c.external) { continue; }
    const auto& decl = model_.method(abstractDecl);
    if (!decl.isAbstract) { break; }
    if (providedAlongChain(sub, decl, plan.destination)) { continue; }

    auto stub = model::MethodNode::concrete(decl.name, decl.params, decl.returnType, decl.visibility, stubBody(decl));
    stub.overrideMarker = true;
    const auto sig = model::signatureText(decl);
    const auto id = model_.addMethod(sub, std::move(stub));
    out.push_back(id);
    plan.stubs.push_back(id);
    plan.touch(sub);
    plan.warn("synthesized stub " + sig + " in " + model_.cls(sub).qualifiedName);
    if (metrics_ != nullptr) { metrics_->incCounter("migrate.stubs"); }
  }
  return out;
}

} // namespace pullup::migrate
