/**
 * @file
 * @brief MethodMigrator return-type widening and retyping of directly returned locals.
 */
#include "migrate/MethodMigrator.h"
#include "body/Scanner.h"
#include <set>

namespace pullup::migrate {

namespace {

class ReturnedNames final : public body::Scanner {
 public:
  std::set<std::string> names;
  using Scanner::visit;
  void visit(body::ReturnStmt& n) override {
    if (n.value && n.value->kind == body::NodeKind::Name) {
      names.insert(static_cast<body::NameExpr&>(*n.value).id);
    }
    Scanner::visit(n);
  }
};

class LocalRetyper final : public body::Scanner {
 public:
  LocalRetyper(const model::Model& model, const std::set<std::string>& names, const std::string& from,
               const std::string& to)
      : model_(model), names_(names), from_(from), to_(to) {}

  using Scanner::visit;
  void visit(body::LocalVarStmt& n) override {
    if (names_.contains(n.name) && model_.sameType(n.type, from_)) { n.type = to_; }
    Scanner::visit(n);
  }
  void visit(body::NameExpr& n) override {
    if (names_.contains(n.id) && model_.sameType(n.type, from_)) { n.type = to_; }
  }

 private:
  const model::Model& model_;
  const std::set<std::string>& names_;
  const std::string& from_;
  const std::string& to_;
};

} // namespace

std::string MethodMigrator::unifiedReturnType(const model::MethodId decl,
                                              const std::vector<model::MethodId>& peers) const {
  const auto& seed = model_.method(decl).returnType;
  const auto& types = model_.types();
  if (types.isPrimitive(seed) || types.isVoid(seed)) { return seed; }
  std::vector<std::string> observed;
  for (const auto id : peers) {
    const auto& t = model_.method(id).returnType;
    if (types.isPrimitive(t) || types.isVoid(t)) { continue; }
    observed.push_back(t);
  }
  const auto unified = unifier_.unify(seed, observed);
  return model_.sameType(unified, seed) ? seed : unified;
}

void MethodMigrator::retypeReturnedLocals(body::Block& body, const std::string& from, const std::string& to) const {
  ReturnedNames returned;
  returned.scan(body);
  if (returned.names.empty()) { return; }
  LocalRetyper retyper(model_, returned.names, from, to);
  retyper.scan(body);
}

} // namespace pullup::migrate
