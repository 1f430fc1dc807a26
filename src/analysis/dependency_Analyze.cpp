/***
 * Name: pullup::analysis::DependencyAnalyzer::analyze (impl)
 * Purpose: Walk a body and collect origin/intermediate members it references.
 */
#include "analysis/DependencyAnalyzer.h"
#include "analysis/MemberResolver.h"
#include "body/Scanner.h"
#include <unordered_set>

namespace pullup::analysis {

namespace {

class ReferenceCollector final : public body::Scanner {
 public:
  ReferenceCollector(const model::Model& model, const DependencyAnalyzer& analyzer, const model::ClassId context,
                     const model::ClassId origin, const model::ClassId destination)
      : model_(model), resolver_(model), analyzer_(analyzer), context_(context), origin_(origin),
        destination_(destination) {}

  std::optional<model::MethodId> selfMethod;
  std::optional<model::FieldId> selfField;
  std::vector<DependencyFinding> findings;

  using Scanner::visit;

  void visit(body::CallExpr& n) override {
    const bool viaSuper = n.target && n.target->kind == body::NodeKind::Super;
    if (!viaSuper) {
      if (const auto id = resolver_.resolveCall(n, context_)) { recordMethod(*id); }
    }
    Scanner::visit(n);
  }

  void visit(body::FieldAccessExpr& n) override {
    if (const auto id = resolver_.resolveField(n, context_)) { recordField(*id); }
    Scanner::visit(n);
  }

 private:
  void recordMethod(const model::MethodId id) {
    if (selfMethod && *selfMethod == id) { return; }
    if (!seenMethods_.insert(id).second) { return; }
    const auto& m = model_.method(id);
    const auto own = analyzer_.classify(m.owner, origin_, destination_);
    if (own == Ownership::Irrelevant) { return; }
    DependencyFinding f;
    f.method = id;
    f.ownership = own;
    if (m.visibility == model::Visibility::Private) {
      f.issue = "method '" + m.name + "' in " + model_.cls(m.owner).qualifiedName + " is private";
    }
    findings.push_back(std::move(f));
  }

  void recordField(const model::FieldId id) {
    if (selfField && *selfField == id) { return; }
    if (!seenFields_.insert(id).second) { return; }
    const auto& fld = model_.field(id);
    const auto own = analyzer_.classify(fld.owner, origin_, destination_);
    if (own == Ownership::Irrelevant) { return; }
    DependencyFinding f;
    f.field = id;
    f.ownership = own;
    if (fld.visibility == model::Visibility::Private) {
      f.issue = "field '" + fld.name + "' in " + model_.cls(fld.owner).qualifiedName + " is private";
    }
    findings.push_back(std::move(f));
  }

  const model::Model& model_;
  MemberResolver resolver_;
  const DependencyAnalyzer& analyzer_;
  model::ClassId context_;
  model::ClassId origin_;
  model::ClassId destination_;
  std::unordered_set<model::MethodId> seenMethods_;
  std::unordered_set<model::FieldId> seenFields_;
};

} // namespace

std::vector<DependencyFinding> DependencyAnalyzer::analyze(const body::Block* body, const body::Expr* expr,
                                                           const model::ClassId context,
                                                           const model::ClassId origin,
                                                           const model::ClassId destination,
                                                           const std::optional<model::MethodId> selfMethod,
                                                           const std::optional<model::FieldId> selfField) const {
  ReferenceCollector collector(model_, *this, context, origin, destination);
  collector.selfMethod = selfMethod;
  collector.selfField = selfField;
  if (body != nullptr) { collector.scan(*body); }
  if (expr != nullptr) { collector.scan(*expr); }
  return std::move(collector.findings);
}

std::vector<DependencyFinding> DependencyAnalyzer::analyzeMethod(const model::MethodId method,
                                                                 const model::ClassId origin,
                                                                 const model::ClassId destination) const {
  const auto& m = model_.method(method);
  if (!m.hasBody()) { return {}; }
  return analyze(&*m.body, nullptr, m.owner, origin, destination, method, std::nullopt);
}

std::vector<DependencyFinding> DependencyAnalyzer::analyzeField(const model::FieldId field,
                                                                const model::ClassId origin,
                                                                const model::ClassId destination) const {
  const auto& f = model_.field(field);
  if (!f.initializer) { return {}; }
  return analyze(nullptr, f.initializer.get(), f.owner, origin, destination, std::nullopt, field);
}

} // namespace pullup::analysis
