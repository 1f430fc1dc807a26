/**
 * @file
 * @brief ConflictChecker::check: classify the candidate against destination declarations.
 */
#include "check/ConflictChecker.h"
#include "body/Printer.h"
#include "model/Signature.h"

namespace pullup::check {

const char* to_string(const ConflictOutcome o) {
  switch (o) {
    case ConflictOutcome::Clear: return "clear";
    case ConflictOutcome::Duplicate: return "duplicate";
    case ConflictOutcome::SignatureConflict: return "signature-conflict";
    case ConflictOutcome::OverloadAmbiguity: return "overload-ambiguity";
  }
  return "unknown";
}

bool ConflictChecker::sameBody(const model::MethodNode& a, const model::MethodNode& b) const {
  if (a.hasBody() != b.hasBody()) { return false; }
  if (!a.hasBody()) { return a.isAbstract == b.isAbstract; }
  return body::normalizedText(*a.body) == body::normalizedText(*b.body);
}

bool ConflictChecker::ambiguousWith(const model::MethodNode& a, const model::MethodNode& b) const {
  if (a.params.size() != b.params.size() || a.params.empty()) { return false; }
  for (std::size_t i = 0; i < a.params.size(); ++i) {
    const auto& ta = a.params[i].type;
    const auto& tb = b.params[i].type;
    if (!model_.isSubtype(ta, tb) && !model_.isSubtype(tb, ta)) { return false; }
  }
  return true;
}

ConflictReport ConflictChecker::check(const model::MethodId candidate, const model::ClassId destination) const {
  const auto& cand = model_.method(candidate);
  const auto& dest = model_.cls(destination);
  ConflictReport report;
  std::optional<model::MethodId> ambiguous;
  for (const auto id : model_.methodsNamed(destination, cand.name)) {
    if (id == candidate) { continue; }
    const auto& other = model_.method(id);
    if (model::sameSignature(model_, cand, other)) {
      report.existing = id;
      if (!other.isAbstract && sameBody(cand, other)) {
        report.outcome = ConflictOutcome::Duplicate;
        report.message = dest.qualifiedName + " already declares an identical " + model::signatureText(cand);
      } else {
        report.outcome = ConflictOutcome::SignatureConflict;
        report.message = dest.qualifiedName + " already declares " + model::signatureText(other) +
                         " with a different body";
      }
      return report;
    }
    if (!ambiguous && ambiguousWith(cand, other)) { ambiguous = id; }
  }
  if (ambiguous) {
    report.outcome = ConflictOutcome::OverloadAmbiguity;
    report.existing = ambiguous;
    report.message = model::signatureText(cand) + " would be ambiguous with " +
                     model::signatureText(model_.method(*ambiguous)) + " in " + dest.qualifiedName;
  }
  return report;
}

} // namespace pullup::check
