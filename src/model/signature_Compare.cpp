/**
 * @file
 * @brief Signature comparison and rendering.
 */
#include "model/Signature.h"
#include "model/Model.h"

namespace pullup::model {

bool sameParamTypes(const Model& model, const std::vector<std::string>& a, const std::vector<std::string>& b) {
  if (a.size() != b.size()) { return false; }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!model.sameType(a[i], b[i])) { return false; }
  }
  return true;
}

bool sameSignature(const Model& model, const MethodNode& a, const MethodNode& b) {
  return a.name == b.name && sameParamTypes(model, a.paramTypes(), b.paramTypes());
}

std::string signatureText(const MethodNode& m) {
  std::string out = m.name + "(";
  for (std::size_t i = 0; i < m.params.size(); ++i) {
    if (i != 0) { out += ","; }
    out += m.params[i].type;
  }
  out += ")";
  return out;
}

} // namespace pullup::model
