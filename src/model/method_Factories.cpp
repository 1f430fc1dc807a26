/**
 * @file
 * @brief MethodNode convenience constructors and parameter type projection.
 */
#include "model/MethodNode.h"
#include <utility>

namespace pullup::model {

std::vector<std::string> MethodNode::paramTypes() const {
  std::vector<std::string> out;
  out.reserve(params.size());
  for (const auto& p : params) { out.push_back(p.type); }
  return out;
}

MethodNode MethodNode::concrete(std::string name, std::vector<Param> params, std::string returnType,
                                const Visibility vis, body::Block body) {
  MethodNode m;
  m.name = std::move(name);
  m.params = std::move(params);
  m.returnType = std::move(returnType);
  m.visibility = vis;
  m.body = std::move(body);
  return m;
}

MethodNode MethodNode::abstractDecl(std::string name, std::vector<Param> params, std::string returnType,
                                    const Visibility vis) {
  MethodNode m;
  m.name = std::move(name);
  m.params = std::move(params);
  m.returnType = std::move(returnType);
  m.visibility = vis;
  m.isAbstract = true;
  return m;
}

} // namespace pullup::model
