/**
 * @file
 * @brief ClassNode simple/package name split.
 */
#include "model/ClassNode.h"

namespace pullup::model {

std::string ClassNode::simpleName() const {
  const auto dot = qualifiedName.rfind('.');
  return dot == std::string::npos ? qualifiedName : qualifiedName.substr(dot + 1);
}

std::string ClassNode::packageName() const {
  const auto dot = qualifiedName.rfind('.');
  return dot == std::string::npos ? std::string{} : qualifiedName.substr(0, dot);
}

} // namespace pullup::model
