#pragma once

#include <string>
#include <vector>
#include "model/MethodNode.h"

namespace pullup::model {
class Model;

// Same parameter count and pairwise identical types (after name resolution).
bool sameParamTypes(const Model& model, const std::vector<std::string>& a, const std::vector<std::string>& b);

// Same name and sameParamTypes.
bool sameSignature(const Model& model, const MethodNode& a, const MethodNode& b);

// "name(T1,T2)" as used in messages and the top-type method list.
std::string signatureText(const MethodNode& m);

} // namespace pullup::model
