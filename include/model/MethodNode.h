/***
 * Name: pullup::model::MethodNode
 * Purpose: Method declaration stored in the model arena.
 * Inputs:
 *   - Name, parameters, return type, modifiers and an optional body
 * Outputs:
 *   - Signature and body queries used by every pass
 * Theory of Operation:
 *   A method without a body is either abstract or (for external classes)
 *   opaque. The owner is an index into the class arena and changes only
 *   when the model re-links a clone. Removed methods stay in the arena
 *   with alive=false so ids remain stable.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "body/Block.h"
#include "model/Ids.h"
#include "model/Visibility.h"

namespace pullup::model {

struct Param {
  std::string name;
  std::string type;
};

struct MethodNode {
  std::string name;
  std::vector<Param> params;
  std::string returnType{"void"};
  Visibility visibility{Visibility::Public};
  bool isAbstract{false};
  bool isStatic{false};
  bool isFinal{false};
  bool overrideMarker{false};
  std::optional<body::Block> body;
  ClassId owner{};
  bool alive{true};

  bool hasBody() const { return body.has_value(); }
  std::vector<std::string> paramTypes() const;

  static MethodNode concrete(std::string name, std::vector<Param> params, std::string returnType,
                             Visibility vis, body::Block body);
  static MethodNode abstractDecl(std::string name, std::vector<Param> params, std::string returnType,
                                 Visibility vis);
};

} // namespace pullup::model
