/**
 * @file
 * @brief Field declaration stored in the model arena.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include "body/Node.h"
#include "model/Ids.h"
#include "model/Visibility.h"

namespace pullup::model {

struct FieldNode {
  std::string name;
  std::string type;
  Visibility visibility{Visibility::Private};
  bool isStatic{false};
  std::unique_ptr<body::Expr> initializer;
  ClassId owner{};
  bool alive{true};

  FieldNode() = default;
  FieldNode(std::string n, std::string t, Visibility v, std::unique_ptr<body::Expr> init = nullptr)
      : name(std::move(n)), type(std::move(t)), visibility(v), initializer(std::move(init)) {}
};

} // namespace pullup::model
