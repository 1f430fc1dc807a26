// Utility: small class graphs shared by the unit tests
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "body/Factory.h"
#include "model/Model.h"

namespace testutil {

using pullup::model::ClassId;
using pullup::model::MethodId;
using pullup::model::Model;
using pullup::model::Param;
using pullup::model::Visibility;

inline MethodId addConcrete(Model& m, ClassId owner, std::string name, std::vector<Param> params,
                            std::string ret, Visibility vis, pullup::body::Block body) {
  return m.addMethod(owner, pullup::model::MethodNode::concrete(std::move(name), std::move(params), std::move(ret),
                                                                vis, std::move(body)));
}

inline MethodId addAbstract(Model& m, ClassId owner, std::string name, std::vector<Param> params,
                            std::string ret, Visibility vis = Visibility::Public) {
  return m.addMethod(owner, pullup::model::MethodNode::abstractDecl(std::move(name), std::move(params),
                                                                    std::move(ret), vis));
}

// C1 <- C2 <- C3
struct Chain {
  Model model;
  ClassId c1{};
  ClassId c2{};
  ClassId c3{};
};

inline Chain makeChain() {
  Chain c;
  c.c1 = c.model.addClass("app.C1", std::nullopt, "", "src/app/C1.java");
  c.c2 = c.model.addClass("app.C2", c.c1, "", "src/app/C2.java");
  c.c3 = c.model.addClass("app.C3", c.c2, "", "src/app/C3.java");
  return c;
}

// Base <- {Left, Right}, Left <- LeftChild
struct Fork {
  Model model;
  ClassId base{};
  ClassId left{};
  ClassId right{};
  ClassId leftChild{};
};

inline Fork makeFork() {
  Fork f;
  f.base = f.model.addClass("zoo.Base", std::nullopt, "", "src/zoo/Base.java");
  f.left = f.model.addClass("zoo.Left", f.base, "", "src/zoo/Left.java");
  f.right = f.model.addClass("zoo.Right", f.base, "", "src/zoo/Right.java");
  f.leftChild = f.model.addClass("zoo.LeftChild", f.left, "", "src/zoo/LeftChild.java");
  return f;
}

inline bool hasMethod(const Model& m, ClassId cls, const std::string& name) {
  return !m.methodsNamed(cls, name).empty();
}

inline bool hasField(const Model& m, ClassId cls, const std::string& name) {
  return m.fieldNamed(cls, name).has_value();
}

} // namespace testutil
