/***
 * Name: test_method_migrator
 * Purpose: Validate prechecks and the full method pull-up over small hierarchies.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "body/Factory.h"
#include "body/Printer.h"
#include "migrate/MethodMigrator.h"
#include "pullup/exceptions/duplicate_method.h"
#include "pullup/exceptions/not_an_ancestor.h"
#include "pullup/exceptions/unresolvable_type.h"
#include "util/Hierarchies.h"

using namespace pullup;
using namespace pullup::body;
using namespace testutil;

namespace {
migrate::MigrationPlan run(Model& m, const MethodId method, const ClassId dest,
                           const migrate::Settings& settings = {}, obs::Metrics* metrics = nullptr) {
  migrate::MethodMigrator mm(m, settings, metrics);
  auto plan = mm.prepare(method, dest);
  mm.precheck(plan);
  mm.execute(plan);
  return plan;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}
} // namespace

TEST(MethodMigrator, PureRelocationLeavesIntermediateUntouched) {
  auto c = makeChain();
  c.model.addField(c.c1, model::FieldNode("count", "int", Visibility::Protected));
  const auto m = addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(field("count"))));
  const auto plan = run(c.model, m, c.c1);
  EXPECT_TRUE(hasMethod(c.model, c.c1, "m"));
  EXPECT_FALSE(hasMethod(c.model, c.c3, "m"));
  EXPECT_TRUE(c.model.cls(c.c2).methods.empty());
  EXPECT_FALSE(c.model.method(m).alive);
  ASSERT_TRUE(plan.migrated.has_value());
  EXPECT_EQ(c.model.method(*plan.migrated).owner, c.c1);
  EXPECT_EQ(c.model.method(*plan.migrated).visibility, Visibility::Public);
  EXPECT_TRUE(plan.warnings.empty());
  EXPECT_EQ(plan.mutatedClasses, (std::vector<ClassId>{c.c1, c.c3}));
  EXPECT_TRUE(plan.visibilityChanged.empty());
  EXPECT_FALSE(c.model.cls(c.c1).isAbstract);
}

TEST(MethodMigrator, PrivateFieldTravelsWithMethod) {
  auto c = makeChain();
  c.model.addField(c.c3, model::FieldNode("secret", "int", Visibility::Private));
  const auto m = addConcrete(c.model, c.c3, "reveal", {}, "int", Visibility::Public, block(ret(field("secret"))));
  const auto plan = run(c.model, m, c.c1);
  ASSERT_EQ(plan.migratedFields.size(), 1u);
  const auto f = c.model.fieldNamed(c.c1, "secret");
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(c.model.field(*f).visibility, Visibility::Protected);
  EXPECT_FALSE(hasField(c.model, c.c3, "secret"));
  EXPECT_TRUE(plan.warnings.empty());
}

TEST(MethodMigrator, OriginMethodDependencyBecomesAbstract) {
  auto c = makeChain();
  const auto helper = addConcrete(c.model, c.c3, "helper", {}, "int", Visibility::Private, block(ret(lit("1", "int"))));
  const auto m = addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(call("helper"))));
  const auto plan = run(c.model, m, c.c1);

  EXPECT_TRUE(c.model.cls(c.c1).isAbstract);
  ASSERT_EQ(plan.introducedAbstracts.size(), 1u);
  const auto& decl = c.model.method(plan.introducedAbstracts[0]);
  EXPECT_EQ(decl.owner, c.c1);
  EXPECT_TRUE(decl.isAbstract);
  EXPECT_EQ(decl.visibility, Visibility::Protected);
  EXPECT_EQ(c.model.method(helper).visibility, Visibility::Protected);
  EXPECT_TRUE(c.model.method(helper).overrideMarker);
  EXPECT_TRUE(c.model.method(helper).alive);

  ASSERT_EQ(plan.stubs.size(), 1u);
  EXPECT_EQ(c.model.method(plan.stubs[0]).owner, c.c2);
  EXPECT_TRUE(contains(plan.warnings, "app.C1 was made abstract"));
  EXPECT_TRUE(contains(plan.warnings, "synthesized stub helper() in app.C2"));
  EXPECT_EQ(plan.visibilityChanged, (std::vector<ClassId>{c.c3}));
  EXPECT_EQ(plan.mutatedClasses, (std::vector<ClassId>{c.c1, c.c3, c.c2}));
}

TEST(MethodMigrator, IntermediateDependencyNeedsNoStub) {
  auto c = makeChain();
  addConcrete(c.model, c.c2, "mid", {}, "int", Visibility::Protected, block(ret(lit("2", "int"))));
  const auto m = addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(call("mid"))));
  const auto plan = run(c.model, m, c.c1);
  ASSERT_EQ(plan.introducedAbstracts.size(), 1u);
  EXPECT_TRUE(plan.stubs.empty());
  EXPECT_EQ(plan.warnings, (std::vector<std::string>{"app.C1 was made abstract"}));
}

TEST(MethodMigrator, UnrelatedOverrideReturnTypesWidenToTop) {
  Model m;
  m.addClass("p.TypeA");
  m.addClass("p.TypeB");
  const auto dest = m.addClass("shapes.Dest");
  const auto x = m.addClass("shapes.X", dest);
  const auto y = m.addClass("shapes.Y", dest);
  addConcrete(m, x, "f", {Param{"n", "int"}}, "p.TypeA", Visibility::Public, block(ret(newObj("p.TypeA"))));
  addConcrete(m, y, "f", {Param{"n", "int"}}, "p.TypeB", Visibility::Public, block(ret(newObj("p.TypeB"))));
  const auto use = addConcrete(m, x, "use", {}, "void", Visibility::Public,
                               block(exprStmt(call("f", args(lit("1", "int"))))));
  const auto plan = run(m, use, dest);

  const auto f = m.findMethod(dest, "f", {"int"});
  ASSERT_TRUE(f.has_value());
  EXPECT_TRUE(m.method(*f).isAbstract);
  EXPECT_EQ(m.method(*f).returnType, "Object");
  EXPECT_TRUE(m.cls(dest).isAbstract);
  EXPECT_TRUE(plan.stubs.empty());
  EXPECT_TRUE(contains(plan.warnings, "abstract f(int) in shapes.Dest returns Object to cover every override"));
}

TEST(MethodMigrator, SelfReferenceArgumentIsDowncast) {
  auto c = makeChain();
  const auto registry = c.model.addClass("app.Registry");
  addConcrete(c.model, registry, "register", {Param{"item", "app.C3"}}, "void", Visibility::Public, block());
  const auto m = addConcrete(c.model, c.c3, "enroll", {}, "void", Visibility::Public,
                             block(exprStmt(call(name("registry", "app.Registry"), "register", args(self())))));
  const auto plan = run(c.model, m, c.c1);

  const auto& moved = c.model.method(*plan.migrated);
  ASSERT_TRUE(moved.hasBody());
  ASSERT_EQ(moved.body->stmts.size(), 1u);
  const auto& stmt = static_cast<const ExprStmt&>(*moved.body->stmts[0]);
  const auto& callNode = static_cast<const CallExpr&>(*stmt.expr);
  ASSERT_EQ(callNode.args.size(), 1u);
  ASSERT_EQ(callNode.args[0]->kind, NodeKind::Cast);
  const auto& castNode = static_cast<const CastExpr&>(*callNode.args[0]);
  EXPECT_EQ(castNode.type, "app.C3");
  EXPECT_EQ(castNode.operand->kind, NodeKind::This);
}

TEST(MethodMigrator, SuperCallForwardsToConcreteAncestor) {
  Model model;
  const auto root = model.addClass("app.Root");
  const auto mid = model.addClass("app.Mid", root);
  const auto leaf = model.addClass("app.Leaf", mid);
  addConcrete(model, root, "helper", {}, "int", Visibility::Public, block(ret(lit("0", "int"))));
  const auto helper = addConcrete(model, leaf, "helper", {}, "int", Visibility::Public, block(ret(superCall("helper"))));
  const auto m = addConcrete(model, leaf, "m", {}, "int", Visibility::Public, block(ret(call("helper"))));
  obs::Metrics metrics;
  const auto plan = run(model, m, mid, {}, &metrics);

  ASSERT_EQ(plan.forwarded.size(), 1u);
  const auto& fwd = model.method(plan.forwarded[0]);
  EXPECT_EQ(fwd.owner, mid);
  EXPECT_FALSE(fwd.isAbstract);
  ASSERT_TRUE(fwd.hasBody());
  EXPECT_EQ(normalizedText(*fwd.body), "return super.helper();");
  EXPECT_FALSE(model.cls(mid).isAbstract);
  EXPECT_FALSE(plan.destinationMadeAbstract);
  EXPECT_TRUE(plan.stubs.empty());
  EXPECT_TRUE(plan.warnings.empty());
  EXPECT_EQ(model.method(helper).body->stmts[0]->kind, NodeKind::ReturnStmt);
  EXPECT_EQ(metrics.counter("migrate.supercalls.forwarded"), 1u);
}

TEST(MethodMigrator, AbstractDestinationClearedOnceNothingAbstractRemains) {
  Model model;
  const auto root = model.addClass("app.Root");
  const auto mid = model.addClass("app.Mid", root);
  const auto leaf = model.addClass("app.Leaf", mid);
  model.cls(mid).isAbstract = true;
  addConcrete(model, root, "helper", {}, "int", Visibility::Public, block(ret(lit("0", "int"))));
  addConcrete(model, leaf, "helper", {}, "int", Visibility::Public, block(ret(superCall("helper"))));
  const auto m = addConcrete(model, leaf, "m", {}, "int", Visibility::Public, block(ret(call("helper"))));
  const auto plan = run(model, m, mid);

  ASSERT_EQ(plan.forwarded.size(), 1u);
  for (const auto id : model.cls(mid).methods) { EXPECT_FALSE(model.method(id).isAbstract); }
  EXPECT_FALSE(model.cls(mid).isAbstract);
  EXPECT_FALSE(plan.destinationMadeAbstract);
  EXPECT_TRUE(plan.warnings.empty());
  EXPECT_TRUE(contains(plan.notes, "app.Mid no longer declares abstract methods; abstract flag cleared"));
}

TEST(MethodMigrator, AbstractDestinationKeptWithoutNewDeclarations) {
  auto c = makeChain();
  c.model.cls(c.c1).isAbstract = true;
  const auto m = addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(lit("1", "int"))));
  const auto plan = run(c.model, m, c.c1);
  EXPECT_TRUE(plan.introducedAbstracts.empty());
  EXPECT_TRUE(c.model.cls(c.c1).isAbstract);
}

TEST(MethodMigrator, NestedSuperCallWithoutImplementationIsRemoved) {
  auto c = makeChain();
  const auto helper = addConcrete(c.model, c.c3, "helper", {}, "int", Visibility::Public,
                                  block(ret(binary("+", superCall("helper"), lit("1", "int")))));
  const auto m = addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(call("helper"))));
  obs::Metrics metrics;
  const auto plan = run(c.model, m, c.c1, {}, &metrics);

  const auto& b = *c.model.method(helper).body;
  ASSERT_EQ(b.stmts.size(), 2u);
  ASSERT_EQ(b.stmts[0]->kind, NodeKind::CommentStmt);
  EXPECT_EQ(static_cast<const CommentStmt&>(*b.stmts[0]).text,
            "super.helper() removed: no concrete implementation above app.C3");
  ASSERT_EQ(b.stmts[1]->kind, NodeKind::ThrowStmt);
  EXPECT_EQ(static_cast<const ThrowStmt&>(*b.stmts[1]).type, "UnsupportedOperationException");
  EXPECT_TRUE(contains(plan.warnings, "statement containing super.helper() in app.C3 was removed because the "
                                      "super call was nested in an expression"));
  EXPECT_EQ(metrics.counter("migrate.supercalls.removed"), 1u);
  EXPECT_TRUE(c.model.cls(c.c1).isAbstract);
}

TEST(MethodMigrator, StaticDependencyIsRelocated) {
  auto c = makeChain();
  const auto util = addConcrete(c.model, c.c3, "util", {}, "int", Visibility::Private, block(ret(lit("7", "int"))));
  c.model.method(util).isStatic = true;
  const auto m = addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(call("util"))));
  const auto plan = run(c.model, m, c.c1);
  ASSERT_EQ(plan.relocatedStatics.size(), 1u);
  const auto& moved = c.model.method(plan.relocatedStatics[0]);
  EXPECT_EQ(moved.owner, c.c1);
  EXPECT_TRUE(moved.isStatic);
  EXPECT_EQ(moved.visibility, Visibility::Protected);
  EXPECT_FALSE(hasMethod(c.model, c.c3, "util"));
  EXPECT_TRUE(plan.introducedAbstracts.empty());
  EXPECT_FALSE(c.model.cls(c.c1).isAbstract);
}

TEST(MethodMigrator, ReturnTypeWidensOverSiblingOverrides) {
  auto f = makeFork();
  const auto make = addConcrete(f.model, f.left, "make", {}, "zoo.Left", Visibility::Public,
                                block(local("zoo.Left", "x", newObj("zoo.Left")), ret(name("x", "zoo.Left"))));
  addConcrete(f.model, f.right, "make", {}, "zoo.Right", Visibility::Public, block(ret(newObj("zoo.Right"))));
  const auto plan = run(f.model, make, f.base);
  const auto& moved = f.model.method(*plan.migrated);
  EXPECT_EQ(moved.returnType, "zoo.Base");
  ASSERT_EQ(moved.body->stmts[0]->kind, NodeKind::LocalVarStmt);
  EXPECT_EQ(static_cast<const LocalVarStmt&>(*moved.body->stmts[0]).type, "zoo.Base");
  EXPECT_TRUE(contains(plan.warnings, "return type of make() widened from zoo.Left to zoo.Base"));
}

TEST(MethodMigrator, PrecheckGates) {
  auto f = makeFork();
  const auto m = addConcrete(f.model, f.left, "m", {}, "void", Visibility::Public, block());
  migrate::MethodMigrator mm(f.model, migrate::Settings{});
  auto sideways = mm.prepare(m, f.right);
  EXPECT_THROW(mm.precheck(sideways), exceptions::NotAnAncestor);

  const auto ghost = addConcrete(f.model, f.left, "g", {Param{"x", "lost.Ghost"}}, "void", Visibility::Public, block());
  auto badParam = mm.prepare(ghost, f.base);
  EXPECT_THROW(mm.precheck(badParam), exceptions::UnresolvableType);

  addConcrete(f.model, f.left, "leak", {}, "lost.Ghost", Visibility::Private, block(ret(lit("null", "lost.Ghost"))));
  const auto user = addConcrete(f.model, f.left, "user", {}, "void", Visibility::Public, block(exprStmt(call("leak"))));
  auto closure = mm.prepare(user, f.base);
  EXPECT_THROW(mm.precheck(closure), exceptions::UnresolvableType);

  addConcrete(f.model, f.base, "m", {}, "void", Visibility::Public, block());
  auto dup = mm.prepare(m, f.base);
  EXPECT_THROW(mm.precheck(dup), exceptions::DuplicateMethod);
  EXPECT_TRUE(f.model.method(m).alive);
}

TEST(MethodMigrator, ExternalDestinationIsRejected) {
  Model model;
  const auto lib = model.addExternalClass("lib.Base");
  const auto a = model.addClass("app.A", lib);
  const auto m = addConcrete(model, a, "m", {}, "void", Visibility::Public, block());
  migrate::MethodMigrator mm(model, migrate::Settings{});
  auto plan = mm.prepare(m, lib);
  EXPECT_THROW(mm.precheck(plan), exceptions::NotAnAncestor);
}
