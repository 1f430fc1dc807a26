/***
 * Name: test_call_site_rewriter
 * Purpose: Validate self-reference downcasts and super-call repair on body trees.
 */
#include <gtest/gtest.h>
#include "body/Factory.h"
#include "body/Printer.h"
#include "rewrite/CallSiteRewriter.h"
#include "util/Hierarchies.h"

using namespace pullup;
using namespace pullup::body;
using namespace testutil;
using rewrite::CallSiteRewriter;
using rewrite::RewriteRules;

namespace {
struct RewriteFixture {
  Chain c = makeChain();
  migrate::Settings settings;
  migrate::MigrationPlan plan;
  RewriteFixture() {
    plan.origin = c.c3;
    plan.destination = c.c1;
  }
};
} // namespace

TEST(CallSiteRewriter, ConstructorArgumentIsDowncast) {
  RewriteFixture fx;
  const hierarchy::Navigator nav(fx.c.model);
  CallSiteRewriter rw(fx.c.model, nav, fx.settings, fx.plan);
  auto b = block(local("app.Ticket", "t", newObj("app.Ticket", args(self(), lit("1", "int")), {"app.C3", "int"})));
  const auto stats = rw.rewrite(b, fx.c.c3, RewriteRules{.castSelf = true});
  EXPECT_EQ(stats.casts, 1u);
  EXPECT_EQ(normalizedText(b), "app.Ticket t = new app.Ticket((app.C3) this, 1);");
}

TEST(CallSiteRewriter, ArgumentAlreadyAcceptedByDestinationIsLeftAlone) {
  RewriteFixture fx;
  addConcrete(fx.c.model, fx.c.c1, "accept", {Param{"v", "app.C1"}}, "void", Visibility::Public, block());
  const hierarchy::Navigator nav(fx.c.model);
  CallSiteRewriter rw(fx.c.model, nav, fx.settings, fx.plan);
  auto b = block(exprStmt(call("accept", args(self()))));
  EXPECT_EQ(rw.rewrite(b, fx.c.c3, RewriteRules{.castSelf = true}).casts, 0u);
  EXPECT_EQ(normalizedText(b), "accept(this);");
}

TEST(CallSiteRewriter, ConcreteSuperTargetIsKept) {
  RewriteFixture fx;
  addConcrete(fx.c.model, fx.c.c1, "tick", {}, "void", Visibility::Public, block());
  const hierarchy::Navigator nav(fx.c.model);
  CallSiteRewriter rw(fx.c.model, nav, fx.settings, fx.plan);
  auto b = block(exprStmt(superCall("tick")));
  const auto stats = rw.rewrite(b, fx.c.c3, RewriteRules{.repairSuper = true, .relocated = true});
  EXPECT_EQ(stats.superKept, 1u);
  EXPECT_EQ(normalizedText(b), "super.tick();");
  EXPECT_TRUE(fx.plan.warnings.empty());
}

TEST(CallSiteRewriter, TopTypeMethodsAreKept) {
  RewriteFixture fx;
  const hierarchy::Navigator nav(fx.c.model);
  CallSiteRewriter rw(fx.c.model, nav, fx.settings, fx.plan);
  auto b = block(ret(superCall("toString")));
  const auto stats = rw.rewrite(b, fx.c.c1, RewriteRules{.repairSuper = true, .relocated = true});
  EXPECT_EQ(stats.superKept, 1u);
  EXPECT_EQ(stats.superRemoved, 0u);
}

TEST(CallSiteRewriter, UnresolvedSuperOnlyRemovedFromRelocatedBodies) {
  RewriteFixture fx;
  const hierarchy::Navigator nav(fx.c.model);
  CallSiteRewriter rw(fx.c.model, nav, fx.settings, fx.plan);
  auto kept = block(exprStmt(superCall("onAttach")));
  EXPECT_EQ(rw.rewrite(kept, fx.c.c3, RewriteRules{.repairSuper = true}).superKept, 1u);

  auto moved = block(exprStmt(superCall("onAttach")), ret());
  const auto stats = rw.rewrite(moved, fx.c.c1, RewriteRules{.repairSuper = true, .relocated = true});
  EXPECT_EQ(stats.superRemoved, 1u);
  ASSERT_EQ(moved.stmts.size(), 2u);
  EXPECT_EQ(moved.stmts[0]->kind, NodeKind::CommentStmt);
  ASSERT_EQ(fx.plan.warnings.size(), 1u);
  EXPECT_EQ(fx.plan.warnings[0], "super.onAttach() removed: no concrete implementation above app.C1");
}

TEST(CallSiteRewriter, SuperCallInConditionRemovesWholeIf) {
  RewriteFixture fx;
  obs::Metrics metrics;
  const hierarchy::Navigator nav(fx.c.model);
  CallSiteRewriter rw(fx.c.model, nav, fx.settings, fx.plan, &metrics);
  auto b = block(ifStmt(binary("==", superCall("ready"), lit("true", "boolean")), block(ret(lit("1", "int")))),
                 ret(lit("0", "int")));
  rw.rewrite(b, fx.c.c1, RewriteRules{.repairSuper = true, .relocated = true});
  ASSERT_EQ(b.stmts.size(), 2u);
  EXPECT_EQ(b.stmts[0]->kind, NodeKind::CommentStmt);
  EXPECT_EQ(b.stmts[1]->kind, NodeKind::ReturnStmt);
  ASSERT_EQ(fx.plan.warnings.size(), 1u);
  EXPECT_EQ(fx.plan.warnings[0], "if statement containing super.ready() in app.C1 was removed with both of its "
                                 "branches because the super call was in its condition");
  EXPECT_EQ(metrics.counter("migrate.supercalls.removed"), 1u);
}
