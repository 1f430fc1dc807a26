/***
 * Name: test_navigator
 * Purpose: Validate ancestor, descendant and path queries.
 */
#include <gtest/gtest.h>
#include "hierarchy/Navigator.h"
#include "util/Hierarchies.h"

using namespace pullup;
using namespace testutil;

TEST(Navigator, AncestorsNearestFirst) {
  auto c = makeChain();
  const hierarchy::Navigator nav(c.model);
  const auto anc = nav.ancestorsOf(c.c3);
  ASSERT_EQ(anc.size(), 2u);
  EXPECT_EQ(anc[0], c.c2);
  EXPECT_EQ(anc[1], c.c1);
  EXPECT_TRUE(nav.ancestorsOf(c.c1).empty());
}

TEST(Navigator, AncestorsAreDeterministicAndIdempotent) {
  auto f = makeFork();
  const hierarchy::Navigator nav(f.model);
  const auto first = nav.ancestorsOf(f.leftChild);
  for (int i = 0; i < 3; ++i) { EXPECT_EQ(nav.ancestorsOf(f.leftChild), first); }
}

TEST(Navigator, ModeledTopTypeIsExcluded) {
  model::Model m;
  const auto top = m.addExternalClass("java.lang.Object");
  const auto a = m.addClass("A", top);
  const auto b = m.addClass("B", a);
  const hierarchy::Navigator nav(m);
  const auto anc = nav.ancestorsOf(b);
  ASSERT_EQ(anc.size(), 1u);
  EXPECT_EQ(anc[0], a);
  EXPECT_FALSE(nav.superclassOf(a).has_value());
  EXPECT_FALSE(nav.isAncestor(top, b));
}

TEST(Navigator, DescendantsBreadthFirst) {
  auto f = makeFork();
  const hierarchy::Navigator nav(f.model);
  const auto d = nav.descendantsOf(f.base);
  ASSERT_EQ(d.size(), 3u);
  EXPECT_EQ(d[0], f.left);
  EXPECT_EQ(d[1], f.right);
  EXPECT_EQ(d[2], f.leftChild);
  EXPECT_TRUE(nav.descendantsOf(f.right).empty());
  EXPECT_EQ(nav.directSubclasses(f.base).size(), 2u);
}

TEST(Navigator, IsAncestorAndPath) {
  auto c = makeChain();
  const hierarchy::Navigator nav(c.model);
  EXPECT_TRUE(nav.isAncestor(c.c1, c.c3));
  EXPECT_FALSE(nav.isAncestor(c.c3, c.c1));
  EXPECT_FALSE(nav.isAncestor(c.c2, c.c2));
  const auto path = nav.pathBetween(c.c3, c.c1);
  ASSERT_EQ(path.size(), 1u);
  EXPECT_EQ(path[0], c.c2);
  EXPECT_TRUE(nav.pathBetween(c.c3, c.c2).empty());
  EXPECT_TRUE(nav.pathBetween(c.c1, c.c3).empty());
}
