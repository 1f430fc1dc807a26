/***
 * Name: test_orchestrator
 * Purpose: Verify request resolution, result reporting, collaborator sequencing and trace output.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "body/Factory.h"
#include "refactor/Orchestrator.h"
#include "util/Hierarchies.h"

using namespace pullup;
using namespace pullup::body;
using namespace testutil;
using refactor::ErrorKind;
using refactor::MigrationRequest;
using refactor::Orchestrator;

namespace {

MigrationRequest request(std::string origin, std::string method, std::optional<std::string> dest = std::nullopt) {
  MigrationRequest r;
  r.originClass = std::move(origin);
  r.methodName = std::move(method);
  r.destinationClass = std::move(dest);
  return r;
}

class Recorder final : public refactor::SnapshotStore,
                       public refactor::ModelWriter,
                       public refactor::ImportFixer,
                       public refactor::ManifestPatcher {
 public:
  std::vector<std::string> calls;
  bool failWrite{false};

  void save(const std::vector<std::string>& files) override {
    calls.push_back("save:" + std::to_string(files.size()));
  }
  void write(const model::Model& model, const model::ClassId cls) override {
    if (failWrite) { throw std::runtime_error("disk full"); }
    calls.push_back("write:" + model.cls(cls).qualifiedName);
  }
  void fix(const model::Model& model, const model::ClassId cls) override {
    calls.push_back("fix:" + model.cls(cls).qualifiedName);
  }
  void link(const std::string& fromModule, const std::string& toModule) override {
    calls.push_back("link:" + fromModule + "->" + toModule);
  }

  refactor::Collaborators all() { return refactor::Collaborators{this, this, this, this}; }
};

} // namespace

TEST(Orchestrator, MovesMethodAndReportsFiles) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  Orchestrator o;
  const auto r = o.migrate(c.model, request("C3", "m", "app.C1"));
  ASSERT_TRUE(r.success) << r.message;
  EXPECT_FALSE(r.error.has_value());
  EXPECT_EQ(r.message, "moved m() from app.C3 to app.C1");
  EXPECT_EQ(r.modifiedFiles, (std::vector<std::string>{"src/app/C1.java", "src/app/C3.java"}));
  EXPECT_EQ(r.mutatedClasses, (std::vector<std::string>{"app.C1", "app.C3"}));
  EXPECT_TRUE(r.visibilityChangedClasses.empty());
  EXPECT_TRUE(hasMethod(c.model, c.c1, "m"));
}

TEST(Orchestrator, DefaultDestinationIsDirectSuperclass) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  Orchestrator o;
  EXPECT_TRUE(o.migrate(c.model, request("app.C3", "m")).success);
  EXPECT_TRUE(hasMethod(c.model, c.c2, "m"));

  addConcrete(c.model, c.c1, "root", {}, "void", Visibility::Public, block());
  const auto r = o.migrate(c.model, request("app.C1", "root"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::NotAnAncestor);
}

TEST(Orchestrator, NotAnAncestorLeavesModelUntouched) {
  auto f = makeFork();
  addConcrete(f.model, f.left, "m", {}, "void", Visibility::Public, block());
  Orchestrator o;
  const auto r = o.migrate(f.model, request("zoo.Left", "m", "zoo.Right"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::NotAnAncestor);
  EXPECT_TRUE(r.modifiedFiles.empty());
  EXPECT_TRUE(hasMethod(f.model, f.left, "m"));
  EXPECT_FALSE(hasMethod(f.model, f.right, "m"));
}

TEST(Orchestrator, UnknownOrAmbiguousNamesFail) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  c.model.addClass("ui.Widget");
  c.model.addClass("net.Widget");
  Orchestrator o;
  EXPECT_EQ(o.migrate(c.model, request("Nope", "m")).error, ErrorKind::ClassNotFound);
  EXPECT_EQ(o.migrate(c.model, request("Widget", "m")).error, ErrorKind::ClassNotFound);
  EXPECT_EQ(o.migrate(c.model, request("app.C3", "missing")).error, ErrorKind::MethodNotFound);
  EXPECT_EQ(o.migrate(c.model, request("app.C3", "m", "Nope")).error, ErrorKind::ClassNotFound);

  auto withTypes = request("app.C3", "m", "app.C1");
  withTypes.parameterTypes = std::vector<std::string>{"int"};
  EXPECT_EQ(o.migrate(c.model, withTypes).error, ErrorKind::MethodNotFound);
}

TEST(Orchestrator, ParameterTypesSelectOverload) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {Param{"n", "int"}}, "void", Visibility::Public, block());
  addConcrete(c.model, c.c3, "m", {Param{"o", "app.C1"}}, "void", Visibility::Public, block());
  auto req = request("app.C3", "m", "app.C1");
  req.parameterTypes = std::vector<std::string>{"app.C1"};
  Orchestrator o;
  const auto r = o.migrate(c.model, req);
  ASSERT_TRUE(r.success) << r.message;
  EXPECT_EQ(r.message, "moved m(app.C1) from app.C3 to app.C1");
  EXPECT_TRUE(c.model.findMethod(c.c3, "m", {"int"}).has_value());
  EXPECT_FALSE(c.model.findMethod(c.c3, "m", {"app.C1"}).has_value());
}

TEST(Orchestrator, DuplicateIsSuccessfulNoOp) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(lit("1", "int"))));
  addConcrete(c.model, c.c1, "m", {}, "int", Visibility::Public, block(ret(lit("1", "int"))));
  Recorder rec;
  Orchestrator o({}, rec.all());
  const auto r = o.migrate(c.model, request("app.C3", "m", "app.C1"));
  EXPECT_TRUE(r.success);
  EXPECT_FALSE(r.error.has_value());
  EXPECT_EQ(r.message, "no change: the destination already has this method");
  EXPECT_EQ(r.warnings.size(), 1u);
  EXPECT_TRUE(r.modifiedFiles.empty());
  EXPECT_TRUE(rec.calls.empty());
  EXPECT_TRUE(hasMethod(c.model, c.c3, "m"));
}

TEST(Orchestrator, FieldClashSkipsOnlyThatField) {
  auto c = makeChain();
  c.model.addField(c.c3, model::FieldNode("a", "int", Visibility::Private));
  c.model.addField(c.c3, model::FieldNode("b", "int", Visibility::Private));
  c.model.addField(c.c1, model::FieldNode("a", "int", Visibility::Protected));
  addConcrete(c.model, c.c3, "sum", {}, "int", Visibility::Public,
              block(ret(binary("+", field("a"), field("b")))));
  Orchestrator o;
  const auto r = o.migrate(c.model, request("app.C3", "sum", "app.C1"));
  ASSERT_TRUE(r.success) << r.message;
  EXPECT_TRUE(hasMethod(c.model, c.c1, "sum"));
  EXPECT_TRUE(hasField(c.model, c.c1, "b"));
  EXPECT_FALSE(hasField(c.model, c.c3, "b"));
  EXPECT_TRUE(hasField(c.model, c.c3, "a"));
  EXPECT_EQ(r.warnings,
            (std::vector<std::string>{"field 'a' not moved: app.C1 already declares a field with that name"}));
}

TEST(Orchestrator, HardGatesReportTheirKind) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "int", Visibility::Public, block(ret(lit("1", "int"))));
  addConcrete(c.model, c.c1, "m", {}, "int", Visibility::Public, block(ret(lit("2", "int"))));
  addConcrete(c.model, c.c3, "g", {Param{"x", "lost.Ghost"}}, "void", Visibility::Public, block());
  addConcrete(c.model, c.c3, "take", {Param{"x", "app.C3"}}, "void", Visibility::Public, block());
  addConcrete(c.model, c.c1, "take", {Param{"x", "app.C1"}}, "void", Visibility::Public, block());
  Orchestrator o;
  EXPECT_EQ(o.migrate(c.model, request("app.C3", "m", "app.C1")).error, ErrorKind::SignatureConflict);
  EXPECT_EQ(o.migrate(c.model, request("app.C3", "g", "app.C1")).error, ErrorKind::UnresolvableType);
  EXPECT_EQ(o.migrate(c.model, request("app.C3", "take", "app.C1")).error, ErrorKind::OverloadAmbiguity);
  EXPECT_EQ(c.model.cls(c.c3).methods.size(), 3u);
  EXPECT_STREQ(refactor::to_string(ErrorKind::OverloadAmbiguity), "OverloadAmbiguity");
  EXPECT_STREQ(refactor::to_string(ErrorKind::MigrationError), "MigrationError");
}

TEST(Orchestrator, CollaboratorsRunInOrder) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  Recorder rec;
  Orchestrator o({}, rec.all());
  ASSERT_TRUE(o.migrate(c.model, request("app.C3", "m", "app.C1")).success);
  EXPECT_EQ(rec.calls, (std::vector<std::string>{"save:2", "write:app.C1", "write:app.C3", "fix:app.C1",
                                                 "fix:app.C3"}));
}

TEST(Orchestrator, CrossModuleMovePatchesManifest) {
  model::Model m;
  const auto base = m.addClass("core.Base", std::nullopt, "core", "core/src/Base.java");
  const auto impl = m.addClass("app.Impl", base, "app", "app/src/Impl.java");
  const auto id = addConcrete(m, impl, "run", {}, "void", Visibility::Protected, block());
  Recorder rec;
  Orchestrator o({}, rec.all());
  ASSERT_TRUE(o.migrate(m, request("app.Impl", "run", "core.Base")).success);
  ASSERT_FALSE(rec.calls.empty());
  EXPECT_EQ(rec.calls.back(), "link:app->core");
  const auto moved = m.findMethod(base, "run", {});
  ASSERT_TRUE(moved.has_value());
  EXPECT_EQ(m.method(*moved).visibility, Visibility::Public);
  EXPECT_FALSE(m.method(id).alive);
}

TEST(Orchestrator, CollaboratorFailureIsMigrationError) {
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  Recorder rec;
  rec.failWrite = true;
  Orchestrator o({}, rec.all());
  const auto r = o.migrate(c.model, request("app.C3", "m", "app.C1"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::MigrationError);
  EXPECT_NE(r.message.find("disk full"), std::string::npos);
}

TEST(Orchestrator, StaleOverrideMarkerIsCleared) {
  auto c = makeChain();
  const auto m = addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  const auto s = addConcrete(c.model, c.c3, "toString", {}, "Object", Visibility::Public, block(ret(lit("null", "Object"))));
  c.model.method(m).overrideMarker = true;
  c.model.method(s).overrideMarker = true;
  Orchestrator o;
  ASSERT_TRUE(o.migrate(c.model, request("app.C3", "m", "app.C1")).success);
  ASSERT_TRUE(o.migrate(c.model, request("app.C3", "toString", "app.C1")).success);
  EXPECT_FALSE(c.model.method(*c.model.findMethod(c.c1, "m", {})).overrideMarker);
  EXPECT_TRUE(c.model.method(*c.model.findMethod(c.c1, "toString", {})).overrideMarker);
}

TEST(Orchestrator, QueriesListChoices) {
  auto c = makeChain();
  c.model.addExternalClass("String");
  addConcrete(c.model, c.c3, "m", {Param{"n", "int"}, Param{"o", "app.C1"}}, "void", Visibility::Public, block());
  const Orchestrator o;
  EXPECT_EQ(o.classNames(c.model), (std::vector<std::string>{"app.C1", "app.C2", "app.C3"}));
  EXPECT_EQ(o.methodNames(c.model, "C3"), (std::vector<std::string>{"m(int,app.C1)"}));
  EXPECT_EQ(o.ancestorNames(c.model, "app.C3"), (std::vector<std::string>{"app.C2", "app.C1"}));
}

TEST(Orchestrator, MetricsAndTraceFiles) {
  namespace fs = std::filesystem;
  const auto dir = fs::temp_directory_path() / "pullup_orchestrator_trace";
  fs::remove_all(dir);
  refactor::Options opts;
  opts.metrics = true;
  opts.trace = true;
  opts.logPath = dir.string();
  auto c = makeChain();
  addConcrete(c.model, c.c3, "m", {}, "void", Visibility::Public, block());
  Orchestrator o(opts);
  ASSERT_TRUE(o.migrate(c.model, request("app.C3", "m", "app.C1")).success);
  EXPECT_EQ(o.metrics().counter("migrate.methods"), 1u);
  EXPECT_EQ(o.metrics().gauges().at("model.classes"), 3u);

  std::vector<std::string> suffixes;
  for (const auto& entry : fs::directory_iterator(dir)) {
    const auto name = entry.path().filename().string();
    for (const char* s : {"pullup.before.log", "pullup.after.log", "pullup.trace.log"}) {
      const std::string suffix(s);
      if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        suffixes.push_back(suffix);
      }
    }
  }
  EXPECT_EQ(suffixes.size(), 3u);
  fs::remove_all(dir);
}
