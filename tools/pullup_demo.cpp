/**
 * Pull-up demo: builds a small shape hierarchy, moves Rectangle.describe()
 * into Shape and prints the classes before and after.
 * Usage: pullup_demo [--json] [--trace <dir>]
 */
#include "body/Factory.h"
#include "observability/ModelPrinter.h"
#include "pullup/exceptions/config_error.h"
#include "refactor/Orchestrator.h"
#include <iostream>
#include <string>

using namespace pullup;

static model::Model buildShapes() {
  using namespace pullup::body;
  using model::Param;
  using model::Visibility;
  model::Model m;
  m.addExternalClass("String");
  const auto shape = m.addClass("geo.Shape", std::nullopt, "core", "core/src/geo/Shape.java");
  const auto polygon = m.addClass("geo.Polygon", shape, "core", "core/src/geo/Polygon.java");
  const auto rect = m.addClass("geo.Rectangle", polygon, "core", "core/src/geo/Rectangle.java");
  const auto circle = m.addClass("geo.Circle", shape, "core", "core/src/geo/Circle.java");

  m.addField(rect, model::FieldNode("label", "String", Visibility::Private, lit("\"rect\"", "String")));
  m.addField(rect, model::FieldNode("width", "double", Visibility::Private));
  m.addField(rect, model::FieldNode("height", "double", Visibility::Private));
  m.addMethod(rect, model::MethodNode::concrete("area", {}, "double", Visibility::Public,
                                                block(ret(binary("*", field("width"), field("height"))))));
  m.addMethod(circle, model::MethodNode::concrete("area", {}, "double", Visibility::Public,
                                                  block(ret(lit("3.14", "double")))));
  m.addMethod(rect, model::MethodNode::concrete(
                        "describe", {}, "String", Visibility::Public,
                        block(ret(binary("+", field("label"), call("area"))))));
  m.addMethod(rect, model::MethodNode::concrete(
                        "register", {Param{"registry", "geo.Registry"}}, "void", Visibility::Public,
                        block(exprStmt(call(name("registry", "geo.Registry"), "add", args(self()))))));
  const auto registry = m.addClass("geo.Registry", std::nullopt, "core", "core/src/geo/Registry.java");
  m.addMethod(registry, model::MethodNode::concrete("add", {Param{"r", "geo.Rectangle"}}, "void",
                                                    Visibility::Public, block()));
  return m;
}

int main(int argc, char** argv) {
  refactor::Options opts;
  opts.metrics = true;
  bool json = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--json") { json = true; }
    else if (arg == "--trace" && i + 1 < argc) { opts.trace = true; opts.logPath = argv[++i]; }
    else {
      std::cerr << "usage: pullup_demo [--json] [--trace <dir>]\n";
      return 2;
    }
  }
  opts = refactor::Options::fromEnvironment(opts);

  try {
    auto shapes = buildShapes();
    refactor::Orchestrator orchestrator(opts);
    std::cout << "== before ==\n" << obs::ModelPrinter(shapes).print() << "\n";

    const auto first = orchestrator.migrate(shapes, {"Rectangle", "describe", std::nullopt, std::string("Shape")});
    const auto second = orchestrator.migrate(shapes, {"Rectangle", "register", std::nullopt, std::nullopt});

    std::cout << "== after ==\n" << obs::ModelPrinter(shapes).print() << "\n";
    for (const auto* r : {&first, &second}) {
      std::cout << (r->success ? "ok: " : "failed: ") << r->message << "\n";
      if (r->error) { std::cout << "  error: " << refactor::to_string(*r->error) << "\n"; }
      for (const auto& w : r->warnings) { std::cout << "  warning: " << w << "\n"; }
      for (const auto& f : r->modifiedFiles) { std::cout << "  modified: " << f << "\n"; }
    }
    std::cout << (json ? orchestrator.metrics().summaryJson() : orchestrator.metrics().summaryText());
    return first.success && second.success ? 0 : 1;
  } catch (const exceptions::ConfigError& e) {
    std::cerr << "pullup_demo: " << e.what() << "\n";
    return 2;
  }
}
