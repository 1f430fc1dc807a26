/***
 * Name: test_model_printer
 * Purpose: Validate the Java-like rendering of classes used for trace dumps.
 */
#include <gtest/gtest.h>
#include "body/Factory.h"
#include "observability/ModelPrinter.h"

using namespace pullup;
using namespace pullup::body;

TEST(ModelPrinter, RendersClassWithMembers) {
  model::Model m;
  const auto base = m.addClass("geo.Shape", std::nullopt, "core");
  const auto rect = m.addClass("geo.Rect", base, "core");
  m.cls(base).isAbstract = true;
  m.addField(rect, model::FieldNode("w", "int", model::Visibility::Protected, lit("0", "int")));
  m.addMethod(base, model::MethodNode::abstractDecl("area", {}, "int", model::Visibility::Public));
  auto area = model::MethodNode::concrete("area", {}, "int", model::Visibility::Public,
                                          block(ret(binary("*", field("w"), field("w")))));
  area.overrideMarker = true;
  m.addMethod(rect, std::move(area));

  const obs::ModelPrinter p(m);
  EXPECT_EQ(p.printClass(base),
            "// module: core\n"
            "public abstract class Shape {\n"
            "    public abstract int area();\n"
            "}\n");
  EXPECT_EQ(p.printClass(rect),
            "// module: core\n"
            "public class Rect extends Shape {\n"
            "    protected int w = 0;\n"
            "    @Override\n"
            "    public int area() {\n"
            "        return w * w;\n"
            "    }\n"
            "}\n");
}

TEST(ModelPrinter, SkipsExternalClasses) {
  model::Model m;
  const auto lib = m.addExternalClass("lib.Base");
  m.addClass("app.Impl", lib);
  const obs::ModelPrinter p(m);
  const auto text = p.print();
  EXPECT_EQ(text.find("class Base"), std::string::npos);
  EXPECT_NE(text.find("public class Impl extends Base {"), std::string::npos);
}
