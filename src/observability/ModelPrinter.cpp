/***
 * Name: pullup::obs::ModelPrinter (impl)
 * Purpose: Java-like class rendering.
 */
#include "observability/ModelPrinter.h"
#include "body/Printer.h"
#include <sstream>

namespace pullup::obs {

namespace {
constexpr int kMemberIndent = 4;
constexpr int kBodyIndent = 8;

void modifiers(std::ostringstream& oss, const model::Visibility v) {
  const std::string kw = model::keyword(v);
  if (!kw.empty()) { oss << kw << " "; }
}
} // namespace

std::string ModelPrinter::printClass(const model::ClassId cls) const {
  const auto& c = model_.cls(cls);
  std::ostringstream oss;
  if (!c.module.empty()) { oss << "// module: " << c.module << "\n"; }
  oss << "public ";
  if (c.isAbstract) { oss << "abstract "; }
  oss << "class " << c.simpleName();
  if (c.superclass) { oss << " extends " << model_.cls(*c.superclass).simpleName(); }
  oss << " {\n";
  const std::string pad(kMemberIndent, ' ');
  for (const auto fid : c.fields) {
    const auto& f = model_.field(fid);
    oss << pad;
    modifiers(oss, f.visibility);
    if (f.isStatic) { oss << "static "; }
    oss << f.type << " " << f.name;
    if (f.initializer) { oss << " = " << body::printExpr(*f.initializer); }
    oss << ";\n";
  }
  for (const auto mid : c.methods) {
    const auto& m = model_.method(mid);
    if (m.overrideMarker) { oss << pad << "@Override\n"; }
    oss << pad;
    modifiers(oss, m.visibility);
    if (m.isStatic) { oss << "static "; }
    if (m.isAbstract) { oss << "abstract "; }
    if (m.isFinal) { oss << "final "; }
    oss << m.returnType << " " << m.name << "(";
    for (std::size_t i = 0; i < m.params.size(); ++i) {
      if (i != 0) { oss << ", "; }
      oss << m.params[i].type << " " << m.params[i].name;
    }
    oss << ")";
    if (!m.hasBody()) {
      oss << ";\n";
      continue;
    }
    oss << " {\n" << body::printBlock(*m.body, kBodyIndent) << pad << "}\n";
  }
  oss << "}\n";
  return oss.str();
}

std::string ModelPrinter::print() const {
  std::ostringstream oss;
  bool first = true;
  for (const auto id : model_.classIds()) {
    if (model_.cls(id).external) { continue; }
    if (!first) { oss << "\n"; }
    first = false;
    oss << printClass(id);
  }
  return oss.str();
}

} // namespace pullup::obs
