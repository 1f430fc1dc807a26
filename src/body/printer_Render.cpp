/***
 * Name: pullup::body::Printer (impl)
 * Purpose: Java-like rendering of body nodes.
 */
#include "body/Printer.h"
#include "body/Visitor.h"
#include "pullup/support/text.h"
#include <sstream>

namespace pullup::body {

namespace {

constexpr int kIndentStep = 4;

std::string quote(const std::string& s) {
  std::string out = "\"";
  for (const char c : s) {
    if (c == '"' || c == '\\') { out.push_back('\\'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

class ExprWriter {
 public:
  std::ostringstream out;

  void write(const Expr& e) { dispatch(e, *this); }

  void writeOperand(const Expr& e) {
    const bool wrap = e.kind == NodeKind::Cast || e.kind == NodeKind::Binary;
    if (wrap) { out << "("; }
    write(e);
    if (wrap) { out << ")"; }
  }

  void writeArgs(const std::vector<std::unique_ptr<Expr>>& args) {
    out << "(";
    for (std::size_t i = 0; i < args.size(); ++i) {
      if (i != 0) { out << ", "; }
      if (args[i]) { write(*args[i]); }
    }
    out << ")";
  }

  void visit(ThisExpr&) { out << "this"; }
  void visit(SuperExpr&) { out << "super"; }
  void visit(NameExpr& n) { out << n.id; }
  void visit(LiteralExpr& n) { out << n.text; }
  void visit(FieldAccessExpr& n) {
    if (n.target) { writeOperand(*n.target); out << "."; }
    out << n.name;
  }
  void visit(CallExpr& n) {
    if (n.target) { writeOperand(*n.target); out << "."; }
    out << n.name;
    writeArgs(n.args);
  }
  void visit(NewExpr& n) {
    out << "new " << n.type;
    writeArgs(n.args);
  }
  void visit(CastExpr& n) {
    out << "(" << n.type << ") ";
    if (n.operand) { writeOperand(*n.operand); }
  }
  void visit(BinaryExpr& n) {
    if (n.lhs) { writeOperand(*n.lhs); }
    out << " " << n.op << " ";
    if (n.rhs) { writeOperand(*n.rhs); }
  }
  // Statements never reach the expression writer.
  void visit(ExprStmt&) {}
  void visit(ReturnStmt&) {}
  void visit(LocalVarStmt&) {}
  void visit(IfStmt&) {}
  void visit(ThrowStmt&) {}
  void visit(CommentStmt&) {}
};

class StmtWriter {
 public:
  std::ostringstream out;
  int indent{0};

  void pad() { out << std::string(static_cast<std::size_t>(indent), ' '); }

  void writeBlock(const Block& b) {
    for (const auto& s : b.stmts) {
      if (s) { dispatch(*s, *this); }
    }
  }

  void visit(ExprStmt& n) {
    pad();
    if (n.expr) { out << printExpr(*n.expr); }
    out << ";\n";
  }
  void visit(ReturnStmt& n) {
    pad();
    out << "return";
    if (n.value) { out << " " << printExpr(*n.value); }
    out << ";\n";
  }
  void visit(LocalVarStmt& n) {
    pad();
    out << n.type << " " << n.name;
    if (n.init) { out << " = " << printExpr(*n.init); }
    out << ";\n";
  }
  void visit(IfStmt& n) {
    pad();
    out << "if (" << (n.cond ? printExpr(*n.cond) : std::string{}) << ") {\n";
    indent += kIndentStep;
    writeBlock(n.thenBody);
    indent -= kIndentStep;
    pad();
    out << "}";
    if (!n.elseBody.empty()) {
      out << " else {\n";
      indent += kIndentStep;
      writeBlock(n.elseBody);
      indent -= kIndentStep;
      pad();
      out << "}";
    }
    out << "\n";
  }
  void visit(ThrowStmt& n) {
    pad();
    out << "throw new " << n.type << "(" << quote(n.message) << ");\n";
  }
  void visit(CommentStmt& n) {
    pad();
    out << "// " << n.text << "\n";
  }
  // Expressions are printed through printExpr.
  void visit(ThisExpr&) {}
  void visit(SuperExpr&) {}
  void visit(NameExpr&) {}
  void visit(LiteralExpr&) {}
  void visit(FieldAccessExpr&) {}
  void visit(CallExpr&) {}
  void visit(NewExpr&) {}
  void visit(CastExpr&) {}
  void visit(BinaryExpr&) {}
};

} // namespace

std::string printExpr(const Expr& e) {
  ExprWriter w;
  w.write(e);
  return w.out.str();
}

std::string printStmt(const Stmt& s, const int indent) {
  StmtWriter w;
  w.indent = indent;
  dispatch(s, w);
  return w.out.str();
}

std::string printBlock(const Block& b, const int indent) {
  StmtWriter w;
  w.indent = indent;
  w.writeBlock(b);
  return w.out.str();
}

std::string normalizedText(const Block& b) {
  return support::CollapseWhitespace(printBlock(b));
}

} // namespace pullup::body
