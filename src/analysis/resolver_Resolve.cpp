/**
 * @file
 * @brief MemberResolver receiver selection, static typing and node binding.
 */
#include "analysis/MemberResolver.h"

namespace pullup::analysis {

std::optional<model::ClassId> MemberResolver::receiverClass(const body::Expr* target,
                                                            const model::ClassId context) const {
  if (target == nullptr || target->kind == body::NodeKind::This) { return context; }
  if (target->kind == body::NodeKind::Super) { return model_.cls(context).superclass; }
  const auto type = staticType(*target, context);
  if (type.empty()) { return std::nullopt; }
  return model_.classForType(type);
}

std::string MemberResolver::staticType(const body::Expr& e, const model::ClassId context) const {
  switch (e.kind) {
    case body::NodeKind::This:
      return model_.cls(context).qualifiedName;
    case body::NodeKind::Super: {
      const auto sup = model_.cls(context).superclass;
      return sup ? model_.cls(*sup).qualifiedName : model_.types().topType;
    }
    case body::NodeKind::Name:
      return static_cast<const body::NameExpr&>(e).type;
    case body::NodeKind::Literal:
      return static_cast<const body::LiteralExpr&>(e).type;
    case body::NodeKind::New:
      return static_cast<const body::NewExpr&>(e).type;
    case body::NodeKind::Cast:
      return static_cast<const body::CastExpr&>(e).type;
    case body::NodeKind::FieldAccess: {
      const auto f = resolveField(static_cast<const body::FieldAccessExpr&>(e), context);
      return f ? model_.field(*f).type : std::string{};
    }
    case body::NodeKind::Call: {
      const auto m = resolveCall(static_cast<const body::CallExpr&>(e), context);
      return m ? model_.method(*m).returnType : std::string{};
    }
    case body::NodeKind::Binary: {
      const auto& b = static_cast<const body::BinaryExpr&>(e);
      static const char* const kBoolOps[] = {"==", "!=", "<", ">", "<=", ">=", "&&", "||", "instanceof"};
      for (const char* op : kBoolOps) {
        if (b.op == op) { return "boolean"; }
      }
      const auto lhs = b.lhs ? staticType(*b.lhs, context) : std::string{};
      const auto rhs = b.rhs ? staticType(*b.rhs, context) : std::string{};
      if (b.op == "+" && (model::TypeUniverse::simpleName(lhs) == "String" ||
                          model::TypeUniverse::simpleName(rhs) == "String")) {
        return "String";
      }
      return lhs;
    }
    default:
      return {};
  }
}

std::optional<model::MethodId> MemberResolver::resolveCall(const body::CallExpr& call,
                                                           const model::ClassId context) const {
  const auto start = receiverClass(call.target.get(), context);
  if (!start) { return std::nullopt; }
  std::vector<std::string> argTypes;
  argTypes.reserve(call.args.size());
  for (const auto& a : call.args) { argTypes.push_back(a ? staticType(*a, context) : std::string{}); }
  return lookupMethod(*start, call.name, argTypes);
}

std::optional<model::FieldId> MemberResolver::resolveField(const body::FieldAccessExpr& access,
                                                           const model::ClassId context) const {
  const auto start = receiverClass(access.target.get(), context);
  if (!start) { return std::nullopt; }
  return lookupField(*start, access.name);
}

} // namespace pullup::analysis
