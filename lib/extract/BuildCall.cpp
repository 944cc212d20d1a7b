// swift_grapher/extract/BuildCall.cpp - Call expressions
#include <string>

#include "swift_grapher/extract/decl_reader.hpp"
#include "swift_grapher/syntax/swift_node_kinds.hpp"

namespace swift_grapher
{

std::optional<std::string> DeclReader::read_callee(ts_ll::Node call_expr) const
{
  // call_expression = callee call_suffix; the callee has no field name, it is
  // the first named child.
  if (call_expr.named_child_count() == 0) {
    return std::nullopt;
  }
  const ts_ll::Node callee = call_expr.named_child(0);
  if (callee.kind() == node_kind::k_call_suffix) {
    return std::nullopt;
  }
  return non_empty_text(callee);
}

}  // namespace swift_grapher
