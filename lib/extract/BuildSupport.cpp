// swift_grapher/extract/BuildSupport.cpp - Shared text helpers for the readers
#include <string>

#include "swift_grapher/extract/decl_reader.hpp"

namespace swift_grapher
{

std::string_view trim(std::string_view s) noexcept
{
  constexpr std::string_view k_ws = " \t\r\n\f\v";
  const auto first = s.find_first_not_of(k_ws);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(k_ws);
  return s.substr(first, last - first + 1);
}

std::string_view DeclReader::node_text(ts_ll::Node n) const
{
  if (n.is_null()) {
    return {};
  }
  return n.text(source_);
}

std::string DeclReader::trimmed_text(ts_ll::Node n) const { return std::string(trim(node_text(n))); }

std::optional<std::string> DeclReader::non_empty_text(ts_ll::Node n) const
{
  std::string text = trimmed_text(n);
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

std::optional<std::pair<uint32_t, uint32_t>> DeclReader::field_span(
  ts_ll::Node n, std::string_view field) const
{
  std::optional<std::pair<uint32_t, uint32_t>> span;
  ts_ll::Cursor cursor(n);
  if (!cursor.goto_first_child()) {
    return span;
  }
  do {
    if (cursor.current_field_name() != field) continue;
    const ts_ll::Node c = cursor.current_node();
    if (!span) {
      span.emplace(c.start_byte(), c.end_byte());
    } else {
      span->second = c.end_byte();
    }
  } while (cursor.goto_next_sibling());
  return span;
}

}  // namespace swift_grapher
