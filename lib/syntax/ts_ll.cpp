// swift_grapher/syntax/ts_ll.cpp - Swift grammar binding
#include "swift_grapher/syntax/ts_ll.hpp"

namespace swift_grapher::ts_ll
{

Parser::Parser() : parser_(ts_parser_new())
{
  const TSLanguage * swift = tree_sitter_swift();
  ready_ = parser_ != nullptr && swift != nullptr && ts_parser_set_language(parser_.get(), swift);
}

Tree Parser::parse(std::string_view utf8_source)
{
  if (!ready_) {
    return Tree();
  }
  return Tree(ts_parser_parse_string(
    parser_.get(), /*old_tree*/ nullptr, utf8_source.data(),
    static_cast<uint32_t>(utf8_source.size())));
}

}  // namespace swift_grapher::ts_ll
