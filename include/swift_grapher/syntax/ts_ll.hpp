// swift_grapher/syntax/ts_ll.hpp - Thin C++ layer over the tree-sitter C API
//
// Node is a value (TSNode is a small struct that borrows from its tree);
// Parser, Tree and Cursor own tree-sitter allocations and are not copyable.
//
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <memory>
#include <string_view>

#include "swift_grapher/basic/source_manager.hpp"

namespace swift_grapher::ts_ll
{

// Provided by the tree-sitter-swift grammar library.
extern "C" const TSLanguage * tree_sitter_swift();

class Node
{
public:
  Node() = default;
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  /// False for anonymous tokens such as keywords and punctuation.
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }
  /// True when this node or any descendant is an ERROR or MISSING node.
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }

  /// Grammar symbol name, e.g. "class_declaration" or "simple_identifier".
  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * name = ts_node_type(node_);
    return name != nullptr ? std::string_view(name) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }
  [[nodiscard]] SourceRange range(FileId file) const noexcept
  {
    return {file, start_byte(), end_byte()};
  }
  [[nodiscard]] std::string_view text(const SourceFile & file) const noexcept
  {
    return file.get_slice(start_byte(), end_byte());
  }

  // Anonymous children (keywords, punctuation) are counted by child_count()
  // only; the extractors mostly look at named children.
  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] Node child(uint32_t index) const noexcept
  {
    return Node(ts_node_child(node_, index));
  }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return ts_node_named_child_count(node_);
  }
  [[nodiscard]] Node named_child(uint32_t index) const noexcept
  {
    return Node(ts_node_named_child(node_, index));
  }

  /// Child stored under a grammar field such as "name" or "body"; a null
  /// node when the field is absent.
  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_{};
};

/// Preorder walker. Needed where a grammar field is repeated (several
/// `name` children in one declaration), which child_by_field cannot express.
class Cursor
{
public:
  explicit Cursor(Node start) : cursor_(ts_tree_cursor_new(start.raw())) {}
  Cursor(const Cursor &) = delete;
  Cursor & operator=(const Cursor &) = delete;
  ~Cursor() { ts_tree_cursor_delete(&cursor_); }

  [[nodiscard]] Node current_node() const noexcept
  {
    return Node(ts_tree_cursor_current_node(&cursor_));
  }
  /// Field the current node occupies in its parent; empty when none.
  [[nodiscard]] std::string_view current_field_name() const noexcept
  {
    const char * field = ts_tree_cursor_current_field_name(&cursor_);
    return field != nullptr ? std::string_view(field) : std::string_view();
  }

  [[nodiscard]] bool goto_first_child() noexcept { return ts_tree_cursor_goto_first_child(&cursor_); }
  [[nodiscard]] bool goto_next_sibling() noexcept
  {
    return ts_tree_cursor_goto_next_sibling(&cursor_);
  }
  [[nodiscard]] bool goto_parent() noexcept { return ts_tree_cursor_goto_parent(&cursor_); }

private:
  TSTreeCursor cursor_;
};

class Tree
{
public:
  Tree() = default;
  explicit Tree(TSTree * tree) : tree_(tree) {}

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }
  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ != nullptr ? Node(ts_tree_root_node(tree_.get())) : Node();
  }

private:
  struct Deleter
  {
    void operator()(TSTree * tree) const noexcept { ts_tree_delete(tree); }
  };
  std::unique_ptr<TSTree, Deleter> tree_;
};

/// A parser bound to the Swift grammar. One per thread: TSParser is not
/// safe to share.
class Parser
{
public:
  Parser();

  /// False when the grammar was generated for an incompatible tree-sitter ABI.
  [[nodiscard]] bool is_ready() const noexcept { return ready_; }

  /// A null Tree when the parser is not ready or tree-sitter gave up.
  [[nodiscard]] Tree parse(std::string_view utf8_source);

private:
  struct Deleter
  {
    void operator()(TSParser * parser) const noexcept { ts_parser_delete(parser); }
  };
  std::unique_ptr<TSParser, Deleter> parser_;
  bool ready_ = false;
};

}  // namespace swift_grapher::ts_ll
