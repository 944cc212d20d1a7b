// swift_grapher/basic/source_manager.hpp - Registered Swift sources and byte ranges
//
// Tree-sitter reports byte offsets. The graph never needs positions, but
// diagnostics do: a SourceRange is a pair of offsets tagged with the FileId
// of the file it was taken from, and the SourceRegistry turns it back into
// a line number and a column counted in Unicode scalars.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace swift_grapher
{

namespace fs = std::filesystem;

/// Index of a file inside its SourceRegistry.
struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  friend constexpr bool operator==(FileId a, FileId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(FileId a, FileId b) noexcept { return a.value != b.value; }
};

class SourceLocation
{
public:
  static constexpr uint32_t k_no_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_no_offset;
  }

  friend constexpr bool operator==(SourceLocation a, SourceLocation b) noexcept
  {
    return a.file_ == b.file_ && a.offset_ == b.offset_;
  }
  friend constexpr bool operator!=(SourceLocation a, SourceLocation b) noexcept
  {
    return !(a == b);
  }
  /// File order first, byte order inside a file.
  friend constexpr bool operator<(SourceLocation a, SourceLocation b) noexcept
  {
    return a.file_.value != b.file_.value ? a.file_.value < b.file_.value
                                          : a.offset_ < b.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_no_offset;
};

/// Half-open byte range [begin, end) of one file.
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : file_(file), begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return {file_, begin_}; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return {file_, end_}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && begin_ != SourceLocation::k_no_offset &&
           end_ != SourceLocation::k_no_offset;
  }
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() && end_ > begin_ ? end_ - begin_ : 0;
  }

private:
  FileId file_;
  uint32_t begin_ = SourceLocation::k_no_offset;
  uint32_t end_ = SourceLocation::k_no_offset;
};

/// 1-based line and column. Columns count Unicode scalars, not bytes, so
/// `let ü = 1` puts `=` in column 7. Zero means "unknown".
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0 && column != 0; }
};

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  /// Offsets past the end resolve to the position after the last byte.
  [[nodiscard]] LineColumn locate(uint32_t offset) const noexcept;

  /// Text of a 1-based line without its line terminator ("" when out of range).
  [[nodiscard]] std::string_view line_text(uint32_t line) const noexcept;

  [[nodiscard]] std::string_view get_slice(uint32_t begin, uint32_t end) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept
  {
    return range.is_valid() ? get_slice(range.get_begin().offset(), range.get_end().offset())
                            : std::string_view{};
  }

private:
  fs::path path_;
  std::string content_;
  /// Byte offset of the first character of every line.
  std::vector<uint32_t> line_starts_;
};

/// Owns every file read during one run. Not copyable: SourceFile pointers
/// handed out stay valid for the registry's lifetime.
class SourceRegistry
{
public:
  SourceRegistry() = default;
  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Adds a file, or returns the id it already has when the same path (after
  /// normalization) was registered before. FileId::invalid() when full.
  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] LineColumn locate(SourceLocation loc) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::map<std::string, FileId, std::less<>> ids_by_path_;
};

}  // namespace swift_grapher
