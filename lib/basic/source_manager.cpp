// swift_grapher/basic/source_manager.cpp - Line tables and path-keyed registry
#include "swift_grapher/basic/source_manager.hpp"

#include <algorithm>
#include <system_error>

namespace swift_grapher
{

namespace
{

// UTF-8 continuation bytes look like 10xxxxxx.
bool is_continuation_byte(char c) { return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U; }

uint32_t count_scalars(std::string_view text)
{
  return static_cast<uint32_t>(
    std::count_if(text.begin(), text.end(), [](char c) { return !is_continuation_byte(c); }));
}

std::string registry_key(const fs::path & path)
{
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec) {
    resolved = path.lexically_normal();
  }
  return resolved.generic_string();
}

}  // namespace

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  for (auto pos = content_.find('\n'); pos != std::string::npos;
       pos = content_.find('\n', pos + 1)) {
    line_starts_.push_back(static_cast<uint32_t>(pos + 1));
  }
}

LineColumn SourceFile::locate(uint32_t offset) const noexcept
{
  const auto end = static_cast<uint32_t>(content_.size());
  offset = std::min(offset, end);

  // Last line start that is <= offset.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
  const uint32_t start = line_starts_[line_index];

  const std::string_view prefix = std::string_view(content_).substr(start, offset - start);
  return {line_index + 1, count_scalars(prefix) + 1};
}

std::string_view SourceFile::line_text(uint32_t line) const noexcept
{
  if (line == 0 || line > line_starts_.size()) {
    return {};
  }
  const uint32_t start = line_starts_[line - 1];
  const uint32_t stop =
    line < line_starts_.size() ? line_starts_[line] : static_cast<uint32_t>(content_.size());

  std::string_view text = std::string_view(content_).substr(start, stop - start);
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view SourceFile::get_slice(uint32_t begin, uint32_t end) const noexcept
{
  const auto size = static_cast<uint32_t>(content_.size());
  end = std::min(end, size);
  if (begin >= end) {
    return {};
  }
  return std::string_view(content_).substr(begin, end - begin);
}

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  std::string key = registry_key(path);
  if (const auto it = ids_by_path_.find(key); it != ids_by_path_.end()) {
    return it->second;
  }
  if (files_.size() >= FileId::k_invalid) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  ids_by_path_.emplace(std::move(key), id);
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  return id.is_valid() && id.value < files_.size() ? files_[id.value].get() : nullptr;
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_no_path;
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : k_no_path;
}

std::optional<FileId> SourceRegistry::find_by_path(const fs::path & path) const
{
  const auto it = ids_by_path_.find(registry_key(path));
  if (it == ids_by_path_.end()) {
    return std::nullopt;
  }
  return it->second;
}

LineColumn SourceRegistry::locate(SourceLocation loc) const noexcept
{
  const SourceFile * file = get_file(loc.file_id());
  if (file == nullptr || !loc.is_valid()) {
    return {};
  }
  return file->locate(loc.offset());
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

}  // namespace swift_grapher
