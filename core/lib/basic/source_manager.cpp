// pilc/basic/source_manager.cpp - PIL source texts and line lookup
#include "pilc/basic/source_manager.hpp"

#include <algorithm>

namespace pilc
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

std::pair<uint32_t, uint32_t> SourceFile::position(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  // line_starts_ begins with 0, so the predecessor always exists
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line = static_cast<uint32_t>(next - line_starts_.begin());
  return {line, offset - line_starts_[line - 1] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }
  const std::string_view rest = std::string_view(content_).substr(line_starts_[line_index]);
  return rest.substr(0, rest.find('\n'));
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }
  const auto [start_line, start_column] = position(range.get_begin().offset());
  const auto [end_line, end_column] = position(range.get_end().offset());
  return FullSourceRange{start_line, start_column, end_line, end_column};
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }
  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_empty;
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : k_empty;
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_full_range(range) : FullSourceRange{};
}

}  // namespace pilc
