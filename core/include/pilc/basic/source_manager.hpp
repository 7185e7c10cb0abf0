// pilc/basic/source_manager.hpp - Source location and range management
//
// Byte-offset ranges attached to PIL AST nodes, and the registry of PIL
// source texts that turns them into lines for diagnostics and SourceRefs.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pilc
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * A byte offset inside a registered file.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }

  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_.value != other.file_.value) return file_.value < other.file_.value;
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - half-open [begin, end)
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(file, start_offset), end_(file, end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }

  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return start_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// FullSourceRange
// ============================================================================

/// 1-indexed lines and columns of a range (0 = unknown)
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * One PIL source text with the byte offset of each line start.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Content of a 0-indexed line without the trailing newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  /// 1-indexed line and column of a byte offset, clamped to the content
  [[nodiscard]] std::pair<uint32_t, uint32_t> position(uint32_t offset) const noexcept;

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns the PIL sources of one analysis and hands out FileIds.
 */
class SourceRegistry
{
public:
  /// Returns FileId::invalid() once every id is taken
  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;

  /// Empty path for unknown ids
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  /// 1-indexed line where `range` starts, 0 if unknown
  [[nodiscard]] uint32_t line_of(SourceRange range) const noexcept
  {
    return get_full_range(range).start_line;
  }

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
};

}  // namespace pilc
