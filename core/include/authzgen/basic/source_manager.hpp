// authzgen/basic/source_manager.hpp - Source files, locations and ranges
//
// Schema text is registered once per compile in a SourceRegistry. Tokens,
// AST nodes and diagnostics refer back to it through compact byte ranges.
//
#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace authzgen
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

/**
 * Index of a file registered in a SourceRegistry.
 */
struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint16_t v) noexcept : value(v) {}

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
  [[nodiscard]] constexpr bool operator<(FileId other) const noexcept
  {
    return value < other.value;
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
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }
  /// Orders by file first, then by offset. Invalid locations sort last.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_ != other.file_) {
      return file_ < other.file_;
    }
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end) inside a single file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : begin_(file, begin), end_(file, end)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.offset() - begin_.offset() : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// Smallest range covering both inputs. Falls back to whichever side is valid.
[[nodiscard]] inline SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (!a.is_valid()) {
    return b;
  }
  if (!b.is_valid() || a.file_id() != b.file_id()) {
    return a;
  }
  const uint32_t begin = std::min(a.get_begin().offset(), b.get_begin().offset());
  const uint32_t end = std::max(a.get_end().offset(), b.get_end().offset());
  return {a.file_id(), begin, end};
}

// ============================================================================
// LineColumn / FullSourceRange
// ============================================================================

/**
 * Human-readable position (1-indexed, 0 = invalid).
 */
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Text of a line (0-indexed) without its trailing newline.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns every SourceFile of a compile and maps FileId back to content.
 *
 * Registering the same normalized path twice returns the existing id.
 */
/// Unregistered input: a path for diagnostics and the text read from it.
struct SourceText
{
  fs::path path;
  std::string text;
};

class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  [[nodiscard]] FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace authzgen
