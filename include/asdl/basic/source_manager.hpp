// asdl/basic/source_manager.hpp - Source location, range and file registry
//
// Schema texts are registered in a SourceRegistry and addressed by FileId.
// Tokens and declarations only carry byte offsets; line/column information
// is computed on demand.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace asdl
{

// ============================================================================
// FileId - Handle to a registered source
// ============================================================================

class FileId
{
public:
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid_value; }
  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value_ != other.value_;
  }

private:
  uint32_t value_ = k_invalid_value;
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into a source file.
 *
 * Line and column information can be computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - File plus half-open byte interval [start, end)
// ============================================================================

class SourceRange
{
public:
  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : file_(file), start_(start_offset), end_(end_offset)
  {
  }

  constexpr SourceRange(FileId file, SourceLocation start, SourceLocation end) noexcept
  : file_(file), start_(start), end_(end)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  /// Size in bytes (0 for invalid ranges)
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.offset() - start_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_ == other.file_ && start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_;
  SourceLocation start_;
  SourceLocation end_;
};

/// Smallest range covering both a and b (same file expected).
[[nodiscard]] SourceRange join_ranges(SourceRange a, SourceRange b) noexcept;

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Source range with pre-computed line/column information, used by
 * diagnostics rendering.
 */
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
// SourceFile - One registered schema text
// ============================================================================

class SourceFile
{
public:
  SourceFile(std::string name, std::string text);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] size_t size() const noexcept { return text_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without the trailing newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::string name_;
  std::string text_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - All sources of one load
// ============================================================================

/**
 * Owns the schema texts of a load and hands out stable FileIds.
 *
 * Registered files are never removed, so string_views into their text stay
 * valid for the lifetime of the registry.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  FileId add_file(std::string name, std::string text);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] std::string_view get_name(FileId id) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  // unique_ptr keeps SourceFile addresses (and their text buffers) stable.
  std::vector<std::unique_ptr<SourceFile>> files_;
};

}  // namespace asdl
