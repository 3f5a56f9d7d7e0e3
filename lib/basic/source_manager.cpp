// asdl/basic/source_manager.cpp - Source file and registry implementation
#include "asdl/basic/source_manager.hpp"

#include <algorithm>

namespace asdl
{

SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.file_id(), a.get_begin(), b.get_end()};
}

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(std::string name, std::string text)
: name_(std::move(name)), text_(std::move(text))
{
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > text_.size()) {
    offset = static_cast<uint32_t>(text_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(text_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && text_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(text_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const auto start = range.get_begin().offset();
  auto end = range.get_end().offset();
  if (start >= text_.size()) {
    return {};
  }
  if (end > text_.size()) {
    end = static_cast<uint32_t>(text_.size());
  }
  return std::string_view(text_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().offset();
  result.end_byte = range.get_end().offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::add_file(std::string name, std::string text)
{
  if (files_.size() >= static_cast<size_t>(FileId::k_invalid_value)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint32_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(name), std::move(text)));
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid()) {
    return nullptr;
  }
  const auto idx = static_cast<size_t>(id.value());
  if (idx >= files_.size()) {
    return nullptr;
  }
  return files_[idx].get();
}

std::string_view SourceRegistry::get_name(FileId id) const noexcept
{
  const auto * f = get_file(id);
  return f ? std::string_view(f->name()) : std::string_view("<unknown>");
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const auto * f = get_file(range.file_id());
  if (f == nullptr) {
    return {};
  }
  return f->get_full_range(range);
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const auto * f = get_file(range.file_id());
  if (f == nullptr) {
    return {};
  }
  return f->get_slice(range);
}

}  // namespace asdl
