// asdl/syntax/lexer.hpp - Schema text to token stream
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "asdl/syntax/token.hpp"

namespace asdl::syntax
{

/**
 * Hand-written lexer for schema text.
 *
 * Never fails: invalid input becomes TokenKind::Unknown tokens, which the
 * front end reports as LexError. The stream always ends with one Eof token.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_identifier();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace asdl::syntax
