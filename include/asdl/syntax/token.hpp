// asdl/syntax/token.hpp - Token kinds of the schema language
#pragma once

#include <cstdint>
#include <string_view>

#include "asdl/basic/source_manager.hpp"

namespace asdl::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // invalid character or unterminated block comment

  // Comments are emitted so tools can preserve them; the parser drops them.
  LineComment,   // -- ...
  BlockComment,  // /* ... */

  Identifier,  // also `module` and `attributes`, recognised by the parser

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,

  Pipe,
  Star,
  Question,
  Comma,
  Eq,
  Dot,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source
  std::string_view text;  // slice view

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }

  [[nodiscard]] bool is_comment() const noexcept
  {
    return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Star:
      return "*";
    case TokenKind::Question:
      return "?";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Dot:
      return ".";
  }
  return "";
}

}  // namespace asdl::syntax
