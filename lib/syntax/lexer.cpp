// asdl/syntax/lexer.cpp - Schema text to token stream
#include "asdl/syntax/lexer.hpp"

#include <cctype>

namespace asdl::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

bool is_utf8_continuation(unsigned char c) { return (c & 0xC0U) == 0x80U; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::lex_line_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  return make_token(TokenKind::LineComment, start);
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }
  if (starts_with("*/")) {
    advance(2);
    return make_token(TokenKind::BlockComment, start);
  }

  // Unterminated: the whole tail becomes one Unknown token.
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  if (starts_with("--")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }

  TokenKind kind = TokenKind::Unknown;
  switch (c) {
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case '{':
      kind = TokenKind::LBrace;
      break;
    case '}':
      kind = TokenKind::RBrace;
      break;
    case '|':
      kind = TokenKind::Pipe;
      break;
    case '*':
      kind = TokenKind::Star;
      break;
    case '?':
      kind = TokenKind::Question;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case '=':
      kind = TokenKind::Eq;
      break;
    case '.':
      kind = TokenKind::Dot;
      break;
    default:
      break;
  }

  advance(1);
  if (kind == TokenKind::Unknown) {
    // Keep a multi-byte UTF-8 character in one token.
    while (!eof() && is_utf8_continuation(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }
  return make_token(kind, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 4 + 1);
  while (true) {
    Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace asdl::syntax
