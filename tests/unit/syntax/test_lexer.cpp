#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "asdl/syntax/lexer.hpp"
#include "asdl/syntax/token.hpp"

using asdl::FileId;
using asdl::syntax::Lexer;
using asdl::syntax::Token;
using asdl::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds_of(std::string_view src)
{
  Lexer lex(FileId(0), src);
  std::vector<TokenKind> out;
  for (const auto & t : lex.lex_all()) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, EmitsLineAndBlockCommentsAsTokens)
{
  const std::string_view src =
    "-- line\n"
    "/* block */\n"
    "module m { -- trailing\n"
    "  t = /* inline */ A\n"
    "}\n";

  Lexer lex(FileId(0), src);
  const auto toks = lex.lex_all();

  int line_comment_count = 0;
  int block_comment_count = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::LineComment) {
      ++line_comment_count;
    }
    if (t.kind == TokenKind::BlockComment) {
      ++block_comment_count;
    }
  }
  EXPECT_EQ(line_comment_count, 2);
  EXPECT_EQ(block_comment_count, 2);
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, PunctuationAndIdentifiers)
{
  const auto kinds = kinds_of("t = A(int* xs, core.tok? y) | B { }");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Eq,       TokenKind::Identifier, TokenKind::LParen,
    TokenKind::Identifier, TokenKind::Star,     TokenKind::Identifier, TokenKind::Comma,
    TokenKind::Identifier, TokenKind::Dot,      TokenKind::Identifier, TokenKind::Question,
    TokenKind::Identifier, TokenKind::RParen,   TokenKind::Pipe,       TokenKind::Identifier,
    TokenKind::LBrace,     TokenKind::RBrace,   TokenKind::Eof,
  };
  EXPECT_EQ(kinds, expected);
}

TEST(SyntaxLexer, TokenTextAndRange)
{
  Lexer lex(FileId(3), "  arith_expr2 ");
  const auto toks = lex.lex_all();
  ASSERT_EQ(toks.size(), 2U);

  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[0].text, "arith_expr2");
  EXPECT_EQ(toks[0].begin(), 2U);
  EXPECT_EQ(toks[0].end(), 13U);
  EXPECT_EQ(toks[0].range.file_id(), FileId(3));

  EXPECT_EQ(toks[1].kind, TokenKind::Eof);
  EXPECT_EQ(toks[1].begin(), 14U);
}

TEST(SyntaxLexer, SingleDashIsNotAComment)
{
  const auto kinds = kinds_of("a - b");
  ASSERT_EQ(kinds.size(), 4U);
  EXPECT_EQ(kinds[1], TokenKind::Unknown);
}

TEST(SyntaxLexer, InvalidCharacterBecomesUnknown)
{
  Lexer lex(FileId(0), "t = A # B");
  const auto toks = lex.lex_all();

  bool saw = false;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Unknown) {
      EXPECT_EQ(t.text, "#");
      saw = true;
    }
  }
  EXPECT_TRUE(saw);
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, MultiByteCharacterIsOneToken)
{
  Lexer lex(FileId(0), "t = \xC3\xA9");
  const auto toks = lex.lex_all();
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[2].kind, TokenKind::Unknown);
  EXPECT_EQ(toks[2].text.size(), 2U);
}

TEST(SyntaxLexer, UnterminatedBlockCommentRunsToEof)
{
  Lexer lex(FileId(0), "module m { /* never closed");
  const auto toks = lex.lex_all();
  ASSERT_GE(toks.size(), 2U);

  const Token & bad = toks[toks.size() - 2];
  EXPECT_EQ(bad.kind, TokenKind::Unknown);
  EXPECT_EQ(bad.text, "/* never closed");
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, EmptyInputYieldsOnlyEof)
{
  const auto kinds = kinds_of("");
  ASSERT_EQ(kinds.size(), 1U);
  EXPECT_EQ(kinds[0], TokenKind::Eof);

  const auto ws = kinds_of(" \n\t\r\n");
  ASSERT_EQ(ws.size(), 1U);
}
