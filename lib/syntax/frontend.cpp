// asdl/syntax/frontend.cpp - High-level parse pipeline
#include "asdl/syntax/frontend.hpp"

#include <fmt/core.h>

#include <utility>
#include <vector>

#include "asdl/syntax/lexer.hpp"
#include "asdl/syntax/parser.hpp"

namespace asdl
{

namespace
{

std::string describe_unknown(std::string_view text)
{
  if (text.size() >= 2 && text.substr(0, 2) == "/*") {
    return "unterminated block comment";
  }
  const auto c = static_cast<unsigned char>(text.empty() ? '\0' : text.front());
  if (text.size() == 1 && c >= 0x20 && c < 0x7F) {
    return fmt::format("invalid character `{}`", text);
  }
  std::string bytes;
  for (const char ch : text) {
    bytes += fmt::format("\\x{:02X}", static_cast<unsigned char>(ch));
  }
  return fmt::format("invalid character `{}`", bytes);
}

// Returns the number of lex errors reported.
size_t report_lex_errors(const std::vector<syntax::Token> & tokens, DiagnosticBag & diags)
{
  size_t count = 0;
  for (const auto & t : tokens) {
    if (t.kind != syntax::TokenKind::Unknown) {
      continue;
    }
    auto builder = diags.report(ErrorCode::LexError, t.range, describe_unknown(t.text));
    if (t.text.substr(0, 2) == "/*") {
      builder.with_help("close the comment with `*/`");
    }
    ++count;
  }
  return count;
}

}  // namespace

ParseOutput parse_source(
  SourceRegistry & sources, std::string name, std::string source_text, AstContext & ast,
  DiagnosticBag & diags)
{
  const FileId id = sources.add_file(std::move(name), std::move(source_text));
  return parse_registered(sources, id, ast, diags);
}

ParseOutput parse_registered(
  const SourceRegistry & sources, FileId file_id, AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = file_id;

  const SourceFile * source = sources.get_file(file_id);
  if (source == nullptr) {
    return out;
  }

  syntax::Lexer lexer(file_id, source->text());
  std::vector<syntax::Token> tokens = lexer.lex_all();
  if (report_lex_errors(tokens, diags) > 0) {
    return out;
  }

  syntax::Parser parser(ast, file_id, *source, diags, std::move(tokens));
  out.file = parser.parse_schema_file();
  return out;
}

}  // namespace asdl
