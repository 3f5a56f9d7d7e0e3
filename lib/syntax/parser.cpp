// asdl/syntax/parser.cpp - Recursive-descent parser for schema text
#include "asdl/syntax/parser.hpp"

#include <string>
#include <utility>

#include "asdl/syntax/keywords.hpp"

namespace asdl::syntax
{

Parser::Parser(
  AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
  std::vector<Token> tokens)
: ast_(ast), file_id_(file_id), source_(source), diags_(diags)
{
  tokens_.reserve(tokens.size());
  for (auto & t : tokens) {
    if (!t.is_comment()) {
      tokens_.push_back(t);
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    const auto at = static_cast<uint32_t>(source_.size());
    eof.range = SourceRange(file_id_, at, at);
    tokens_.push_back(eof);
  }
}

// =============================================================================
// Token helpers
// =============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), std::string("expected ") + std::string(what));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  std::string label;
  if (t.kind == TokenKind::Eof) {
    label = "unexpected end of input";
  } else {
    label = "unexpected `" + std::string(t.text) + "`";
  }
  diags_.report(ErrorCode::ParseError, t.range, std::string(msg), std::move(label));
}

void Parser::synchronize_to_decl()
{
  while (!at_eof()) {
    if (at(TokenKind::RBrace) || at_type_decl_start() || at_module_start()) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_module()
{
  while (!at_eof() && !at_module_start()) {
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::at_type_decl_start() const
{
  return at(TokenKind::Identifier) && cur(1).kind == TokenKind::Eq;
}

bool Parser::at_module_start() const
{
  return is_kw(k_module_keyword, cur()) && cur(1).kind == TokenKind::Identifier;
}

const Token * Parser::expect_name(std::string_view what)
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) {
    error_at(t, std::string("expected ") + std::string(what));
    return nullptr;
  }
  if (is_reserved_word(t.text)) {
    diags_.report(
      ErrorCode::ParseError, t.range,
      "reserved word `" + std::string(t.text) + "` cannot be used as " + std::string(what),
      "reserved word");
  }
  // Reserved names are still consumed so parsing can continue.
  return &advance();
}

SourceRange Parser::range_from(const Token & first) const
{
  const uint32_t end = (idx_ > 0) ? tokens_[idx_ - 1].end() : first.end();
  return {file_id_, first.begin(), end};
}

// =============================================================================
// Declarations
// =============================================================================

SchemaFile * Parser::parse_schema_file()
{
  auto * file = ast_.create<SchemaFile>(
    file_id_, SourceRange(file_id_, 0, static_cast<uint32_t>(source_.size())));

  std::vector<ModuleDecl *> modules;
  while (!at_eof()) {
    if (is_kw(k_module_keyword, cur())) {
      if (auto * mod = parse_module()) {
        modules.push_back(mod);
      }
      continue;
    }
    error_at(cur(), "expected `module` declaration");
    advance();
    synchronize_to_module();
  }

  file->modules = ast_.copy_to_arena(modules);
  return file;
}

ModuleDecl * Parser::parse_module()
{
  const Token & kw = advance();  // 'module'

  const Token * name_tok = expect_name("module name");
  if (name_tok == nullptr) {
    synchronize_to_module();
    return nullptr;
  }

  auto * mod = ast_.create<ModuleDecl>(ast_.intern(name_tok->text));
  mod->name_range = name_tok->range;

  if (!expect(TokenKind::LBrace, "`{` after module name")) {
    synchronize_to_module();
    return nullptr;
  }

  std::vector<TypeDecl *> types;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    if (at_type_decl_start()) {
      if (auto * decl = parse_type_decl()) {
        types.push_back(decl);
      } else {
        synchronize_to_decl();
      }
      continue;
    }
    if (at_module_start()) {
      break;  // missing '}' reported below
    }
    error_at(cur(), "expected type declaration `name = ...`");
    advance();
    synchronize_to_decl();
  }

  mod->types = ast_.copy_to_arena(types);

  if (!match(TokenKind::RBrace)) {
    error_at(cur(), "expected `}` to close module `" + std::string(mod->name) + "`");
  }
  mod->range_ = range_from(kw);
  return mod;
}

TypeDecl * Parser::parse_type_decl()
{
  const Token & name_tok = advance();
  if (is_reserved_word(name_tok.text)) {
    diags_.report(
      ErrorCode::ParseError, name_tok.range,
      "reserved word `" + std::string(name_tok.text) + "` cannot be used as a type name",
      "reserved word");
  }
  advance();  // '='

  TypeDecl * decl = nullptr;
  if (at(TokenKind::LParen)) {
    decl = parse_product(name_tok);
  } else {
    decl = parse_sum(name_tok);
  }
  if (decl == nullptr) {
    return nullptr;
  }

  if (is_kw(k_attributes_keyword, cur())) {
    advance();
    if (!expect(TokenKind::LParen, "`(` after `attributes`")) {
      return nullptr;
    }
    std::vector<FieldDecl *> attrs;
    if (!parse_fields(attrs)) {
      return nullptr;
    }
    if (!expect(TokenKind::RParen, "`)` to close attributes")) {
      return nullptr;
    }
    decl->attributes = ast_.copy_to_arena(attrs);
    check_duplicate_fields(decl->name, decl->attributes);

    if (const auto * sum = dyn_cast<SumTypeDecl>(decl)) {
      for (const auto * ctor : sum->constructors) {
        check_attribute_clashes(ctor->name, ctor->fields, decl->attributes);
      }
    } else if (const auto * product = dyn_cast<ProductTypeDecl>(decl)) {
      check_attribute_clashes(product->name, product->fields, decl->attributes);
    }
  }

  // A declaration ends at the next declaration, the closing brace or EOF.
  if (!at_eof() && !at(TokenKind::RBrace) && !at_type_decl_start() && !at_module_start()) {
    if (isa<SumTypeDecl>(decl)) {
      error_at(cur(), "expected `|` or the end of type `" + std::string(decl->name) + "`");
    } else {
      error_at(cur(), "expected the end of type `" + std::string(decl->name) + "`");
    }
    return nullptr;
  }

  decl->range_ = range_from(name_tok);
  return decl;
}

SumTypeDecl * Parser::parse_sum(const Token & name_tok)
{
  auto * sum = ast_.create<SumTypeDecl>(ast_.intern(name_tok.text));
  sum->name_range = name_tok.range;

  std::vector<ConstructorDecl *> ctors;
  do {
    auto * ctor = parse_constructor();
    if (ctor == nullptr) {
      return nullptr;
    }
    for (const auto * prev : ctors) {
      if (prev->name == ctor->name) {
        diags_
          .report(
            ErrorCode::ParseError, ctor->name_range,
            "duplicate constructor `" + std::string(ctor->name) + "` in type `" +
              std::string(sum->name) + "`",
            "redefined here")
          .with_secondary_label(prev->name_range, "first defined here");
        break;
      }
    }
    ctors.push_back(ctor);
  } while (match(TokenKind::Pipe));

  sum->constructors = ast_.copy_to_arena(ctors);
  sum->range_ = range_from(name_tok);
  return sum;
}

ProductTypeDecl * Parser::parse_product(const Token & name_tok)
{
  auto * product = ast_.create<ProductTypeDecl>(ast_.intern(name_tok.text));
  product->name_range = name_tok.range;

  advance();  // '('
  std::vector<FieldDecl *> fields;
  if (!parse_fields(fields)) {
    return nullptr;
  }
  if (!expect(TokenKind::RParen, "`)` to close the field list")) {
    return nullptr;
  }

  product->fields = ast_.copy_to_arena(fields);
  check_duplicate_fields(product->name, product->fields);
  product->range_ = range_from(name_tok);
  return product;
}

ConstructorDecl * Parser::parse_constructor()
{
  const Token * name_tok = expect_name("constructor name");
  if (name_tok == nullptr) {
    return nullptr;
  }

  auto * ctor = ast_.create<ConstructorDecl>(ast_.intern(name_tok->text));
  ctor->name_range = name_tok->range;

  if (match(TokenKind::LParen)) {
    std::vector<FieldDecl *> fields;
    if (!parse_fields(fields)) {
      return nullptr;
    }
    if (!expect(TokenKind::RParen, "`)` to close the field list")) {
      return nullptr;
    }
    ctor->fields = ast_.copy_to_arena(fields);
    check_duplicate_fields(ctor->name, ctor->fields);
  }

  ctor->range_ = range_from(*name_tok);
  return ctor;
}

bool Parser::parse_fields(std::vector<FieldDecl *> & out)
{
  if (at(TokenKind::RParen)) {
    return true;
  }
  do {
    auto * field = parse_field();
    if (field == nullptr) {
      return false;
    }
    out.push_back(field);
  } while (match(TokenKind::Comma));
  return true;
}

FieldDecl * Parser::parse_field()
{
  const Token * type_tok = expect_name("field type");
  if (type_tok == nullptr) {
    return nullptr;
  }

  std::string_view type_module;
  std::string_view type_name = type_tok->text;
  SourceRange type_range = type_tok->range;

  if (match(TokenKind::Dot)) {
    const Token * qualified = expect_name("type name after `.`");
    if (qualified == nullptr) {
      return nullptr;
    }
    type_module = type_name;
    type_name = qualified->text;
    type_range = join_ranges(type_tok->range, qualified->range);
  }

  Multiplicity mult = Multiplicity::Single;
  if (match(TokenKind::Star)) {
    mult = Multiplicity::Repeated;
  } else if (match(TokenKind::Question)) {
    mult = Multiplicity::Optional;
  }

  const Token * name_tok = expect_name("field name");
  if (name_tok == nullptr) {
    return nullptr;
  }

  auto * field = ast_.create<FieldDecl>(
    type_module.empty() ? std::string_view{} : ast_.intern(type_module), ast_.intern(type_name),
    mult, ast_.intern(name_tok->text), range_from(*type_tok));
  field->type_range = type_range;
  field->name_range = name_tok->range;
  return field;
}

// =============================================================================
// Duplicate checks
// =============================================================================

void Parser::check_duplicate_fields(std::string_view owner, gsl::span<FieldDecl *> fields)
{
  for (size_t i = 0; i < fields.size(); ++i) {
    for (size_t j = 0; j < i; ++j) {
      if (fields[i]->name == fields[j]->name) {
        diags_
          .report(
            ErrorCode::ParseError, fields[i]->name_range,
            "duplicate field `" + std::string(fields[i]->name) + "` in `" + std::string(owner) +
              "`",
            "redefined here")
          .with_secondary_label(fields[j]->name_range, "first defined here");
        break;
      }
    }
  }
}

void Parser::check_attribute_clashes(
  std::string_view owner, gsl::span<FieldDecl *> fields, gsl::span<FieldDecl *> attributes)
{
  for (const auto * attr : attributes) {
    for (const auto * field : fields) {
      if (field->name == attr->name) {
        diags_
          .report(
            ErrorCode::ParseError, attr->name_range,
            "attribute `" + std::string(attr->name) + "` clashes with a field of `" +
              std::string(owner) + "`",
            "attribute declared here")
          .with_secondary_label(field->name_range, "field declared here");
        break;
      }
    }
  }
}

}  // namespace asdl::syntax
