// asdl/runtime/printer.cpp - Canonical text rendering of values
#include "asdl/runtime/printer.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace asdl
{

namespace
{

class ValuePrinter
{
public:
  explicit ValuePrinter(const PrintOptions & options) : options_(options) {}

  // `depth` counts enclosing values; `level` is the indentation of the
  // line the output starts on.
  Status print_value(const Value & value, size_t depth, size_t level, const std::string & path);
  Status print_field(
    const FieldValue & value, size_t depth, size_t level, const std::string & path);

  [[nodiscard]] std::string take() { return std::move(out_); }

private:
  void newline(size_t level)
  {
    out_ += '\n';
    out_.append(level * options_.indent, ' ');
  }

  // Separator before element `i` of a parenthesised or bracketed group.
  void separator(size_t i, size_t level)
  {
    if (options_.multiline) {
      if (i > 0) out_ += ',';
      newline(level);
    } else if (i > 0) {
      out_ += ", ";
    }
  }

  const PrintOptions & options_;
  std::string out_;
};

Status ValuePrinter::print_value(
  const Value & value, size_t depth, size_t level, const std::string & path)
{
  if (depth >= options_.max_depth) {
    return Status::fail(
      ErrorCode::RecursionLimitError, path,
      fmt::format("value nesting exceeds the maximum depth of {}", options_.max_depth));
  }

  const ConstructorInfo & ctor = value.constructor();
  if (value.field_count() != ctor.arity()) {
    return Status::fail(
      ErrorCode::TypeMismatchError, path,
      fmt::format(
        "`{}` declares {} field(s), value has {}", ctor.name, ctor.arity(), value.field_count()));
  }

  const bool is_product = value.type().is_product();
  if (!is_product) {
    out_ += ctor.name;
    if (ctor.fields.empty()) {
      return Status::ok();
    }
  }

  out_ += '(';
  for (const auto & field : ctor.fields) {
    separator(field.index, level + 1);
    if (!is_product) {
      out_ += field.name;
      out_ += '=';
    }
    Status s =
      print_field(value.fields()[field.index], depth + 1, level + 1, path + "." + field.name);
    if (!s.success) {
      return s;
    }
  }
  if (options_.multiline && !ctor.fields.empty()) {
    newline(level);
  }
  out_ += ')';
  return Status::ok();
}

Status ValuePrinter::print_field(
  const FieldValue & value, size_t depth, size_t level, const std::string & path)
{
  switch (value.kind()) {
    case FieldValueKind::Absent:
      out_ += "null";
      return Status::ok();
    case FieldValueKind::Integer:
      fmt::format_to(std::back_inserter(out_), "{}", value.as_integer());
      return Status::ok();
    case FieldValueKind::String:
      out_ += quote_string(value.as_string());
      return Status::ok();
    case FieldValueKind::Bool:
      out_ += value.as_bool() ? "true" : "false";
      return Status::ok();
    case FieldValueKind::Node:
      if (!value.as_node()) {
        return Status::fail(ErrorCode::TypeMismatchError, path, "null node");
      }
      return print_value(*value.as_node(), depth, level, path);
    case FieldValueKind::List: {
      const auto & elements = value.as_list();
      out_ += '[';
      for (size_t i = 0; i < elements.size(); ++i) {
        separator(i, level + 1);
        Status s = print_field(elements[i], depth, level + 1, fmt::format("{}[{}]", path, i));
        if (!s.success) {
          return s;
        }
      }
      if (options_.multiline && !elements.empty()) {
        newline(level);
      }
      out_ += ']';
      return Status::ok();
    }
  }
  return Status::ok();
}

}  // namespace

std::string quote_string(const std::string & s)
{
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default: {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) {
          fmt::format_to(std::back_inserter(out), "\\x{:02x}", static_cast<unsigned>(u));
        } else {
          out += c;
        }
        break;
      }
    }
  }
  out += '"';
  return out;
}

Result<std::string> print(const Value & value, const PrintOptions & options)
{
  ValuePrinter printer(options);
  const Status s = printer.print_value(value, 0, 0, value.constructor().name);
  if (!s.success) {
    return Result<std::string>::fail(s.error);
  }
  return Result<std::string>::ok(printer.take());
}

Result<std::string> print(const FieldValue & value, const PrintOptions & options)
{
  ValuePrinter printer(options);
  const Status s = printer.print_field(value, 0, 0, "");
  if (!s.success) {
    return Result<std::string>::fail(s.error);
  }
  return Result<std::string>::ok(printer.take());
}

}  // namespace asdl
