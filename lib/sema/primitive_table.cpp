// asdl/sema/primitive_table.cpp - Primitive type namespace
#include "asdl/sema/primitive_table.hpp"

namespace asdl
{

std::optional<PrimitiveKind> parse_primitive_kind(std::string_view name) noexcept
{
  for (const auto k : {PrimitiveKind::String, PrimitiveKind::Integer, PrimitiveKind::Bool}) {
    if (to_string(k) == name) {
      return k;
    }
  }
  return std::nullopt;
}

void PrimitiveTable::register_builtins()
{
  names_.emplace(std::string(to_string(PrimitiveKind::String)), PrimitiveKind::String);
  names_.emplace(std::string(to_string(PrimitiveKind::Integer)), PrimitiveKind::Integer);
  names_.emplace(std::string(to_string(PrimitiveKind::Bool)), PrimitiveKind::Bool);

  // Built-in aliases
  names_.emplace("identifier", PrimitiveKind::String);
}

bool PrimitiveTable::define_alias(std::string_view alias_name, PrimitiveKind kind)
{
  auto [it, inserted] = names_.emplace(std::string(alias_name), kind);
  (void)it;
  return inserted;
}

std::optional<PrimitiveKind> PrimitiveTable::lookup(std::string_view name) const
{
  auto it = names_.find(name);
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PrimitiveTable::is_alias(std::string_view name) const
{
  return contains(name) && !parse_primitive_kind(name).has_value();
}

}  // namespace asdl
