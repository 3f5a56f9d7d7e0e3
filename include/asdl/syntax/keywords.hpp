// asdl/syntax/keywords.hpp - Reserved words of the schema language
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace asdl::syntax
{

inline constexpr std::string_view k_module_keyword = "module";
inline constexpr std::string_view k_attributes_keyword = "attributes";

inline constexpr std::array<std::string_view, 2> k_reserved_words = {
  k_module_keyword,
  k_attributes_keyword,
};

[[nodiscard]] inline bool is_reserved_word(std::string_view ident) noexcept
{
  return std::find(k_reserved_words.begin(), k_reserved_words.end(), ident) !=
         k_reserved_words.end();
}

}  // namespace asdl::syntax
