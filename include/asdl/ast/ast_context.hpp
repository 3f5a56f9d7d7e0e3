// asdl/ast/ast_context.hpp - Arena allocator and string pool for declaration trees
//
// Every node and interned name of one parsed source lives in an AstContext
// and is released in one go when the context is destroyed.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace asdl
{

class AstNode;

/**
 * Owns all declaration nodes and interned strings using PMR.
 *
 * Nodes are never freed individually; they must therefore be trivially
 * destructible (string_view instead of std::string, gsl::span instead of
 * std::vector).
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * field = ctx.create<FieldDecl>(ctx.intern("int"), ...);
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB); schemas are small.
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  // PMR resources are neither copyable nor movable.
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Create a node of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /**
   * Intern a string and return a view that stays valid as long as the
   * context is alive. Equal strings share storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  /// Copy a vector into arena memory.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace asdl
