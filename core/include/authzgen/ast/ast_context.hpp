// authzgen/ast/ast_context.hpp - AST arena allocator and string pool
//
// Owns all AST nodes and interned strings of one compile using a
// std::pmr::monotonic_buffer_resource. Nothing is freed before the context.
//
#pragma once

#include <algorithm>
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

namespace authzgen
{

class AstNode;

/**
 * Arena for AST nodes and identifier text.
 *
 * @code
 *   AstContext ctx;
 *   auto * id = ctx.create<IdentifierExpr>(ctx.intern("viewer"));
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Construct a node of type T in the arena.
   *
   * The returned pointer stays valid until the context is destroyed.
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
   * Intern a string and return a view that lives as long as the context.
   * Equal inputs return views over the same storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (const auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }
    if (s.empty()) {
      return *string_pool_.insert(std::string_view{}).first;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  /// Copy a vector into an arena-backed array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_copyable_v<T>, "arena arrays hold trivially copyable values");
    if (vec.empty()) {
      return {};
    }
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace authzgen
