// pilc/basic/arena.hpp - PMR arena allocator and string pool
//
// Shared by AstContext (parser output) and IrContext (analyzed program).
// Everything allocated here lives exactly as long as the arena.
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

namespace pilc
{

/**
 * Arena that owns trivially destructible nodes and interned strings.
 *
 * Uses std::pmr::monotonic_buffer_resource: O(1) allocation, no individual
 * deallocation, memory released when the arena is destroyed.
 */
class Arena
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit Arena(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~Arena() = default;

  // PMR resources are not movable
  Arena(const Arena &) = delete;
  Arena & operator=(const Arena &) = delete;
  Arena(Arena &&) = delete;
  Arena & operator=(Arena &&) = delete;

  /**
   * Construct a T in the arena.
   *
   * T must be trivially destructible since destructors are never run.
   */
  template <typename T, typename... Args>
  T * make(Args &&... args)
  {
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Arena objects must be trivially destructible! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /**
   * Intern a string and return a stable string_view.
   *
   * Interning the same content twice returns views to the same storage.
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

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  /// Allocate a value-initialized array of T
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a vector into arena storage
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

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace pilc
