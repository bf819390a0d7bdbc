#pragma once
#include <veribuild/cache/cache.hpp>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace veribuild::cache {

/// Non-owning handle over any `cache<Library>`, so coordination code does
/// not depend on which backend the service was started with. The backend
/// must outlive the handle.
class cache_ref final {
 public:
  template <typename Library>
  cache_ref(cache<Library>& backend)
      : update_{[&backend](std::string_view key,
                           const cache_mutator_t& mutator) {
          return backend.update(key, mutator);
        }},
        get_{[&backend](std::string_view key) { return backend.get(key); }} {}

  cache_status update(std::string_view key,
                      const cache_mutator_t& mutator) const {
    return update_(key, mutator);
  }

  std::pair<cache_status, std::optional<cache_entry>> get(
      std::string_view key) const {
    return get_(key);
  }

 private:
  std::function<cache_status(std::string_view, const cache_mutator_t&)>
      update_;
  std::function<std::pair<cache_status, std::optional<cache_entry>>(
      std::string_view)>
      get_;
};

}  // namespace veribuild::cache
