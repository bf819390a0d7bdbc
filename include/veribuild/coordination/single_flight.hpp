#pragma once

#include <veribuild/cache/cache_ref.hpp>
#include <veribuild/schema/job_state.hpp>
#include <veribuild/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace veribuild::coordination {

enum class acquire_status : uint8_t {
  acquired = 0,
  held = 1,         // another job owns the program
  unavailable = 2,  // cache unreachable; caller proceeds without dedup
};

/// Value of a `lock|<program_id>` key.
struct lock_record final {
  veribuild::schema::job_token_t owner;
  veribuild::schema::job_state_t state{veribuild::schema::job_state_t::queued};
};

std::string make_lock_key(std::string_view program_id);
std::string encode_lock(const lock_record& record);
std::optional<lock_record> decode_lock(std::string_view raw);

class single_flight;

/// Exclusive ownership of one program lock. Releasing (explicitly or on
/// destruction) deletes the key only if this lease still owns it.
class lease final {
 public:
  lease() = default;
  lease(single_flight* owner,
        veribuild::schema::program_id_t program_id,
        veribuild::schema::job_token_t token);
  lease(lease&& other) noexcept;
  lease& operator=(lease&& other) noexcept;
  lease(const lease&) = delete;
  lease& operator=(const lease&) = delete;
  ~lease();

  const veribuild::schema::program_id_t& program_id() const;
  const veribuild::schema::job_token_t& token() const;

  /// False for a default lease and after release.
  bool active() const;

  /// Record the job phase in the lock value and push its expiry out by a
  /// full TTL. No-op once released.
  void set_state(veribuild::schema::job_state_t state);

  /// Push the expiry out by a full TTL. False when the lock was lost.
  bool refresh();

  void release();

 private:
  single_flight* owner_{nullptr};
  veribuild::schema::program_id_t program_id_;
  veribuild::schema::job_token_t token_;
};

struct acquire_result final {
  acquire_status status{acquire_status::unavailable};
  /// Set when acquired. When the cache is unavailable the lease still
  /// carries a fresh token so the job can run, but guards nothing.
  lease owned;
  /// Current holder when the lock is held.
  std::optional<lock_record> holder;
};

/// Per-program mutual exclusion on top of the coordination cache. Locks
/// expire after `ttl` so a crashed worker cannot block a program forever.
class single_flight final {
 public:
  single_flight(veribuild::cache::cache_ref cache,
                veribuild::schema::duration_milliseconds_t ttl);

  acquire_result try_acquire(std::string_view program_id);

  /// Current holder; nullopt when free, expired or the cache is unavailable.
  std::optional<lock_record> holder(std::string_view program_id) const;

  /// True when the lock is known to be free or expired.
  bool is_free(std::string_view program_id) const;

  /// Owner-only: update the phase and restart the TTL.
  bool set_state(std::string_view program_id,
                 std::string_view token,
                 veribuild::schema::job_state_t state);

  /// Owner-only: restart the TTL. Long jobs call this periodically so the
  /// lock cannot lapse while the job still runs.
  bool refresh(std::string_view program_id, std::string_view token);

  veribuild::schema::duration_milliseconds_t ttl() const;

  /// Delete the lock if `token` still owns it.
  bool release(std::string_view program_id, std::string_view token);

 private:
  bool rewrite(std::string_view program_id,
               std::string_view token,
               std::optional<veribuild::schema::job_state_t> state);

  veribuild::cache::cache_ref cache_;
  veribuild::schema::duration_milliseconds_t ttl_{};
};

}  // namespace veribuild::coordination
