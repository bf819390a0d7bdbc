#include <spdlog/spdlog.h>
#include <veribuild/coordination/single_flight.hpp>

#include <utility>

namespace veribuild::coordination {

std::string make_lock_key(std::string_view program_id) {
  auto key = std::string{"lock|"};
  key.append(program_id);
  return key;
}

std::string encode_lock(const lock_record& record) {
  auto raw = record.owner;
  raw.push_back('|');
  raw.append(veribuild::schema::to_string(record.state));
  return raw;
}

std::optional<lock_record> decode_lock(std::string_view raw) {
  auto separator = raw.rfind('|');
  if (separator == std::string_view::npos || separator == 0) {
    return std::nullopt;
  }
  auto state = veribuild::schema::try_from_string<veribuild::schema::job_state_t>(
      raw.substr(separator + 1));
  if (!state) {
    return std::nullopt;
  }
  return lock_record{.owner = std::string{raw.substr(0, separator)},
                     .state = *state};
}

lease::lease(single_flight* owner,
             veribuild::schema::program_id_t program_id,
             veribuild::schema::job_token_t token)
    : owner_{owner},
      program_id_{std::move(program_id)},
      token_{std::move(token)} {}

lease::lease(lease&& other) noexcept
    : owner_{std::exchange(other.owner_, nullptr)},
      program_id_{std::move(other.program_id_)},
      token_{std::move(other.token_)} {}

lease& lease::operator=(lease&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
    program_id_ = std::move(other.program_id_);
    token_ = std::move(other.token_);
  }
  return *this;
}

lease::~lease() {
  release();
}

const veribuild::schema::program_id_t& lease::program_id() const {
  return program_id_;
}

const veribuild::schema::job_token_t& lease::token() const {
  return token_;
}

bool lease::active() const {
  return owner_ != nullptr;
}

void lease::set_state(veribuild::schema::job_state_t state) {
  if (owner_ != nullptr) {
    owner_->set_state(program_id_, token_, state);
  }
}

bool lease::refresh() {
  return owner_ != nullptr && owner_->refresh(program_id_, token_);
}

void lease::release() {
  if (owner_ == nullptr) {
    return;
  }
  auto* owner = std::exchange(owner_, nullptr);
  if (!owner->release(program_id_, token_)) {
    spdlog::debug("Lock for {} was no longer owned by job {}", program_id_,
                  token_);
  }
}

single_flight::single_flight(veribuild::cache::cache_ref cache,
                             veribuild::schema::duration_milliseconds_t ttl)
    : cache_{std::move(cache)}, ttl_{ttl} {}

veribuild::schema::duration_milliseconds_t single_flight::ttl() const {
  return ttl_;
}

acquire_result single_flight::try_acquire(std::string_view program_id) {
  auto token = veribuild::schema::make_token();
  auto holder = std::optional<lock_record>{};
  auto status = cache_.update(
      make_lock_key(program_id),
      [&](std::optional<veribuild::cache::cache_entry>& entry,
          veribuild::schema::timestamp_milliseconds_t now) {
        if (entry) {
          holder = decode_lock(entry->value);
          if (holder) {
            return veribuild::cache::cache_write::keep;
          }
          spdlog::warn("Replacing unreadable lock value for {}", program_id);
        }
        holder.reset();
        entry = veribuild::cache::cache_entry{
            .value = encode_lock(lock_record{
                .owner = token, .state = veribuild::schema::job_state_t::queued}),
            .expires_at = now + ttl_};
        return veribuild::cache::cache_write::store;
      });

  auto result = acquire_result{};
  if (status == veribuild::cache::cache_status::unavailable) {
    spdlog::warn("Coordination cache unavailable; building {} without dedup",
                 program_id);
    result.status = acquire_status::unavailable;
    result.owned = lease{nullptr, std::string{program_id}, std::move(token)};
    return result;
  }
  if (holder) {
    result.status = acquire_status::held;
    result.holder = std::move(holder);
    return result;
  }
  result.status = acquire_status::acquired;
  result.owned = lease{this, std::string{program_id}, std::move(token)};
  return result;
}

std::optional<lock_record> single_flight::holder(
    std::string_view program_id) const {
  auto [status, entry] = cache_.get(make_lock_key(program_id));
  if (status != veribuild::cache::cache_status::ok || !entry) {
    return std::nullopt;
  }
  return decode_lock(entry->value);
}

bool single_flight::is_free(std::string_view program_id) const {
  auto [status, entry] = cache_.get(make_lock_key(program_id));
  return status == veribuild::cache::cache_status::ok && !entry;
}

bool single_flight::set_state(std::string_view program_id,
                              std::string_view token,
                              veribuild::schema::job_state_t state) {
  return rewrite(program_id, token, state);
}

bool single_flight::refresh(std::string_view program_id,
                            std::string_view token) {
  return rewrite(program_id, token, std::nullopt);
}

bool single_flight::rewrite(
    std::string_view program_id,
    std::string_view token,
    std::optional<veribuild::schema::job_state_t> state) {
  auto updated = false;
  auto status = cache_.update(
      make_lock_key(program_id),
      [&](std::optional<veribuild::cache::cache_entry>& entry,
          veribuild::schema::timestamp_milliseconds_t now) {
        if (!entry) {
          return veribuild::cache::cache_write::keep;
        }
        auto record = decode_lock(entry->value);
        if (!record || record->owner != token) {
          return veribuild::cache::cache_write::keep;
        }
        if (state) {
          record->state = *state;
          entry->value = encode_lock(*record);
        }
        entry->expires_at = now + ttl_;
        updated = true;
        return veribuild::cache::cache_write::store;
      });
  return status == veribuild::cache::cache_status::ok && updated;
}

bool single_flight::release(std::string_view program_id,
                            std::string_view token) {
  auto released = false;
  auto status = cache_.update(
      make_lock_key(program_id),
      [&](std::optional<veribuild::cache::cache_entry>& entry, auto) {
        if (!entry) {
          return veribuild::cache::cache_write::keep;
        }
        auto record = decode_lock(entry->value);
        if (!record || record->owner != token) {
          return veribuild::cache::cache_write::keep;
        }
        released = true;
        return veribuild::cache::cache_write::erase;
      });
  if (status != veribuild::cache::cache_status::ok) {
    spdlog::warn("Could not release lock for {}; it expires on its own",
                 program_id);
  }
  return status == veribuild::cache::cache_status::ok && released;
}

}  // namespace veribuild::coordination
