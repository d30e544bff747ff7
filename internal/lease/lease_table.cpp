#include "lease_table.hpp"

namespace docflow::lease {

bool LeaseTable::IsExpired(const Lease& lease, Clock::time_point now) {
  return lease.expires_at <= now;
}

const Lease* LeaseTable::LiveLocked(const std::string& execution_id, Clock::time_point now) {
  auto owner = by_execution_.find(execution_id);
  if (owner == by_execution_.end()) return nullptr;

  auto lease_it = leases_.find(owner->second);
  if (lease_it == leases_.end() || IsExpired(lease_it->second, now)) {
    if (lease_it != leases_.end()) leases_.erase(lease_it);
    by_execution_.erase(owner);
    return nullptr;
  }

  return &lease_it->second;
}

std::optional<Lease> LeaseTable::TryInsert(const Lease& lease) {
  std::lock_guard lock(mutex_);

  if (LiveLocked(lease.execution_id, Clock::now())) {
    return std::nullopt;
  }

  leases_[lease.lease_id]           = lease;
  by_execution_[lease.execution_id] = lease.lease_id;
  return lease;
}

bool LeaseTable::Renew(const std::string& lease_id, Clock::time_point expires_at) {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(lease_id);
  if (it == leases_.end()) return false;

  const auto* live = LiveLocked(it->second.execution_id, Clock::now());
  if (!live || live->lease_id != lease_id) return false;

  leases_[lease_id].expires_at = expires_at;
  return true;
}

void LeaseTable::Remove(const std::string& lease_id) {
  std::lock_guard lock(mutex_);

  auto it = leases_.find(lease_id);
  if (it == leases_.end()) return;

  auto owner = by_execution_.find(it->second.execution_id);
  if (owner != by_execution_.end() && owner->second == lease_id) {
    by_execution_.erase(owner);
  }

  leases_.erase(it);
}

bool LeaseTable::HasActive(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  return LiveLocked(execution_id, Clock::now()) != nullptr;
}

std::optional<Lease> LeaseTable::Active(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  const auto*     live = LiveLocked(execution_id, Clock::now());
  if (!live) return std::nullopt;
  return *live;
}

} // namespace docflow::lease
