#include "lease_manager.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace docflow::lease {

LeaseManager::LeaseManager(std::chrono::milliseconds duration) : duration_(duration) {
  if (duration_.count() <= 0) {
    throw std::invalid_argument("lease duration must be positive");
  }
}

std::string LeaseManager::GenerateLeaseID() {
  return util::ToString(util::GenerateUUID());
}

std::optional<Lease> LeaseManager::TryAcquire(const std::string& execution_id) {
  Lease lease;
  lease.lease_id     = GenerateLeaseID();
  lease.execution_id = execution_id;
  lease.expires_at   = util::Now() + duration_;
  return table_.TryInsert(lease);
}

bool LeaseManager::Renew(const Lease& lease) {
  return table_.Renew(lease.lease_id, util::Now() + duration_);
}

bool LeaseManager::Reclaim(const Lease& lease) {
  if (Renew(lease)) {
    return true;
  }
  Lease renewed      = lease;
  renewed.expires_at = util::Now() + duration_;
  return table_.TryInsert(renewed).has_value();
}

void LeaseManager::Release(const std::string& lease_id) {
  table_.Remove(lease_id);
}

bool LeaseManager::IsHeld(const std::string& execution_id) {
  return table_.HasActive(execution_id);
}

} // namespace docflow::lease
