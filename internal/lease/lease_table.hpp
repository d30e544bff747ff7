#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "lease.hpp"

namespace docflow::lease {

/*
  At most one live lease per execution. Expired leases are dropped lazily
  whenever the execution is looked at.
*/
class LeaseTable {
 public:
  // Inserts `lease` unless another live lease holds its execution.
  std::optional<Lease> TryInsert(const Lease& lease);

  // Extends a live lease. False if it expired or was replaced.
  bool Renew(const std::string& lease_id, std::chrono::system_clock::time_point expires_at);

  void Remove(const std::string& lease_id);

  bool HasActive(const std::string& execution_id);

  std::optional<Lease> Active(const std::string& execution_id);

 private:
  using Clock = std::chrono::system_clock;

  std::mutex mutex_;

  std::unordered_map<std::string, Lease>       leases_;
  std::unordered_map<std::string, std::string> by_execution_;

  static bool IsExpired(const Lease& lease, Clock::time_point now);

  // Returns the live lease for execution_id, erasing an expired one.
  const Lease* LiveLocked(const std::string& execution_id, Clock::time_point now);
};

} // namespace docflow::lease
