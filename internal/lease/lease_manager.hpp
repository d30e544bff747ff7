#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "lease.hpp"
#include "lease_table.hpp"

namespace docflow::lease {

class LeaseManager {
public:
  explicit LeaseManager(std::chrono::milliseconds duration = std::chrono::minutes(10));

  // Empty when another worker holds the execution.
  std::optional<Lease> TryAcquire(const std::string& execution_id);

  // Pushes the expiry out by the lease duration. False if ownership was lost.
  bool Renew(const Lease& lease);

  /*
    Renew(), or when the lease already expired and nobody took the execution
    over, re-inserts it under the same lease id. False only if another
    worker holds the execution.
  */
  bool Reclaim(const Lease& lease);

  void Release(const std::string& lease_id);

  bool IsHeld(const std::string& execution_id);

  std::chrono::milliseconds Duration() const {
    return duration_;
  }

private:
  LeaseTable                table_;
  std::chrono::milliseconds duration_;

  static std::string GenerateLeaseID();
};

}
