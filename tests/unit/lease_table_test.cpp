#include "internal/lease/lease_table.hpp"
#include "internal/lease/lease_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using docflow::lease::Lease;
using docflow::lease::LeaseManager;
using docflow::lease::LeaseTable;

Lease MakeLease(const std::string& lease_id, const std::string& execution_id, std::chrono::system_clock::time_point expires_at) {
  Lease lease;
  lease.lease_id     = lease_id;
  lease.execution_id = execution_id;
  lease.expires_at   = expires_at;
  return lease;
}

void TestExpiredLeaseIsInactive() {
  LeaseTable table;

  assert(table.TryInsert(MakeLease("lease-expired", "exec-1", std::chrono::system_clock::now() - std::chrono::seconds(1))));

  assert(!table.HasActive("exec-1"));
}

void TestLiveLeaseBlocksSecondOwner() {
  LeaseTable table;
  const auto later = std::chrono::system_clock::now() + std::chrono::seconds(30);

  assert(table.TryInsert(MakeLease("lease-a", "exec-1", later)));
  assert(!table.TryInsert(MakeLease("lease-b", "exec-1", later)));
  assert(table.TryInsert(MakeLease("lease-c", "exec-2", later)));

  assert(table.Active("exec-1")->lease_id == "lease-a");

  table.Remove("lease-a");
  assert(!table.HasActive("exec-1"));
  assert(table.TryInsert(MakeLease("lease-b", "exec-1", later)));
}

void TestExpiredLeaseCanBeTakenOver() {
  LeaseTable table;

  assert(table.TryInsert(MakeLease("lease-old", "exec-1", std::chrono::system_clock::now() - std::chrono::milliseconds(1))));
  assert(table.TryInsert(MakeLease("lease-new", "exec-1", std::chrono::system_clock::now() + std::chrono::seconds(30))));

  // The previous owner can neither renew nor release the new lease.
  assert(!table.Renew("lease-old", std::chrono::system_clock::now() + std::chrono::seconds(60)));
  table.Remove("lease-old");
  assert(table.Active("exec-1")->lease_id == "lease-new");
}

void TestManagerAcquireRenewRelease() {
  LeaseManager manager(std::chrono::milliseconds(50));

  auto lease = manager.TryAcquire("exec-1");
  assert(lease.has_value());
  assert(!manager.TryAcquire("exec-1").has_value());
  assert(manager.IsHeld("exec-1"));

  assert(manager.Renew(*lease));

  manager.Release(lease->lease_id);
  assert(!manager.IsHeld("exec-1"));
  assert(!manager.Renew(*lease));

  auto short_lived = manager.TryAcquire("exec-2");
  assert(short_lived.has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  assert(!manager.IsHeld("exec-2"));
  assert(manager.TryAcquire("exec-2").has_value());
}

void TestManagerReclaimsExpiredLease() {
  LeaseManager manager(std::chrono::milliseconds(30));

  auto lease = manager.TryAcquire("exec-1");
  assert(lease.has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  // Expired but untouched: the owner gets it back under the same id.
  assert(!manager.Renew(*lease));
  assert(manager.Reclaim(*lease));
  assert(manager.IsHeld("exec-1"));
  assert(manager.Renew(*lease));
  assert(!manager.TryAcquire("exec-1").has_value());

  // Expired and taken over: the old owner stays out.
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  auto successor = manager.TryAcquire("exec-1");
  assert(successor.has_value());
  assert(!manager.Reclaim(*lease));

  manager.Release(lease->lease_id);
  assert(manager.IsHeld("exec-1"));
}

} // namespace

int main() {
  TestExpiredLeaseIsInactive();
  TestLiveLeaseBlocksSecondOwner();
  TestExpiredLeaseCanBeTakenOver();
  TestManagerAcquireRenewRelease();
  TestManagerReclaimsExpiredLease();

  std::cout << "docflow_unit_lease_table: pass\n";
  return 0;
}
