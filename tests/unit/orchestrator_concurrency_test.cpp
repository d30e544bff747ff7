#include "internal/orchestrator/orchestrator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/document_ref.hpp"
#include "internal/scheduler/execution_scheduler.hpp"
#include "internal/scheduler/execution_worker.hpp"

namespace {

using docflow::model::MakeDocumentRef;
using docflow::orchestrator::Orchestrator;
using docflow::pipeline::PipelineDefinition;
using docflow::pipeline::StageSpec;
using docflow::stage::StageContext;
using docflow::stage::StageResult;

/*
  Records how often each execution reached the stage and fails the test
  if two calls for one execution overlap.
*/
class CountingStage final : public docflow::stage::StageExecutor {
 public:
  explicit CountingStage(std::string name) : name_(std::move(name)) {
  }

  std::string Name() const override {
    return name_;
  }

  StageResult Execute(const docflow::model::StagePayload&, const StageContext& context) override {
    {
      std::lock_guard lock(mutex_);
      const bool entered = active_.insert(context.execution_id).second;
      assert(entered);
      ++calls_[context.execution_id];
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(1));

    {
      std::lock_guard lock(mutex_);
      active_.erase(context.execution_id);
    }

    docflow::model::StagePayload update;
    (*update.mutable_fields())[name_].set_bool_value(true);
    return StageResult::Ok(std::move(update));
  }

  int Calls(const std::string& execution_id) {
    std::lock_guard lock(mutex_);
    return calls_[execution_id];
  }

 private:
  std::string                name_;
  std::mutex                 mutex_;
  std::set<std::string>      active_;
  std::map<std::string, int> calls_;
};

struct Fixture {
  std::vector<std::shared_ptr<CountingStage>> stages;
  std::shared_ptr<Orchestrator>               orchestrator;
};

Fixture MakeFixture() {
  Fixture fixture;
  auto    registry = std::make_shared<docflow::stage::StageRegistry>();

  std::vector<StageSpec> specs;
  for (const auto* name : {"first", "second", "third"}) {
    auto stage = std::make_shared<CountingStage>(name);
    fixture.stages.push_back(stage);
    registry->Register(stage);

    StageSpec spec;
    spec.name         = name;
    spec.backoff_base = std::chrono::milliseconds(1);
    spec.max_backoff  = std::chrono::milliseconds(1);
    specs.push_back(spec);
  }

  fixture.orchestrator = std::make_shared<Orchestrator>(
      std::make_shared<docflow::store::ExecutionStore>(std::make_shared<docflow::db::memory::MemoryRepository>()),
      std::make_shared<const PipelineDefinition>(std::move(specs)), registry, std::make_shared<docflow::lease::LeaseManager>());
  return fixture;
}

void TestConcurrentStartsCreateOneRecord() {
  auto       fixture = MakeFixture();
  const auto ref     = MakeDocumentRef("docs", "shared.pdf");

  std::atomic<int>         created{0};
  std::mutex               ids_mutex;
  std::set<std::string>    ids;
  std::vector<std::thread> threads;

  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      const auto result = fixture.orchestrator->Start(ref);
      if (result.created) ++created;
      std::lock_guard lock(ids_mutex);
      ids.insert(result.execution_id);
    });
  }
  for (auto& thread : threads) thread.join();

  assert(created == 1);
  assert(ids.size() == 1);
  assert(fixture.orchestrator->ListExecutions().size() == 1);
}

void TestConcurrentRunsOfOneExecutionRunStagesOnce() {
  auto       fixture = MakeFixture();
  const auto id      = fixture.orchestrator->Start(MakeDocumentRef("docs", "a.pdf")).execution_id;

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] { fixture.orchestrator->Run(id); });
  }
  for (auto& thread : threads) thread.join();

  // Runs that lost the lease returned; a late one found the record terminal.
  for (auto& stage : fixture.stages) {
    assert(stage->Calls(id) == 1);
  }
  assert(fixture.orchestrator->GetExecutionStatus(MakeDocumentRef("docs", "a.pdf")).status() == docflow::v1::EXECUTION_STATUS_SUCCEEDED);
}

void TestWorkersDriveManyExecutions() {
  auto fixture   = MakeFixture();
  auto scheduler = std::make_shared<docflow::scheduler::ExecutionScheduler>();
  fixture.orchestrator->SetScheduleCallback(
      [scheduler](const std::string& execution_id) { scheduler->Enqueue(docflow::scheduler::ExecutionTask{execution_id}); });

  std::vector<std::unique_ptr<docflow::scheduler::ExecutionWorker>> workers;
  for (int i = 0; i < 4; ++i) {
    workers.push_back(std::make_unique<docflow::scheduler::ExecutionWorker>(scheduler, fixture.orchestrator));
    workers.back()->Start();
  }

  constexpr int kDocuments = 40;
  std::vector<std::string> ids;
  for (int i = 0; i < kDocuments; ++i) {
    const auto ref = MakeDocumentRef("docs", "doc-" + std::to_string(i) + ".pdf");
    ids.push_back(fixture.orchestrator->Start(ref).execution_id);
    // Duplicate trigger; must not run anything twice.
    fixture.orchestrator->Start(ref);
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
  for (;;) {
    int succeeded = 0;
    for (const auto& view : fixture.orchestrator->ListExecutions()) {
      if (view.status() == docflow::v1::EXECUTION_STATUS_SUCCEEDED) ++succeeded;
    }
    if (succeeded == kDocuments) break;
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  for (auto& worker : workers) worker->Stop();

  for (const auto& id : ids) {
    for (auto& stage : fixture.stages) {
      assert(stage->Calls(id) == 1);
    }
  }
}

} // namespace

int main() {
  TestConcurrentStartsCreateOneRecord();
  TestConcurrentRunsOfOneExecutionRunStagesOnce();
  TestWorkersDriveManyExecutions();

  std::cout << "docflow_unit_orchestrator_concurrency: pass\n";
  return 0;
}
