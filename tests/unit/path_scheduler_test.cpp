#include "internal/dispatch/path_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/dispatch/worker_pool.hpp"

namespace {

using namespace std::chrono_literals;
using notewatch::dispatch::PathScheduler;
using notewatch::dispatch::WorkItem;
using notewatch::dispatch::WorkKind;
using notewatch::watch::ChangeKind;

void TestOnePathInFlightAtATime() {
  PathScheduler scheduler;
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, ChangeKind::kModify}));
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kSync, ChangeKind::kModify}));
  assert(scheduler.Enqueue({"/notes/b.md", WorkKind::kChange, ChangeKind::kModify}));

  auto first  = scheduler.Dequeue();
  auto second = scheduler.Dequeue();
  assert(first && first->path == "/notes/a.md" && first->kind == WorkKind::kChange);
  assert(second && second->path == "/notes/b.md");

  // a.md's sync waits for Complete
  assert(scheduler.Pending() == 1);
  scheduler.Complete("/notes/a.md");

  auto third = scheduler.Dequeue();
  assert(third && third->path == "/notes/a.md" && third->kind == WorkKind::kSync);

  scheduler.Complete("/notes/a.md");
  scheduler.Complete("/notes/b.md");
  scheduler.WaitIdle();
}

void TestSameKindCoalesces() {
  PathScheduler scheduler;
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, ChangeKind::kCreate}));
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, ChangeKind::kModify}));
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, ChangeKind::kRemove}));
  assert(scheduler.Pending() == 1);

  auto item = scheduler.Dequeue();
  assert(item && item->change == ChangeKind::kRemove);
  scheduler.Complete(item->path);
}

void TestAlternatingKindsStayBounded() {
  PathScheduler scheduler;
  for (int i = 0; i < 50; ++i) {
    assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, i % 4 == 0 ? ChangeKind::kCreate : ChangeKind::kModify}));
    assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kSync, ChangeKind::kModify}));
  }
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, ChangeKind::kRemove}));
  assert(scheduler.Pending() == 2);

  auto first = scheduler.Dequeue();
  assert(first && first->kind == WorkKind::kChange && first->change == ChangeKind::kRemove);
  scheduler.Complete(first->path);

  auto second = scheduler.Dequeue();
  assert(second && second->kind == WorkKind::kSync);
  scheduler.Complete(second->path);
  assert(scheduler.Pending() == 0);
}

void TestShutdownDropsPending() {
  PathScheduler scheduler;
  assert(scheduler.Enqueue({"/notes/a.md", WorkKind::kChange, ChangeKind::kModify}));
  assert(scheduler.Enqueue({"/notes/b.md", WorkKind::kChange, ChangeKind::kModify}));

  auto in_flight = scheduler.Dequeue();
  assert(in_flight);

  scheduler.Shutdown(true);
  assert(!scheduler.Enqueue({"/notes/c.md", WorkKind::kChange, ChangeKind::kModify}));
  assert(scheduler.Pending() == 0);
  assert(!scheduler.Dequeue());

  scheduler.Complete(in_flight->path);
  scheduler.WaitIdle();
}

void TestWorkerPoolSerializesPerPath() {
  auto scheduler = std::make_shared<PathScheduler>();

  std::mutex                           mutex;
  std::map<std::filesystem::path, int> active;
  std::vector<std::filesystem::path>   order;
  std::atomic<bool>                    overlapped{false};

  notewatch::dispatch::WorkerPool pool(
      scheduler,
      [&](const WorkItem& item) {
        {
          std::lock_guard lock(mutex);
          if (++active[item.path] > 1) overlapped = true;
          order.push_back(item.path);
        }
        std::this_thread::sleep_for(5ms);
        std::lock_guard lock(mutex);
        --active[item.path];
      },
      4);
  pool.Start();

  for (int i = 0; i < 20; ++i) {
    scheduler->Enqueue({"/notes/hot.md", i % 2 == 0 ? WorkKind::kChange : WorkKind::kSync, ChangeKind::kModify});
    scheduler->Enqueue({"/notes/n" + std::to_string(i) + ".md", WorkKind::kChange, ChangeKind::kModify});
  }
  scheduler->WaitIdle();
  pool.Stop(false);

  assert(!overlapped);
  assert(order.size() >= 21);
}

} // namespace

int main() {
  TestOnePathInFlightAtATime();
  TestSameKindCoalesces();
  TestAlternatingKindsStayBounded();
  TestShutdownDropsPending();
  TestWorkerPoolSerializesPerPath();

  std::cout << "notewatch_unit_path_scheduler: pass\n";
  return 0;
}
