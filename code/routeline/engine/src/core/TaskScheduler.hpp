#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// State shared by a scheduled task and its handles.
struct TaskControl {
  std::atomic<bool> done{false};
  // Held by the scheduler for the whole of each tick.
  std::mutex running;
  // Thread the ticks run on; default when ticks run on the caller's thread.
  std::thread::id runner;
};

// Handle to a scheduled repeating task. Copies share the same task; cancelling
// any of them stops it. A default-constructed handle refers to no task.
class TaskHandle {
public:
  TaskHandle() = default;
  explicit TaskHandle(std::shared_ptr<TaskControl> control)
      : control_(std::move(control)) {}

  // Idempotent. Once this returns no tick of the task is running or will run.
  // Called from inside the task's own tick it only stops later ticks.
  void cancel() {
    if (!control_)
      return;
    control_->done.store(true);
    if (control_->runner != std::this_thread::get_id()) {
      // wait out a tick already past its done check
      std::lock_guard<std::mutex> wait(control_->running);
    }
  }
  // True while the task is still scheduled.
  bool active() const { return control_ && !control_->done.load(); }

private:
  std::shared_ptr<TaskControl> control_;
};

// Source of repeating tasks, independent of any UI timer mechanism.
class TaskScheduler {
public:
  // Receives the time since the task was scheduled; returning false ends the
  // task.
  using Tick = std::function<bool(std::chrono::milliseconds elapsed)>;

  virtual ~TaskScheduler() = default;

  // First tick fires one interval after scheduling.
  virtual TaskHandle schedule_repeating(std::chrono::milliseconds interval,
                                        Tick tick) = 0;
};
