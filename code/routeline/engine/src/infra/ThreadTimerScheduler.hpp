#pragma once
#include "core/TaskScheduler.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

// Runs every task's ticks on one worker thread. Destruction drops pending
// tasks and joins the thread.
class ThreadTimerScheduler final : public TaskScheduler {
public:
  ThreadTimerScheduler();
  ~ThreadTimerScheduler();

  ThreadTimerScheduler(const ThreadTimerScheduler &) = delete;
  ThreadTimerScheduler &operator=(const ThreadTimerScheduler &) = delete;

  TaskHandle schedule_repeating(std::chrono::milliseconds interval,
                                Tick tick) override;

  std::size_t pending() const;

private:
  using Clock = std::chrono::steady_clock;

  struct Task {
    std::chrono::milliseconds interval;
    Clock::time_point start;
    Clock::time_point next_run;
    Tick tick;
    std::shared_ptr<TaskControl> control;
  };

  void run();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<Task>> tasks_;
  bool stopping_ = false;
  std::thread worker_;
};
