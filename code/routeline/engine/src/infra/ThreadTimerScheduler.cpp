#include "infra/ThreadTimerScheduler.hpp"
#include <algorithm>
#include <iostream>

ThreadTimerScheduler::ThreadTimerScheduler() : worker_([this] { run(); }) {}

ThreadTimerScheduler::~ThreadTimerScheduler() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    for (auto &t : tasks_)
      t->control->done.store(true);
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

TaskHandle
ThreadTimerScheduler::schedule_repeating(std::chrono::milliseconds interval,
                                         Tick tick) {
  auto task = std::make_shared<Task>();
  task->interval = std::max(interval, std::chrono::milliseconds(1));
  task->start = Clock::now();
  task->next_run = task->start + task->interval;
  task->tick = std::move(tick);
  task->control = std::make_shared<TaskControl>();
  task->control->runner = worker_.get_id();
  TaskHandle handle(task->control);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      task->control->done.store(true);
      return handle;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_all();
  return handle;
}

std::size_t ThreadTimerScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(tasks_.begin(), tasks_.end(),
                    [](const std::shared_ptr<Task> &t) {
                      return !t->control->done.load();
                    }));
}

void ThreadTimerScheduler::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::shared_ptr<Task> &t) {
                                  return t->control->done.load();
                                }),
                 tasks_.end());
    if (tasks_.empty()) {
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      continue;
    }

    auto next = std::min_element(
        tasks_.begin(), tasks_.end(),
        [](const std::shared_ptr<Task> &a, const std::shared_ptr<Task> &b) {
          return a->next_run < b->next_run;
        });
    std::shared_ptr<Task> task = *next;
    if (Clock::now() < task->next_run) {
      // woken early by a new task, a cancel sweep or shutdown
      cv_.wait_until(lock, task->next_run);
      continue;
    }

    // tick outside the lock so it may schedule or cancel tasks; holding
    // `running` makes a concurrent cancel() wait for the tick to finish
    lock.unlock();
    bool keep = false;
    {
      std::lock_guard<std::mutex> running(task->control->running);
      if (!task->control->done.load()) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - task->start);
        try {
          keep = task->tick(elapsed);
        } catch (const std::exception &e) {
          std::cerr << "[scheduler] task dropped after exception: " << e.what()
                    << "\n";
          keep = false;
        } catch (...) {
          std::cerr << "[scheduler] task dropped after unknown exception\n";
          keep = false;
        }
      }
    }
    lock.lock();

    if (keep && !task->control->done.load()) {
      task->next_run += task->interval;
      const auto now = Clock::now();
      if (task->next_run < now)
        task->next_run = now; // fell behind; do not burst to catch up
    } else {
      task->control->done.store(true);
    }
  }
}
