#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace oaicompat {

/// Where result callbacks run. The host decides (UI thread, worker, caller).
class Executor {
public:
  virtual ~Executor() = default;
  virtual void execute(std::function<void()> task) = 0;
};

/// Runs each task immediately on the calling thread.
class InlineExecutor final : public Executor {
public:
  void execute(std::function<void()> task) override;
};

/**
 * Task queue drained by one owning thread, typically a UI loop.
 *
 * With `wait_for_completion` set, execute() blocks the submitting thread until
 * the owner has run the task. Tasks submitted from the owning thread itself run
 * inline. The owner is the thread that constructed the executor unless
 * bind_to_current_thread() moves it.
 */
class TaskQueueExecutor final : public Executor {
public:
  explicit TaskQueueExecutor(bool wait_for_completion = true);
  ~TaskQueueExecutor() override;

  TaskQueueExecutor(const TaskQueueExecutor&) = delete;
  TaskQueueExecutor& operator=(const TaskQueueExecutor&) = delete;

  void execute(std::function<void()> task) override;

  void bind_to_current_thread();

  // Runs queued tasks on the calling thread. Waits up to `wait` for the first one.
  std::size_t run_pending(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

  // Rejects new tasks and releases any submitter still waiting.
  void shutdown();

  [[nodiscard]] std::size_t pending() const;

private:
  struct Task {
    std::function<void()> fn;
    std::shared_ptr<bool> done;
  };

  bool on_owner_thread() const;

  const bool wait_for_completion_;
  mutable std::mutex mutex_;
  std::condition_variable queued_;
  std::condition_variable completed_;
  std::deque<Task> tasks_;
  std::thread::id owner_;
  bool shut_down_ = false;
};

}  // namespace oaicompat
