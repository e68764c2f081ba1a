#include "oaicompat/executor.hpp"

#include "oaicompat/error.hpp"

#include <iterator>
#include <utility>

namespace oaicompat {

void InlineExecutor::execute(std::function<void()> task) {
  if (task) {
    task();
  }
}

TaskQueueExecutor::TaskQueueExecutor(bool wait_for_completion)
    : wait_for_completion_(wait_for_completion), owner_(std::this_thread::get_id()) {}

TaskQueueExecutor::~TaskQueueExecutor() {
  shutdown();
}

void TaskQueueExecutor::bind_to_current_thread() {
  std::lock_guard<std::mutex> lock(mutex_);
  owner_ = std::this_thread::get_id();
}

bool TaskQueueExecutor::on_owner_thread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return owner_ == std::this_thread::get_id();
}

void TaskQueueExecutor::execute(std::function<void()> task) {
  if (!task) {
    return;
  }
  if (on_owner_thread()) {
    task();
    return;
  }

  auto done = std::make_shared<bool>(false);
  std::unique_lock<std::mutex> lock(mutex_);
  if (shut_down_) {
    throw OaiCompatError("TaskQueueExecutor is shut down");
  }
  tasks_.push_back(Task{std::move(task), done});
  queued_.notify_one();

  if (wait_for_completion_) {
    completed_.wait(lock, [&] { return *done || shut_down_; });
  }
}

std::size_t TaskQueueExecutor::run_pending(std::chrono::milliseconds wait) {
  std::deque<Task> batch;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (tasks_.empty() && wait.count() > 0) {
      queued_.wait_for(lock, wait, [&] { return !tasks_.empty() || shut_down_; });
    }
    batch.swap(tasks_);
  }

  std::size_t ran = 0;
  for (auto it = batch.begin(); it != batch.end(); ++it) {
    try {
      it->fn();
    } catch (...) {
      // Unblock this submitter and keep the unrun tasks queued for the next drain.
      std::lock_guard<std::mutex> lock(mutex_);
      *it->done = true;
      tasks_.insert(tasks_.begin(), std::make_move_iterator(std::next(it)), std::make_move_iterator(batch.end()));
      completed_.notify_all();
      throw;
    }
    ++ran;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      *it->done = true;
    }
    completed_.notify_all();
  }
  return ran;
}

void TaskQueueExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
  }
  queued_.notify_all();
  completed_.notify_all();
}

std::size_t TaskQueueExecutor::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

}  // namespace oaicompat
