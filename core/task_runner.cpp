#include "core/task_runner.h"

#include "absl/log/log.h"

namespace dropin {

TaskRunner::TaskRunner(int num_threads) {
  if (num_threads < 1) num_threads = 1;
  for (int i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&TaskRunner::WorkerLoop, this);
  }
}

TaskRunner::~TaskRunner() { Shutdown(); }

bool TaskRunner::Post(std::function<void()> task) {
  absl::MutexLock lock(&mu_);
  if (stop_) {
    LOG(WARNING) << "TaskRunner is shutting down; dropping task.";
    return false;
  }
  tasks_.push(std::move(task));
  return true;
}

void TaskRunner::WaitIdle() {
  absl::MutexLock lock(&mu_);
  auto idle = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return tasks_.empty() && running_ == 0; };
  mu_.Await(absl::Condition(&idle));
}

void TaskRunner::Shutdown() {
  {
    absl::MutexLock lock(&mu_);
    stop_ = true;
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

int TaskRunner::pending() const {
  absl::ReaderMutexLock lock(&mu_);
  return static_cast<int>(tasks_.size()) + running_;
}

void TaskRunner::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      absl::MutexLock lock(&mu_);
      auto condition = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return stop_ || !tasks_.empty(); };
      mu_.Await(absl::Condition(&condition));

      if (stop_ && tasks_.empty()) return;

      task = std::move(tasks_.front());
      tasks_.pop();
      running_++;
    }
    task();
    absl::MutexLock lock(&mu_);
    running_--;
  }
}

}  // namespace dropin
