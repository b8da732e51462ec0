#ifndef DROPIN_TASK_RUNNER_H_
#define DROPIN_TASK_RUNNER_H_

#include <functional>
#include <queue>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace dropin {

/**
 * @brief Runs posted tasks on a fixed pool of worker threads.
 *
 * Detector-originated submissions (stability waits, file reads, scratch copies)
 * run here so the terminal input loop never blocks on them.
 */
class TaskRunner {
 public:
  explicit TaskRunner(int num_threads = 2);
  ~TaskRunner();

  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  // Queues a task. Returns false (and drops the task) once Shutdown() has begun.
  bool Post(std::function<void()> task);

  // Blocks until the queue is empty and no task is running.
  void WaitIdle();

  // Runs what is already queued, then joins the workers. Idempotent.
  void Shutdown();

  int pending() const;

 private:
  void WorkerLoop();

  std::vector<std::thread> workers_;

  mutable absl::Mutex mu_;
  std::queue<std::function<void()>> tasks_ ABSL_GUARDED_BY(mu_);
  int running_ ABSL_GUARDED_BY(mu_) = 0;
  bool stop_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace dropin

#endif  // DROPIN_TASK_RUNNER_H_
