#pragma once

#include <pthread.h>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ffibridge::frontend::internal {

// Fixed number of pthread workers pulling task indices from a shared
// counter. RunAll returns once every worker has finished, which makes it the
// barrier between the two translation phases.
class WorkPool {
 public:
  explicit WorkPool(unsigned jobs);
  ~WorkPool();

  WorkPool(const WorkPool&) = delete;
  WorkPool& operator=(const WorkPool&) = delete;

  // Runs task(i) for every i in [0, count). A std::exception escaping task(i)
  // is recorded in failures()[i]; the remaining tasks still run.
  void RunAll(std::size_t count, const std::function<void(std::size_t)>& task);

  const std::vector<std::string>& failures() const { return failures_; }
  unsigned jobs() const { return jobs_; }

 private:
  struct Batch;

  static void* WorkerMain(void* opaque);
  static void RunTasks(Batch* batch);
  void MarkWorkerStart();
  void MarkWorkerDone();
  void WaitAll();

  unsigned jobs_;
  pthread_mutex_t mutex_;
  pthread_cond_t cond_;
  std::size_t inflight_ = 0;
  std::vector<std::string> failures_;
};

// Number of workers to use when --jobs is not given.
unsigned DefaultJobCount();

}  // namespace ffibridge::frontend::internal
