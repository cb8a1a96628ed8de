#include "work_pool.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace ffibridge::frontend::internal {

struct WorkPool::Batch {
  WorkPool* pool = nullptr;
  const std::function<void(std::size_t)>* task = nullptr;
  std::size_t count = 0;
  std::atomic<std::size_t> next{0};
};

WorkPool::WorkPool(unsigned jobs) : jobs_(std::max(1U, jobs)) {
  pthread_mutex_init(&mutex_, nullptr);
  pthread_cond_init(&cond_, nullptr);
}

WorkPool::~WorkPool() {
  WaitAll();
  pthread_cond_destroy(&cond_);
  pthread_mutex_destroy(&mutex_);
}

void WorkPool::MarkWorkerStart() {
  pthread_mutex_lock(&mutex_);
  ++inflight_;
  pthread_mutex_unlock(&mutex_);
}

void WorkPool::MarkWorkerDone() {
  pthread_mutex_lock(&mutex_);
  if (inflight_ > 0) {
    --inflight_;
  }
  if (inflight_ == 0) {
    pthread_cond_broadcast(&cond_);
  }
  pthread_mutex_unlock(&mutex_);
}

void WorkPool::WaitAll() {
  pthread_mutex_lock(&mutex_);
  while (inflight_ > 0) {
    pthread_cond_wait(&cond_, &mutex_);
  }
  pthread_mutex_unlock(&mutex_);
}

void WorkPool::RunTasks(Batch* batch) {
  while (true) {
    const std::size_t index = batch->next.fetch_add(1, std::memory_order_relaxed);
    if (index >= batch->count) {
      return;
    }
    try {
      (*batch->task)(index);
    } catch (const std::exception& ex) {
      // Each index is claimed once, so the slot has a single writer.
      batch->pool->failures_[index] = ex.what();
    }
  }
}

void* WorkPool::WorkerMain(void* opaque) {
  Batch* batch = static_cast<Batch*>(opaque);
  RunTasks(batch);
  batch->pool->MarkWorkerDone();
  return nullptr;
}

void WorkPool::RunAll(std::size_t count, const std::function<void(std::size_t)>& task) {
  failures_.assign(count, std::string());
  if (count == 0) {
    return;
  }

  Batch batch;
  batch.pool = this;
  batch.task = &task;
  batch.count = count;

  const std::size_t workers = std::min<std::size_t>(jobs_, count);
  for (std::size_t i = 0; i < workers; ++i) {
    MarkWorkerStart();
    pthread_t thread{};
    if (pthread_create(&thread, nullptr, WorkerMain, &batch) != 0) {
      MarkWorkerDone();
      break;
    }
    pthread_detach(thread);
  }

  // The calling thread drains whatever is left, so a failed pthread_create
  // only costs parallelism.
  RunTasks(&batch);
  WaitAll();
}

unsigned DefaultJobCount() {
  const unsigned hardware = std::thread::hardware_concurrency();
  return hardware == 0 ? 1U : hardware;
}

}  // namespace ffibridge::frontend::internal
