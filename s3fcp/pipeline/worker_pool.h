/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_WORKER_POOL_H_
#define S3FCP_PIPELINE_WORKER_POOL_H_

#include <pthread.h>

#include <vector>

#include "util/exception.h"
#include "util/single_copy.h"
#include "util/tube.h"

template <class JobT>
class WorkerPool;


/**
 * A thread that pops jobs from a shared tube until it finds a quit beacon.
 * Every job handed to Process() is owned by the worker.  OnTerminate() runs
 * in the worker thread after the quit beacon.
 */
template <class JobT>
class Worker : SingleCopy {
  friend class WorkerPool<JobT>;

 public:
  virtual ~Worker() { }

 protected:
  explicit Worker(Tube<JobT> *jobs) : jobs_(jobs) { }

  virtual void Process(JobT *job) = 0;
  virtual void OnTerminate() { }

  Tube<JobT> *jobs_;

 private:
  static void *MainWorker(void *data) {
    Worker<JobT> *worker = reinterpret_cast<Worker<JobT> *>(data);
    JobT *job = worker->jobs_->PopFront();
    while (!job->IsQuitBeacon()) {
      worker->Process(job);
      job = worker->jobs_->PopFront();
    }
    delete job;
    worker->OnTerminate();
    return NULL;
  }
};


/**
 * Owns a fixed set of workers sharing one job tube.  The producer stops the
 * pool by enqueuing one quit beacon per worker and then calls Join().
 */
template <class JobT>
class WorkerPool : SingleCopy {
 public:
  WorkerPool() : is_running_(false) { }

  ~WorkerPool() {
    for (unsigned i = 0; i < workers_.size(); ++i)
      delete workers_[i];
  }

  /**
   * Takes ownership of the worker.  Only valid before Start().
   */
  void Add(Worker<JobT> *worker) {
    if (is_running_)
      PANIC(kLogStderr, "cannot add workers to a running pool");
    workers_.push_back(worker);
  }

  void Start() {
    if (is_running_)
      PANIC(kLogStderr, "worker pool started twice");
    threads_.resize(workers_.size());
    for (unsigned i = 0; i < workers_.size(); ++i) {
      const int retval = pthread_create(&threads_[i], NULL,
                                        Worker<JobT>::MainWorker, workers_[i]);
      if (retval != 0)
        PANIC(kLogStderr, "failed to start worker %u (error: %d)", i, retval);
    }
    is_running_ = true;
  }

  void Join() {
    if (!is_running_)
      return;
    for (unsigned i = 0; i < threads_.size(); ++i) {
      const int retval = pthread_join(threads_[i], NULL);
      if (retval != 0)
        PANIC(kLogStderr, "failed to join worker %u (error: %d)", i, retval);
    }
    is_running_ = false;
  }

 private:
  bool is_running_;
  std::vector<Worker<JobT> *> workers_;
  std::vector<pthread_t> threads_;
};

#endif  // S3FCP_PIPELINE_WORKER_POOL_H_
