// util/alignkit-thread.h

// Copyright 2012  Johns Hopkins University (Author: Daniel Povey)
//                 Frantisek Skala
//           2017  University of Southern California (Author: Dogan Can)
//           2026  Alignkit Authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef ALIGNKIT_UTIL_ALIGNKIT_THREAD_H_
#define ALIGNKIT_UTIL_ALIGNKIT_THREAD_H_

#include <condition_variable>
#include <mutex>
#include <thread>
#include <algorithm>
#include <vector>

#include "itf/options-itf.h"
#include "base/alignkit-common.h"

// This header provides TaskSequencer, which runs tasks in a bounded pool of
// threads while making sure that their "output" stage happens in the order
// in which the tasks were given to Run().  The C++11 threading library is
// used for the threads and synchronization.

namespace alignkit {

struct TaskSequencerConfig {
  int32 num_threads;
  int32 num_threads_total;
  TaskSequencerConfig(): num_threads(1), num_threads_total(0)  { }
  void Register(OptionsItf *opts) {
    opts->Register("num-threads", &num_threads, "Number of actively processing "
                   "threads to run in parallel");
    opts->Register("num-threads-total", &num_threads_total, "Total number of "
                   "threads, including those that are waiting on other threads "
                   "to produce their output.  Controls memory use.  If <= 0, "
                   "defaults to --num-threads plus 20.  Otherwise, must "
                   "be >= num-threads.");
  }
};

/// A mutex-and-condition-variable semaphore, used by TaskSequencer to
/// bound the number of threads.
class Semaphore {
 public:
  explicit Semaphore(int32 count = 0): count_(count) {
    ALIGNKIT_ASSERT(count >= 0);
  }

  /// Returns true if it decremented the count without waiting.
  bool TryWait() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (count_) {
      count_--;
      return true;
    }
    return false;
  }

  void Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (count_ == 0)
      condition_variable_.wait(lock);
    count_--;
  }

  void Signal() {
    std::unique_lock<std::mutex> lock(mutex_);
    count_++;
    condition_variable_.notify_one();
  }

 private:
  int32 count_;
  std::mutex mutex_;
  std::condition_variable condition_variable_;
  ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(Semaphore);
};

// C should have an operator () taking no arguments, that does some kind
// of computation, and a destructor that produces some kind of output.
// The operator () may be run in a different thread than the one
// that called Run(), and the destructors are run sequentially, in the
// same order in which Run() was called.
template<class C>
class TaskSequencer {
 public:
  TaskSequencer(const TaskSequencerConfig &config):
      num_threads_(config.num_threads),
      threads_avail_(config.num_threads),
      tot_threads_avail_(config.num_threads_total > 0 ? config.num_threads_total :
                         config.num_threads + 20),
      thread_list_(NULL) {
    ALIGNKIT_ASSERT((config.num_threads_total <= 0 ||
                     config.num_threads_total >= config.num_threads) &&
                    "num-threads-total, if specified, must be >= num-threads");
  }

  /// This function takes ownership of the pointer "c", and will delete it
  /// in the same sequence as Run was called on the jobs.
  void Run(C *c) {
    // run in main thread
    if (num_threads_ == 0) {
      (*c)();
      delete c;
      return;
    }

    threads_avail_.Wait();  // wait till we have a thread for computation free.
    tot_threads_avail_.Wait();  // this ensures we don't have too many threads
                                // waiting on I/O, and consuming memory.

    // put the new RunTaskArgsList object at head of the singly
    // linked list thread_list_.
    thread_list_ = new RunTaskArgsList(this, c, thread_list_);
    thread_list_->thread = std::thread(TaskSequencer<C>::RunTask,
                                       thread_list_);
  }

  void Wait() {  // You call this at the end if it's more convenient
    // than waiting for the destructor.  It waits for all tasks to finish.
    if (thread_list_ != NULL) {
      thread_list_->thread.join();
      ALIGNKIT_ASSERT(thread_list_->tail == NULL);  // thread would not
      // have exited without setting tail to NULL.
      delete thread_list_;
      thread_list_ = NULL;
    }
  }

  /// The destructor waits for the last thread to exit.
  ~TaskSequencer() {
    Wait();
  }
 private:
  struct RunTaskArgsList {
    TaskSequencer *me;  // Think of this as a "this" pointer.
    C *c;  // Clist element.
    std::thread thread;
    RunTaskArgsList *tail;
    RunTaskArgsList(TaskSequencer *me, C *c, RunTaskArgsList *tail):
        me(me), c(c), tail(tail) {}
  };
  // This static function gets run in the threads that we create.
  static void RunTask(RunTaskArgsList *args) {
    // (1) run the job.
    (*(args->c))();  // call operator () on args->c, which does the computation.
    args->me->threads_avail_.Signal();  // Signal that the compute-intensive
    // part of the thread is done (we want to run no more than
    // config_.num_threads of these.)

    // (2) we want to destroy the object "c" now, by deleting it.  But for
    //     correct sequencing (this is the whole point of this class, it
    //     is intended to ensure the output of the program is in correct order),
    //     we first wait till the previous thread, whose details will be in "tail",
    //     is finished.
    if (args->tail != NULL) {
      args->tail->thread.join();
    }

    delete args->c;  // delete the object "c".  This may cause some output,
    // e.g. to a stream.  We don't need to worry about concurrent access to
    // the output stream, because each thread waits for the previous thread
    // to be done, before doing this.  So there is no risk of concurrent
    // access.
    args->c = NULL;

    if (args->tail != NULL) {
      ALIGNKIT_ASSERT(args->tail->tail == NULL);  // Because we already
      // did join on args->tail->thread, which means that
      // thread was done, and before it exited, it would have
      // deleted and set to NULL its tail (which is the next line of code).
      delete args->tail;
      args->tail = NULL;
    }
    // At this point we are exiting from the thread.  Signal the
    // "tot_threads_avail_" semaphore which is used to limit the total number of threads that are alive, including
    // not onlhy those that are in active computation in c->operator (), but those
    // that are waiting on I/O or other threads.
    args->me->tot_threads_avail_.Signal();
  }

  int32 num_threads_;  // copy of config.num_threads (since Semaphore doesn't store original count).

  Semaphore threads_avail_;  // Initialized to the number of threads we are
  // supposed to run with; the function Run() waits on this.

  Semaphore tot_threads_avail_;  // We use this semaphore to ensure we don't
  // consume too much memory...
  RunTaskArgsList *thread_list_;

};

}  // namespace alignkit

#endif  // ALIGNKIT_UTIL_ALIGNKIT_THREAD_H_
