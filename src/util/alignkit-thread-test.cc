// util/alignkit-thread-test.cc

// Copyright 2012  Johns Hopkins University (Author: Daniel Povey)
//           2026  Alignkit Authors
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

#include "base/alignkit-common.h"
#include "util/alignkit-thread.h"

namespace alignkit {

class MyTaskClass {  // spins for a while, then outputs its index to a vector.
 public:
  MyTaskClass(int32 i, std::vector<int32> *vec):
      done_(false), i_(i), vec_(vec) { }

  void operator() () {
    int32 spin = static_cast<int32>(1000000.0 * Rand() / RAND_MAX);
    for (int32 i = 0; i < spin; i++);
    done_ = true;
  }
  ~MyTaskClass() {
    ALIGNKIT_ASSERT(done_);
    vec_->push_back(i_);
  }

 private:
  bool done_;
  int32 i_;
  std::vector<int32> *vec_;
};


void TestTaskSequencer() {
  TaskSequencerConfig config;
  config.num_threads = 1 + Rand() % 20;
  if (Rand() % 2 == 1 )
    config.num_threads_total = config.num_threads + Rand() % config.num_threads;

  int32 num_tasks = Rand() % 100;

  std::vector<int32> task_output;
  {
    TaskSequencer<MyTaskClass> sequencer(config);
    for (int32 i = 0; i < num_tasks; i++) {
      sequencer.Run(new MyTaskClass(i, &task_output));
    }
  }  // and let "sequencer" be destroyed, which waits for the last threads.
  ALIGNKIT_ASSERT(task_output.size() == static_cast<size_t>(num_tasks));
  for (int32 i = 0; i < num_tasks; i++)
    ALIGNKIT_ASSERT(task_output[i] == i);
}

void TestTaskSequencerWait() {
  TaskSequencerConfig config;
  config.num_threads = 4;
  std::vector<int32> task_output;
  TaskSequencer<MyTaskClass> sequencer(config);
  for (int32 i = 0; i < 10; i++)
    sequencer.Run(new MyTaskClass(i, &task_output));
  sequencer.Wait();
  ALIGNKIT_ASSERT(task_output.size() == 10);
  for (int32 i = 0; i < 10; i++)
    ALIGNKIT_ASSERT(task_output[i] == i);
  // The sequencer may be reused after Wait().
  sequencer.Run(new MyTaskClass(10, &task_output));
  sequencer.Wait();
  ALIGNKIT_ASSERT(task_output.size() == 11 && task_output[10] == 10);
}

void TestTaskSequencerInMainThread() {
  TaskSequencerConfig config;
  config.num_threads = 0;
  std::vector<int32> task_output;
  TaskSequencer<MyTaskClass> sequencer(config);
  for (int32 i = 0; i < 5; i++) {
    sequencer.Run(new MyTaskClass(i, &task_output));
    ALIGNKIT_ASSERT(task_output.size() == static_cast<size_t>(i + 1));
  }
}

}  // end namespace alignkit

int main() {
  using namespace alignkit;
  for (int32 i = 0; i < 100; i++)
    TestTaskSequencer();
  TestTaskSequencerWait();
  TestTaskSequencerInMainThread();
  std::cout << "Test OK.\n";
}
