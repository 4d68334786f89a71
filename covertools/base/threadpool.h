// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef COVERTOOLS_BASE_THREADPOOL_H_
#define COVERTOOLS_BASE_THREADPOOL_H_

#include <condition_variable>  // NOLINT
#include <functional>
#include <list>
#include <mutex>  // NOLINT
#include <thread>  // NOLINT
#include <vector>

#include "absl/strings/string_view.h"

namespace covertools {

// A fixed-size pool of worker threads. Closures scheduled before
// StartWorkers() are queued and run once the workers start. The destructor
// waits for all the scheduled closures to complete.
class ThreadPool {
 public:
  ThreadPool(absl::string_view prefix, int num_threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void StartWorkers();
  void Schedule(std::function<void()> closure);
  std::function<void()> GetNextTask();

 private:
  const int num_workers_;
  std::list<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable condition_;
  bool waiting_to_finish_ = false;
  bool started_ = false;
  std::vector<std::thread> all_workers_;
};

// Runs `shard_fn(shard)` for every shard in [0, num_shards), using up to
// `num_threads` threads, and returns when all of them are done. With
// num_threads <= 1, everything runs inline in the calling thread, in order.
// `shard_fn` must be safe to run concurrently on distinct shards.
void ParallelForEachShard(int num_shards, int num_threads,
                          const std::function<void(int)>& shard_fn);

}  // namespace covertools

#endif  // COVERTOOLS_BASE_THREADPOOL_H_
