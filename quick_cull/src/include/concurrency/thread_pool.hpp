//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "type/type.hpp"

namespace quickcull {
/**
 * @brief Fixed-size worker pool. Queued tasks run highest priority first, FIFO within one
 *        priority, and may be re-prioritized until a worker picks them up.
 */
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  auto Submit(std::function<void()> task, PriorityLevel priority = 0) -> task_id_t;

  /**
   * @brief Move a queued task to a new priority
   *
   * @return false if the task already started or never existed
   */
  auto Reprioritize(task_id_t id, PriorityLevel priority) -> bool;

  auto PendingCount() -> size_t;
  auto ThreadCount() const -> size_t { return workers_.size(); }

 private:
  struct QueueKey {
    PriorityLevel priority_;
    task_id_t     id_;

    bool          operator<(const QueueKey& other) const {
      if (priority_ != other.priority_) return priority_ > other.priority_;
      return id_ < other.id_;
    }
  };

  std::map<QueueKey, std::function<void()>>   tasks_;
  std::unordered_map<task_id_t, PriorityLevel> queued_priority_;
  std::mutex                                  mtx_;
  std::condition_variable                     condition_;
  std::vector<std::thread>                    workers_;

  task_id_t                                   next_id_ = 0;
  bool                                        stop_    = false;

  void                                        WorkerThread();
};
};  // namespace quickcull
