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

#include "concurrency/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>

namespace quickcull {
ThreadPool::ThreadPool(size_t thread_count) {
  thread_count = std::max<size_t>(thread_count, 1);
  for (size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerThread, this);
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(mtx_);
    stop_ = true;
  }
  condition_.notify_all();
  for (std::thread& worker : workers_) {
    worker.join();
  }
}

auto ThreadPool::Submit(std::function<void()> task, PriorityLevel priority) -> task_id_t {
  task_id_t id;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    id = ++next_id_;
    tasks_.emplace(QueueKey{priority, id}, std::move(task));
    queued_priority_.emplace(id, priority);
  }
  condition_.notify_one();
  return id;
}

auto ThreadPool::Reprioritize(task_id_t id, PriorityLevel priority) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        it = queued_priority_.find(id);
  if (it == queued_priority_.end()) {
    return false;
  }
  if (it->second == priority) {
    return true;
  }
  // Keep the submission order as tie breaker
  auto node     = tasks_.extract(QueueKey{it->second, id});
  node.key()    = QueueKey{priority, id};
  tasks_.insert(std::move(node));
  it->second = priority;
  return true;
}

auto ThreadPool::PendingCount() -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

void ThreadPool::WorkerThread() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) return;
      auto front = tasks_.begin();
      queued_priority_.erase(front->first.id_);
      task = std::move(front->second);
      tasks_.erase(front);
    }
    try {
      task();
    } catch (const std::exception& e) {
      // Tasks report through their own futures, anything reaching here is a bug in the task
      spdlog::error("[ThreadPool] Task threw: {}", e.what());
    }
  }
}
};  // namespace quickcull
