/*
 * Copyright (c) 2026 JBL AV Bridge Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "jblav_utils/scheduling/thread_scheduler.hpp"

#include <exception>

#include <rclcpp/rclcpp.hpp>

namespace jblav
{
namespace scheduling
{

ThreadScheduler::~ThreadScheduler()
{
  stop();
}

void ThreadScheduler::start()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  stop_requested_ = false;
  worker_ = std::thread(&ThreadScheduler::workerLoop, this);
}

void ThreadScheduler::stop()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  queue_.clear();
}

bool ThreadScheduler::running() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ && !stop_requested_;
}

TimePoint ThreadScheduler::now() const
{
  return Clock::now();
}

TaskId ThreadScheduler::schedule(Duration delay, Task task)
{
  TaskId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = queue_.push(Clock::now() + delay, std::move(task));
  }
  cv_.notify_all();
  return id;
}

bool ThreadScheduler::cancel(TaskId id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.cancel(id);
}

size_t ThreadScheduler::pending() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void ThreadScheduler::runTask(Task & task)
{
  try {
    task();
  } catch (const std::exception & e) {
    RCLCPP_ERROR(rclcpp::get_logger("JblAvScheduler"), "Scheduled task threw: %s", e.what());
  }
}

void ThreadScheduler::workerLoop()
{
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    TimePoint deadline;
    Task task;
    if (queue_.popDue(Clock::now(), deadline, task)) {
      lock.unlock();
      runTask(task);
      lock.lock();
      continue;
    }

    if (stop_requested_) {
      // Everything due has run; later timers are abandoned
      return;
    }

    if (queue_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, queue_.nextDeadline());
    }
  }
}

} // namespace scheduling
} // namespace jblav
