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

#ifndef JBLAV_UTILS__SCHEDULING__THREAD_SCHEDULER_HPP_
#define JBLAV_UTILS__SCHEDULING__THREAD_SCHEDULER_HPP_

#pragma once

#include <condition_variable>
#include <mutex>
#include <thread>

#include "jblav_utils/scheduling/scheduler.hpp"

namespace jblav
{
namespace scheduling
{

// Runs tasks on one dedicated worker thread against the steady clock
class ThreadScheduler : public Scheduler
{
public:
  ThreadScheduler() = default;
  ~ThreadScheduler() override;

  ThreadScheduler(const ThreadScheduler &) = delete;
  ThreadScheduler & operator=(const ThreadScheduler &) = delete;

  void start();
  // Runs the tasks that are already due, drops future timers and joins
  void stop();
  bool running() const;

  TimePoint now() const override;
  TaskId schedule(Duration delay, Task task) override;
  bool cancel(TaskId id) override;

  size_t pending() const;

private:
  void workerLoop();
  void runTask(Task & task);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  TaskQueue queue_;
  std::thread worker_;
  bool running_ = false;
  bool stop_requested_ = false;
};

} // namespace scheduling
} // namespace jblav

#endif  // JBLAV_UTILS__SCHEDULING__THREAD_SCHEDULER_HPP_
