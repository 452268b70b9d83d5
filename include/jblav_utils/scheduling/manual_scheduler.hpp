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

#ifndef JBLAV_UTILS__SCHEDULING__MANUAL_SCHEDULER_HPP_
#define JBLAV_UTILS__SCHEDULING__MANUAL_SCHEDULER_HPP_

#pragma once

#include <mutex>

#include "jblav_utils/scheduling/scheduler.hpp"

namespace jblav
{
namespace scheduling
{

/**
 * @brief Scheduler driven by a virtual clock
 *
 * Nothing runs until the owner calls runPending() or advance(). Time only
 * moves inside advance(), which makes timeout, retry and backoff behavior
 * reproducible in tests. Exceptions thrown by tasks propagate to the caller.
 */
class ManualScheduler : public Scheduler
{
public:
  ManualScheduler();

  TimePoint now() const override;
  TaskId schedule(Duration delay, Task task) override;
  bool cancel(TaskId id) override;

  // Run every task whose deadline is <= now(), including ones they post.
  // Returns the number of tasks run.
  size_t runPending();

  // Move the clock forward by delta, running due tasks at their deadlines
  size_t advance(Duration delta);

  size_t pending() const;
  // Deadline of the earliest queued task, or now() if the queue is empty
  TimePoint nextDeadline() const;

private:
  mutable std::mutex mutex_;
  TaskQueue queue_;
  TimePoint now_;
};

} // namespace scheduling
} // namespace jblav

#endif  // JBLAV_UTILS__SCHEDULING__MANUAL_SCHEDULER_HPP_
