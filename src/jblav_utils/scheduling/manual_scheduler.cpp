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

#include "jblav_utils/scheduling/manual_scheduler.hpp"

namespace jblav
{
namespace scheduling
{

// Start away from the epoch so "now - timeout" never underflows
ManualScheduler::ManualScheduler()
: now_(TimePoint(std::chrono::hours(1)))
{
}

TimePoint ManualScheduler::now() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

TaskId ManualScheduler::schedule(Duration delay, Task task)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (delay < Duration::zero()) {
    delay = Duration::zero();
  }
  return queue_.push(now_ + delay, std::move(task));
}

bool ManualScheduler::cancel(TaskId id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.cancel(id);
}

size_t ManualScheduler::runPending()
{
  size_t count = 0;
  for (;;) {
    TimePoint deadline;
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!queue_.popDue(now_, deadline, task)) {
        return count;
      }
    }
    task();
    ++count;
  }
}

size_t ManualScheduler::advance(Duration delta)
{
  TimePoint target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target = now_ + delta;
  }

  size_t count = 0;
  for (;;) {
    TimePoint deadline;
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!queue_.popDue(target, deadline, task)) {
        now_ = target;
        break;
      }
      if (deadline > now_) {
        now_ = deadline;
      }
    }
    task();
    ++count;
  }
  return count;
}

size_t ManualScheduler::pending() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

TimePoint ManualScheduler::nextDeadline() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty() ? now_ : queue_.nextDeadline();
}

} // namespace scheduling
} // namespace jblav
