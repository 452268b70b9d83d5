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

#include "jblav_utils/scheduling/scheduler.hpp"

namespace jblav
{
namespace scheduling
{

TaskId scheduleGuarded(
  Scheduler & scheduler, std::weak_ptr<void> owner, Duration delay, Task task)
{
  return scheduler.schedule(
    delay, [owner = std::move(owner), task = std::move(task)]() {
      if (!owner.expired()) {
        task();
      }
    });
}

TaskId TaskQueue::push(TimePoint deadline, Task task)
{
  const TaskId id = next_id_++;
  tasks_.emplace(Key(deadline, id), std::move(task));
  index_.emplace(id, deadline);
  return id;
}

bool TaskQueue::cancel(TaskId id)
{
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  tasks_.erase(Key(it->second, id));
  index_.erase(it);
  return true;
}

bool TaskQueue::popDue(TimePoint limit, TimePoint & deadline, Task & task)
{
  if (tasks_.empty()) {
    return false;
  }
  auto it = tasks_.begin();
  if (it->first.first > limit) {
    return false;
  }
  deadline = it->first.first;
  task = std::move(it->second);
  index_.erase(it->first.second);
  tasks_.erase(it);
  return true;
}

void TaskQueue::clear()
{
  tasks_.clear();
  index_.clear();
}

} // namespace scheduling
} // namespace jblav
