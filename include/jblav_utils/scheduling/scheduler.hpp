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

#ifndef JBLAV_UTILS__SCHEDULING__SCHEDULER_HPP_
#define JBLAV_UTILS__SCHEDULING__SCHEDULER_HPP_

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>
#include <utility>

namespace jblav
{
namespace scheduling
{

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using Task = std::function<void ()>;
using TaskId = uint64_t;

static constexpr TaskId kInvalidTask = 0;

/**
 * @brief Single execution context with a cancellable timer queue
 *
 * Tasks run one at a time, ordered by deadline and then by submission order,
 * so two post() calls from the same thread run in the order they were made.
 * Every component state that the connection, synchronizer and dispatcher
 * share is touched only from inside scheduled tasks.
 */
class Scheduler
{
public:
  virtual ~Scheduler() = default;

  virtual TimePoint now() const = 0;
  virtual TaskId schedule(Duration delay, Task task) = 0;
  // Returns false if the task already ran or was never scheduled
  virtual bool cancel(TaskId id) = 0;

  TaskId post(Task task) {return schedule(Duration::zero(), std::move(task));}
};

// Schedules task so that it is skipped if owner has expired by the time it runs
TaskId scheduleGuarded(
  Scheduler & scheduler, std::weak_ptr<void> owner, Duration delay, Task task);

/**
 * Deadline-ordered task storage shared by the scheduler implementations.
 * Not thread-safe; callers hold their own lock.
 */
class TaskQueue
{
public:
  TaskId push(TimePoint deadline, Task task);
  bool cancel(TaskId id);

  bool empty() const {return tasks_.empty();}
  size_t size() const {return tasks_.size();}
  // Only valid when !empty()
  TimePoint nextDeadline() const {return tasks_.begin()->first.first;}

  // Removes and returns the earliest task if its deadline is <= limit
  bool popDue(TimePoint limit, TimePoint & deadline, Task & task);
  void clear();

private:
  using Key = std::pair<TimePoint, TaskId>;

  TaskId next_id_ = 1;
  std::map<Key, Task> tasks_;
  std::unordered_map<TaskId, TimePoint> index_;
};

} // namespace scheduling
} // namespace jblav

#endif  // JBLAV_UTILS__SCHEDULING__SCHEDULER_HPP_
