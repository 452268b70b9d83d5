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

#ifndef JBLAV_UTILS__CONNECTION__BACKOFF_HPP_
#define JBLAV_UTILS__CONNECTION__BACKOFF_HPP_

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace jblav
{
namespace connection
{

struct BackoffPolicy
{
  std::chrono::milliseconds initial{1000};
  std::chrono::milliseconds max{30000};
  double multiplier = 2.0;
  double jitter = 0.2;    // random fraction of the delay, 0..1
};

/**
 * Exponential reconnect delay with a ceiling and jitter.
 * Successive delays never decrease until the base reaches the ceiling; from then
 * on each delay is drawn from [max * (1 - jitter), max].
 */
class Backoff
{
public:
  explicit Backoff(BackoffPolicy policy = {});
  Backoff(BackoffPolicy policy, uint32_t seed);

  std::chrono::milliseconds next();
  void reset();

  int attempts() const {return attempts_;}
  const BackoffPolicy & policy() const {return policy_;}

private:
  BackoffPolicy policy_;
  std::mt19937 rng_;
  double base_ms_;
  std::chrono::milliseconds last_{0};
  int attempts_ = 0;
};

} // namespace connection
} // namespace jblav

#endif  // JBLAV_UTILS__CONNECTION__BACKOFF_HPP_
