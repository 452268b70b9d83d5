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

#include "jblav_utils/connection/backoff.hpp"

#include <algorithm>

namespace jblav
{
namespace connection
{

Backoff::Backoff(BackoffPolicy policy)
: Backoff(policy, std::random_device{}())
{
}

Backoff::Backoff(BackoffPolicy policy, uint32_t seed)
: policy_(policy),
  rng_(seed),
  base_ms_(static_cast<double>(policy.initial.count()))
{
  policy_.jitter = std::min(1.0, std::max(0.0, policy_.jitter));
  policy_.multiplier = std::max(1.0, policy_.multiplier);
  if (policy_.max < policy_.initial) {
    policy_.max = policy_.initial;
  }
}

std::chrono::milliseconds Backoff::next()
{
  const double cap = static_cast<double>(policy_.max.count());
  std::uniform_real_distribution<double> dist(0.0, policy_.jitter);

  if (base_ms_ < cap) {
    const double delay = std::min(cap, base_ms_ * (1.0 + dist(rng_)));
    // Jitter can undercut the previous delay while the base still grows
    last_ = std::max(last_, std::chrono::milliseconds(static_cast<int64_t>(delay)));
  } else {
    // At the ceiling the jitter spreads delays below it instead of pinning them to max
    const double floor = static_cast<double>(policy_.initial.count());
    const double delay = std::max(floor, cap * (1.0 - dist(rng_)));
    last_ = std::chrono::milliseconds(static_cast<int64_t>(delay));
  }
  base_ms_ = std::min(cap, base_ms_ * policy_.multiplier);
  ++attempts_;
  return last_;
}

void Backoff::reset()
{
  base_ms_ = static_cast<double>(policy_.initial.count());
  last_ = std::chrono::milliseconds(0);
  attempts_ = 0;
}

} // namespace connection
} // namespace jblav
