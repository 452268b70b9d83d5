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

#ifndef JBLAV_UTILS__CONFIG__CONFIG_HPP_
#define JBLAV_UTILS__CONFIG__CONFIG_HPP_

#pragma once

#include <string>

namespace jblav
{
namespace config
{

struct Timing
{
  int connect_timeout_ms = 5000;
  int command_timeout_ms = 3000;
  int command_retries = 2;
  int coalesce_window_ms = 50;
  int heartbeat_interval_ms = 10000;
  int idle_timeout_ms = 30000;
  int reconnect_initial_ms = 1000;
  int reconnect_max_ms = 30000;
  double reconnect_jitter = 0.2;
};

struct LimitedControl
{
  int command_timeouts = 2;
  int refused_connects = 3;
};

struct Features
{
  bool query_on_connect = true;
  bool log_latency_stats = false;
};

struct Config
{
  std::string host;
  std::string name = "JBL AV Receiver";
  Timing timing;
  LimitedControl limited_control;
  Features features;

  void validate() const;
};

Config parse_from_yaml_file(const std::string & path);
Config parse_from_yaml_string(const std::string & yaml);

} // namespace config
} // namespace jblav

#endif  // JBLAV_UTILS__CONFIG__CONFIG_HPP_
