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

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "jblav_utils/config/config.hpp"

using namespace jblav::config;

TEST(ConfigParse, MinimalConfigUsesDefaults) {
  const auto cfg = parse_from_yaml_string(
    "jblav_bridge:\n"
    "  host: 192.168.1.40\n");
  EXPECT_EQ(cfg.host, "192.168.1.40");
  EXPECT_EQ(cfg.name, "JBL AV Receiver");
  EXPECT_EQ(cfg.timing.command_timeout_ms, 3000);
  EXPECT_EQ(cfg.timing.command_retries, 2);
  EXPECT_EQ(cfg.timing.coalesce_window_ms, 50);
  EXPECT_EQ(cfg.limited_control.command_timeouts, 2);
  EXPECT_TRUE(cfg.features.query_on_connect);
  EXPECT_FALSE(cfg.features.log_latency_stats);
}

TEST(ConfigParse, FullConfig) {
  const auto cfg = parse_from_yaml_string(
    "# living room\n"
    "jblav_bridge:\n"
    "  host: \"avr.local\"\n"
    "  name: 'Room #2'   # quoted hash stays\n"
    "  timing:\n"
    "    connect_timeout_ms: 2000\n"
    "    command_timeout_ms: 1500\n"
    "    command_retries: 1\n"
    "    coalesce_window_ms: 0\n"
    "    heartbeat_interval_ms: 5000\n"
    "    idle_timeout_ms: 12000\n"
    "    reconnect_initial_ms: 500\n"
    "    reconnect_max_ms: 8000\n"
    "    reconnect_jitter: 0.1\n"
    "  limited_control:\n"
    "    command_timeouts: 3\n"
    "    refused_connects: 5\n"
    "  features:\n"
    "    query_on_connect: no\n"
    "    log_latency_stats: true\n");

  EXPECT_EQ(cfg.host, "avr.local");
  EXPECT_EQ(cfg.name, "Room #2");
  EXPECT_EQ(cfg.timing.connect_timeout_ms, 2000);
  EXPECT_EQ(cfg.timing.command_timeout_ms, 1500);
  EXPECT_EQ(cfg.timing.command_retries, 1);
  EXPECT_EQ(cfg.timing.coalesce_window_ms, 0);
  EXPECT_EQ(cfg.timing.heartbeat_interval_ms, 5000);
  EXPECT_EQ(cfg.timing.idle_timeout_ms, 12000);
  EXPECT_EQ(cfg.timing.reconnect_initial_ms, 500);
  EXPECT_EQ(cfg.timing.reconnect_max_ms, 8000);
  EXPECT_DOUBLE_EQ(cfg.timing.reconnect_jitter, 0.1);
  EXPECT_EQ(cfg.limited_control.command_timeouts, 3);
  EXPECT_EQ(cfg.limited_control.refused_connects, 5);
  EXPECT_FALSE(cfg.features.query_on_connect);
  EXPECT_TRUE(cfg.features.log_latency_stats);
}

TEST(ConfigParse, SectionsCloseOnDedent) {
  const auto cfg = parse_from_yaml_string(
    "jblav_bridge:\n"
    "  timing:\n"
    "    command_retries: 0\n"
    "  host: 10.0.0.2\n"
    "  extra:\n"
    "    host: ignored\n"
    "other_tool:\n"
    "  host: also.ignored\n");
  EXPECT_EQ(cfg.host, "10.0.0.2");
  EXPECT_EQ(cfg.timing.command_retries, 0);
}

TEST(ConfigParse, Rejections) {
  EXPECT_THROW(parse_from_yaml_string("other:\n  host: x\n"), std::runtime_error);
  EXPECT_THROW(parse_from_yaml_string("jblav_bridge:\n  name: x\n"), std::runtime_error);
  EXPECT_THROW(
    parse_from_yaml_string("jblav_bridge:\n  host: a\n  port: 50001\n"), std::runtime_error);
  EXPECT_THROW(
    parse_from_yaml_string(
      "jblav_bridge:\n  host: a\n  timing:\n    command_retries: two\n"),
    std::runtime_error);
  EXPECT_THROW(
    parse_from_yaml_string(
      "jblav_bridge:\n  host: a\n  features:\n    query_on_connect: maybe\n"),
    std::runtime_error);
}

TEST(ConfigValidate, Ranges) {
  Config cfg;
  cfg.host = "avr";
  EXPECT_NO_THROW(cfg.validate());

  Config bad = cfg;
  bad.host = "two words";
  EXPECT_THROW(bad.validate(), std::runtime_error);

  bad = cfg;
  bad.timing.command_retries = 11;
  EXPECT_THROW(bad.validate(), std::runtime_error);

  bad = cfg;
  bad.timing.idle_timeout_ms = bad.timing.heartbeat_interval_ms;
  EXPECT_THROW(bad.validate(), std::runtime_error);

  bad = cfg;
  bad.timing.reconnect_max_ms = 100;
  EXPECT_THROW(bad.validate(), std::runtime_error);

  bad = cfg;
  bad.timing.reconnect_jitter = 1.5;
  EXPECT_THROW(bad.validate(), std::runtime_error);

  bad = cfg;
  bad.limited_control.refused_connects = 0;
  EXPECT_THROW(bad.validate(), std::runtime_error);
}

TEST(ConfigFile, ReadsFromDisk) {
  const std::string path = ::testing::TempDir() + "jblav_config_test.yaml";
  {
    std::ofstream out(path);
    out << "jblav_bridge:\r\n  host: 172.16.0.9\r\n";
  }
  EXPECT_EQ(parse_from_yaml_file(path).host, "172.16.0.9");
  std::remove(path.c_str());
  EXPECT_THROW(parse_from_yaml_file(path), std::runtime_error);
}
