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

#include "jblav_utils/config/config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace jblav
{
namespace config
{

static inline std::string trim(const std::string & s)
{
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {++i;}
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {--j;}
  return s.substr(i, j - i);
}

// A '#' only starts a comment at line start or after whitespace, so that
// names like "Room #2" survive when quoted
static inline std::string strip_inline_comment(const std::string & s)
{
  char quote = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quote) {
      if (c == quote) {quote = 0;}
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(s[i - 1])))) {
      return s.substr(0, i);
    }
  }
  return s;
}

static inline size_t indent_of(const std::string & s)
{
  size_t n = 0;
  while (n < s.size() && s[n] == ' ') {++n;}
  return n;
}

static inline bool ieq(const std::string & a, const std::string & b)
{
  if (a.size() != b.size()) {return false;}
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {return false;}
  }
  return true;
}

void Config::validate() const
{
  if (host.empty()) {throw std::runtime_error("host missing");}
  if (host.find_first_of(" \t") != std::string::npos) {
    throw std::runtime_error("host must not contain whitespace");
  }
  if (timing.connect_timeout_ms <= 0) {throw std::runtime_error("connect_timeout_ms must be >0");}
  if (timing.command_timeout_ms <= 0) {throw std::runtime_error("command_timeout_ms must be >0");}
  if (timing.command_retries < 0 || timing.command_retries > 10) {
    throw std::runtime_error("command_retries out of range");
  }
  if (timing.coalesce_window_ms < 0 || timing.coalesce_window_ms > 1000) {
    throw std::runtime_error("coalesce_window_ms out of range");
  }
  if (timing.heartbeat_interval_ms <= 0) {
    throw std::runtime_error("heartbeat_interval_ms must be >0");
  }
  if (timing.idle_timeout_ms <= timing.heartbeat_interval_ms) {
    throw std::runtime_error("idle_timeout_ms must exceed heartbeat_interval_ms");
  }
  if (timing.reconnect_initial_ms <= 0) {
    throw std::runtime_error("reconnect_initial_ms must be >0");
  }
  if (timing.reconnect_max_ms < timing.reconnect_initial_ms) {
    throw std::runtime_error("reconnect_max_ms below reconnect_initial_ms");
  }
  if (timing.reconnect_jitter < 0.0 || timing.reconnect_jitter > 1.0) {
    throw std::runtime_error("reconnect_jitter out of range");
  }
  if (limited_control.command_timeouts < 1 || limited_control.refused_connects < 1) {
    throw std::runtime_error("limited_control thresholds must be >=1");
  }
}

static inline bool parse_kv_scalar(const std::string & line, std::string & key, std::string & value)
{
  auto s = strip_inline_comment(line);
  auto pos = s.find(':');
  if (pos == std::string::npos) {return false;}
  key = trim(s.substr(0, pos));
  value = trim(s.substr(pos + 1));
  return !key.empty();
}

static inline int to_int(const std::string & key, const std::string & v)
{
  size_t used = 0;
  int out = 0;
  try {
    out = std::stoi(v, &used);
  } catch (const std::exception &) {
    throw std::runtime_error("invalid integer for " + key + ": " + v);
  }
  if (used != v.size()) {throw std::runtime_error("invalid integer for " + key + ": " + v);}
  return out;
}

static inline double to_double(const std::string & key, const std::string & v)
{
  size_t used = 0;
  double out = 0.0;
  try {
    out = std::stod(v, &used);
  } catch (const std::exception &) {
    throw std::runtime_error("invalid float for " + key + ": " + v);
  }
  if (used != v.size()) {throw std::runtime_error("invalid float for " + key + ": " + v);}
  return out;
}

static inline bool to_bool(const std::string & key, const std::string & v)
{
  if (ieq(v, "true") || ieq(v, "yes") || v == "1") {return true;}
  if (ieq(v, "false") || ieq(v, "no") || v == "0") {return false;}
  throw std::runtime_error("invalid bool for " + key + ": " + v);
}

static inline std::string unquote(std::string v)
{
  if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
    if (v.size() >= 2 && v.back() == v.front()) {v = v.substr(1, v.size() - 2);}
  }
  return v;
}

Config parse_from_yaml_string(const std::string & yaml)
{
  Config cfg;

  enum class Sect { NONE, ROOT, TIMING, LIMITED, FEATURES, OTHER };
  Sect sect = Sect::NONE;
  size_t section_indent = 0;
  bool seen_root = false;

  std::stringstream in(yaml);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {line.pop_back();}
    const std::string stripped = trim(strip_inline_comment(line));
    if (stripped.empty()) {continue;}
    const size_t indent = indent_of(line);

    if (stripped == "jblav_bridge:") {
      sect = Sect::ROOT;
      seen_root = true;
      continue;
    }
    if (sect == Sect::NONE) {continue;}

    // Leaving a subsection drops back to the root map
    if (sect != Sect::ROOT && indent <= section_indent) {sect = Sect::ROOT;}
    if (indent == 0) {sect = Sect::NONE; continue;}

    std::string key, value;
    if (!parse_kv_scalar(stripped, key, value)) {continue;}
    value = unquote(value);

    switch (sect) {
      case Sect::ROOT:
        if (!value.empty()) {
          if (key == "host") {
            cfg.host = value;
          } else if (key == "name") {
            cfg.name = value;
          } else if (key == "port") {
            throw std::runtime_error("port is fixed and cannot be configured");
          }
          break;
        }
        section_indent = indent;
        if (key == "timing") {
          sect = Sect::TIMING;
        } else if (key == "limited_control") {
          sect = Sect::LIMITED;
        } else if (key == "features") {
          sect = Sect::FEATURES;
        } else {
          sect = Sect::OTHER;
        }
        break;

      case Sect::TIMING:
        if (key == "connect_timeout_ms") {
          cfg.timing.connect_timeout_ms = to_int(key, value);
        } else if (key == "command_timeout_ms") {
          cfg.timing.command_timeout_ms = to_int(key, value);
        } else if (key == "command_retries") {
          cfg.timing.command_retries = to_int(key, value);
        } else if (key == "coalesce_window_ms") {
          cfg.timing.coalesce_window_ms = to_int(key, value);
        } else if (key == "heartbeat_interval_ms") {
          cfg.timing.heartbeat_interval_ms = to_int(key, value);
        } else if (key == "idle_timeout_ms") {
          cfg.timing.idle_timeout_ms = to_int(key, value);
        } else if (key == "reconnect_initial_ms") {
          cfg.timing.reconnect_initial_ms = to_int(key, value);
        } else if (key == "reconnect_max_ms") {
          cfg.timing.reconnect_max_ms = to_int(key, value);
        } else if (key == "reconnect_jitter") {
          cfg.timing.reconnect_jitter = to_double(key, value);
        }
        break;

      case Sect::LIMITED:
        if (key == "command_timeouts") {
          cfg.limited_control.command_timeouts = to_int(key, value);
        } else if (key == "refused_connects") {
          cfg.limited_control.refused_connects = to_int(key, value);
        }
        break;

      case Sect::FEATURES:
        if (key == "query_on_connect") {
          cfg.features.query_on_connect = to_bool(key, value);
        } else if (key == "log_latency_stats") {
          cfg.features.log_latency_stats = to_bool(key, value);
        }
        break;

      default: break;
    }
  }

  if (!seen_root) {throw std::runtime_error("jblav_bridge section missing");}

  cfg.validate();
  return cfg;
}

Config parse_from_yaml_file(const std::string & path)
{
  std::ifstream in(path);
  if (!in) {throw std::runtime_error("failed to open YAML: " + path);}
  std::stringstream ss; ss << in.rdbuf();
  return parse_from_yaml_string(ss.str());
}

} // namespace config
} // namespace jblav
