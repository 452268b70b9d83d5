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

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "jblav_bridge/jblav_receiver.hpp"
#include "jblav_utils/config/config.hpp"
#include "jblav_utils/errors.hpp"
#include "jblav_utils/scheduling/thread_scheduler.hpp"
#include "jblav_utils/transport/loopback_transport.hpp"
#include "jblav_utils/transport/tcp_transport.hpp"

using jblav::state::Axis;

namespace
{

const rclcpp::Logger & logger()
{
  static const rclcpp::Logger l = rclcpp::get_logger("JblAvMonitor");
  return l;
}

std::mutex g_out_mutex;

void printLine(const std::string & line)
{
  std::lock_guard<std::mutex> lock(g_out_mutex);
  std::cout << line << std::endl;
}

void printEvent(const jblav::state::StateEvent & event)
{
  std::ostringstream out;
  if (event.kind == jblav::state::StateEvent::Kind::Snapshot) {
    out << "snapshot:";
    for (const auto & change : event.changes) {
      out << "\n  " << jblav::state::fieldName(change.field) << " = " << change.text;
    }
  } else {
    bool first = true;
    for (const auto & change : event.changes) {
      out << (first ? "" : ", ") << jblav::state::fieldName(change.field) << " = " << change.text;
      first = false;
    }
  }
  printLine(out.str());
}

jblav_bridge::CompletionHandler printOutcome(const std::string & what)
{
  return [what](jblav_bridge::CommandOutcome outcome) {
      printLine(what + ": " + jblav::dispatch::outcomeName(outcome));
    };
}

std::optional<bool> parseOnOff(const std::string & word)
{
  if (word == "on" || word == "1") {return true;}
  if (word == "off" || word == "0") {return false;}
  return std::nullopt;
}

std::optional<Axis> axisFromName(const std::string & name)
{
  for (Axis axis : jblav::state::kAllAxes) {
    if (name == jblav::state::axisName(axis)) {
      return axis;
    }
  }
  return std::nullopt;
}

void printHelp()
{
  printLine(
    "commands:\n"
    "  power on|off          volume <0-99>|up|down [steps]\n"
    "  mute on|off           input <name>        surround <name>\n"
    "  set <axis> <value>    query <axis>        ir <key>\n"
    "  refresh  state  latency  reboot  help  quit");
}

// Returns false when the user asked to quit
bool handleCommand(jblav_bridge::JblAvReceiver & receiver, const std::string & line)
{
  std::istringstream in(line);
  std::vector<std::string> words;
  for (std::string w; in >> w; ) {
    words.push_back(w);
  }
  if (words.empty()) {
    return true;
  }

  const std::string & cmd = words[0];
  const std::string arg = words.size() > 1 ? words[1] : "";
  std::string rest;
  for (size_t i = 1; i < words.size(); ++i) {
    rest += (i > 1 ? " " : "") + words[i];
  }

  if (cmd == "quit" || cmd == "exit") {
    return false;
  }
  if (cmd == "help") {
    printHelp();
  } else if (cmd == "power") {
    auto on = parseOnOff(arg);
    if (!on) {printLine("usage: power on|off"); return true;}
    receiver.setPower(*on, printOutcome(line));
  } else if (cmd == "mute") {
    auto on = parseOnOff(arg);
    if (!on) {printLine("usage: mute on|off"); return true;}
    receiver.setMute(*on, printOutcome(line));
  } else if (cmd == "volume") {
    const int steps = words.size() > 2 ? std::stoi(words[2]) : 1;
    if (arg == "up") {
      receiver.volumeUp(steps, printOutcome(line));
    } else if (arg == "down") {
      receiver.volumeDown(steps, printOutcome(line));
    } else {
      receiver.setVolume(std::stoi(arg), printOutcome(line));
    }
  } else if (cmd == "input") {
    auto source = jblav::protocol::inputSourceFromString(rest);
    if (!source) {printLine("unknown input: " + rest); return true;}
    receiver.setInput(*source, printOutcome(line));
  } else if (cmd == "surround") {
    auto mode = jblav::protocol::surroundModeFromString(rest);
    if (!mode) {printLine("unknown surround mode: " + rest); return true;}
    receiver.setSurroundMode(*mode, printOutcome(line));
  } else if (cmd == "set" && words.size() == 3) {
    auto axis = axisFromName(arg);
    if (!axis) {printLine("unknown axis: " + arg); return true;}
    receiver.issue(*axis, std::stoi(words[2]), printOutcome(line));
  } else if (cmd == "query") {
    auto axis = axisFromName(arg);
    if (!axis) {printLine("unknown axis: " + arg); return true;}
    receiver.query(*axis);
  } else if (cmd == "ir") {
    auto code = jblav::protocol::irCodeFromString(arg);
    if (!code) {printLine("unknown IR key: " + arg); return true;}
    receiver.sendIr(*code);
  } else if (cmd == "refresh") {
    receiver.refresh();
  } else if (cmd == "reboot") {
    receiver.reboot();
  } else if (cmd == "latency") {
    receiver.logLatencyStats();
  } else if (cmd == "state") {
    jblav::state::StateEvent event;
    event.kind = jblav::state::StateEvent::Kind::Snapshot;
    event.state = receiver.snapshot();
    event.changes = jblav::state::describeState(event.state);
    printEvent(event);
  } else {
    printLine("unknown command, try help");
  }
  return true;
}

} // namespace

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  std::string config_path;
  bool loopback = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--loopback") {
      loopback = true;
    } else if (a.rfind("--ros-args", 0) == 0) {
      break;
    } else if (config_path.empty()) {
      config_path = a;
    }
  }
  if (config_path.empty()) {
    std::cerr << "usage: jblav_monitor <config.yaml> [--loopback]" << std::endl;
    rclcpp::shutdown();
    return 2;
  }

  jblav::config::Config cfg;
  try {
    cfg = jblav::config::parse_from_yaml_file(config_path);
  } catch (const std::runtime_error & e) {
    RCLCPP_ERROR(logger(), "Failed to load %s: %s", config_path.c_str(), e.what());
    rclcpp::shutdown();
    return 1;
  }

  std::unique_ptr<jblav::transport::Transport> transport;
  if (loopback) {
    RCLCPP_INFO(logger(), "Using the simulated receiver");
    transport = std::make_unique<jblav::transport::LoopbackTransport>();
  } else {
    transport = std::make_unique<jblav::transport::TcpTransport>();
  }

  jblav::scheduling::ThreadScheduler scheduler;
  scheduler.start();
  {
    jblav_bridge::JblAvReceiver receiver(scheduler, std::move(transport), cfg);
    receiver.subscribe(printEvent);
    receiver.start();
    printHelp();

    std::string line;
    while (rclcpp::ok() && std::getline(std::cin, line)) {
      try {
        if (!handleCommand(receiver, line)) {
          break;
        }
      } catch (const jblav::EncodingError & e) {
        printLine(std::string("rejected: ") + e.what());
      } catch (const std::logic_error &) {
        // std::stoi on a word that is not a number
        printLine("expected a number");
      }
    }

    receiver.shutdown();
    scheduler.stop();
  }

  rclcpp::shutdown();
  return 0;
}
