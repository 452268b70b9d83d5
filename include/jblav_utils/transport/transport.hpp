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

#ifndef JBLAV_UTILS__TRANSPORT__TRANSPORT_HPP_
#define JBLAV_UTILS__TRANSPORT__TRANSPORT_HPP_

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

#include "jblav_utils/protocol/constants.hpp"

namespace jblav
{
namespace transport
{

struct TransportOptions
{
  std::string host;
  uint16_t port = protocol::CONTROL_PORT;
  int connect_timeout_ms = 5000;
  int read_timeout_ms = 100;
  int write_timeout_ms = 1000;
};

enum class OpenResult
{
  OK,
  REFUSED,          // peer actively refused (RST); host is up but not listening
  TIMED_OUT,
  RESOLVE_FAILED,
  FAILED
};

const char * openResultName(OpenResult result);

/**
 * Byte stream to the receiver.
 *
 * read() is called from the connection's reader context while write() is
 * called from the scheduler; implementations must allow the two to run
 * concurrently. open() and close() are never called while a read is active.
 */
class Transport
{
public:
  static constexpr int kReadError = -1;
  static constexpr int kPeerClosed = -2;

  virtual ~Transport() = default;

  virtual OpenResult open(const TransportOptions & opts) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Returns bytes read; 0 on timeout; kReadError or kPeerClosed otherwise
  virtual int read(uint8_t * buf, size_t len) = 0;
  // Returns bytes written; negative on error
  virtual int write(const uint8_t * buf, size_t len) = 0;
};

} // namespace transport
} // namespace jblav

#endif  // JBLAV_UTILS__TRANSPORT__TRANSPORT_HPP_
