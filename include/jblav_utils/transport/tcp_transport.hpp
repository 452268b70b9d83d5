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

#ifndef JBLAV_UTILS__TRANSPORT__TCP_TRANSPORT_HPP_
#define JBLAV_UTILS__TRANSPORT__TCP_TRANSPORT_HPP_

#pragma once

#include <atomic>

#include "jblav_utils/transport/transport.hpp"

namespace jblav
{
namespace transport
{

// Result to report once every resolved address has failed. The first refusal or
// timeout is kept; a plain failure never replaces it.
OpenResult mergeOpenResult(OpenResult reported, OpenResult attempt);

/**
 * @brief POSIX TCP client socket
 *
 * Connects with a bounded timeout (non-blocking connect + poll), disables
 * Nagle so single command frames leave immediately, and polls on read so the
 * reader loop can notice a stop request within read_timeout_ms.
 */
class TcpTransport : public Transport
{
public:
  TcpTransport() = default;
  ~TcpTransport() override;

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport & operator=(const TcpTransport &) = delete;

  OpenResult open(const TransportOptions & opts) override;
  void close() override;
  bool is_open() const override;

  int read(uint8_t * buf, size_t len) override;
  int write(const uint8_t * buf, size_t len) override;

private:
  TransportOptions opts_{};
  std::atomic<int> fd_{-1};
};

} // namespace transport
} // namespace jblav

#endif  // JBLAV_UTILS__TRANSPORT__TCP_TRANSPORT_HPP_
