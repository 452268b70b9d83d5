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

#ifndef JBLAV_UTILS__ERRORS_HPP_
#define JBLAV_UTILS__ERRORS_HPP_

#pragma once

#include <stdexcept>
#include <string>

namespace jblav
{

class JblavError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Intent or operand cannot be represented on the wire
class EncodingError : public JblavError
{
public:
  using JblavError::JblavError;
};

// send() called while the connection is not in the Connected state
class NotConnectedError : public JblavError
{
public:
  NotConnectedError()
  : JblavError("not connected to receiver") {}
  explicit NotConnectedError(const std::string & what)
  : JblavError(what) {}
};

// The socket failed underneath a send; the reconnect cycle has been triggered
class ConnectionLostError : public JblavError
{
public:
  using JblavError::JblavError;
};

} // namespace jblav

#endif  // JBLAV_UTILS__ERRORS_HPP_
