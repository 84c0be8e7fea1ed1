// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (epoll/eventfd/timerfd)"
#endif

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "text_codec.hpp"

namespace whoischase
{
namespace network
{

using MonoClock = std::chrono::steady_clock;
using MonoTime = std::chrono::time_point<MonoClock>;

/// \brief Well-known WHOIS TCP port (RFC 3912)
inline constexpr std::uint16_t kWhoisPort = 43;

enum class TransportError
{
  None = 0,
  Resolve,
  Socket,
  Connect,
  Timeout,
  Write,
  Read,
  Cancelled,
  Unknown
};

inline const char *toString(TransportError code)
{
  switch (code)
  {
  case TransportError::None:
    return "none";
  case TransportError::Resolve:
    return "resolve";
  case TransportError::Socket:
    return "socket";
  case TransportError::Connect:
    return "connect";
  case TransportError::Timeout:
    return "timeout";
  case TransportError::Write:
    return "write";
  case TransportError::Read:
    return "read";
  case TransportError::Cancelled:
    return "cancelled";
  case TransportError::Unknown:
    break;
  }
  return "unknown";
}

/// \brief Failure talking to a WHOIS server
class WhoisTransportException : public std::runtime_error
{
public:
  WhoisTransportException(TransportError code, const std::string &message, int sysErrno = 0)
      : std::runtime_error("WHOIS transport error (" + std::string(toString(code)) +
                           "): " + message),
        _code(code), _sysErrno(sysErrno)
  {
  }

  TransportError code() const { return _code; }
  int sysErrno() const { return _sysErrno; }

private:
  TransportError _code;
  int _sysErrno;
};

class WhoisTimeoutException : public WhoisTransportException
{
public:
  explicit WhoisTimeoutException(const std::string &message)
      : WhoisTransportException(TransportError::Timeout, message, ETIMEDOUT)
  {
  }
};

/// \brief An exchange or resolution was aborted through its CancellationToken
class WhoisCancelledException : public WhoisTransportException
{
public:
  explicit WhoisCancelledException(const std::string &message = "operation cancelled")
      : WhoisTransportException(TransportError::Cancelled, message)
  {
  }
};

/// \brief host:port of one WHOIS server
struct WhoisEndpoint
{
  std::string host;
  std::uint16_t port{kWhoisPort};

  std::string toString() const { return host + ":" + std::to_string(port); }
};

/// \brief Per-exchange knobs. Timeouts apply to each connect attempt and to
/// each individual read or write, never to the exchange as a whole.
struct ExchangeOptions
{
  TextCodec encoding{TextCodec::ascii()};
  std::chrono::milliseconds timeout{std::chrono::seconds(600)};
  /// Pause after a failed connect before reporting it.
  std::chrono::milliseconds failureCooldown{200};
  /// Pause after each received chunk before reading again.
  std::chrono::milliseconds chunkPacing{100};
  /// Raise connect-phase failures instead of completing with empty text.
  bool rethrowTransportErrors{false};
};

} // namespace network
} // namespace whoischase
