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

/// \file whois_channel.hpp
/// \brief One WHOIS request/response exchange over a bare TCP connection.
///
/// WhoisChannel is the seam between the referral-chasing logic and the
/// network. Two implementations exist:
///   - TcpWhoisChannel (this file): blocks the calling thread for connect,
///     write, read, cooldown and pacing, and completes before returning.
///   - ReactorWhoisChannel (reactor_whois_channel.hpp): returns at once and
///     completes on its epoll thread; waits never hold a thread.
///
/// Completion contract, shared by both:
///   - connect-phase failure: after the failure cooldown, completes with the
///     error if rethrowTransportErrors is set, otherwise with empty text
///   - write/read failure after connecting: completes with whatever text was
///     received so far and no error
///   - cancellation: completes with WhoisCancelledException, always

#include <chrono>
#include <climits>
#include <exception>
#include <functional>
#include <memory>
#include <poll.h>
#include <string>
#include <thread>

#include "cancellation.hpp"
#include "socket_utils.hpp"
#include "transport_types.hpp"
#include "whoischase/core/logger.hpp"

namespace whoischase
{
namespace network
{

class WhoisChannel
{
public:
  /// \brief text is the decoded response; error is null on success.
  using Completion = std::function<void(std::string text, std::exception_ptr error)>;

  virtual ~WhoisChannel() = default;

  /// \brief Send `statement` followed by CRLF and collect the full reply.
  /// \param token may be null
  virtual void exchange(const WhoisEndpoint &endpoint, const std::string &statement,
                        const ExchangeOptions &options,
                        std::shared_ptr<CancellationToken> token, Completion done) = 0;
};

/// \brief Thread-blocking channel built on poll(2).
///
/// The token is only consulted between operations; a connect, write or read
/// in progress is bounded by the configured timeout alone.
class TcpWhoisChannel : public WhoisChannel
{
public:
  void exchange(const WhoisEndpoint &endpoint, const std::string &statement,
                const ExchangeOptions &options, std::shared_ptr<CancellationToken> token,
                Completion done) override
  {
    std::string text;
    std::exception_ptr error;
    try
    {
      text = query(endpoint, statement, options, token.get());
    }
    catch (const std::exception &)
    {
      error = std::current_exception();
    }
    done(std::move(text), error);
  }

  /// \brief Synchronous form of exchange(); failures are thrown.
  std::string query(const WhoisEndpoint &endpoint, const std::string &statement,
                    const ExchangeOptions &options, const CancellationToken *token = nullptr)
  {
    throwIfCancelled(token);

    FileDescriptor fd;
    try
    {
      fd = connect(endpoint, options.timeout);
    }
    catch (const WhoisTransportException &e)
    {
      WHOISCHASE_LOG_WARN("Connect to " << endpoint.toString() << " failed: " << e.what());
      std::this_thread::sleep_for(options.failureCooldown);
      if (options.rethrowTransportErrors)
      {
        throw;
      }
      return {};
    }

    std::string received;
    try
    {
      writeAll(fd.get(), TextCodec::toAsciiQuery(statement) + "\r\n", options.timeout);
      readToEnd(fd.get(), received, options, token);
    }
    catch (const WhoisCancelledException &)
    {
      throw;
    }
    catch (const WhoisTransportException &e)
    {
      WHOISCHASE_LOG_DEBUG("Stopped reading from " << endpoint.toString() << " after "
                                                   << received.size() << " bytes: " << e.what());
    }
    return options.encoding.decode(received);
  }

private:
  static void throwIfCancelled(const CancellationToken *token)
  {
    if (token && token->isCancelled())
    {
      throw WhoisCancelledException("WHOIS exchange cancelled");
    }
  }

  /// \return poll revents, 0 on timeout
  /// A negative timeout is already expired, as it is for the reactor.
  static short waitFor(int fd, short events, std::chrono::milliseconds timeout)
  {
    int pollMs = 0;
    if (timeout.count() > INT_MAX)
    {
      pollMs = INT_MAX;
    }
    else if (timeout.count() > 0)
    {
      pollMs = static_cast<int>(timeout.count());
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = 0;
    do
    {
      rc = ::poll(&pfd, 1, pollMs);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0)
    {
      throw WhoisTransportException(TransportError::Unknown, "poll: " + lastErr(), errno);
    }
    return rc == 0 ? 0 : pfd.revents;
  }

  static FileDescriptor connect(const WhoisEndpoint &endpoint, std::chrono::milliseconds timeout)
  {
    auto addresses = resolveEndpoint(endpoint);
    std::exception_ptr lastError;
    for (const auto &address : addresses)
    {
      try
      {
        bool inProgress = false;
        FileDescriptor fd = startConnect(address, inProgress);
        if (inProgress)
        {
          if (waitFor(fd.get(), POLLOUT, timeout) == 0)
          {
            throw WhoisTimeoutException("connect to " + address.toString() + " timed out after " +
                                        std::to_string(timeout.count()) + "ms");
          }
          int err = socketError(fd.get());
          if (err != 0)
          {
            throw WhoisTransportException(TransportError::Connect,
                                          address.toString() + ": " + lastErr(err), err);
          }
        }
        WHOISCHASE_LOG_DEBUG("Connected to " << endpoint.host << " (" << address.toString()
                                             << ") port " << endpoint.port);
        return fd;
      }
      catch (const WhoisTransportException &)
      {
        lastError = std::current_exception();
      }
    }
    std::rethrow_exception(lastError);
  }

  static void writeAll(int fd, const std::string &data, std::chrono::milliseconds timeout)
  {
    std::size_t sent = 0;
    while (sent < data.size())
    {
      ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n > 0)
      {
        sent += static_cast<std::size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      {
        if (waitFor(fd, POLLOUT, timeout) == 0)
        {
          throw WhoisTimeoutException("write timed out");
        }
        continue;
      }
      throw WhoisTransportException(TransportError::Write, "send: " + lastErr(), errno);
    }
  }

  /// Reads until the peer closes. A read timeout or error ends the loop by
  /// exception; `received` keeps everything gathered up to that point.
  static void readToEnd(int fd, std::string &received, const ExchangeOptions &options,
                        const CancellationToken *token)
  {
    char buffer[8192];
    for (;;)
    {
      throwIfCancelled(token);
      short revents = waitFor(fd, POLLIN, options.timeout);
      if (revents == 0)
      {
        throw WhoisTimeoutException("read timed out after " +
                                    std::to_string(options.timeout.count()) + "ms");
      }

      ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
      if (n > 0)
      {
        received.append(buffer, static_cast<std::size_t>(n));
        if (options.chunkPacing.count() > 0)
        {
          std::this_thread::sleep_for(options.chunkPacing);
        }
        continue;
      }
      if (n == 0)
      {
        // Orderly shutdown; nothing more can arrive on this connection.
        return;
      }
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
      {
        continue;
      }
      throw WhoisTransportException(TransportError::Read, "recv: " + lastErr(), errno);
    }
  }
};

} // namespace network
} // namespace whoischase
