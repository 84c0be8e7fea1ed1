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

/// \file reactor_whois_channel.hpp
/// \brief Suspending WhoisChannel driven by a single epoll thread.
///
/// Design:
///   - Single I/O thread (epoll + eventfd + timerfd)
///   - Any number of exchanges in flight; each is a small state machine
///     (Resolving -> Connecting -> Writing -> Reading <-> Pacing, or
///     Cooldown after a failed connect)
///   - Every wait (connect, read, write, cooldown, pacing) is a deadline on
///     the shared timerfd, never a sleeping thread
///   - Host names are resolved by getaddrinfo() on a helper task and posted
///     back; literal addresses are used directly
///   - Thread-safe public API (signals I/O thread via eventfd)
///
/// Completions run on the I/O thread. They may start new exchanges but must
/// not block waiting for one.

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <thread>
#include <unordered_map>
#include <vector>

#include "ip_utils.hpp"
#include "whois_channel.hpp"

namespace whoischase
{
namespace network
{

class ReactorWhoisChannel : public WhoisChannel
{
public:
  ReactorWhoisChannel() = default;
  ReactorWhoisChannel(const ReactorWhoisChannel &) = delete;
  ReactorWhoisChannel &operator=(const ReactorWhoisChannel &) = delete;

  ~ReactorWhoisChannel() { stop(); }

  /// \brief Create the epoll set and start the I/O thread.
  /// \return false if already running or a descriptor could not be created
  bool start()
  {
    bool exp = false;
    if (!_running.compare_exchange_strong(exp, true))
    {
      return false;
    }

    _epollFd.reset(::epoll_create1(EPOLL_CLOEXEC));
    _eventFd.reset(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    _timerFd.reset(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC));
    if (!_epollFd.valid() || !_eventFd.valid() || !_timerFd.valid())
    {
      WHOISCHASE_LOG_ERROR("ReactorWhoisChannel: descriptor setup failed: " << lastErr());
      cleanupStartFail();
      return false;
    }
    addEpoll(_eventFd.get(), EPOLLIN);
    addEpoll(_timerFd.get(), EPOLLIN);

    {
      std::lock_guard<std::mutex> g(_cmdMutex);
      _accepting = true;
    }
    try
    {
      _loop = std::thread([this] { loop(); });
    }
    catch (const std::exception &ex)
    {
      WHOISCHASE_LOG_ERROR("ReactorWhoisChannel: thread start: " << ex.what());
      cleanupStartFail();
      return false;
    }
    WHOISCHASE_LOG_DEBUG("ReactorWhoisChannel started");
    return true;
  }

  /// \brief Stop the I/O thread. Every exchange still in flight completes
  /// with WhoisCancelledException.
  void stop()
  {
    bool exp = true;
    if (!_running.compare_exchange_strong(exp, false))
    {
      return;
    }
    enqueue(Command::shutdown());
    if (_loop.joinable())
    {
      _loop.join();
    }

    // Resolver tasks post through _eventFd; wait for them before closing it.
    for (auto &task : _resolveTasks)
    {
      task.wait();
    }
    _resolveTasks.clear();

    std::deque<Command> leftover;
    {
      std::lock_guard<std::mutex> g(_cmdMutex);
      _accepting = false;
      leftover.swap(_cmds);
    }
    for (auto &cmd : leftover)
    {
      if (cmd.type == Cmd::Start && cmd.exchange)
      {
        completeCancelled(*cmd.exchange, "WHOIS channel stopped");
      }
    }

    _timerFd.reset();
    _eventFd.reset();
    _epollFd.reset();
    WHOISCHASE_LOG_DEBUG("ReactorWhoisChannel stopped");
  }

  bool isRunning() const { return _running.load(); }

  /// \brief Number of exchanges currently owned by the I/O thread.
  std::size_t inFlight() const { return _inFlight.load(); }

  void exchange(const WhoisEndpoint &endpoint, const std::string &statement,
                const ExchangeOptions &options, std::shared_ptr<CancellationToken> token,
                Completion done) override
  {
    auto ex = std::make_shared<Exchange>(options);
    ex->id = _nextId.fetch_add(1) + 1;
    ex->endpoint = endpoint;
    ex->payload = TextCodec::toAsciiQuery(statement) + "\r\n";
    ex->token = std::move(token);
    ex->done = std::move(done);

    if (ex->token && ex->token->isCancelled())
    {
      completeCancelled(*ex, "WHOIS exchange cancelled");
      return;
    }
    if (!enqueue(Command::start(ex)))
    {
      completeCancelled(*ex, "WHOIS channel is not running");
    }
  }

private:
  enum class Phase
  {
    Queued,
    Resolving,
    Connecting,
    Writing,
    Reading,
    Pacing,
    Cooldown
  };

  struct Exchange
  {
    explicit Exchange(const ExchangeOptions &opts) : options(opts) {}

    std::uint64_t id{0};
    WhoisEndpoint endpoint;
    std::string payload;
    std::size_t written{0};
    ExchangeOptions options;
    std::shared_ptr<CancellationToken> token;
    CancellationToken::CallbackId cancelHook{0};
    Completion done;

    Phase phase{Phase::Queued};
    std::vector<ResolvedAddress> addresses;
    std::size_t nextAddress{0};
    FileDescriptor fd;
    std::string received;
    std::exception_ptr connectError;
    bool hasDeadline{false};
    MonoTime deadline{};
  };

  enum class Cmd
  {
    Shutdown,
    Start,
    Resolved,
    Cancel
  };

  struct Command
  {
    Cmd type;
    std::shared_ptr<Exchange> exchange;
    std::uint64_t id{0};
    std::vector<ResolvedAddress> addresses;
    std::exception_ptr error;

    static Command shutdown() { return Command{Cmd::Shutdown}; }
    static Command start(std::shared_ptr<Exchange> ex)
    {
      Command c{Cmd::Start};
      c.exchange = std::move(ex);
      return c;
    }
    static Command resolved(std::uint64_t id, std::vector<ResolvedAddress> addrs,
                            std::exception_ptr error)
    {
      Command c{Cmd::Resolved};
      c.id = id;
      c.addresses = std::move(addrs);
      c.error = std::move(error);
      return c;
    }
    static Command cancel(std::uint64_t id)
    {
      Command c{Cmd::Cancel};
      c.id = id;
      return c;
    }
  };

  std::atomic<bool> _running{false};
  std::atomic<std::uint64_t> _nextId{0};
  std::atomic<std::size_t> _inFlight{0};
  std::thread _loop;
  FileDescriptor _epollFd;
  FileDescriptor _eventFd;
  FileDescriptor _timerFd;

  std::mutex _cmdMutex;
  std::deque<Command> _cmds;
  bool _accepting{false};

  // I/O thread only
  std::unordered_map<std::uint64_t, std::shared_ptr<Exchange>> _exchanges;
  std::unordered_map<int, std::uint64_t> _fdOwners;
  std::vector<std::future<void>> _resolveTasks;

  bool enqueue(Command &&cmd)
  {
    std::lock_guard<std::mutex> g(_cmdMutex);
    if (!_accepting)
    {
      return false;
    }
    _cmds.push_back(std::move(cmd));
    std::uint64_t one = 1;
    ssize_t rc = ::write(_eventFd.get(), &one, sizeof(one));
    (void)rc; // EAGAIN means a wakeup is already pending
    return true;
  }

  void cleanupStartFail()
  {
    {
      std::lock_guard<std::mutex> g(_cmdMutex);
      _accepting = false;
      _cmds.clear();
    }
    _timerFd.reset();
    _eventFd.reset();
    _epollFd.reset();
    _running.store(false);
  }

  bool addEpoll(int fd, std::uint32_t ev)
  {
    epoll_event e{};
    e.events = ev;
    e.data.fd = fd;
    return ::epoll_ctl(_epollFd.get(), EPOLL_CTL_ADD, fd, &e) == 0;
  }

  bool modEpoll(int fd, std::uint32_t ev)
  {
    epoll_event e{};
    e.events = ev;
    e.data.fd = fd;
    return ::epoll_ctl(_epollFd.get(), EPOLL_CTL_MOD, fd, &e) == 0;
  }

  void delEpoll(int fd) { ::epoll_ctl(_epollFd.get(), EPOLL_CTL_DEL, fd, nullptr); }

  void drainFd(int fd)
  {
    std::uint64_t v;
    while (::read(fd, &v, sizeof(v)) > 0)
    {
    }
  }

  void loop()
  {
    std::vector<epoll_event> evs(64);
    bool stopping = false;
    while (!stopping)
    {
      int n = ::epoll_wait(_epollFd.get(), evs.data(), static_cast<int>(evs.size()), -1);
      if (n < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        WHOISCHASE_LOG_ERROR("ReactorWhoisChannel: epoll_wait: " << lastErr());
        break;
      }

      for (int i = 0; i < n && !stopping; ++i)
      {
        int fd = evs[static_cast<std::size_t>(i)].data.fd;
        std::uint32_t events = evs[static_cast<std::size_t>(i)].events;

        if (fd == _eventFd.get())
        {
          drainFd(fd);
          stopping = !process();
          continue;
        }
        if (fd == _timerFd.get())
        {
          drainFd(fd);
          runDeadlines();
          continue;
        }

        auto owner = _fdOwners.find(fd);
        if (owner == _fdOwners.end())
        {
          continue;
        }
        auto it = _exchanges.find(owner->second);
        if (it != _exchanges.end())
        {
          onSocket(it->second, events);
        }
      }
      rearmTimer();
    }

    // Draining on shutdown
    std::vector<std::shared_ptr<Exchange>> pending;
    pending.reserve(_exchanges.size());
    for (auto &kv : _exchanges)
    {
      pending.push_back(kv.second);
    }
    for (auto &ex : pending)
    {
      finish(ex, {}, std::make_exception_ptr(WhoisCancelledException("WHOIS channel stopped")));
    }
  }

  /// \return false on shutdown
  bool process()
  {
    std::deque<Command> q;
    {
      std::lock_guard<std::mutex> g(_cmdMutex);
      q.swap(_cmds);
    }
    bool keepRunning = true;
    for (auto &cmd : q)
    {
      switch (cmd.type)
      {
      case Cmd::Shutdown:
        keepRunning = false;
        break;
      case Cmd::Start:
        if (keepRunning)
        {
          onStart(cmd.exchange);
        }
        else
        {
          completeCancelled(*cmd.exchange, "WHOIS channel stopped");
        }
        break;
      case Cmd::Resolved:
        onResolved(cmd.id, std::move(cmd.addresses), cmd.error);
        break;
      case Cmd::Cancel:
      {
        auto it = _exchanges.find(cmd.id);
        if (it != _exchanges.end())
        {
          WHOISCHASE_LOG_DEBUG("Cancelling WHOIS exchange with " << it->second->endpoint.toString());
          finish(it->second, {},
                 std::make_exception_ptr(WhoisCancelledException("WHOIS exchange cancelled")));
        }
        break;
      }
      }
    }
    return keepRunning;
  }

  void onStart(const std::shared_ptr<Exchange> &ex)
  {
    _exchanges.emplace(ex->id, ex);
    _inFlight.store(_exchanges.size());
    if (ex->token)
    {
      std::uint64_t id = ex->id;
      ex->cancelHook = ex->token->registerCallback([this, id] { enqueue(Command::cancel(id)); });
    }

    WHOISCHASE_LOG_DEBUG("WHOIS exchange " << ex->id << " to " << ex->endpoint.toString());
    if (IpAddress::tryParse(ex->endpoint.host))
    {
      try
      {
        ex->addresses = resolveEndpoint(ex->endpoint);
      }
      catch (const WhoisTransportException &)
      {
        connectFailed(ex, std::current_exception());
        return;
      }
      connectNext(ex);
      return;
    }

    ex->phase = Phase::Resolving;
    std::uint64_t id = ex->id;
    WhoisEndpoint endpoint = ex->endpoint;
    pruneResolveTasks();
    _resolveTasks.push_back(std::async(std::launch::async, [this, id, endpoint] {
      std::vector<ResolvedAddress> addrs;
      std::exception_ptr error;
      try
      {
        addrs = resolveEndpoint(endpoint);
      }
      catch (const WhoisTransportException &)
      {
        error = std::current_exception();
      }
      enqueue(Command::resolved(id, std::move(addrs), error));
    }));
  }

  void pruneResolveTasks()
  {
    _resolveTasks.erase(std::remove_if(_resolveTasks.begin(), _resolveTasks.end(),
                                       [](std::future<void> &f) {
                                         return f.wait_for(std::chrono::seconds(0)) ==
                                                std::future_status::ready;
                                       }),
                        _resolveTasks.end());
  }

  void onResolved(std::uint64_t id, std::vector<ResolvedAddress> addrs, std::exception_ptr error)
  {
    auto it = _exchanges.find(id);
    if (it == _exchanges.end())
    {
      return; // cancelled while resolving
    }
    auto ex = it->second;
    if (error)
    {
      connectFailed(ex, error);
      return;
    }
    ex->addresses = std::move(addrs);
    connectNext(ex);
  }

  void connectNext(const std::shared_ptr<Exchange> &ex)
  {
    while (ex->nextAddress < ex->addresses.size())
    {
      const ResolvedAddress &address = ex->addresses[ex->nextAddress++];
      try
      {
        bool inProgress = false;
        ex->fd = startConnect(address, inProgress);
        _fdOwners[ex->fd.get()] = ex->id;
        if (!inProgress)
        {
          addEpoll(ex->fd.get(), EPOLLOUT);
          onConnected(ex);
          return;
        }
        addEpoll(ex->fd.get(), EPOLLOUT);
        ex->phase = Phase::Connecting;
        setDeadline(*ex, ex->options.timeout);
        return;
      }
      catch (const WhoisTransportException &)
      {
        releaseSocket(*ex);
        ex->connectError = std::current_exception();
      }
    }
    connectFailed(ex, ex->connectError
                        ? ex->connectError
                        : std::make_exception_ptr(WhoisTransportException(
                            TransportError::Connect, ex->endpoint.host + ": no address to try")));
  }

  void connectFailed(const std::shared_ptr<Exchange> &ex, std::exception_ptr error)
  {
    releaseSocket(*ex);
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      WHOISCHASE_LOG_WARN("Connect to " << ex->endpoint.toString() << " failed: " << e.what());
    }
    ex->connectError = error;
    ex->phase = Phase::Cooldown;
    setDeadline(*ex, ex->options.failureCooldown);
  }

  void onConnected(const std::shared_ptr<Exchange> &ex)
  {
    WHOISCHASE_LOG_DEBUG("Connected to " << ex->endpoint.toString());
    ex->phase = Phase::Writing;
    setDeadline(*ex, ex->options.timeout);
    writeSome(ex);
  }

  void onSocket(const std::shared_ptr<Exchange> &ex, std::uint32_t events)
  {
    switch (ex->phase)
    {
    case Phase::Connecting:
    {
      int err = socketError(ex->fd.get());
      if (err != 0)
      {
        std::string where = ex->addresses[ex->nextAddress - 1].toString();
        releaseSocket(*ex);
        ex->connectError = std::make_exception_ptr(
          WhoisTransportException(TransportError::Connect, where + ": " + lastErr(err), err));
        connectNext(ex);
        return;
      }
      onConnected(ex);
      return;
    }
    case Phase::Writing:
      writeSome(ex);
      return;
    case Phase::Reading:
      readSome(ex, events);
      return;
    default:
      return;
    }
  }

  void writeSome(const std::shared_ptr<Exchange> &ex)
  {
    while (ex->written < ex->payload.size())
    {
      ssize_t n = ::send(ex->fd.get(), ex->payload.data() + ex->written,
                         ex->payload.size() - ex->written, MSG_NOSIGNAL);
      if (n > 0)
      {
        ex->written += static_cast<std::size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      {
        modEpoll(ex->fd.get(), EPOLLOUT);
        return;
      }
      WHOISCHASE_LOG_DEBUG("send to " << ex->endpoint.toString() << ": " << lastErr());
      finish(ex, ex->received, nullptr);
      return;
    }
    ex->phase = Phase::Reading;
    modEpoll(ex->fd.get(), EPOLLIN | EPOLLRDHUP);
    setDeadline(*ex, ex->options.timeout);
  }

  void readSome(const std::shared_ptr<Exchange> &ex, std::uint32_t events)
  {
    char buffer[8192];
    ssize_t n = ::recv(ex->fd.get(), buffer, sizeof(buffer), 0);
    if (n > 0)
    {
      ex->received.append(buffer, static_cast<std::size_t>(n));
      if (ex->options.chunkPacing.count() > 0)
      {
        // Stop watching the socket until the pacing deadline passes.
        delEpoll(ex->fd.get());
        ex->phase = Phase::Pacing;
        setDeadline(*ex, ex->options.chunkPacing);
      }
      else
      {
        setDeadline(*ex, ex->options.timeout);
      }
      return;
    }
    if (n == 0)
    {
      finish(ex, ex->received, nullptr);
      return;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
    {
      if (events & (EPOLLERR | EPOLLHUP))
      {
        finish(ex, ex->received, nullptr);
      }
      return;
    }
    WHOISCHASE_LOG_DEBUG("recv from " << ex->endpoint.toString() << " after "
                                      << ex->received.size() << " bytes: " << lastErr());
    finish(ex, ex->received, nullptr);
  }

  void runDeadlines()
  {
    auto now = MonoClock::now();
    std::vector<std::shared_ptr<Exchange>> due;
    for (auto &kv : _exchanges)
    {
      if (kv.second->hasDeadline && kv.second->deadline <= now)
      {
        due.push_back(kv.second);
      }
    }
    for (auto &ex : due)
    {
      if (_exchanges.find(ex->id) == _exchanges.end())
      {
        continue;
      }
      ex->hasDeadline = false;
      onDeadline(ex);
    }
  }

  void onDeadline(const std::shared_ptr<Exchange> &ex)
  {
    switch (ex->phase)
    {
    case Phase::Connecting:
    {
      std::string where = ex->addresses[ex->nextAddress - 1].toString();
      releaseSocket(*ex);
      ex->connectError = std::make_exception_ptr(
        WhoisTimeoutException("connect to " + where + " timed out after " +
                              std::to_string(ex->options.timeout.count()) + "ms"));
      connectNext(ex);
      return;
    }
    case Phase::Writing:
    case Phase::Reading:
      WHOISCHASE_LOG_DEBUG("I/O with " << ex->endpoint.toString() << " timed out after "
                                       << ex->received.size() << " bytes");
      finish(ex, ex->received, nullptr);
      return;
    case Phase::Pacing:
      ex->phase = Phase::Reading;
      addEpoll(ex->fd.get(), EPOLLIN | EPOLLRDHUP);
      setDeadline(*ex, ex->options.timeout);
      return;
    case Phase::Cooldown:
      if (ex->options.rethrowTransportErrors)
      {
        finish(ex, {}, ex->connectError);
      }
      else
      {
        finish(ex, {}, nullptr);
      }
      return;
    default:
      return;
    }
  }

  void setDeadline(Exchange &ex, std::chrono::milliseconds after)
  {
    ex.hasDeadline = true;
    ex.deadline = MonoClock::now() + after;
  }

  void rearmTimer()
  {
    bool any = false;
    MonoTime earliest{};
    for (auto &kv : _exchanges)
    {
      if (kv.second->hasDeadline && (!any || kv.second->deadline < earliest))
      {
        earliest = kv.second->deadline;
        any = true;
      }
    }

    itimerspec its{};
    if (any)
    {
      auto delta = std::chrono::duration_cast<std::chrono::nanoseconds>(earliest - MonoClock::now());
      if (delta.count() <= 0)
      {
        delta = std::chrono::nanoseconds(1);
      }
      its.it_value.tv_sec = static_cast<time_t>(delta.count() / 1000000000);
      its.it_value.tv_nsec = static_cast<long>(delta.count() % 1000000000);
    }
    ::timerfd_settime(_timerFd.get(), 0, &its, nullptr);
  }

  void releaseSocket(Exchange &ex)
  {
    if (ex.fd.valid())
    {
      delEpoll(ex.fd.get());
      _fdOwners.erase(ex.fd.get());
      ex.fd.reset();
    }
  }

  void finish(const std::shared_ptr<Exchange> &ex, const std::string &raw, std::exception_ptr error)
  {
    releaseSocket(*ex);
    _exchanges.erase(ex->id);
    _inFlight.store(_exchanges.size());
    if (ex->token)
    {
      ex->token->unregisterCallback(ex->cancelHook);
    }

    std::string text;
    if (!error)
    {
      try
      {
        text = ex->options.encoding.decode(raw);
      }
      catch (const std::exception &)
      {
        error = std::current_exception();
      }
    }
    auto done = std::move(ex->done);
    if (done)
    {
      done(std::move(text), error);
    }
  }

  static void completeCancelled(Exchange &ex, const std::string &why)
  {
    auto done = std::move(ex.done);
    if (done)
    {
      done({}, std::make_exception_ptr(WhoisCancelledException(why)));
    }
  }
};

} // namespace network
} // namespace whoischase
