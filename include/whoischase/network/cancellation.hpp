// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace whoischase
{
namespace network
{

/// \brief Cancellation signal shared between a caller and in-flight work.
///
/// Hand it around as std::shared_ptr<CancellationToken>. Callbacks run on
/// the thread calling cancel(), or immediately on registration if the token
/// has already fired.
/// \note Non-copyable to keep a single owner of the callback table
class CancellationToken
{
public:
  using Callback = std::function<void()>;
  using CallbackId = std::uint64_t;

  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  static std::shared_ptr<CancellationToken> create()
  {
    return std::make_shared<CancellationToken>();
  }

  /// \brief Fire the token. Only the first call runs callbacks.
  void cancel()
  {
    std::vector<Callback> toRun;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_cancelled.exchange(true))
      {
        return;
      }
      for (auto &entry : _callbacks)
      {
        toRun.push_back(std::move(entry.second));
      }
      _callbacks.clear();
    }
    for (auto &cb : toRun)
    {
      cb();
    }
  }

  bool isCancelled() const { return _cancelled.load(); }

  /// \brief Register a callback for cancel().
  /// \return id for unregisterCallback(), or 0 if the token had already
  /// fired and the callback ran inline.
  CallbackId registerCallback(Callback cb)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!_cancelled.load())
      {
        CallbackId id = ++_nextId;
        _callbacks.emplace(id, std::move(cb));
        return id;
      }
    }
    cb();
    return 0;
  }

  void unregisterCallback(CallbackId id)
  {
    if (id == 0)
    {
      return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _callbacks.erase(id);
  }

private:
  std::atomic<bool> _cancelled{false};
  std::mutex _mutex;
  std::map<CallbackId, Callback> _callbacks;
  CallbackId _nextId{0};
};

} // namespace network
} // namespace whoischase
