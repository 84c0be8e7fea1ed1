// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file whois_resolver.hpp
/// \brief Referral-chasing WHOIS lookups over a WhoisChannel.
///
/// Two drivers share one ReferralChase:
///   - resolve()/rawQuery() block the caller until the lookup finishes. Any
///     channel works; with ReactorWhoisChannel the caller waits on a future
///     while the I/O thread does the work, so the token aborts promptly.
///   - resolveAsync()/rawQueryAsync() return at once and continue from each
///     exchange's completion. Meant for ReactorWhoisChannel; with the
///     blocking channel they complete before returning.
///
/// A lookup is strictly sequential. Independent lookups share nothing but
/// the channel.

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "lookup_result.hpp"
#include "referral_chase.hpp"
#include "whoischase/core/logger.hpp"
#include "whoischase/network/cancellation.hpp"
#include "whoischase/network/whois_channel.hpp"

namespace whoischase
{
namespace whois
{

class WhoisResolver
{
public:
  using ResultCallback = std::function<void(LookupResult, std::exception_ptr)>;
  using RawCallback = std::function<void(std::string, std::exception_ptr)>;

  explicit WhoisResolver(std::shared_ptr<network::WhoisChannel> channel)
      : _channel(std::move(channel))
  {
    if (!_channel)
    {
      throw std::invalid_argument("WhoisResolver requires a channel");
    }
  }

  const std::shared_ptr<network::WhoisChannel> &channel() const { return _channel; }

  /// \brief Follow referrals from options.server until a server answers
  /// without one.
  /// \throws network::WhoisCancelledException if `token` fires
  /// \throws network::WhoisTransportException when a hop exhausts its
  /// retries and options.rethrowTransportErrors is set
  LookupResult resolve(const std::string &query, const ResolveOptions &options = {},
                       std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    ReferralChase chase(query, options);
    const auto exchangeOptions = chase.options().exchangeOptions();
    for (;;)
    {
      throwIfCancelled(token);
      WHOISCHASE_LOG_DEBUG("Querying " << chase.endpoint().toString() << " with \""
                                       << chase.statement() << "\" (attempt " << chase.attempt()
                                       << ")");
      auto outcome = exchangeAndWait(chase.endpoint(), chase.statement(), exchangeOptions, token);
      auto step = outcome.second ? chase.onFailure(outcome.second)
                                 : chase.onResponse(std::move(outcome.first));
      if (step == ReferralChase::Step::Done)
      {
        return chase.result();
      }
    }
  }

  /// \brief Non-blocking resolve(). `callback` receives the result, or a
  /// null-initialized result and the error.
  void resolveAsync(const std::string &query, const ResolveOptions &options,
                    std::shared_ptr<network::CancellationToken> token, ResultCallback callback)
  {
    auto lookup = std::make_shared<AsyncLookup>(_channel, ReferralChase(query, options),
                                                std::move(token), std::move(callback));
    lookup->next();
  }

  std::future<LookupResult> resolveAsync(const std::string &query, const ResolveOptions &options = {},
                                         std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    auto promise = std::make_shared<std::promise<LookupResult>>();
    auto future = promise->get_future();
    resolveAsync(query, options, std::move(token),
                 [promise](LookupResult result, std::exception_ptr error)
                 {
                   if (error)
                   {
                     promise->set_exception(error);
                   }
                   else
                   {
                     promise->set_value(std::move(result));
                   }
                 });
    return future;
  }

  /// \brief One exchange with options.server. `query` is sent verbatim; no
  /// referral is followed and no field is extracted. options.maxRetries and
  /// options.maxHops do not apply.
  std::string rawQuery(const std::string &query, const ResolveOptions &options = {},
                       std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    throwIfCancelled(token);
    auto outcome = exchangeAndWait(endpointOf(options), query, options.exchangeOptions(), token);
    if (outcome.second)
    {
      std::rethrow_exception(outcome.second);
    }
    return std::move(outcome.first);
  }

  void rawQueryAsync(const std::string &query, const ResolveOptions &options,
                     std::shared_ptr<network::CancellationToken> token, RawCallback callback)
  {
    _channel->exchange(endpointOf(options), query, options.exchangeOptions(), std::move(token),
                       std::move(callback));
  }

  std::future<std::string> rawQueryAsync(const std::string &query,
                                         const ResolveOptions &options = {},
                                         std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();
    rawQueryAsync(query, options, std::move(token),
                  [promise](std::string text, std::exception_ptr error)
                  {
                    if (error)
                    {
                      promise->set_exception(error);
                    }
                    else
                    {
                      promise->set_value(std::move(text));
                    }
                  });
    return future;
  }

private:
  using Outcome = std::pair<std::string, std::exception_ptr>;

  std::shared_ptr<network::WhoisChannel> _channel;

  static network::WhoisEndpoint endpointOf(const ResolveOptions &options)
  {
    network::WhoisEndpoint endpoint;
    endpoint.host = options.firstServer();
    endpoint.port = options.port;
    return endpoint;
  }

  static void throwIfCancelled(const std::shared_ptr<network::CancellationToken> &token)
  {
    if (token && token->isCancelled())
    {
      throw network::WhoisCancelledException("WHOIS lookup cancelled");
    }
  }

  Outcome exchangeAndWait(const network::WhoisEndpoint &endpoint, const std::string &statement,
                          const network::ExchangeOptions &options,
                          const std::shared_ptr<network::CancellationToken> &token)
  {
    auto promise = std::make_shared<std::promise<Outcome>>();
    auto future = promise->get_future();
    _channel->exchange(endpoint, statement, options, token,
                       [promise](std::string text, std::exception_ptr error)
                       { promise->set_value(Outcome(std::move(text), error)); });
    return future.get();
  }

  /// State of one resolveAsync() call, kept alive by the pending completion.
  struct AsyncLookup : std::enable_shared_from_this<AsyncLookup>
  {
    AsyncLookup(std::shared_ptr<network::WhoisChannel> ch, ReferralChase c,
                std::shared_ptr<network::CancellationToken> t, ResultCallback cb)
        : channel(std::move(ch)), chase(std::move(c)), token(std::move(t)),
          callback(std::move(cb)), exchangeOptions(chase.options().exchangeOptions())
    {
    }

    std::shared_ptr<network::WhoisChannel> channel;
    ReferralChase chase;
    std::shared_ptr<network::CancellationToken> token;
    ResultCallback callback;
    network::ExchangeOptions exchangeOptions;

    void next()
    {
      if (token && token->isCancelled())
      {
        fail(std::make_exception_ptr(network::WhoisCancelledException("WHOIS lookup cancelled")));
        return;
      }
      WHOISCHASE_LOG_DEBUG("Querying " << chase.endpoint().toString() << " with \""
                                       << chase.statement() << "\" (attempt " << chase.attempt()
                                       << ")");
      auto self = shared_from_this();
      channel->exchange(chase.endpoint(), chase.statement(), exchangeOptions, token,
                        [self](std::string text, std::exception_ptr error)
                        { self->onExchange(std::move(text), error); });
    }

    void onExchange(std::string text, std::exception_ptr error)
    {
      ReferralChase::Step step;
      try
      {
        step = error ? chase.onFailure(error) : chase.onResponse(std::move(text));
      }
      catch (const std::exception &)
      {
        fail(std::current_exception());
        return;
      }

      if (step == ReferralChase::Step::Send)
      {
        next();
        return;
      }
      if (callback)
      {
        callback(chase.result(), nullptr);
      }
    }

    void fail(std::exception_ptr error)
    {
      if (callback)
      {
        callback(LookupResult(), error);
      }
    }
  };
};

} // namespace whois
} // namespace whoischase
