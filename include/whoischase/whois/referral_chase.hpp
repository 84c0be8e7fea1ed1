// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file referral_chase.hpp
/// \brief Transport-free state of one referral-chasing lookup.
///
/// ReferralChase decides what to send next and what to do with each
/// outcome; it never touches the network. Both the blocking and the
/// suspending drivers in whois_resolver.hpp feed it the result of every
/// exchange and act on the returned Step.

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "lookup_result.hpp"
#include "query_statement.hpp"
#include "referral_detector.hpp"
#include "whoischase/core/logger.hpp"
#include "whoischase/network/transport_types.hpp"
#include "whoischase/util/text_lines.hpp"

namespace whoischase
{
namespace whois
{

/// \brief Bootstrap registry asked first when no server is given
inline constexpr const char *kBootstrapServer = "whois.iana.org";

/// \brief Knobs for resolve() and rawQuery()
struct ResolveOptions
{
  /// First server to ask; empty means kBootstrapServer.
  std::string server{kBootstrapServer};
  /// Port of the first server. Later hops use the port named by the referral.
  std::uint16_t port{network::kWhoisPort};
  network::TextCodec encoding{network::TextCodec::ascii()};
  /// Per connect attempt and per read or write, never per lookup.
  std::chrono::milliseconds timeout{std::chrono::seconds(600)};
  /// Attempts per hop; values below 1 mean 1.
  int maxRetries{10};
  /// Propagate the last transport error of a hop instead of treating the
  /// hop's response as empty.
  bool rethrowTransportErrors{false};
  std::chrono::milliseconds failureCooldown{200};
  std::chrono::milliseconds chunkPacing{100};
  /// Longest server chain to build; 0 follows referrals without limit.
  std::size_t maxHops{0};

  network::ExchangeOptions exchangeOptions() const
  {
    network::ExchangeOptions ex;
    ex.encoding = encoding;
    ex.timeout = timeout;
    ex.failureCooldown = failureCooldown;
    ex.chunkPacing = chunkPacing;
    ex.rethrowTransportErrors = rethrowTransportErrors;
    return ex;
  }

  std::string firstServer() const { return server.empty() ? kBootstrapServer : server; }
};

class ReferralChase
{
public:
  enum class Step
  {
    Send,
    Done
  };

  ReferralChase(std::string query, ResolveOptions options)
      : _query(std::move(query)), _options(std::move(options))
  {
    if (_options.maxRetries < 1)
    {
      _options.maxRetries = 1;
    }
    _endpoint.host = _options.firstServer();
    _endpoint.port = _options.port;
    _servers.push_back(_endpoint.host);
  }

  const std::string &query() const { return _query; }
  const ResolveOptions &options() const { return _options; }

  /// \brief Server for the next exchange.
  const network::WhoisEndpoint &endpoint() const { return _endpoint; }

  /// \brief Query line for the next exchange.
  std::string statement() const { return QueryStatementBuilder::build(_endpoint.host, _query); }

  /// \brief 1-based attempt number within the current hop.
  int attempt() const { return _attempt; }

  const std::vector<std::string> &servers() const { return _servers; }

  bool done() const { return _done; }

  /// \brief Record a completed exchange.
  /// A blank response counts as a failed attempt while retries remain.
  Step onResponse(std::string text)
  {
    if (util::isBlank(text) && retryAvailable())
    {
      WHOISCHASE_LOG_WARN("Empty response from " << _endpoint.toString() << " (attempt "
                                                 << _attempt << "/" << _options.maxRetries
                                                 << "), retrying");
      ++_attempt;
      return Step::Send;
    }
    return completeHop(std::move(text));
  }

  /// \brief Record a failed exchange.
  /// \throws the failure itself on cancellation, on anything that is not a
  /// transport error, and on the last attempt when rethrowTransportErrors
  /// is set
  Step onFailure(std::exception_ptr error)
  {
    try
    {
      std::rethrow_exception(error);
    }
    catch (const network::WhoisCancelledException &)
    {
      throw;
    }
    catch (const network::WhoisTransportException &e)
    {
      if (retryAvailable())
      {
        WHOISCHASE_LOG_WARN("Query to " << _endpoint.toString() << " failed (attempt " << _attempt
                                        << "/" << _options.maxRetries << "): " << e.what());
        ++_attempt;
        return Step::Send;
      }
      if (_options.rethrowTransportErrors)
      {
        WHOISCHASE_LOG_ERROR("Giving up on " << _endpoint.toString() << " after " << _attempt
                                             << " attempts: " << e.what());
        throw;
      }
      WHOISCHASE_LOG_WARN("Giving up on " << _endpoint.toString() << " after " << _attempt
                                          << " attempts: " << e.what());
    }
    return completeHop({});
  }

  /// \brief Final result; valid once done() is true.
  LookupResult result() const { return LookupResult(_servers, _raw); }

private:
  std::string _query;
  ResolveOptions _options;
  network::WhoisEndpoint _endpoint;
  std::vector<std::string> _servers;
  int _attempt{1};
  std::string _raw;
  bool _done{false};

  bool retryAvailable() const { return _attempt < _options.maxRetries; }

  Step completeHop(std::string text)
  {
    WHOISCHASE_LOG_TRACE("Response from " << _endpoint.toString() << ":\n" << text);

    auto referral = ReferralDetector::detect(text, _endpoint.host);
    if (referral)
    {
      if (_options.maxHops > 0 && _servers.size() >= _options.maxHops)
      {
        WHOISCHASE_LOG_WARN("Not following referral to " << referral->host << ":" << referral->port
                                                         << ", hop limit " << _options.maxHops
                                                         << " reached");
      }
      else
      {
        WHOISCHASE_LOG_INFO("Referral from " << _endpoint.host << " to " << referral->host << ":"
                                             << referral->port);
        _endpoint.host = referral->host;
        _endpoint.port = referral->port;
        _servers.push_back(referral->host);
        _attempt = 1;
        return Step::Send;
      }
    }

    _raw = std::move(text);
    _done = true;
    return Step::Done;
  }
};

} // namespace whois
} // namespace whoischase
