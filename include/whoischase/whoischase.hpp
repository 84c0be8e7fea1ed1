// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "network/cancellation.hpp"
#include "network/ip_utils.hpp"
#include "network/reactor_whois_channel.hpp"
#include "network/text_codec.hpp"
#include "network/whois_channel.hpp"
#include "whois/lookup_result.hpp"
#include "whois/whois_resolver.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#define WHOISCHASE_DEFAULT_CONFIG_FILE_PATH "/etc/whoischase/whoischase.toml"

namespace whoischase
{

using whois::LookupResult;
using whois::ResolveOptions;

/// \brief Entry point for WHOIS lookups.
///
/// Owns a channel and a resolver. The blocking mode uses TcpWhoisChannel;
/// the suspending mode starts a ReactorWhoisChannel for the lifetime of the
/// client. Either mode serves both the blocking and the async calls.
class WhoisClient
{
public:
  enum class Mode
  {
    Blocking,
    Suspending
  };

  /// \brief Settings as read from the command line and the TOML file.
  /// Unset values fall back to the ResolveOptions defaults.
  struct Config
  {
    struct WhoisConfig
    {
      std::optional<std::string> server;
      std::optional<int> port;
      std::optional<std::string> encoding;
      std::optional<int> timeoutSeconds;
      std::optional<int> maxRetries;
      std::optional<bool> rethrowErrors;
      std::optional<int> failureCooldownMs;
      std::optional<int> chunkPacingMs;
      std::optional<int> maxHops;
    } whois;
    struct LogConfig
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
    } log;

    // Configuration file path (used for CLI parsing)
    std::optional<std::string> configFile;
  };

  WhoisClient(const WhoisClient &) = delete;
  WhoisClient &operator=(const WhoisClient &) = delete;

  /// \throws std::runtime_error if the suspending channel cannot start
  explicit WhoisClient(Mode mode = Mode::Blocking)
  {
    if (mode == Mode::Suspending)
    {
      _reactor = std::make_shared<network::ReactorWhoisChannel>();
      if (!_reactor->start())
      {
        throw std::runtime_error("WhoisClient: failed to start the I/O thread");
      }
      _resolver = std::make_unique<whois::WhoisResolver>(_reactor);
    }
    else
    {
      _resolver =
        std::make_unique<whois::WhoisResolver>(std::make_shared<network::TcpWhoisChannel>());
    }
  }

  /// \brief Use a caller-supplied channel; the caller manages its lifetime.
  explicit WhoisClient(std::shared_ptr<network::WhoisChannel> channel)
      : _resolver(std::make_unique<whois::WhoisResolver>(std::move(channel)))
  {
  }

  ~WhoisClient()
  {
    if (_reactor)
    {
      _reactor->stop();
    }
  }

  whois::WhoisResolver &resolver() { return *_resolver; }

  /// \brief Look up `query`, following referrals from `server`.
  /// An empty `server` means the bootstrap registry.
  LookupResult resolve(const std::string &query, const std::string &server = whois::kBootstrapServer,
                       int port = network::kWhoisPort,
                       const network::TextCodec &encoding = network::TextCodec::ascii(),
                       int timeoutSeconds = 600, int maxRetries = 10,
                       bool rethrowTransportErrors = false,
                       std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    return _resolver->resolve(query,
                              makeOptions(server, port, encoding, timeoutSeconds, maxRetries,
                                          rethrowTransportErrors),
                              std::move(token));
  }

  LookupResult resolve(const std::string &query, const ResolveOptions &options,
                       std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    return _resolver->resolve(query, options, std::move(token));
  }

  std::future<LookupResult> resolveAsync(const std::string &query, const ResolveOptions &options,
                                         std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    return _resolver->resolveAsync(query, options, std::move(token));
  }

  void resolveAsync(const std::string &query, const ResolveOptions &options,
                    std::shared_ptr<network::CancellationToken> token,
                    whois::WhoisResolver::ResultCallback callback)
  {
    _resolver->resolveAsync(query, options, std::move(token), std::move(callback));
  }

  /// \brief Send `query` verbatim to `server` and return its reply.
  std::string rawQuery(const std::string &query, const std::string &server,
                       int port = network::kWhoisPort,
                       const network::TextCodec &encoding = network::TextCodec::ascii(),
                       int timeoutSeconds = 600, bool rethrowTransportErrors = false,
                       std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    return _resolver->rawQuery(
      query, makeOptions(server, port, encoding, timeoutSeconds, 1, rethrowTransportErrors),
      std::move(token));
  }

  std::future<std::string> rawQueryAsync(const std::string &query, const ResolveOptions &options,
                                         std::shared_ptr<network::CancellationToken> token = nullptr)
  {
    return _resolver->rawQueryAsync(query, options, std::move(token));
  }

  /// \brief Fill every unset value in `config` from the loaded TOML table.
  static void mergeConfigFile(Config &config, const core::ConfigLoader &loader)
  {
    auto fillInt = [&loader](std::optional<int> &target, const char *key)
    {
      if (!target.has_value())
      {
        if (auto v = loader.getInt(key))
        {
          target = static_cast<int>(*v);
        }
      }
    };
    auto fillString = [&loader](std::optional<std::string> &target, const char *key)
    {
      if (!target.has_value())
      {
        if (auto v = loader.getString(key))
        {
          target = *v;
        }
      }
    };

    fillString(config.whois.server, "whoischase.whois.server");
    fillInt(config.whois.port, "whoischase.whois.port");
    fillString(config.whois.encoding, "whoischase.whois.encoding");
    fillInt(config.whois.timeoutSeconds, "whoischase.whois.timeoutSeconds");
    fillInt(config.whois.maxRetries, "whoischase.whois.maxRetries");
    if (!config.whois.rethrowErrors.has_value())
    {
      if (auto v = loader.getBool("whoischase.whois.rethrowErrors"))
      {
        config.whois.rethrowErrors = *v;
      }
    }
    fillInt(config.whois.failureCooldownMs, "whoischase.whois.failureCooldownMs");
    fillInt(config.whois.chunkPacingMs, "whoischase.whois.chunkPacingMs");
    fillInt(config.whois.maxHops, "whoischase.whois.maxHops");
    fillString(config.log.level, "whoischase.log.level");
    fillString(config.log.file, "whoischase.log.file");
  }

  /// \throws std::runtime_error on out-of-range values or an unknown encoding
  static ResolveOptions toResolveOptions(const Config &config)
  {
    const auto &w = config.whois;
    ResolveOptions options;
    if (w.server)
    {
      options.server = *w.server;
    }
    if (w.port)
    {
      if (*w.port < 1 || *w.port > 65535)
      {
        throw std::runtime_error("Invalid port: " + std::to_string(*w.port));
      }
      options.port = static_cast<std::uint16_t>(*w.port);
    }
    if (w.encoding)
    {
      try
      {
        options.encoding = network::TextCodec::byName(*w.encoding);
      }
      catch (const std::invalid_argument &e)
      {
        throw std::runtime_error(e.what());
      }
    }
    if (w.timeoutSeconds)
    {
      if (*w.timeoutSeconds < 1)
      {
        throw std::runtime_error("Invalid timeout: " + std::to_string(*w.timeoutSeconds));
      }
      options.timeout = std::chrono::seconds(*w.timeoutSeconds);
    }
    if (w.maxRetries)
    {
      options.maxRetries = *w.maxRetries;
    }
    if (w.rethrowErrors)
    {
      options.rethrowTransportErrors = *w.rethrowErrors;
    }
    if (w.failureCooldownMs)
    {
      options.failureCooldown = std::chrono::milliseconds(std::max(0, *w.failureCooldownMs));
    }
    if (w.chunkPacingMs)
    {
      options.chunkPacing = std::chrono::milliseconds(std::max(0, *w.chunkPacingMs));
    }
    if (w.maxHops)
    {
      if (*w.maxHops < 0)
      {
        throw std::runtime_error("Invalid max hops: " + std::to_string(*w.maxHops));
      }
      options.maxHops = static_cast<std::size_t>(*w.maxHops);
    }
    return options;
  }

  /// \brief Initialize the process logger from the `log` section.
  /// \throws std::runtime_error on an unknown level name
  static void initLogging(const Config &config)
  {
    auto level = core::Logger::Level::Warning;
    if (config.log.level)
    {
      auto parsed = core::Logger::levelFromString(*config.log.level);
      if (!parsed)
      {
        throw std::runtime_error("Invalid log level: " + *config.log.level);
      }
      level = *parsed;
    }
    core::Logger::init(level, config.log.file.value_or(""));
  }

private:
  std::shared_ptr<network::ReactorWhoisChannel> _reactor;
  std::unique_ptr<whois::WhoisResolver> _resolver;

  static ResolveOptions makeOptions(const std::string &server, int port,
                                    const network::TextCodec &encoding, int timeoutSeconds,
                                    int maxRetries, bool rethrowTransportErrors)
  {
    if (port < 1 || port > 65535)
    {
      throw std::invalid_argument("Invalid port: " + std::to_string(port));
    }
    if (timeoutSeconds < 1)
    {
      throw std::invalid_argument("Invalid timeout: " + std::to_string(timeoutSeconds));
    }
    ResolveOptions options;
    options.server = server;
    options.port = static_cast<std::uint16_t>(port);
    options.encoding = encoding;
    options.timeout = std::chrono::seconds(timeoutSeconds);
    options.maxRetries = maxRetries;
    options.rethrowTransportErrors = rethrowTransportErrors;
    return options;
  }
};

} // namespace whoischase
