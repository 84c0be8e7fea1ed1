// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <whoischase/whoischase.hpp>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>

namespace
{
  struct CliOptions
  {
    whoischase::WhoisClient::Config config;
    std::string query;
    bool raw{false};
    bool json{false};
    bool async{false};
  };

  class UsageError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  std::atomic<bool> interrupted{false};

  /// \brief Print help message
  void printHelp()
  {
    std::cout
        << "Usage: whoischase [options] <query>\n"
        << "\n"
        << "Options:\n"
        << "      --help                       Show this help message\n"
        << "  -h, --host <server>              First WHOIS server (default: whois.iana.org)\n"
        << "  -p, --port <port>                Port of the first server (default: 43)\n"
        << "  -e, --encoding <name>            Response encoding: ascii, utf-8, latin1 or any\n"
        << "                                   iconv charset (default: ascii)\n"
        << "  -t, --timeout <seconds>          Connect/read/write timeout (default: 600)\n"
        << "  -r, --retries <n>                Attempts per server (default: 10)\n"
        << "      --rethrow                    Fail on transport errors instead of\n"
        << "                                   treating the response as empty\n"
        << "      --max-hops <n>               Longest server chain, 0 = unlimited (default: 0)\n"
        << "      --raw                        Query one server only, print its reply\n"
        << "      --json                       Print the result as JSON\n"
        << "      --async                      Use the event-driven channel (Ctrl-C cancels)\n"
        << "  -c, --config <file>              Configuration file path\n"
        << "  -l, --log-level <level>          Log level (trace, debug, info, "
           "warning, error, fatal)\n"
        << "  -f, --log-file <file>            Log file path\n";
  }

  int parseInt(const std::string& what, const char* text)
  {
    try
    {
      std::size_t used = 0;
      int value = std::stoi(text, &used);
      if (text[used] != '\0')
      {
        throw std::invalid_argument(text);
      }
      return value;
    }
    catch (const std::exception&)
    {
      throw UsageError("Invalid " + what + ": " + std::string(text));
    }
  }

  /// \brief Parse command-line arguments into the config
  void parseCliArgs(int argc, char** argv, CliOptions& cli,
                    std::unique_ptr<whoischase::core::ConfigLoader>& configLoader)
  {
    auto& config = cli.config;
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      bool hasValue = i + 1 < argc;
      if ((arg == "-h" || arg == "--host") && hasValue)
      {
        config.whois.server = argv[++i];
      }
      else if ((arg == "-p" || arg == "--port") && hasValue)
      {
        config.whois.port = parseInt("port number", argv[++i]);
      }
      else if ((arg == "-e" || arg == "--encoding") && hasValue)
      {
        config.whois.encoding = argv[++i];
      }
      else if ((arg == "-t" || arg == "--timeout") && hasValue)
      {
        config.whois.timeoutSeconds = parseInt("timeout", argv[++i]);
      }
      else if ((arg == "-r" || arg == "--retries") && hasValue)
      {
        config.whois.maxRetries = parseInt("retry count", argv[++i]);
      }
      else if (arg == "--rethrow")
      {
        config.whois.rethrowErrors = true;
      }
      else if (arg == "--max-hops" && hasValue)
      {
        config.whois.maxHops = parseInt("max hops", argv[++i]);
      }
      else if (arg == "--raw")
      {
        cli.raw = true;
      }
      else if (arg == "--json")
      {
        cli.json = true;
      }
      else if (arg == "--async")
      {
        cli.async = true;
      }
      else if ((arg == "-c" || arg == "--config") && hasValue)
      {
        config.configFile = argv[++i];
        configLoader = std::make_unique<whoischase::core::ConfigLoader>(config.configFile.value());
      }
      else if ((arg == "-l" || arg == "--log-level") && hasValue)
      {
        config.log.level = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && hasValue)
      {
        config.log.file = argv[++i];
      }
      else if (arg == "--help")
      {
        printHelp();
        std::exit(0);
      }
      else if (arg.length() > 0 && arg[0] == '-')
      {
        throw UsageError("Unknown option or missing value: " + arg);
      }
      else if (cli.query.empty())
      {
        cli.query = arg;
      }
      else
      {
        throw UsageError("Only one query may be given, got '" + cli.query + "' and '" + arg + "'");
      }
    }
    if (cli.query.empty())
    {
      throw UsageError("Missing query");
    }
  }

  /// \brief Merge the TOML configuration file into the config.
  /// An explicit -c file must load; the default file is optional.
  void parseTomlConfig(whoischase::WhoisClient::Config& config,
                       std::unique_ptr<whoischase::core::ConfigLoader>& configLoader)
  {
    if (configLoader)
    {
      configLoader->load();
    }
    else
    {
      std::ifstream probe(WHOISCHASE_DEFAULT_CONFIG_FILE_PATH);
      if (!probe.good())
      {
        return;
      }
      configLoader =
          std::make_unique<whoischase::core::ConfigLoader>(WHOISCHASE_DEFAULT_CONFIG_FILE_PATH);
      configLoader->load();
    }
    whoischase::WhoisClient::mergeConfigFile(config, *configLoader);
  }

  template <typename T>
  T waitInterruptible(std::future<T>& future,
                      const std::shared_ptr<whoischase::network::CancellationToken>& token)
  {
    while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
    {
      if (interrupted.load())
      {
        token->cancel();
      }
    }
    return future.get();
  }

  void printResult(const whoischase::LookupResult& result)
  {
    std::cout << "Servers:      ";
    const auto& servers = result.respondedServers();
    for (std::size_t i = 0; i < servers.size(); ++i)
    {
      std::cout << (i ? " -> " : "") << servers[i];
    }
    std::cout << "\n";
    std::cout << "Organization: " << result.organizationName() << "\n";
    std::cout << "Range:        "
              << (result.addressRange() ? result.addressRange()->toString() : std::string())
              << "\n\n";
    std::cout << result.raw();
    if (!result.raw().empty() && result.raw().back() != '\n')
    {
      std::cout << "\n";
    }
  }
} // namespace

int main(int argc, char** argv)
{
  CliOptions cli;
  whoischase::ResolveOptions options;
  try
  {
    std::unique_ptr<whoischase::core::ConfigLoader> configLoader;
    parseCliArgs(argc, argv, cli, configLoader);
    parseTomlConfig(cli.config, configLoader);
    whoischase::WhoisClient::initLogging(cli.config);
    options = whoischase::WhoisClient::toResolveOptions(cli.config);
  }
  catch (const std::exception& ex)
  {
    std::cerr << "whoischase: " << ex.what() << "\n";
    if (dynamic_cast<const UsageError*>(&ex))
    {
      std::cerr << "Try 'whoischase --help' for more information.\n";
    }
    return 1;
  }

  try
  {
    auto mode = cli.async ? whoischase::WhoisClient::Mode::Suspending
                          : whoischase::WhoisClient::Mode::Blocking;
    whoischase::WhoisClient client(mode);
    auto token = whoischase::network::CancellationToken::create();
    if (cli.async)
    {
      std::signal(SIGINT, [](int) { interrupted.store(true); });
    }

    if (cli.raw)
    {
      auto future = client.rawQueryAsync(cli.query, options, token);
      std::string text = cli.async ? waitInterruptible(future, token) : future.get();
      if (cli.json)
      {
        whoischase::core::Json j;
        j["server"] = options.firstServer();
        j["raw"] = text;
        std::cout << j.dump(2) << std::endl;
      }
      else
      {
        std::cout << text;
      }
    }
    else
    {
      auto future = client.resolveAsync(cli.query, options, token);
      auto result = cli.async ? waitInterruptible(future, token) : future.get();
      if (cli.json)
      {
        std::cout << result.toJson().dump(2) << std::endl;
      }
      else
      {
        printResult(result);
      }
    }
  }
  catch (const whoischase::network::WhoisCancelledException& ex)
  {
    std::cerr << "whoischase: " << ex.what() << "\n";
    return 130;
  }
  catch (const whoischase::network::WhoisTransportException& ex)
  {
    std::cerr << "whoischase: " << ex.what() << "\n";
    return 2;
  }
  catch (const std::exception& ex)
  {
    std::cerr << "whoischase: " << ex.what() << "\n";
    return 1;
  }

  whoischase::core::Logger::shutdown();
  return 0;
}
