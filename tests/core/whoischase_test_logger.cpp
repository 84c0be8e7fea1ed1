// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <iterator>

using whoischase::core::Log;
using whoischase::core::Logger;

namespace
{
std::string readAll(const std::string &path)
{
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), {});
}
} // namespace

TEST_CASE("Logger Basic Levels", "[logger][levels]")
{
  whoischase::test::removeFilesMatchingPrefix("testlog.");

  Logger::init(Logger::Level::Trace, "testlog");
  WHOISCHASE_LOG_TRACE("Trace message");
  WHOISCHASE_LOG_DEBUG("Debug message");
  WHOISCHASE_LOG_INFO("Info message");
  WHOISCHASE_LOG_WARN("Warn message");
  WHOISCHASE_LOG_ERROR("Error message");
  WHOISCHASE_LOG_FATAL("Fatal message");
  Logger::shutdown();

  std::string logFile = "testlog." + Logger::currentDate() + ".log";
  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  REQUIRE(std::count(std::istreambuf_iterator<char>(in), {}, '\n') >= 6);
  whoischase::test::removeFilesMatchingPrefix("testlog.");
}

TEST_CASE("Logger drops entries below the minimum level", "[logger][levels]")
{
  whoischase::test::removeFilesMatchingPrefix("levellog.");

  Logger::init(Logger::Level::Warning, "levellog");
  WHOISCHASE_LOG_INFO("quiet info");
  WHOISCHASE_LOG_WARN("loud warning " << 7);
  Logger::shutdown();

  auto content = readAll("levellog." + Logger::currentDate() + ".log");
  REQUIRE(content.find("quiet info") == std::string::npos);
  REQUIRE(content.find("[WARN] loud warning 7") != std::string::npos);
  whoischase::test::removeFilesMatchingPrefix("levellog.");
}

TEST_CASE("Logger Stream Logging", "[logger][stream]")
{
  whoischase::test::removeFilesMatchingPrefix("streamlog.");

  Logger::init(Logger::Level::Info, "streamlog");
  Log << Logger::Level::Info << "Stream log test: " << 123 << Logger::endl;
  Logger::stream(Logger::Level::Error) << "flushed on scope exit";
  Logger::shutdown();

  auto content = readAll("streamlog." + Logger::currentDate() + ".log");
  REQUIRE(content.find("Stream log test: 123") != std::string::npos);
  REQUIRE(content.find("flushed on scope exit") != std::string::npos);
  whoischase::test::removeFilesMatchingPrefix("streamlog.");
}

TEST_CASE("Logger Thread Safety", "[logger][threaded]")
{
  whoischase::test::removeFilesMatchingPrefix("threadlog.");

  Logger::init(Logger::Level::Info, "threadlog");
  const int threads = 8;
  const int perThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t)
  {
    workers.emplace_back(
      [t]
      {
        for (int i = 0; i < perThread; ++i)
        {
          WHOISCHASE_LOG_INFO("thread " << t << " message " << i);
        }
      });
  }
  for (auto &w : workers)
  {
    w.join();
  }
  Logger::shutdown();

  std::ifstream in("threadlog." + Logger::currentDate() + ".log");
  REQUIRE(in.is_open());
  REQUIRE(std::count(std::istreambuf_iterator<char>(in), {}, '\n') == threads * perThread);
  whoischase::test::removeFilesMatchingPrefix("threadlog.");
}

TEST_CASE("External handler replaces file output", "[logger][external]")
{
  Logger::init(Logger::Level::Debug);

  std::vector<std::string> raw;
  std::vector<std::string> formatted;
  Logger::setExternalHandler(
    [&](Logger::Level level, const std::string &line, const std::string &message)
    {
      if (level >= Logger::Level::Info)
      {
        raw.push_back(message);
        formatted.push_back(line);
      }
    });

  WHOISCHASE_LOG_INFO("routed " << 1);
  WHOISCHASE_LOG_ERROR("routed " << 2);
  WHOISCHASE_LOG_DEBUG("debug carries location");
  Logger::clearExternalHandler();
  WHOISCHASE_LOG_INFO("not routed");

  REQUIRE(raw.size() == 2);
  REQUIRE(raw[0] == "routed 1");
  REQUIRE(formatted[1].find("[ERROR] routed 2") != std::string::npos);
  REQUIRE(formatted[1].back() == '\n');
}

TEST_CASE("Debug entries carry the source location", "[logger][external]")
{
  Logger::init(Logger::Level::Trace);
  std::string captured;
  Logger::setExternalHandler([&](Logger::Level, const std::string &line, const std::string &)
                             { captured = line; });
  WHOISCHASE_LOG_DEBUG("located");
  Logger::clearExternalHandler();

  REQUIRE(captured.find("[whoischase_test_logger.cpp:") != std::string::npos);
  REQUIRE(captured.find("located") != std::string::npos);
}

TEST_CASE("Level names", "[logger][levels]")
{
  REQUIRE(Logger::levelToString(Logger::Level::Warning) == "WARN");
  REQUIRE(Logger::levelToString(Logger::Level::Trace) == "TRACE");

  REQUIRE(Logger::levelFromString("DEBUG").value() == Logger::Level::Debug);
  REQUIRE(Logger::levelFromString("warn").value() == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("Warning").value() == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("fatal").value() == Logger::Level::Fatal);
  REQUIRE_FALSE(Logger::levelFromString("verbose").has_value());
  REQUIRE_FALSE(Logger::levelFromString("").has_value());
}

TEST_CASE("basename strips directories", "[logger]")
{
  namespace detail = whoischase::core::detail;
  static_assert(detail::basename("a/b/c.cpp")[0] == 'c', "constexpr basename");
  REQUIRE(std::string(detail::basename("/usr/src/whois.cpp")) == "whois.cpp");
  REQUIRE(std::string(detail::basename("C:\\src\\win.cpp")) == "win.cpp");
  REQUIRE(std::string(detail::basename("plain.cpp")) == "plain.cpp");
}
