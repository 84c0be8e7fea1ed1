// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include "MockWhoisServer.hpp"
#include "whoischase_test_net_utils.hpp"

using namespace whoischase::network;
using namespace std::chrono_literals;

namespace
{
ExchangeOptions loopbackOptions()
{
  ExchangeOptions options;
  options.timeout = 2000ms;
  options.failureCooldown = 5ms;
  options.chunkPacing = 0ms;
  return options;
}
} // namespace

TEST_CASE("TcpWhoisChannel reads the whole reply", "[network][tcp]")
{
  whoischase::test::initializeTestLogging();
  MockWhoisServer server;
  server.on("example.com",
            MockWhoisServer::Reply::chunked({"Domain Name: EXAMPLE.COM\r\n", "Registrar: X\r\n",
                                             "Whois Server: whois.example\r\n"},
                                            20ms));
  REQUIRE(server.start());

  TcpWhoisChannel channel;
  WhoisEndpoint endpoint{"127.0.0.1", server.port()};

  SECTION("Chunks are joined in order")
  {
    auto text = channel.query(endpoint, "example.com", loopbackOptions());
    REQUIRE(text ==
            "Domain Name: EXAMPLE.COM\r\nRegistrar: X\r\nWhois Server: whois.example\r\n");
    REQUIRE(server.queries() == std::vector<std::string>{"example.com"});
  }

  SECTION("Chunk pacing does not lose data")
  {
    auto options = loopbackOptions();
    options.chunkPacing = 30ms;
    auto text = channel.query(endpoint, "example.com", options);
    REQUIRE(text.find("Whois Server: whois.example") != std::string::npos);
  }

  SECTION("Completion form reports the text")
  {
    std::string got;
    std::exception_ptr error;
    channel.exchange(endpoint, "example.com", loopbackOptions(), nullptr,
                     [&](std::string text, std::exception_ptr e)
                     {
                       got = std::move(text);
                       error = e;
                     });
    REQUIRE_FALSE(error);
    REQUIRE(got.find("Registrar: X") != std::string::npos);
  }

  server.stop();
}

TEST_CASE("TcpWhoisChannel sends non-ASCII query characters as '?'", "[network][tcp]")
{
  MockWhoisServer server;
  server.otherwise(MockWhoisServer::Reply::text("ok\n"));
  REQUIRE(server.start());

  TcpWhoisChannel channel;
  auto text =
    channel.query({"127.0.0.1", server.port()}, "caf\xC3\xA9.example", loopbackOptions());
  REQUIRE(text == "ok\n");
  REQUIRE(server.queries() == std::vector<std::string>{"caf?.example"});
}

TEST_CASE("TcpWhoisChannel decodes with the requested encoding", "[network][tcp]")
{
  MockWhoisServer server;
  server.otherwise(MockWhoisServer::Reply::text("org: Caf\xE9\n"));
  REQUIRE(server.start());

  TcpWhoisChannel channel;
  auto options = loopbackOptions();

  options.encoding = TextCodec::latin1();
  REQUIRE(channel.query({"127.0.0.1", server.port()}, "x", options) == "org: Caf\xC3\xA9\n");

  options.encoding = TextCodec::ascii();
  REQUIRE(channel.query({"127.0.0.1", server.port()}, "x", options) == "org: Caf?\n");
}

TEST_CASE("TcpWhoisChannel connect failures", "[network][tcp]")
{
  whoischase::test::initializeTestLogging();
  TcpWhoisChannel channel;
  WhoisEndpoint endpoint{"127.0.0.1", testnet::getFreePortTCP()};

  SECTION("Swallowed by default")
  {
    auto options = loopbackOptions();
    options.failureCooldown = 50ms;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(channel.query(endpoint, "x", options).empty());
    REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);
  }

  SECTION("Raised when asked")
  {
    auto options = loopbackOptions();
    options.rethrowTransportErrors = true;
    try
    {
      channel.query(endpoint, "x", options);
      FAIL("expected WhoisTransportException");
    }
    catch (const WhoisTransportException &e)
    {
      REQUIRE(e.code() == TransportError::Connect);
      REQUIRE(e.sysErrno() == ECONNREFUSED);
    }
  }

  SECTION("Completion form carries the error")
  {
    auto options = loopbackOptions();
    options.rethrowTransportErrors = true;
    std::exception_ptr error;
    channel.exchange(endpoint, "x", options, nullptr,
                     [&](std::string, std::exception_ptr e) { error = e; });
    REQUIRE(error);
    REQUIRE_THROWS_AS(std::rethrow_exception(error), WhoisTransportException);
  }

  SECTION("Unresolvable host")
  {
    auto options = loopbackOptions();
    options.rethrowTransportErrors = true;
    REQUIRE_THROWS_AS(channel.query({"no-such-host.invalid", 43}, "x", options),
                      WhoisTransportException);
  }
}

TEST_CASE("TcpWhoisChannel read timeout keeps partial data", "[network][tcp]")
{
  whoischase::test::initializeTestLogging();
  MockWhoisServer server;
  auto partial = MockWhoisServer::Reply::text("OrgName: Partial\n");
  partial.holdOpenAfterReply = true;
  server.on("partial", partial);
  server.on("silent", MockWhoisServer::Reply::silence());
  REQUIRE(server.start());

  TcpWhoisChannel channel;
  auto options = loopbackOptions();
  options.timeout = 200ms;
  options.rethrowTransportErrors = true;

  REQUIRE(channel.query({"127.0.0.1", server.port()}, "partial", options) ==
          "OrgName: Partial\n");
  REQUIRE(channel.query({"127.0.0.1", server.port()}, "silent", options).empty());

  server.stop();
}

TEST_CASE("TcpWhoisChannel timeouts outside the poll range", "[network][tcp]")
{
  whoischase::test::initializeTestLogging();
  MockWhoisServer server;
  server.on("silent", MockWhoisServer::Reply::silence());
  server.on("example.com", MockWhoisServer::Reply::text("Domain Name: EXAMPLE.COM\r\n"));
  REQUIRE(server.start());

  TcpWhoisChannel channel;
  WhoisEndpoint endpoint{"127.0.0.1", server.port()};

  SECTION("A negative timeout is already expired")
  {
    auto options = loopbackOptions();
    options.timeout = std::chrono::milliseconds(-5);
    auto start = std::chrono::steady_clock::now();
    REQUIRE(channel.query(endpoint, "silent", options).empty());
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
  }

  SECTION("A timeout longer than INT_MAX milliseconds still reads the reply")
  {
    auto options = loopbackOptions();
    options.timeout = std::chrono::hours(24 * 30);
    REQUIRE(channel.query(endpoint, "example.com", options) == "Domain Name: EXAMPLE.COM\r\n");
  }

  server.stop();
}

TEST_CASE("TcpWhoisChannel honours a cancelled token", "[network][tcp][cancel]")
{
  MockWhoisServer server;
  server.otherwise(MockWhoisServer::Reply::text("never read\n"));
  REQUIRE(server.start());

  TcpWhoisChannel channel;
  auto token = CancellationToken::create();
  token->cancel();

  REQUIRE_THROWS_AS(channel.query({"127.0.0.1", server.port()}, "x", loopbackOptions(), token.get()),
                    WhoisCancelledException);

  std::exception_ptr error;
  channel.exchange({"127.0.0.1", server.port()}, "x", loopbackOptions(), token,
                   [&](std::string, std::exception_ptr e) { error = e; });
  REQUIRE_THROWS_AS(std::rethrow_exception(error), WhoisCancelledException);
  REQUIRE(server.connectionCount() == 0);
}
