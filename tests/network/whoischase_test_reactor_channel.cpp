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

#include <future>

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

struct Outcome
{
  std::string text;
  std::exception_ptr error;
};

/// Start an exchange and hand back a future for its completion.
std::future<Outcome> exchangeAsync(ReactorWhoisChannel &channel, const WhoisEndpoint &endpoint,
                                   const std::string &statement, const ExchangeOptions &options,
                                   std::shared_ptr<CancellationToken> token = nullptr)
{
  auto promise = std::make_shared<std::promise<Outcome>>();
  auto future = promise->get_future();
  channel.exchange(endpoint, statement, options, std::move(token),
                   [promise](std::string text, std::exception_ptr error)
                   { promise->set_value(Outcome{std::move(text), error}); });
  return future;
}

Outcome waitOutcome(std::future<Outcome> &future, std::chrono::milliseconds limit = 5000ms)
{
  REQUIRE(future.wait_for(limit) == std::future_status::ready);
  return future.get();
}
} // namespace

TEST_CASE("ReactorWhoisChannel lifecycle", "[network][reactor]")
{
  whoischase::test::initializeTestLogging();
  ReactorWhoisChannel channel;
  REQUIRE_FALSE(channel.isRunning());
  REQUIRE(channel.start());
  REQUIRE(channel.isRunning());
  REQUIRE_FALSE(channel.start());
  channel.stop();
  REQUIRE_FALSE(channel.isRunning());
  channel.stop();

  SECTION("Exchanges after stop complete as cancelled")
  {
    auto future = exchangeAsync(channel, {"127.0.0.1", 43}, "x", loopbackOptions());
    auto outcome = waitOutcome(future, 100ms);
    REQUIRE_THROWS_AS(std::rethrow_exception(outcome.error), WhoisCancelledException);
  }
}

TEST_CASE("ReactorWhoisChannel reads the whole reply", "[network][reactor]")
{
  whoischase::test::initializeTestLogging();
  MockWhoisServer server;
  server.on("example.com", MockWhoisServer::Reply::chunked(
                             {"Domain Name: EXAMPLE.COM\r\n", "Registrar: X\r\n"}, 20ms));
  REQUIRE(server.start());

  ReactorWhoisChannel channel;
  REQUIRE(channel.start());
  WhoisEndpoint endpoint{"127.0.0.1", server.port()};

  SECTION("Without pacing")
  {
    auto future = exchangeAsync(channel, endpoint, "example.com", loopbackOptions());
    auto outcome = waitOutcome(future);
    REQUIRE_FALSE(outcome.error);
    REQUIRE(outcome.text == "Domain Name: EXAMPLE.COM\r\nRegistrar: X\r\n");
  }

  SECTION("With pacing between chunks")
  {
    auto options = loopbackOptions();
    options.chunkPacing = 30ms;
    auto future = exchangeAsync(channel, endpoint, "example.com", options);
    auto outcome = waitOutcome(future);
    REQUIRE_FALSE(outcome.error);
    REQUIRE(outcome.text == "Domain Name: EXAMPLE.COM\r\nRegistrar: X\r\n");
  }

  SECTION("Host names go through the resolver task")
  {
    auto future = exchangeAsync(channel, {"localhost", server.port()}, "example.com",
                                loopbackOptions());
    auto outcome = waitOutcome(future);
    REQUIRE_FALSE(outcome.error);
    REQUIRE(outcome.text.find("Registrar: X") != std::string::npos);
  }

  REQUIRE(whoischase::test::waitFor([&] { return channel.inFlight() == 0; }));
  channel.stop();
  server.stop();
}

TEST_CASE("ReactorWhoisChannel runs exchanges concurrently", "[network][reactor]")
{
  MockWhoisServer server;
  MockWhoisServer::Reply slow = MockWhoisServer::Reply::text("slow\n");
  slow.delayBeforeFirst = 300ms;
  server.otherwise(slow);
  REQUIRE(server.start());

  ReactorWhoisChannel channel;
  REQUIRE(channel.start());

  auto start = std::chrono::steady_clock::now();
  std::vector<std::future<Outcome>> futures;
  for (int i = 0; i < 5; ++i)
  {
    futures.push_back(exchangeAsync(channel, {"127.0.0.1", server.port()},
                                    "q" + std::to_string(i), loopbackOptions()));
  }
  for (auto &f : futures)
  {
    auto outcome = waitOutcome(f);
    REQUIRE(outcome.text == "slow\n");
  }
  REQUIRE(std::chrono::steady_clock::now() - start < 1200ms);
  REQUIRE(server.queries().size() == 5);

  channel.stop();
  server.stop();
}

TEST_CASE("ReactorWhoisChannel connect failures", "[network][reactor]")
{
  whoischase::test::initializeTestLogging();
  ReactorWhoisChannel channel;
  REQUIRE(channel.start());
  WhoisEndpoint endpoint{"127.0.0.1", testnet::getFreePortTCP()};

  SECTION("Swallowed by default")
  {
    auto future = exchangeAsync(channel, endpoint, "x", loopbackOptions());
    auto outcome = waitOutcome(future);
    REQUIRE_FALSE(outcome.error);
    REQUIRE(outcome.text.empty());
  }

  SECTION("Raised when asked")
  {
    auto options = loopbackOptions();
    options.rethrowTransportErrors = true;
    auto future = exchangeAsync(channel, endpoint, "x", options);
    auto outcome = waitOutcome(future);
    REQUIRE(outcome.error);
    try
    {
      std::rethrow_exception(outcome.error);
    }
    catch (const WhoisTransportException &e)
    {
      REQUIRE(e.code() == TransportError::Connect);
    }
  }

  SECTION("Cooldown delays the completion")
  {
    auto options = loopbackOptions();
    options.failureCooldown = 150ms;
    auto start = std::chrono::steady_clock::now();
    auto future = exchangeAsync(channel, endpoint, "x", options);
    waitOutcome(future);
    REQUIRE(std::chrono::steady_clock::now() - start >= 150ms);
  }

  channel.stop();
}

TEST_CASE("ReactorWhoisChannel read timeout keeps partial data", "[network][reactor]")
{
  MockWhoisServer server;
  auto partial = MockWhoisServer::Reply::text("OrgName: Partial\n");
  partial.holdOpenAfterReply = true;
  server.otherwise(partial);
  REQUIRE(server.start());

  ReactorWhoisChannel channel;
  REQUIRE(channel.start());

  auto options = loopbackOptions();
  options.timeout = 200ms;
  auto future = exchangeAsync(channel, {"127.0.0.1", server.port()}, "x", options);
  auto outcome = waitOutcome(future);
  REQUIRE_FALSE(outcome.error);
  REQUIRE(outcome.text == "OrgName: Partial\n");

  channel.stop();
  server.stop();
}

TEST_CASE("ReactorWhoisChannel cancellation", "[network][reactor][cancel]")
{
  whoischase::test::initializeTestLogging();
  MockWhoisServer server;
  server.otherwise(MockWhoisServer::Reply::silence());
  REQUIRE(server.start());

  ReactorWhoisChannel channel;
  REQUIRE(channel.start());
  WhoisEndpoint endpoint{"127.0.0.1", server.port()};
  auto options = loopbackOptions();
  options.timeout = 30000ms;

  SECTION("Token cancelled before the exchange")
  {
    auto token = CancellationToken::create();
    token->cancel();
    auto future = exchangeAsync(channel, endpoint, "x", options, token);
    auto outcome = waitOutcome(future, 100ms);
    REQUIRE_THROWS_AS(std::rethrow_exception(outcome.error), WhoisCancelledException);
    REQUIRE(server.connectionCount() == 0);
  }

  SECTION("Token cancelled while waiting for the reply")
  {
    auto token = CancellationToken::create();
    auto future = exchangeAsync(channel, endpoint, "x", options, token);
    REQUIRE(whoischase::test::waitFor([&] { return server.queries().size() == 1; }));

    auto start = std::chrono::steady_clock::now();
    token->cancel();
    auto outcome = waitOutcome(future, 1000ms);
    REQUIRE(std::chrono::steady_clock::now() - start < 1000ms);
    REQUIRE_THROWS_AS(std::rethrow_exception(outcome.error), WhoisCancelledException);
    REQUIRE(whoischase::test::waitFor([&] { return server.clientHangups() == 1; }));
  }

  SECTION("Stopping the channel cancels in-flight exchanges")
  {
    auto first = exchangeAsync(channel, endpoint, "a", options);
    auto second = exchangeAsync(channel, endpoint, "b", options);
    REQUIRE(whoischase::test::waitFor([&] { return channel.inFlight() == 2; }));

    channel.stop();
    REQUIRE_THROWS_AS(std::rethrow_exception(waitOutcome(first, 100ms).error),
                      WhoisCancelledException);
    REQUIRE_THROWS_AS(std::rethrow_exception(waitOutcome(second, 100ms).error),
                      WhoisCancelledException);
  }

  channel.stop();
  server.stop();
}
