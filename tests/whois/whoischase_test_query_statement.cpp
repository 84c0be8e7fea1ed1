// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using whoischase::whois::QueryStatementBuilder;

TEST_CASE("Verisign registry hosts get the domain keyword", "[whois][statement]")
{
  REQUIRE(QueryStatementBuilder::build("whois.internic.net", "example.com") ==
          "domain example.com");
  REQUIRE(QueryStatementBuilder::build("whois.verisign-grs.com", "example.net") ==
          "domain example.net");
}

TEST_CASE("ARIN gets the network flag", "[whois][statement]")
{
  REQUIRE(QueryStatementBuilder::build("whois.arin.net", "192.0.2.1") == "n + 192.0.2.1");
}

TEST_CASE("Other servers get the query unchanged", "[whois][statement]")
{
  REQUIRE(QueryStatementBuilder::build("whois.iana.org", "example.com") == "example.com");
  REQUIRE(QueryStatementBuilder::build("whois.ripe.net", "193.0.0.1") == "193.0.0.1");
  REQUIRE(QueryStatementBuilder::build("whois.arin.net.example", "x") == "x");
  REQUIRE(QueryStatementBuilder::build("", "") == "");
}

TEST_CASE("Server names match regardless of case", "[whois][statement]")
{
  REQUIRE(QueryStatementBuilder::build("WHOIS.ARIN.NET", "8.8.8.8") == "n + 8.8.8.8");
  REQUIRE(QueryStatementBuilder::build("Whois.Verisign-GRS.com", "a.com") == "domain a.com");
}
