// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

// IpAddressRange exposes begin()/end(), so Catch2 would otherwise try to
// stringify it as a container.
namespace Catch
{
template <> struct StringMaker<whoischase::network::IpAddressRange>
{
  static std::string convert(const whoischase::network::IpAddressRange &range) { return range.toString(); }
};
} // namespace Catch

using whoischase::network::IpAddressRange;
using whoischase::whois::ResponseFieldExtractor;

namespace
{
const std::vector<std::string> kNoServers;
const std::vector<std::string> kArinOnly = {"whois.arin.net"};

const char *kArinRecord = "\n"
                          "NetRange:       192.0.2.0 - 192.0.2.255\n"
                          "CIDR:           192.0.2.0/24\n"
                          "NetName:        TEST-NET-1\n"
                          "\n"
                          "OrgName:        Example Networks\n"
                          "OrgId:          EXN\n";
} // namespace

TEST_CASE("ARIN-style record", "[whois][fields]")
{
  auto fields = ResponseFieldExtractor::extract(kArinRecord, kNoServers);
  REQUIRE(fields.organizationName == "Example Networks");
  REQUIRE(fields.addressRange.has_value());
  REQUIRE(*fields.addressRange == IpAddressRange::parse("192.0.2.0 - 192.0.2.255"));
}

TEST_CASE("RIPE-style record", "[whois][fields]")
{
  auto fields = ResponseFieldExtractor::extract("% This is the RIPE Database query service.\r\n"
                                                "\r\n"
                                                "inetnum:        193.0.0.0 - 193.0.7.255\r\n"
                                                "netname:        RIPE-NCC\r\n"
                                                "descr:          RIPE Network Coordination Centre\r\n"
                                                "org-name:       Reseaux IP Europeens\r\n",
                                                {"whois.iana.org", "whois.ripe.net"});
  REQUIRE(fields.organizationName == "RIPE Network Coordination Centre");
  REQUIRE(fields.addressRange->toString() == "193.0.0.0 - 193.0.7.255");
}

TEST_CASE("JPNIC bracket labels", "[whois][fields]")
{
  const std::string text = u8"[ JPNIC database provides information ]\n"
                           u8"a. [IPネットワークアドレス]     192.0.2.0/24\n"
                           u8"b. [ネットワーク名]             EXAMPLE-NET\n"
                           u8"f. [組織名]                     株式会社エグザンプル\n"
                           u8"g. [Organization]               Example K.K.\n";
  auto fields = ResponseFieldExtractor::extract(text, {"whois.nic.ad.jp"});
  REQUIRE(fields.organizationName == u8"株式会社エグザンプル");
  REQUIRE(fields.addressRange->toString() == "192.0.2.0 - 192.0.2.255");
}

TEST_CASE("Organization name tiers", "[whois][fields]")
{
  SECTION("Tier 1 wins even when tier 2 comes first")
  {
    auto name = ResponseFieldExtractor::organizationName(
      {"Organization:   Second Choice", "owner:          First Choice"});
    REQUIRE(name == "First Choice");
  }

  SECTION("Tier 2 is used when tier 1 is absent")
  {
    auto name = ResponseFieldExtractor::organizationName(
      {"domain: example.br", "org-name:       Fallback Org"});
    REQUIRE(name == "Fallback Org");
  }

  SECTION("Registrant Organization with indentation")
  {
    auto name = ResponseFieldExtractor::organizationName(
      {"   Registrant Organization: Example Holdings LLC  "});
    REQUIRE(name == "Example Holdings LLC");
  }

  SECTION("Top-most line of a tier wins")
  {
    auto name = ResponseFieldExtractor::organizationName(
      {"descr:          Upper", "OrgName:        Lower"});
    REQUIRE(name == "Upper");
  }

  SECTION("Labels are case-sensitive")
  {
    REQUIRE(ResponseFieldExtractor::organizationName({"orgname: lower"}).empty());
    REQUIRE(ResponseFieldExtractor::organizationName({"DESCR: upper"}).empty());
  }

  SECTION("A label needs a value after the separator")
  {
    REQUIRE(ResponseFieldExtractor::organizationName({"OrgName:"}).empty());
    REQUIRE(ResponseFieldExtractor::organizationName({"OrgName: "}).empty());
    REQUIRE(ResponseFieldExtractor::organizationName({"OrgName:NoSpace"}).empty());
  }

  SECTION("Nothing found")
  {
    REQUIRE(ResponseFieldExtractor::organizationName({}).empty());
    REQUIRE(ResponseFieldExtractor::organizationName({"No match for \"EXAMPLE.TEST\"."}).empty());
  }
}

TEST_CASE("Address range candidates", "[whois][fields]")
{
  SECTION("Range labels must start the line")
  {
    REQUIRE_FALSE(ResponseFieldExtractor::addressRange({"  NetRange: 10.0.0.0 - 10.0.0.255"})
                    .has_value());
  }

  SECTION("Unparseable candidates are skipped")
  {
    auto range = ResponseFieldExtractor::addressRange(
      {"inetnum:        not-an-address", "CIDR:           198.51.100.0/24"});
    REQUIRE(range.has_value());
    REQUIRE(range->toCidrString() == "198.51.100.0/24");
  }

  SECTION("IPv6 blocks")
  {
    auto range = ResponseFieldExtractor::addressRange({"inet6num:       2001:db8::/32"});
    REQUIRE(range.has_value());
    REQUIRE(range->toCidrString() == "2001:db8::/32");
  }

  SECTION("No candidate")
  {
    REQUIRE_FALSE(ResponseFieldExtractor::addressRange({"netname: X"}).has_value());
  }
}

TEST_CASE("ARIN summary lines override the fields", "[whois][fields][arin]")
{
  const std::string summary = "Example Customer EXAMPLE-CUST (NET-192-0-2-128-1) "
                              "192.0.2.128 - 192.0.2.191\n"
                              "Example Networks EXN-NET (NET-192-0-2-0-1) 192.0.2.0 - 192.0.2.255\n";

  SECTION("Last summary line wins when ARIN answered last")
  {
    auto fields = ResponseFieldExtractor::extract(summary, kArinOnly);
    REQUIRE(fields.organizationName == "Example Networks EXN-NET (NET-192-0-2-0-1)");
    REQUIRE(fields.addressRange->toString() == "192.0.2.0 - 192.0.2.255");
  }

  SECTION("Server name matches regardless of case")
  {
    auto fields = ResponseFieldExtractor::extract(summary, {"whois.iana.org", "WHOIS.ARIN.NET"});
    REQUIRE(fields.organizationName == "Example Networks EXN-NET (NET-192-0-2-0-1)");
  }

  SECTION("Ignored when another server answered last")
  {
    auto fields =
      ResponseFieldExtractor::extract(summary, {"whois.arin.net", "whois.apnic.net"});
    REQUIRE(fields.organizationName.empty());
    REQUIRE_FALSE(fields.addressRange.has_value());
  }

  SECTION("A plain range label is not a summary")
  {
    auto fields = ResponseFieldExtractor::extract(kArinRecord, kArinOnly);
    REQUIRE(fields.organizationName == "Example Networks");
    REQUIRE(fields.addressRange->toString() == "192.0.2.0 - 192.0.2.255");
  }

  SECTION("Very long lines")
  {
    const std::string filler(300000, 'x');
    auto fields = ResponseFieldExtractor::extract(filler + "\n", kArinOnly);
    REQUIRE(fields.organizationName.empty());
    REQUIRE_FALSE(fields.addressRange.has_value());

    fields = ResponseFieldExtractor::extract(filler + " 192.0.2.0 - 192.0.2.255\n", kArinOnly);
    REQUIRE(fields.organizationName == filler);
    REQUIRE(fields.addressRange->toString() == "192.0.2.0 - 192.0.2.255");
  }

  SECTION("A summary with an impossible range is ignored")
  {
    auto fields = ResponseFieldExtractor::extract(std::string(kArinRecord) +
                                                    "Broken Org 10.0.0.9 - 10.0.0.1\n",
                                                  kArinOnly);
    REQUIRE(fields.organizationName == "Example Networks");
    REQUIRE(fields.addressRange->toString() == "192.0.2.0 - 192.0.2.255");
  }
}
