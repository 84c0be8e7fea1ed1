// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file referral_detector.hpp
/// \brief Finds the "ask that server instead" hint in a WHOIS response.
///
/// Recognised markers, in priority order:
///   1. `ReferralServer: whois://host[:port]`          (ARIN)
///   2. `[Registrar ]Whois Server: host[:port]`         (gTLD registries)
///   3. `refer: host[:port]`                            (IANA)
///   4. `whois: host[:port]`                            (IANA TLD records)
///   5. `remarks: ... whois.example.tld[:port]`         (APNIC, JPNIC)
///
/// Lines are scanned top to bottom; on each line the markers are tried in
/// the order above. The first hit in the document decides, even if a later
/// line carries a more specific marker.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "whoischase/network/transport_types.hpp"
#include "whoischase/util/text_lines.hpp"

namespace whoischase
{
namespace whois
{

/// \brief A server named by a referral marker
struct Referral
{
  std::string host;
  std::uint16_t port{network::kWhoisPort};

  bool operator==(const Referral &other) const
  {
    return host == other.host && port == other.port;
  }
  bool operator!=(const Referral &other) const { return !(*this == other); }
};

class ReferralDetector
{
public:
  /// \brief First referral marker in `text`, regardless of the current server.
  static std::optional<Referral> firstMarker(const std::string &text)
  {
    for (const auto &line : util::splitLines(text))
    {
      for (auto matcher : matchers())
      {
        if (auto referral = matcher(line))
        {
          return referral;
        }
      }
    }
    return std::nullopt;
  }

  /// \brief Referral to follow from a response of `currentServer`.
  /// A marker naming `currentServer` itself (any case) means no referral.
  static std::optional<Referral> detect(const std::string &text, const std::string &currentServer)
  {
    auto referral = firstMarker(text);
    if (!referral || util::iequals(referral->host, currentServer))
    {
      return std::nullopt;
    }
    return referral;
  }

private:
  using Matcher = std::optional<Referral> (*)(const std::string &);

  /// `ReferralServer:<non-word>+whois://host[:port]` at the start of the line.
  static std::optional<Referral> referralServer(const std::string &line)
  {
    static const std::string label = "ReferralServer:";
    if (!util::istartsWith(line, 0, label))
    {
      return std::nullopt;
    }
    std::size_t pos = skipNonWord(line, label.size());
    if (pos == label.size() || !util::istartsWith(line, pos, "whois://"))
    {
      return std::nullopt;
    }
    return hostAndPort(line, pos + 8);
  }

  /// `[Registrar ]Whois Server: host[:port]`, leading blanks allowed.
  static std::optional<Referral> whoisServer(const std::string &line)
  {
    static const std::string label = "Whois Server:";
    std::size_t pos = skipSpace(line, 0);
    if (util::istartsWith(line, pos, "Registrar"))
    {
      std::size_t after = skipSpace(line, pos + 9);
      if (after > pos + 9 && util::istartsWith(line, after, label))
      {
        return hostAndPort(line, skipSpace(line, after + label.size()));
      }
    }
    if (!util::istartsWith(line, pos, label))
    {
      return std::nullopt;
    }
    return hostAndPort(line, skipSpace(line, pos + label.size()));
  }

  static std::optional<Referral> refer(const std::string &line)
  {
    return simpleLabel(line, "refer:");
  }

  static std::optional<Referral> whois(const std::string &line)
  {
    return simpleLabel(line, "whois:");
  }

  /// `remarks:<non-word>...whois.name.tld[:port]`; the last host name on the
  /// line is taken. The host is the longest run of name characters after
  /// `whois.` that still ends in a dot followed by at least two letters.
  static std::optional<Referral> remarks(const std::string &line)
  {
    static const std::string label = "remarks:";
    if (!util::istartsWith(line, 0, label) || line.size() <= label.size() ||
        util::isWordChar(line[label.size()]))
    {
      return std::nullopt;
    }
    // Walk backwards, tracking the last usable top-level dot of the current
    // run of name characters.
    std::size_t tldDot = std::string::npos;
    for (std::size_t i = line.size(); i-- > label.size() + 1;)
    {
      if (!isHostChar(line[i]))
      {
        tldDot = std::string::npos;
        continue;
      }
      if (tldDot == std::string::npos && line[i] == '.' && i + 2 < line.size() &&
          util::isAlpha(line[i + 1]) && util::isAlpha(line[i + 2]))
      {
        tldDot = i;
      }
      if (tldDot == std::string::npos || tldDot < i + 7 || !util::istartsWith(line, i, "whois."))
      {
        continue;
      }
      std::size_t end = tldDot + 1;
      while (end < line.size() && util::isAlpha(line[end]))
      {
        ++end;
      }
      return withPort(line.substr(i, end - i), line, end);
    }
    return std::nullopt;
  }

  static std::optional<Referral> simpleLabel(const std::string &line, const std::string &label)
  {
    std::size_t pos = skipSpace(line, 0);
    if (!util::istartsWith(line, pos, label))
    {
      return std::nullopt;
    }
    return hostAndPort(line, skipSpace(line, pos + label.size()));
  }

  /// Host up to the next colon, then an optional `:digits` port.
  static std::optional<Referral> hostAndPort(const std::string &line, std::size_t pos)
  {
    std::size_t colon = line.find(':', pos);
    std::size_t hostEnd = colon == std::string::npos ? line.size() : colon;
    if (hostEnd <= pos)
    {
      return std::nullopt;
    }
    return withPort(line.substr(pos, hostEnd - pos), line, hostEnd);
  }

  static std::optional<Referral> withPort(const std::string &host, const std::string &line,
                                          std::size_t pos)
  {
    Referral referral;
    referral.host = util::trim(host);
    if (referral.host.empty())
    {
      return std::nullopt;
    }
    if (pos + 1 < line.size() && line[pos] == ':' && util::isDigit(line[pos + 1]))
    {
      std::size_t end = pos + 1;
      while (end < line.size() && util::isDigit(line[end]))
      {
        ++end;
      }
      referral.port = parsePort(line.substr(pos + 1, end - pos - 1));
    }
    return referral;
  }

  static bool isHostChar(char c)
  {
    return util::isAlpha(c) || util::isDigit(c) || c == '-' || c == '.';
  }

  static std::size_t skipSpace(const std::string &line, std::size_t pos)
  {
    while (pos < line.size() && util::isSpace(line[pos]))
    {
      ++pos;
    }
    return pos;
  }

  static std::size_t skipNonWord(const std::string &line, std::size_t pos)
  {
    while (pos < line.size() && !util::isWordChar(line[pos]))
    {
      ++pos;
    }
    return pos;
  }

  /// Out-of-range ports fall back to the well-known port.
  static std::uint16_t parsePort(const std::string &digits)
  {
    if (digits.empty() || digits.size() > 5)
    {
      return network::kWhoisPort;
    }
    unsigned long value = std::stoul(digits);
    if (value == 0 || value > 65535)
    {
      return network::kWhoisPort;
    }
    return static_cast<std::uint16_t>(value);
  }

  static const std::vector<Matcher> &matchers()
  {
    static const std::vector<Matcher> list = {&referralServer, &whoisServer, &refer, &whois,
                                              &remarks};
    return list;
  }
};

} // namespace whois
} // namespace whoischase
