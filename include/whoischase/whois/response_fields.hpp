// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file response_fields.hpp
/// \brief Organization name and address range from free-form WHOIS text.
///
/// Registries disagree on labels and language, so each field is found by an
/// ordered list of line matchers; the first line (top to bottom) accepted by
/// a matcher tier wins. Labels are case-sensitive.
///
/// Organization name:
///   tier 1: `f. [組織名] value` (JPNIC), or `OrgName:`, `descr:`,
///           `Registrant Organization:`, `owner:`
///   tier 2: `Organization:`, `org-name:`
/// Address range:
///   `a. [IPネットワークアドレス] value` (JPNIC), or `NetRange:`, `CIDR:`,
///   `inetnum:`, `inet6num:` at the start of a line
///
/// When the last server is whois.arin.net, the last line of the form
/// `<org> <a.b.c.d> - <e.f.g.h>` overrides both fields unless <org> is just
/// one of the range labels above.
///
/// "Non-word" below means ASCII punctuation, whitespace and control bytes.
/// Bytes >= 0x80 count as word characters so that UTF-8 values survive.

#include <cctype>
#include <optional>
#include <string>
#include <vector>

#include "whoischase/network/ip_utils.hpp"
#include "whoischase/util/text_lines.hpp"

namespace whoischase
{
namespace whois
{

struct ResponseFields
{
  std::string organizationName;
  std::optional<network::IpAddressRange> addressRange;
};

class ResponseFieldExtractor
{
public:
  static constexpr const char *kArinServer = "whois.arin.net";

  static ResponseFields extract(const std::string &raw, const std::vector<std::string> &servers)
  {
    auto lines = util::splitLines(raw);
    ResponseFields fields;
    fields.organizationName = organizationName(lines);
    fields.addressRange = addressRange(lines);

    if (!servers.empty() && util::iequals(servers.back(), kArinServer))
    {
      applyArinSummary(lines, fields);
    }
    return fields;
  }

  static std::string organizationName(const std::vector<std::string> &lines)
  {
    static const std::vector<std::string> primary = {"OrgName", "descr", "Registrant Organization",
                                                     "owner"};
    static const std::vector<std::string> fallback = {"Organization", "org-name"};

    for (const auto &line : lines)
    {
      if (auto v = bracketLabelValue(line, "f.", u8"[組織名]"))
      {
        return *v;
      }
      if (auto v = colonLabelValue(line, primary, true))
      {
        return *v;
      }
    }
    for (const auto &line : lines)
    {
      if (auto v = colonLabelValue(line, fallback, true))
      {
        return *v;
      }
    }
    return {};
  }

  /// Candidates whose value does not parse as a range are skipped.
  static std::optional<network::IpAddressRange> addressRange(const std::vector<std::string> &lines)
  {
    static const std::vector<std::string> labels = {"NetRange", "CIDR", "inetnum", "inet6num"};

    for (const auto &line : lines)
    {
      auto v = bracketLabelValue(line, "a.", u8"[IPネットワークアドレス]");
      if (!v)
      {
        v = colonLabelValue(line, labels, false);
      }
      if (!v)
      {
        continue;
      }
      if (auto range = network::IpAddressRange::tryParse(*v))
      {
        return range;
      }
    }
    return std::nullopt;
  }

private:
  static bool isNonWord(char c)
  {
    auto u = static_cast<unsigned char>(c);
    if (u >= 0x80)
    {
      return false;
    }
    return !(std::isalnum(u) || c == '_');
  }

  /// Value after a run of at least one non-word character starting at `pos`.
  /// If the run reaches the end of the line its last character is the value.
  static std::optional<std::string> valueAfterSeparator(const std::string &line, std::size_t pos)
  {
    std::size_t end = pos;
    while (end < line.size() && isNonWord(line[end]))
    {
      ++end;
    }
    std::size_t run = end - pos;
    if (end == line.size())
    {
      if (run < 2)
      {
        return std::nullopt;
      }
      end = line.size() - 1;
    }
    else if (run == 0)
    {
      return std::nullopt;
    }
    std::string value = util::trimRight(line.substr(end));
    if (value.empty())
    {
      return std::nullopt;
    }
    return value;
  }

  /// `[prefix]<non-word>*<label><non-word>+value`
  static std::optional<std::string> bracketLabelValue(const std::string &line,
                                                      const std::string &prefix,
                                                      const std::string &label)
  {
    std::size_t pos = 0;
    if (line.compare(0, prefix.size(), prefix) == 0)
    {
      pos = prefix.size();
    }
    std::size_t at = line.find(label, pos);
    if (at == std::string::npos)
    {
      return std::nullopt;
    }
    for (std::size_t i = pos; i < at; ++i)
    {
      if (!isNonWord(line[i]))
      {
        return std::nullopt;
      }
    }
    return valueAfterSeparator(line, at + label.size());
  }

  /// `<label>:<non-word>+value`, optionally after leading whitespace.
  static std::optional<std::string> colonLabelValue(const std::string &line,
                                                    const std::vector<std::string> &labels,
                                                    bool allowIndent)
  {
    std::size_t pos = 0;
    if (allowIndent)
    {
      while (pos < line.size() && util::isSpace(line[pos]))
      {
        ++pos;
      }
    }
    for (const auto &label : labels)
    {
      if (line.compare(pos, label.size(), label) == 0 && pos + label.size() < line.size() &&
          line[pos + label.size()] == ':')
      {
        return valueAfterSeparator(line, pos + label.size() + 1);
      }
    }
    return std::nullopt;
  }

  /// Length of `d.d.d.d - d.d.d.d` at `pos`, or 0 when the text there is not
  /// in that shape. Octet values are checked later by the range parser.
  static std::size_t dottedRangeLength(const std::string &line, std::size_t pos)
  {
    std::size_t p = pos;
    for (int side = 0; side < 2; ++side)
    {
      if (side == 1)
      {
        if (line.compare(p, 3, " - ") != 0)
        {
          return 0;
        }
        p += 3;
      }
      for (int octet = 0; octet < 4; ++octet)
      {
        if (octet > 0)
        {
          if (p >= line.size() || line[p] != '.')
          {
            return 0;
          }
          ++p;
        }
        std::size_t digits = p;
        while (p < line.size() && util::isDigit(line[p]))
        {
          ++p;
        }
        if (p == digits)
        {
          return 0;
        }
      }
    }
    return p - pos;
  }

  /// Summary lines read `<org> <begin> - <end>`; the org part runs up to the
  /// last space that is followed by a dotted range.
  static void applyArinSummary(const std::vector<std::string> &lines, ResponseFields &fields)
  {
    std::string org;
    std::string range;
    bool found = false;
    for (const auto &line : lines)
    {
      for (std::size_t k = line.size(); k-- > 0;)
      {
        if (line[k] != ' ')
        {
          continue;
        }
        if (std::size_t len = dottedRangeLength(line, k + 1))
        {
          org = util::trim(line.substr(0, k));
          range = line.substr(k + 1, len);
          found = true;
          break;
        }
      }
    }
    if (!found || org == "NetRange:" || org == "CIDR:" || org == "inetnum:")
    {
      return;
    }
    auto parsed = network::IpAddressRange::tryParse(range);
    if (!parsed)
    {
      return;
    }
    fields.organizationName = org;
    fields.addressRange = parsed;
  }
};

} // namespace whois
} // namespace whoischase
