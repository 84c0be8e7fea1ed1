// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0

/// \file ip_utils.hpp
/// \brief IP address and address range values
///
/// Provides:
/// - IPv4 and IPv6 address parsing and formatting
/// - A family-tagged IpAddress value with ordering
/// - IpAddressRange: inclusive begin/end pair parsed from a single address,
///   CIDR ("10.0.0.0/8"), IPv4 netmask ("10.0.0.0/255.0.0.0") or dashed
///   ("10.0.0.0 - 10.255.255.255") notation, as found in WHOIS records

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace whoischase
{
namespace network
{

/// \brief IPv4 address parsing utilities
class IPv4
{
public:
  /// \brief Parse dotted-quad IPv4 text to a 32-bit integer (host order)
  /// \note Rejects leading zeros to prevent octal interpretation ambiguity
  static bool parse(std::string_view ip, std::uint32_t &result)
  {
    std::uint32_t value = 0;
    std::size_t pos = 0;
    for (int i = 0; i < 4; ++i)
    {
      if (i > 0)
      {
        if (pos >= ip.size() || ip[pos] != '.')
        {
          return false;
        }
        ++pos;
      }

      std::size_t start = pos;
      std::uint32_t octet = 0;
      while (pos < ip.size() && std::isdigit(static_cast<unsigned char>(ip[pos])))
      {
        octet = octet * 10 + static_cast<std::uint32_t>(ip[pos] - '0');
        if (octet > 255)
        {
          return false;
        }
        ++pos;
      }
      std::size_t len = pos - start;
      if (len == 0 || (len > 1 && ip[start] == '0'))
      {
        return false;
      }
      value = (value << 8) | octet;
    }
    if (pos != ip.size())
    {
      return false;
    }
    result = value;
    return true;
  }

  static std::string toString(std::uint32_t ip)
  {
    return std::to_string((ip >> 24) & 0xFF) + "." + std::to_string((ip >> 16) & 0xFF) + "." +
           std::to_string((ip >> 8) & 0xFF) + "." + std::to_string(ip & 0xFF);
  }

  static bool isValid(std::string_view ip)
  {
    std::uint32_t dummy = 0;
    return parse(ip, dummy);
  }
};

/// \brief IPv6 address parsing utilities
class IPv6
{
public:
  using Address = std::array<std::uint8_t, 16>;

  /// \brief Parse IPv6 text ("2001:db8::1", "::", "::ffff:192.0.2.1")
  static bool parse(std::string_view ip, Address &result)
  {
    result.fill(0);
    if (ip.size() < 2)
    {
      return false;
    }

    // Dotted IPv4 tail occupies the last two groups.
    std::vector<std::uint16_t> tail4;
    auto lastColon = ip.rfind(':');
    if (lastColon != std::string_view::npos && ip.find('.', lastColon) != std::string_view::npos)
    {
      std::uint32_t v4 = 0;
      if (!IPv4::parse(ip.substr(lastColon + 1), v4))
      {
        return false;
      }
      tail4 = {static_cast<std::uint16_t>(v4 >> 16), static_cast<std::uint16_t>(v4 & 0xFFFF)};
      // A trailing "::" stays a compression marker ("::1.2.3.4").
      ip = ip.substr(0, lastColon + 1);
      if (ip.size() < 2 || ip.substr(ip.size() - 2) != "::")
      {
        ip = ip.substr(0, ip.size() - 1);
      }
    }

    std::vector<std::uint16_t> head;
    std::vector<std::uint16_t> rest;
    auto gap = ip.find("::");
    if (gap != std::string_view::npos)
    {
      if (ip.find("::", gap + 1) != std::string_view::npos)
      {
        return false;
      }
      if (!parseGroups(ip.substr(0, gap), head) || !parseGroups(ip.substr(gap + 2), rest))
      {
        return false;
      }
    }
    else if (!parseGroups(ip, head))
    {
      return false;
    }
    rest.insert(rest.end(), tail4.begin(), tail4.end());

    std::size_t total = head.size() + rest.size();
    if (gap == std::string_view::npos ? total != 8 : total > 7)
    {
      return false;
    }

    std::size_t idx = 0;
    for (auto g : head)
    {
      result[idx++] = static_cast<std::uint8_t>(g >> 8);
      result[idx++] = static_cast<std::uint8_t>(g & 0xFF);
    }
    idx = 16 - rest.size() * 2;
    for (auto g : rest)
    {
      result[idx++] = static_cast<std::uint8_t>(g >> 8);
      result[idx++] = static_cast<std::uint8_t>(g & 0xFF);
    }
    return true;
  }

  /// \brief Compressed form (RFC 5952)
  static std::string toString(const Address &addr)
  {
    std::array<std::uint16_t, 8> groups{};
    for (std::size_t i = 0; i < 8; ++i)
    {
      groups[i] = static_cast<std::uint16_t>((addr[i * 2] << 8) | addr[i * 2 + 1]);
    }

    std::size_t bestStart = 8;
    std::size_t bestLen = 1;
    for (std::size_t i = 0; i < 8;)
    {
      if (groups[i] != 0)
      {
        ++i;
        continue;
      }
      std::size_t j = i;
      while (j < 8 && groups[j] == 0)
      {
        ++j;
      }
      if (j - i > bestLen)
      {
        bestStart = i;
        bestLen = j - i;
      }
      i = j;
    }

    std::ostringstream oss;
    oss << std::hex;
    for (std::size_t i = 0; i < 8; ++i)
    {
      if (i == bestStart)
      {
        oss << "::";
        i += bestLen - 1;
        continue;
      }
      if (i > 0 && i != bestStart + bestLen)
      {
        oss << ':';
      }
      oss << groups[i];
    }
    return oss.str();
  }

  static bool isValid(std::string_view ip)
  {
    Address dummy{};
    return parse(ip, dummy);
  }

private:
  static bool parseGroups(std::string_view text, std::vector<std::uint16_t> &groups)
  {
    if (text.empty())
    {
      return true;
    }
    std::size_t pos = 0;
    while (pos <= text.size())
    {
      auto colon = text.find(':', pos);
      auto group = text.substr(pos, colon == std::string_view::npos ? text.size() - pos
                                                                      : colon - pos);
      if (group.empty() || group.size() > 4)
      {
        return false;
      }
      std::uint16_t value = 0;
      for (char c : group)
      {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
          return false;
        }
        int digit = std::isdigit(static_cast<unsigned char>(c))
                      ? c - '0'
                      : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        value = static_cast<std::uint16_t>((value << 4) | digit);
      }
      groups.push_back(value);
      if (colon == std::string_view::npos)
      {
        break;
      }
      pos = colon + 1;
    }
    return true;
  }
};

enum class AddressFamily
{
  IPv4,
  IPv6
};

/// \brief Unified IP address that can hold IPv4 or IPv6
class IpAddress
{
public:
  IpAddress() = default;

  static std::optional<IpAddress> tryParse(std::string_view text)
  {
    IpAddress addr;
    std::uint32_t v4 = 0;
    if (IPv4::parse(text, v4))
    {
      addr._family = AddressFamily::IPv4;
      addr._bytes[0] = static_cast<std::uint8_t>(v4 >> 24);
      addr._bytes[1] = static_cast<std::uint8_t>(v4 >> 16);
      addr._bytes[2] = static_cast<std::uint8_t>(v4 >> 8);
      addr._bytes[3] = static_cast<std::uint8_t>(v4);
      return addr;
    }
    IPv6::Address v6{};
    if (IPv6::parse(text, v6))
    {
      addr._family = AddressFamily::IPv6;
      addr._bytes = v6;
      return addr;
    }
    return std::nullopt;
  }

  /// \throws std::invalid_argument on malformed text
  static IpAddress parse(std::string_view text)
  {
    auto addr = tryParse(text);
    if (!addr)
    {
      throw std::invalid_argument("Invalid IP address: " + std::string(text));
    }
    return *addr;
  }

  static IpAddress fromBytes(AddressFamily family, const std::array<std::uint8_t, 16> &bytes)
  {
    IpAddress addr;
    addr._family = family;
    addr._bytes = bytes;
    if (family == AddressFamily::IPv4)
    {
      std::fill(addr._bytes.begin() + 4, addr._bytes.end(), 0);
    }
    return addr;
  }

  AddressFamily family() const { return _family; }
  std::size_t width() const { return _family == AddressFamily::IPv4 ? 4 : 16; }
  std::size_t maxPrefix() const { return width() * 8; }

  /// \brief Network-order bytes; IPv4 uses the first four.
  const std::array<std::uint8_t, 16> &bytes() const { return _bytes; }

  std::uint32_t ipv4() const
  {
    return (static_cast<std::uint32_t>(_bytes[0]) << 24) |
           (static_cast<std::uint32_t>(_bytes[1]) << 16) |
           (static_cast<std::uint32_t>(_bytes[2]) << 8) | _bytes[3];
  }

  std::string toString() const
  {
    if (_family == AddressFamily::IPv4)
    {
      return IPv4::toString(ipv4());
    }
    return IPv6::toString(_bytes);
  }

  friend bool operator==(const IpAddress &a, const IpAddress &b)
  {
    return a._family == b._family && a._bytes == b._bytes;
  }
  friend bool operator!=(const IpAddress &a, const IpAddress &b) { return !(a == b); }

  /// \brief IPv4 orders before IPv6; within a family, numeric order.
  friend bool operator<(const IpAddress &a, const IpAddress &b)
  {
    if (a._family != b._family)
    {
      return a._family == AddressFamily::IPv4;
    }
    return a._bytes < b._bytes;
  }
  friend bool operator<=(const IpAddress &a, const IpAddress &b) { return !(b < a); }

private:
  AddressFamily _family{AddressFamily::IPv4};
  std::array<std::uint8_t, 16> _bytes{};
};

/// \brief Inclusive range of addresses of one family.
class IpAddressRange
{
public:
  IpAddressRange() = default;

  /// \throws std::invalid_argument on family mismatch or begin > end
  IpAddressRange(const IpAddress &begin, const IpAddress &end) : _begin(begin), _end(end)
  {
    if (begin.family() != end.family())
    {
      throw std::invalid_argument("IpAddressRange: address families differ");
    }
    if (end < begin)
    {
      throw std::invalid_argument("IpAddressRange: begin " + begin.toString() + " is after end " +
                                  end.toString());
    }
  }

  /// \brief Parse "a", "a/len", "a/netmask" (IPv4) or "a - b".
  /// Surrounding whitespace is ignored.
  static std::optional<IpAddressRange> tryParse(std::string_view text)
  {
    text = trim(text);
    if (text.empty())
    {
      return std::nullopt;
    }

    auto dash = text.find('-');
    if (dash != std::string_view::npos)
    {
      auto begin = IpAddress::tryParse(trim(text.substr(0, dash)));
      auto end = IpAddress::tryParse(trim(text.substr(dash + 1)));
      if (!begin || !end || begin->family() != end->family() || *end < *begin)
      {
        return std::nullopt;
      }
      return IpAddressRange(*begin, *end);
    }

    auto slash = text.find('/');
    if (slash == std::string_view::npos)
    {
      auto single = IpAddress::tryParse(text);
      if (!single)
      {
        return std::nullopt;
      }
      return IpAddressRange(*single, *single);
    }

    auto base = IpAddress::tryParse(trim(text.substr(0, slash)));
    if (!base)
    {
      return std::nullopt;
    }
    auto maskText = trim(text.substr(slash + 1));
    auto prefix = parsePrefix(maskText, *base);
    if (!prefix)
    {
      return std::nullopt;
    }
    return fromPrefix(*base, *prefix);
  }

  /// \throws std::invalid_argument on malformed text
  static IpAddressRange parse(std::string_view text)
  {
    auto range = tryParse(text);
    if (!range)
    {
      throw std::invalid_argument("Invalid IP address range: " + std::string(text));
    }
    return *range;
  }

  /// \brief Block of `prefix` leading bits containing `addr`.
  static IpAddressRange fromPrefix(const IpAddress &addr, std::size_t prefix)
  {
    auto low = addr.bytes();
    auto high = addr.bytes();
    for (std::size_t bit = prefix; bit < addr.maxPrefix(); ++bit)
    {
      auto mask = static_cast<std::uint8_t>(0x80u >> (bit % 8));
      low[bit / 8] = static_cast<std::uint8_t>(low[bit / 8] & ~mask);
      high[bit / 8] = static_cast<std::uint8_t>(high[bit / 8] | mask);
    }
    return IpAddressRange(IpAddress::fromBytes(addr.family(), low),
                          IpAddress::fromBytes(addr.family(), high));
  }

  const IpAddress &begin() const { return _begin; }
  const IpAddress &end() const { return _end; }
  AddressFamily family() const { return _begin.family(); }

  bool contains(const IpAddress &addr) const
  {
    return addr.family() == family() && _begin <= addr && addr <= _end;
  }

  /// \brief Prefix length when the range is exactly one CIDR block.
  std::optional<std::size_t> prefixLength() const
  {
    for (std::size_t prefix = 0; prefix <= _begin.maxPrefix(); ++prefix)
    {
      auto block = fromPrefix(_begin, prefix);
      if (block._begin == _begin && block._end == _end)
      {
        return prefix;
      }
    }
    return std::nullopt;
  }

  /// \brief "begin - end", or the bare address for a single-host range.
  std::string toString() const
  {
    if (_begin == _end)
    {
      return _begin.toString();
    }
    return _begin.toString() + " - " + _end.toString();
  }

  /// \brief "base/len" when prefixLength() exists, toString() otherwise.
  std::string toCidrString() const
  {
    if (auto prefix = prefixLength())
    {
      return _begin.toString() + "/" + std::to_string(*prefix);
    }
    return toString();
  }

  friend bool operator==(const IpAddressRange &a, const IpAddressRange &b)
  {
    return a._begin == b._begin && a._end == b._end;
  }
  friend bool operator!=(const IpAddressRange &a, const IpAddressRange &b) { return !(a == b); }

private:
  IpAddress _begin;
  IpAddress _end;

  static std::string_view trim(std::string_view s)
  {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    {
      s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    {
      s.remove_suffix(1);
    }
    return s;
  }

  static std::optional<std::size_t> parsePrefix(std::string_view text, const IpAddress &base)
  {
    if (text.empty())
    {
      return std::nullopt;
    }
    if (std::all_of(text.begin(), text.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    {
      if (text.size() > 3)
      {
        return std::nullopt;
      }
      std::size_t prefix = 0;
      for (char c : text)
      {
        prefix = prefix * 10 + static_cast<std::size_t>(c - '0');
      }
      if (prefix > base.maxPrefix())
      {
        return std::nullopt;
      }
      return prefix;
    }

    // Dotted netmask, IPv4 only, must be contiguous ones.
    std::uint32_t mask = 0;
    if (base.family() != AddressFamily::IPv4 || !IPv4::parse(text, mask))
    {
      return std::nullopt;
    }
    std::size_t ones = 0;
    while (ones < 32 && (mask & (0x80000000u >> ones)))
    {
      ++ones;
    }
    std::uint32_t expected = ones == 0 ? 0 : ~((ones == 32) ? 0u : (0xFFFFFFFFu >> ones));
    if (mask != expected)
    {
      return std::nullopt;
    }
    return ones;
  }
};

} // namespace network
} // namespace whoischase
