// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file text_codec.hpp
/// \brief Byte <-> text conversion for WHOIS payloads.
///
/// Decoded text is always UTF-8. ASCII, UTF-8 and Latin-1 are converted
/// in-process; every other charset name goes through iconv(3).

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <iconv.h>
#include <stdexcept>
#include <string>

namespace whoischase
{
namespace network
{

class TextCodec
{
public:
  enum class Kind
  {
    Ascii,
    Utf8,
    Latin1,
    Iconv
  };

  static TextCodec ascii() { return TextCodec(Kind::Ascii, "us-ascii"); }
  static TextCodec utf8() { return TextCodec(Kind::Utf8, "utf-8"); }
  static TextCodec latin1() { return TextCodec(Kind::Latin1, "iso-8859-1"); }

  /// \brief Look up a codec by charset name (case-insensitive).
  /// An empty name selects ASCII.
  /// \throws std::invalid_argument if the platform has no such charset
  static TextCodec byName(const std::string &name)
  {
    std::string key;
    for (char c : name)
    {
      key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (key.empty() || key == "ascii" || key == "us-ascii")
    {
      return ascii();
    }
    if (key == "utf-8" || key == "utf8")
    {
      return utf8();
    }
    if (key == "latin1" || key == "iso-8859-1" || key == "iso8859-1")
    {
      return latin1();
    }

    iconv_t cd = ::iconv_open("UTF-8", key.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1))
    {
      throw std::invalid_argument("Unsupported text encoding: " + name);
    }
    ::iconv_close(cd);
    return TextCodec(Kind::Iconv, key);
  }

  Kind kind() const { return _kind; }
  const std::string &name() const { return _name; }

  /// \brief Convert received bytes to UTF-8 text.
  /// Undecodable input becomes '?' (ASCII) or U+FFFD (everything else).
  std::string decode(const std::string &bytes) const
  {
    switch (_kind)
    {
    case Kind::Ascii:
    {
      std::string out(bytes);
      for (auto &c : out)
      {
        if (static_cast<unsigned char>(c) > 0x7F)
        {
          c = '?';
        }
      }
      return out;
    }
    case Kind::Utf8:
      return replaceInvalidUtf8(bytes);
    case Kind::Latin1:
    {
      std::string out;
      out.reserve(bytes.size());
      for (unsigned char c : bytes)
      {
        if (c < 0x80)
        {
          out.push_back(static_cast<char>(c));
        }
        else
        {
          out.push_back(static_cast<char>(0xC0 | (c >> 6)));
          out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
      }
      return out;
    }
    case Kind::Iconv:
      return decodeWithIconv(bytes);
    }
    return bytes;
  }

  /// \brief Render a UTF-8 query as 7-bit ASCII, one '?' per non-ASCII code
  /// point. Query lines always go out as ASCII, whatever the response codec.
  static std::string toAsciiQuery(const std::string &utf8)
  {
    std::string out;
    out.reserve(utf8.size());
    for (unsigned char c : utf8)
    {
      if (c < 0x80)
      {
        out.push_back(static_cast<char>(c));
      }
      else if ((c & 0xC0) != 0x80)
      {
        out.push_back('?');
      }
    }
    return out;
  }

  friend bool operator==(const TextCodec &a, const TextCodec &b) { return a._name == b._name; }
  friend bool operator!=(const TextCodec &a, const TextCodec &b) { return !(a == b); }

private:
  Kind _kind;
  std::string _name;

  TextCodec(Kind kind, std::string name) : _kind(kind), _name(std::move(name)) {}

  /// Length of the well-formed UTF-8 sequence at `pos`, or 0 when the bytes
  /// there are not one (RFC 3629: no overlongs, surrogates or code points
  /// above U+10FFFF).
  static std::size_t utf8SequenceLength(const std::string &bytes, std::size_t pos)
  {
    auto at = [&](std::size_t i) -> unsigned
    { return i < bytes.size() ? static_cast<unsigned char>(bytes[i]) : 0x100; };
    auto inRange = [](unsigned b, unsigned lo, unsigned hi) { return b >= lo && b <= hi; };

    unsigned lead = at(pos);
    if (lead < 0x80)
    {
      return 1;
    }
    if (inRange(lead, 0xC2, 0xDF))
    {
      return inRange(at(pos + 1), 0x80, 0xBF) ? 2 : 0;
    }
    if (inRange(lead, 0xE0, 0xEF))
    {
      unsigned lo = lead == 0xE0 ? 0xA0 : 0x80;
      unsigned hi = lead == 0xED ? 0x9F : 0xBF;
      return inRange(at(pos + 1), lo, hi) && inRange(at(pos + 2), 0x80, 0xBF) ? 3 : 0;
    }
    if (inRange(lead, 0xF0, 0xF4))
    {
      unsigned lo = lead == 0xF0 ? 0x90 : 0x80;
      unsigned hi = lead == 0xF4 ? 0x8F : 0xBF;
      return inRange(at(pos + 1), lo, hi) && inRange(at(pos + 2), 0x80, 0xBF) &&
                 inRange(at(pos + 3), 0x80, 0xBF)
               ? 4
               : 0;
    }
    return 0;
  }

  /// Copy well-formed UTF-8 through; each byte that does not start a
  /// well-formed sequence becomes U+FFFD.
  static std::string replaceInvalidUtf8(const std::string &bytes)
  {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size())
    {
      std::size_t len = utf8SequenceLength(bytes, pos);
      if (len == 0)
      {
        out += "\xEF\xBF\xBD";
        ++pos;
        continue;
      }
      out.append(bytes, pos, len);
      pos += len;
    }
    return out;
  }

  std::string decodeWithIconv(const std::string &bytes) const
  {
    iconv_t cd = ::iconv_open("UTF-8", _name.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1))
    {
      throw std::invalid_argument("Unsupported text encoding: " + _name);
    }

    static const std::string kReplacement = "\xEF\xBF\xBD";
    std::string out;
    std::string in(bytes);
    char *inPtr = in.empty() ? nullptr : &in[0];
    std::size_t inLeft = in.size();
    char buffer[4096];

    while (inLeft > 0)
    {
      char *outPtr = buffer;
      std::size_t outLeft = sizeof(buffer);
      std::size_t rc = ::iconv(cd, &inPtr, &inLeft, &outPtr, &outLeft);
      int err = rc == static_cast<std::size_t>(-1) ? errno : 0;
      out.append(buffer, sizeof(buffer) - outLeft);
      if (err == 0 || err == E2BIG)
      {
        continue;
      }
      // EILSEQ: skip one bad byte. EINVAL: truncated sequence at the end.
      out += kReplacement;
      if (err == EINVAL)
      {
        break;
      }
      ++inPtr;
      --inLeft;
    }

    // Flush shift state (ISO-2022-JP and friends).
    char *outPtr = buffer;
    std::size_t outLeft = sizeof(buffer);
    ::iconv(cd, nullptr, nullptr, &outPtr, &outLeft);
    out.append(buffer, sizeof(buffer) - outLeft);

    ::iconv_close(cd);
    return out;
  }
};

} // namespace network
} // namespace whoischase
