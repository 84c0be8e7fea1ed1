// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace whoischase
{
namespace util
{
  /// \brief Split text on LF, dropping a trailing CR from each line.
  /// A final line without a terminator is kept; a trailing LF does not
  /// produce an extra empty line.
  inline std::vector<std::string> splitLines(const std::string& text)
  {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size())
    {
      std::size_t end = text.find('\n', start);
      if (end == std::string::npos)
      {
        end = text.size();
      }
      std::size_t len = end - start;
      if (len > 0 && text[start + len - 1] == '\r')
      {
        --len;
      }
      lines.emplace_back(text, start, len);
      start = end + 1;
    }
    return lines;
  }

  inline bool isSpace(char c)
  {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
  }

  inline std::string trimRight(const std::string& s)
  {
    std::size_t end = s.size();
    while (end > 0 && isSpace(s[end - 1]))
    {
      --end;
    }
    return s.substr(0, end);
  }

  inline std::string trim(const std::string& s)
  {
    std::size_t begin = 0;
    while (begin < s.size() && isSpace(s[begin]))
    {
      ++begin;
    }
    return trimRight(s.substr(begin));
  }

  inline bool isBlank(const std::string& s)
  {
    for (char c : s)
    {
      if (!isSpace(c))
      {
        return false;
      }
    }
    return true;
  }

  /// \brief ASCII case-insensitive equality, as used for host names.
  inline bool iequals(const std::string& a, const std::string& b)
  {
    if (a.size() != b.size())
    {
      return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
      if (std::tolower(static_cast<unsigned char>(a[i])) !=
          std::tolower(static_cast<unsigned char>(b[i])))
      {
        return false;
      }
    }
    return true;
  }

  /// \brief True when `s` holds `prefix` at `pos`, ignoring ASCII case.
  inline bool istartsWith(const std::string& s, std::size_t pos, const std::string& prefix)
  {
    if (pos > s.size() || s.size() - pos < prefix.size())
    {
      return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
      if (std::tolower(static_cast<unsigned char>(s[pos + i])) !=
          std::tolower(static_cast<unsigned char>(prefix[i])))
      {
        return false;
      }
    }
    return true;
  }

  inline bool isDigit(char c) { return c >= '0' && c <= '9'; }

  inline bool isAlpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

  /// \brief Word character in the regex sense: letter, digit or underscore.
  inline bool isWordChar(char c) { return isAlpha(c) || isDigit(c) || c == '_'; }
} // namespace util
} // namespace whoischase
