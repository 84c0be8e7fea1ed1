// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief Small TOML subset reader for configuration files.
///
/// Supports [dotted.sections], bare or dotted keys, basic and literal
/// strings, integers, floats, booleans, arrays (single or multi-line) and
/// '#' comments. Dates, inline tables and multi-line strings are rejected.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace whoischase
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Parse failure with 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }
  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else
    {
      if (auto *val = std::get_if<T>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *val = std::get_if<std::shared_ptr<array>>(&_value);
    return val ? val->get() : nullptr;
  }

  table *as_table()
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *val = std::get_if<std::shared_ptr<table>>(&_value);
    return val ? val->get() : nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

inline std::vector<std::string> split_path(const std::string &dotted)
{
  std::vector<std::string> parts;
  std::stringstream ss(dotted);
  std::string part;
  while (std::getline(ss, part, '.'))
  {
    parts.push_back(part);
  }
  return parts;
}

class table
{
public:
  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Look up a dotted path; returns an empty node when absent.
  node at_path(const std::string &dottedPath) const
  {
    auto parts = split_path(dottedPath);
    const table *current = this;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
      {
        return node();
      }
      if (i + 1 == parts.size())
      {
        return it->second;
      }
      current = it->second.as_table();
      if (!current)
      {
        return node();
      }
    }
    return node();
  }

private:
  std::unordered_map<std::string, node> _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    for (;;)
    {
      skipBlankAndComments();
      if (isEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        current = descend(&root, parseSectionHeader());
      }
      else
      {
        parseAssignment(*current);
      }
      expectEndOfLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
    {
      return '\0';
    }
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  void skipInlineSpace()
  {
    while (peek() == ' ' || peek() == '\t')
    {
      advance();
    }
  }

  void skipBlankAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (std::isspace(static_cast<unsigned char>(c)))
      {
        advance();
      }
      else if (c == '#')
      {
        while (!isEnd() && peek() != '\n')
        {
          advance();
        }
      }
      else
      {
        break;
      }
    }
  }

  void expectEndOfLine()
  {
    skipInlineSpace();
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
      {
        advance();
      }
    }
    if (peek() == '\r')
    {
      advance();
    }
    if (!isEnd() && peek() != '\n')
    {
      fail(std::string("unexpected character '") + peek() + "'");
    }
  }

  std::string parseSectionHeader()
  {
    advance(); // '['
    skipInlineSpace();
    std::string name = parseKey();
    skipInlineSpace();
    if (peek() != ']')
    {
      fail("unterminated section header");
    }
    advance();
    return name;
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd())
    {
      char c = peek();
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')
      {
        key += advance();
      }
      else
      {
        break;
      }
    }
    if (key.empty() || key.front() == '.' || key.back() == '.')
    {
      fail("invalid key");
    }
    return key;
  }

  void parseAssignment(table &target)
  {
    std::string key = parseKey();
    skipInlineSpace();
    if (peek() != '=')
    {
      fail("expected '=' after key '" + key + "'");
    }
    advance();
    skipInlineSpace();

    auto parts = split_path(key);
    table *owner = &target;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i)
    {
      owner = descend(owner, parts[i]);
    }
    if (owner->contains(parts.back()))
    {
      fail("duplicate key '" + key + "'");
    }
    (*owner)[parts.back()] = node(parseValue());
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return parseString();
    }
    if (c == '[')
    {
      return parseArray();
    }
    if (c == 't' || c == 'f')
    {
      return parseBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber();
    }
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    bool literal = quote == '\'';
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && !literal)
      {
        char esc = advance();
        switch (esc)
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        case '\\':
        case '"':
          str += esc;
          break;
        default:
          fail(std::string("unsupported escape '\\") + esc + "'");
        }
      }
      else
      {
        str += c;
      }
    }
    if (peek() != quote)
    {
      fail("unterminated string");
    }
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipBlankAndComments();
    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipBlankAndComments();
      if (peek() == ',')
      {
        advance();
        skipBlankAndComments();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
    {
      fail("unterminated array");
    }
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
    {
      word += advance();
    }
    if (word == "true")
    {
      return true;
    }
    if (word == "false")
    {
      return false;
    }
    fail("invalid boolean '" + word + "'");
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
    {
      num += advance();
    }
    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !(isFloat && (c == '+' || c == '-')))
      {
        break;
      }
      num += advance();
    }
    try
    {
      if (isFloat)
      {
        return std::stod(num);
      }
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + num + "'");
    }
  }

  table *descend(table *from, const std::string &path)
  {
    table *current = from;
    for (const auto &key : split_path(path))
    {
      if (!current->contains(key))
      {
        (*current)[key] = node(std::make_shared<table>());
      }
      current = (*current)[key].as_table();
      if (!current)
      {
        fail("'" + path + "' is not a table");
      }
    }
    return current;
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace whoischase
