// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <whoischase/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace whoischase
{
namespace core
{
/// \brief Loads and parses TOML configuration files.
class ConfigLoader
{
public:
  /// \brief Records the file name; nothing is read until reload()/load().
  explicit ConfigLoader(std::string filename) : _filename(std::move(filename)) {}

  /// \brief Builds a loader over an in-memory document (no file backing).
  static ConfigLoader fromString(const std::string &toml)
  {
    ConfigLoader loader("");
    loader._table = parsers::toml::parse(toml);
    loader._loaded = true;
    return loader;
  }

  /// \brief Re-reads the configuration from disk.
  /// \return false if the file is missing or malformed; the previous table is
  /// cleared in that case and the failure reason kept in lastError().
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      _lastError.clear();
      return true;
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _loaded = false;
      _lastError = e.what();
      return false;
    }
  }

  /// \brief Loads the file if not loaded yet.
  /// \throws std::runtime_error when the file cannot be read or parsed.
  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }
  const std::string &filename() const { return _filename; }
  const std::string &lastError() const { return _lastError; }
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }
  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \throws std::runtime_error if any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node || !node.is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node.as_array())
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
  std::string _lastError;
};

} // namespace core
} // namespace whoischase
