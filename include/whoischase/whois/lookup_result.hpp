// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "response_fields.hpp"
#include "whoischase/core/json.hpp"

namespace whoischase
{
namespace whois
{

/// \brief Outcome of one referral-chasing lookup.
///
/// Immutable once built. Organization name and address range are extracted
/// from the final response in the constructor and never change afterwards.
class LookupResult
{
public:
  LookupResult() = default;

  /// \param respondedServers every server asked, bootstrap first
  /// \param raw text returned by the last server
  LookupResult(std::vector<std::string> respondedServers, std::string raw)
      : _respondedServers(std::move(respondedServers)), _raw(std::move(raw))
  {
    auto fields = ResponseFieldExtractor::extract(_raw, _respondedServers);
    _organizationName = std::move(fields.organizationName);
    _addressRange = std::move(fields.addressRange);
  }

  const std::vector<std::string> &respondedServers() const { return _respondedServers; }
  const std::string &raw() const { return _raw; }

  /// \brief Empty when no heuristic matched.
  const std::string &organizationName() const { return _organizationName; }
  const std::optional<network::IpAddressRange> &addressRange() const { return _addressRange; }

  core::Json toJson() const
  {
    core::Json j;
    j["respondedServers"] = _respondedServers;
    j["raw"] = _raw;
    j["organizationName"] = _organizationName;
    if (_addressRange)
    {
      j["addressRange"] = {{"begin", _addressRange->begin().toString()},
                           {"end", _addressRange->end().toString()}};
    }
    else
    {
      j["addressRange"] = nullptr;
    }
    return j;
  }

private:
  std::vector<std::string> _respondedServers;
  std::string _raw;
  std::string _organizationName;
  std::optional<network::IpAddressRange> _addressRange;
};

} // namespace whois
} // namespace whoischase
