// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <string>

#include "whoischase/util/text_lines.hpp"

namespace whoischase
{
namespace whois
{

/// \brief Builds the query line for a server's dialect.
///
/// The Verisign registry hosts want the `domain` keyword; ARIN needs `n +`
/// so that a bare term is not rejected as ambiguous. Everyone else gets the
/// query as is. Host comparison ignores case.
class QueryStatementBuilder
{
public:
  static std::string build(const std::string &server, const std::string &query)
  {
    if (util::iequals(server, "whois.internic.net") ||
        util::iequals(server, "whois.verisign-grs.com"))
    {
      return "domain " + query;
    }
    if (util::iequals(server, "whois.arin.net"))
    {
      return "n + " + query;
    }
    return query;
  }
};

} // namespace whois
} // namespace whoischase
