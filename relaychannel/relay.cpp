// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relay.hpp"

#include <sstream>

namespace unite4
{

std::vector<std::string>
ParseRelayList (const std::string& list)
{
  constexpr const char* WHITESPACE = " \t\r\n";

  std::vector<std::string> res;
  std::istringstream in(list);
  std::string entry;
  while (std::getline (in, entry, ','))
    {
      const auto start = entry.find_first_not_of (WHITESPACE);
      if (start == std::string::npos)
        continue;
      const auto end = entry.find_last_not_of (WHITESPACE);
      res.push_back (entry.substr (start, end - start + 1));
    }

  return res;
}

} // namespace unite4
