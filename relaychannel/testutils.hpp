// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_TESTUTILS_HPP
#define RELAYCHANNEL_TESTUTILS_HPP

#include "networkactor.hpp"
#include "relay.hpp"
#include "relaystore.hpp"

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace unite4
{

/**
 * RelayConnection backed directly by a RelayStore in memory.  Failures of
 * the individual operations can be switched on to simulate broken relays.
 */
class StoreRelay : public RelayConnection
{

private:

  RelayStore& store;

public:

  /** How long Receive waits for events.  */
  static constexpr auto POLL_TIMEOUT = std::chrono::milliseconds (10);

  std::atomic<bool> failConnect;
  std::atomic<bool> failPublish;
  std::atomic<bool> failQuery;
  std::atomic<bool> failReceive;

  explicit StoreRelay (const std::string& url, RelayStore& s)
    : RelayConnection(url), store(s),
      failConnect(false), failPublish(false),
      failQuery(false), failReceive(false)
  {}

  void Connect () override;
  void Publish (const RelayEvent& ev) override;
  std::vector<RelayEvent> Query (const RelayFilter& f,
                                 std::chrono::milliseconds timeout) override;
  uint64_t GetSequence () override;
  std::vector<RelayEvent> Receive (const RelayFilter& f,
                                   uint64_t& seq) override;

};

/**
 * NoticeSink that records all notices for inspection in tests.
 */
class RecordingNotices : public NoticeSink
{

private:

  mutable std::mutex mut;
  std::vector<std::string> notices;

public:

  void Notice (const std::string& msg) override;

  std::vector<std::string> Get () const;

};

/**
 * Parses a string as JSON value.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Waits (for a few seconds at most) until the predicate becomes true.
 * Returns the final value of the predicate.
 */
bool WaitFor (const std::function<bool ()>& pred);

} // namespace unite4

#endif // RELAYCHANNEL_TESTUTILS_HPP
