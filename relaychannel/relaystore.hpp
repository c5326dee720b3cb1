// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_RELAYSTORE_HPP
#define RELAYCHANNEL_RELAYSTORE_HPP

#include "event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace unite4
{

/**
 * In-memory event log of a relay.  Events are appended in arrival order
 * and numbered by their position, which serves as sequence number for
 * live delivery.  This class is thread-safe.
 */
class RelayStore
{

private:

  /** Lock for all the data.  */
  mutable std::mutex mut;

  /** Signalled whenever a new event is added.  */
  mutable std::condition_variable cvNewEvent;

  /** All events in arrival order.  */
  std::vector<RelayEvent> events;

  /** IDs of all stored events, to reject duplicates.  */
  std::set<std::string> ids;

public:

  RelayStore () = default;

  RelayStore (const RelayStore&) = delete;
  void operator= (const RelayStore&) = delete;

  /**
   * Adds a new event.  Returns false (and does nothing) if an event with
   * the same ID is already stored.
   */
  bool Add (const RelayEvent& ev);

  /**
   * Returns stored events matching the filter, newest first, and at most
   * limit of them (if limit is non-zero).
   */
  std::vector<RelayEvent> Query (const RelayFilter& f, size_t limit) const;

  /**
   * Returns the current sequence number (the number of stored events).
   */
  uint64_t GetSequence () const;

  /**
   * Returns all events matching the filter whose sequence number is at least
   * seq, in arrival order.  If there are no new events at all, waits up to
   * the given timeout for some to arrive.  seq is updated to the sequence
   * number after the last examined event.
   */
  std::vector<RelayEvent> Receive (const RelayFilter& f, uint64_t& seq,
                                   std::chrono::milliseconds timeout) const;

};

} // namespace unite4

#endif // RELAYCHANNEL_RELAYSTORE_HPP
