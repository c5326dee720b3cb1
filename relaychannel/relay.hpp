// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_RELAY_HPP
#define RELAYCHANNEL_RELAY_HPP

#include "event.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace unite4
{

/**
 * Exception thrown by RelayConnection implementations when talking to
 * the relay failed (connection refused, timeout, rejected request, ...).
 */
class RelayError : public std::runtime_error
{

public:

  using std::runtime_error::runtime_error;

};

/**
 * Connection to a single relay.  Relays store signed events and forward
 * them to subscribers, but give no ordering or delivery guarantees across
 * different relays.
 *
 * Instances are only used from a single thread (the network actor).
 * All methods throw RelayError on failure.
 */
class RelayConnection
{

private:

  /** The relay's address, used for logging.  */
  const std::string url;

protected:

  explicit RelayConnection (const std::string& u)
    : url(u)
  {}

public:

  virtual ~RelayConnection () = default;

  RelayConnection () = delete;
  RelayConnection (const RelayConnection&) = delete;
  void operator= (const RelayConnection&) = delete;

  const std::string&
  GetUrl () const
  {
    return url;
  }

  /**
   * Establishes (or checks) the connection.  This is called once before
   * any other method.
   */
  virtual void Connect () = 0;

  /**
   * Publishes a signed event to the relay.
   */
  virtual void Publish (const RelayEvent& ev) = 0;

  /**
   * Fetches the stored events matching the filter.  The order of the
   * result is up to the relay.  The call gives up after the timeout.
   */
  virtual std::vector<RelayEvent> Query (const RelayFilter& f,
                                         std::chrono::milliseconds timeout)
      = 0;

  /**
   * Returns the relay's current sequence number, i.e. the position
   * from which Receive will return new events.
   */
  virtual uint64_t GetSequence () = 0;

  /**
   * Returns events matching the filter that arrived at the relay after
   * the given sequence number, and updates seq accordingly.  This may block
   * for a relay-defined (short) time if no events are available.
   */
  virtual std::vector<RelayEvent> Receive (const RelayFilter& f,
                                           uint64_t& seq) = 0;

};

/**
 * Parses a comma-separated list of relay addresses.  Whitespace around
 * entries is trimmed and empty entries are skipped.
 */
std::vector<std::string> ParseRelayList (const std::string& list);

} // namespace unite4

#endif // RELAYCHANNEL_RELAY_HPP
