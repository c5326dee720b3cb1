// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_NETWORKACTOR_HPP
#define RELAYCHANNEL_NETWORKACTOR_HPP

#include "channelbridge.hpp"
#include "event.hpp"
#include "identity.hpp"
#include "relay.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace unite4
{

/**
 * Receiver of user-visible, non-fatal notices (e.g. about relays that
 * could not be reached).  Implementations must be thread-safe, as notices
 * are raised from the network actor's thread.
 */
class NoticeSink
{

public:

  NoticeSink () = default;
  virtual ~NoticeSink () = default;

  virtual void Notice (const std::string& msg) = 0;

};

/**
 * Game-specific logic that recognises events by which the opponent
 * identifies itself.  When such an event is seen, the network actor narrows
 * its live subscription to that author.
 */
class PeerDetector
{

public:

  PeerDetector () = default;
  virtual ~PeerDetector () = default;

  /**
   * Returns true if the event (authored by someone else) identifies its
   * author as the peer.  backlog is true for events from the backlog
   * snapshot and false for live events.
   */
  virtual bool IsPeerAnnouncement (const ReceivedEvent& ev,
                                   bool backlog) const = 0;

};

/**
 * The long-lived background task talking to relays.  It connects to all
 * relays, fetches the backlog of the topic and hands it to the frame loop,
 * then publishes outbound payloads and forwards live events.
 *
 * The actor owns no game state.  It only touches the ChannelBridge queues
 * and its relay connections.
 */
class NetworkActor
{

private:

  /** One relay with its live-delivery state.  */
  struct Relay
  {

    std::unique_ptr<RelayConnection> conn;

    /** Sequence number for live delivery.  */
    uint64_t seq = 0;

    /** Whether Connect succeeded.  */
    bool connected = false;

    /**
     * Set while receiving fails, so that we raise a notice only once
     * per outage.
     */
    bool failing = false;

  };

  /** The local identity, used to sign published events.  */
  const Identity& identity;

  /** The topic (GameTag) all events are tagged with.  */
  const std::string topic;

  /** The event kind used for all traffic.  */
  const int kind;

  /** The queues shared with the frame loop.  */
  std::shared_ptr<ChannelBridge> bridge;

  std::vector<Relay> relays;

  /** Receiver of notices, if any.  */
  NoticeSink* notices = nullptr;

  /** Detector for peer announcements, if any.  */
  const PeerDetector* peerDetector = nullptr;

  /** Deadline for the backlog query.  */
  std::chrono::milliseconds backlogTimeout;

  /** Filter used for live delivery.  */
  RelayFilter liveFilter;

  /** The peer we narrowed the subscription to (empty if not yet).  */
  std::string peer;

  /** IDs of all events seen so far, for de-duplication across relays.  */
  std::set<std::string> seenIds;

  /** The running loop, if any.  */
  std::unique_ptr<std::thread> loop;

  /** If set to true, signals the loop to stop.  */
  std::atomic<bool> stopLoop;

  /**
   * Reports a transport failure through the log and as notice.
   */
  void ReportTransportError (const std::string& msg);

  /**
   * Connects all relays and records their sequence numbers.
   */
  void ConnectRelays ();

  /**
   * Fetches the backlog from all connected relays, ordered oldest first
   * and without duplicates.  failed is set to true if there were connected
   * relays, but none of them returned the backlog.
   */
  std::vector<RelayEvent> FetchBacklog (bool& failed);

  /**
   * Restricts the live subscription to the given author.
   */
  void NarrowTo (const std::string& author);

  /**
   * Runs the backlog phase:  Fetches it, detects the peer and hands
   * the snapshot to the frame loop.
   */
  void DeliverBacklog ();

  /**
   * Publishes all pending outbound payloads.
   */
  void PublishPending ();

  /**
   * Receives live events from all relays and forwards them.
   */
  void ReceiveLive ();

  /**
   * Runs the whole actor until stopped.
   */
  void RunLoop ();

public:

  /** Default deadline for fetching the backlog.  */
  static constexpr auto DEFAULT_BACKLOG_TIMEOUT = std::chrono::seconds (10);

  explicit NetworkActor (const Identity& id, const std::string& t, int k,
                         std::shared_ptr<ChannelBridge> b);

  ~NetworkActor ();

  NetworkActor () = delete;
  NetworkActor (const NetworkActor&) = delete;
  void operator= (const NetworkActor&) = delete;

  /**
   * Adds a relay connection.  Must be called before Start.
   */
  void AddRelay (std::unique_ptr<RelayConnection> conn);

  void
  SetNoticeSink (NoticeSink& n)
  {
    notices = &n;
  }

  void
  SetPeerDetector (const PeerDetector& d)
  {
    peerDetector = &d;
  }

  void
  SetBacklogTimeout (const std::chrono::milliseconds t)
  {
    backlogTimeout = t;
  }

  /**
   * Returns the author to which the live subscription is narrowed, or
   * the empty string if it is not narrowed.  Must only be called while the
   * actor is not running.
   */
  const std::string&
  GetPeer () const
  {
    return peer;
  }

  /**
   * Starts the background thread.
   */
  void Start ();

  /**
   * Stops the background thread if it is running.
   */
  void Stop ();

};

} // namespace unite4

#endif // RELAYCHANNEL_NETWORKACTOR_HPP
