// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CONNECTFOUR_MATCHMAKING_HPP
#define CONNECTFOUR_MATCHMAKING_HPP

#include "messages.hpp"
#include "proto/messages.pb.h"

#include <relaychannel/channelbridge.hpp>
#include <relaychannel/networkactor.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace connectfour
{

/**
 * The role of the local client in a match.
 */
enum class Role
{

  /** No role has been determined yet.  */
  UNASSIGNED,

  /** We play first (and created the match).  */
  PLAYER1,

  /** We joined an existing match.  */
  PLAYER2,

  /** The match is between other players.  */
  REJECTED,

};

std::ostream& operator<< (std::ostream& out, Role r);

/**
 * State of the local client's participation in one match.
 */
struct SessionState
{

  Role role = Role::UNASSIGNED;

  /** Set once both players are known and the game can start.  */
  bool started = false;

  /** Our own identity (hex public key).  */
  std::string identity;

  /** The tag scoping the match.  */
  std::string gameTag;

  /** Our display name (may be empty).  */
  std::string displayName;

  /** The participants, as far as known.  */
  proto::Players players;

  /**
   * Returns the player number (1 or 2) of the local client if the game
   * has started and we take part in it, and NO_PLAYER otherwise.
   */
  int GetLocalPlayer () const;

  /**
   * Returns the identity of our opponent if the game has started and we
   * take part in it, and the empty string otherwise.
   */
  std::string GetOpponent () const;

};

/**
 * The matchmaking part of the protocol:  Determines our role from the backlog
 * of the match and from announcements of other clients, and sends our own
 * announcements.
 *
 * Role assignment is guarded by the started flag.  Two clients that announce
 * a new game at the same time may both end up thinking they are the
 * first player; there is no tie-break for this.
 */
class MatchmakingProtocol
{

private:

  SessionState& state;
  MessageSender& sender;

  /** Whether the backlog has been processed already.  */
  bool backlogProcessed = false;

  /**
   * Set if the backlog could not be fetched.  We have then not announced
   * anything, so a live game announcement is answered with a join.
   */
  bool backlogUnavailable = false;

  /**
   * Starts the game with the given role and participants.
   */
  void Start (Role r, const proto::Players& players);

public:

  explicit MatchmakingProtocol (SessionState& s, MessageSender& snd)
    : state(s), sender(snd)
  {}

  MatchmakingProtocol () = delete;
  MatchmakingProtocol (const MatchmakingProtocol&) = delete;
  void operator= (const MatchmakingProtocol&) = delete;

  bool
  HasProcessedBacklog () const
  {
    return backlogProcessed;
  }

  /**
   * Decides the role from the backlog snapshot (oldest event first) and
   * sends our announcement if needed.  Returns the backlog entries that
   * should be replayed through the normal message processing, which
   * excludes our own matchmaking announcements.
   */
  std::vector<unite4::ReceivedEvent> ProcessBacklog (
      const std::vector<unite4::ReceivedEvent>& backlog);

  /**
   * Marks the backlog as processed when it could not be fetched from any
   * relay.  No role is assigned, as nothing is known about the match.
   */
  void ProcessUnavailableBacklog ();

  /**
   * Processes an AnnounceNewGame message by the given author.
   */
  void OnNewGame (const std::string& author,
                  const proto::AnnounceNewGame& msg);

  /**
   * Processes an AnnounceJoin message by the given author.
   */
  void OnJoin (const std::string& author, const proto::Players& players);

};

/**
 * PeerDetector for the network actor based on the matchmaking messages.
 * In the backlog, both announcement types identify the peer, while live
 * only AnnounceJoin does (a live AnnounceNewGame is a competing match).
 */
class AnnouncementDetector : public unite4::PeerDetector
{

public:

  AnnouncementDetector () = default;

  bool IsPeerAnnouncement (const unite4::ReceivedEvent& ev,
                           bool backlog) const override;

};

} // namespace connectfour

#endif // CONNECTFOUR_MATCHMAKING_HPP
