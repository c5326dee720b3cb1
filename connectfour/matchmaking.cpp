// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "matchmaking.hpp"

#include "board.hpp"

#include <glog/logging.h>

namespace connectfour
{

std::ostream&
operator<< (std::ostream& out, const Role r)
{
  switch (r)
    {
    case Role::UNASSIGNED:
      return out << "unassigned";
    case Role::PLAYER1:
      return out << "player 1";
    case Role::PLAYER2:
      return out << "player 2";
    case Role::REJECTED:
      return out << "rejected";
    }

  LOG (FATAL) << "Invalid role: " << static_cast<int> (r);
}

int
SessionState::GetLocalPlayer () const
{
  if (!started)
    return NO_PLAYER;

  switch (role)
    {
    case Role::PLAYER1:
      return 1;
    case Role::PLAYER2:
      return 2;
    default:
      return NO_PLAYER;
    }
}

std::string
SessionState::GetOpponent () const
{
  switch (GetLocalPlayer ())
    {
    case 1:
      return players.p2_identity ();
    case 2:
      return players.p1_identity ();
    default:
      return "";
    }
}

void
MatchmakingProtocol::Start (const Role r, const proto::Players& players)
{
  CHECK (r == Role::PLAYER1 || r == Role::PLAYER2);
  CHECK (!state.started);

  LOG (INFO)
      << "Starting the game as " << r << ", player 1 is "
      << players.p1_identity () << ", player 2 is " << players.p2_identity ();

  state.role = r;
  state.started = true;
  state.players = players;
}

std::vector<unite4::ReceivedEvent>
MatchmakingProtocol::ProcessBacklog (
    const std::vector<unite4::ReceivedEvent>& backlog)
{
  CHECK (!backlogProcessed) << "The backlog has already been processed";
  backlogProcessed = true;

  if (backlog.empty ())
    {
      LOG (INFO) << "No existing game for " << state.gameTag
                 << ", announcing a new one";
      state.role = Role::PLAYER1;
      state.players.Clear ();
      if (!state.displayName.empty ())
        state.players.set_p1_name (state.displayName);
      state.players.set_p1_identity (state.identity);

      if (!sender.SendNewGame (state.displayName))
        LOG (ERROR) << "Could not queue our game announcement";

      return {};
    }

  const auto& tip = backlog.back ();
  proto::ProtocolMessage tipMsg;
  if (tip.author != state.identity && DecodeMessage (tip.content, tipMsg)
        && tipMsg.has_announce_new_game ())
    {
      proto::Players players;
      if (tipMsg.announce_new_game ().has_name ())
        players.set_p1_name (tipMsg.announce_new_game ().name ());
      players.set_p1_identity (tip.author);
      if (!state.displayName.empty ())
        players.set_p2_name (state.displayName);
      players.set_p2_identity (state.identity);

      Start (Role::PLAYER2, players);
      if (!sender.SendJoin (players))
        LOG (ERROR) << "Could not queue our join announcement";
    }
  else
    VLOG (1) << "Backlog does not end in a foreign game announcement";

  std::vector<unite4::ReceivedEvent> res;
  for (const auto& ev : backlog)
    {
      if (ev.author == state.identity)
        {
          proto::ProtocolMessage msg;
          if (DecodeMessage (ev.content, msg)
                && (msg.has_announce_new_game () || msg.has_announce_join ()))
            continue;
        }

      res.push_back (ev);
    }

  return res;
}

void
MatchmakingProtocol::ProcessUnavailableBacklog ()
{
  CHECK (!backlogProcessed) << "The backlog has already been processed";
  backlogProcessed = true;
  backlogUnavailable = true;

  LOG (WARNING)
      << "The history of " << state.gameTag << " is unavailable,"
      << " waiting for live announcements";
}

void
MatchmakingProtocol::OnNewGame (const std::string& author,
                                const proto::AnnounceNewGame& msg)
{
  if (author == state.identity || state.role == Role::REJECTED)
    return;

  if (state.started)
    {
      VLOG (1) << "Ignoring game announcement by " << author;
      return;
    }

  proto::Players players;
  if (msg.has_name ())
    players.set_p1_name (msg.name ());
  players.set_p1_identity (author);
  if (!state.displayName.empty ())
    players.set_p2_name (state.displayName);
  players.set_p2_identity (state.identity);

  Start (Role::PLAYER2, players);

  if (backlogUnavailable && !sender.SendJoin (players))
    LOG (ERROR) << "Could not queue our join announcement";
}

void
MatchmakingProtocol::OnJoin (const std::string& author,
                             const proto::Players& players)
{
  if (author == state.identity || state.role == Role::REJECTED)
    return;

  const bool isFirst = (players.p1_identity () == state.identity);
  const bool isSecond = (players.p2_identity () == state.identity);

  if (!isFirst && !isSecond)
    {
      /* Before the start, this means the match is taken by others.  Once
         we play as second player, it means that the first player paired
         up with someone else.  */
      const bool taken
          = !state.started
              || (state.role == Role::PLAYER2
                    && players.p1_identity ()
                          == state.players.p1_identity ());
      if (taken)
        {
          LOG (INFO) << "Not our game, players are " << players.p1_identity ()
                     << " and " << players.p2_identity ();
          state.role = Role::REJECTED;
          state.started = false;
        }
      else
        VLOG (1) << "Ignoring unrelated join by " << author;
      return;
    }

  if (state.started)
    {
      VLOG (1) << "Ignoring late join by " << author;
      return;
    }

  Start (isFirst ? Role::PLAYER1 : Role::PLAYER2, players);
}

bool
AnnouncementDetector::IsPeerAnnouncement (const unite4::ReceivedEvent& ev,
                                          const bool backlog) const
{
  proto::ProtocolMessage msg;
  if (!DecodeMessage (ev.content, msg))
    return false;

  switch (msg.payload_case ())
    {
    case proto::ProtocolMessage::kAnnounceJoin:
      return true;
    case proto::ProtocolMessage::kAnnounceNewGame:
      return backlog;
    default:
      return false;
    }
}

} // namespace connectfour
