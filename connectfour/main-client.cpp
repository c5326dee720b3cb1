// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "matchmaking.hpp"
#include "messages.hpp"
#include "session.hpp"
#include "settings.hpp"

#include <relaychannel/channelbridge.hpp>
#include <relaychannel/networkactor.hpp>
#include <relaychannel/relay.hpp>
#include <relaychannel/rpcrelay.hpp>
#include <unite4util/cryptorand.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace
{

DEFINE_string (relays, "",
               "comma-separated list of relay URLs to use; if empty,"
               " the list from the settings file is used");
DEFINE_string (username, "",
               "display name to announce; if empty, the name from the"
               " settings file is used");
DEFINE_string (game_id, "",
               "ID of the game to join; if empty, a new game is created");
DEFINE_string (app_domain, connectfour::DEFAULT_APP_DOMAIN,
               "application domain that scopes the game tags");
DEFINE_string (settings_file, "unite4.json",
               "file in which settings and the identity are stored");

DEFINE_int32 (tick_ms, 33, "duration of one frame in milliseconds");
DEFINE_int32 (drop_ticks, 10,
              "number of frames a dropped piece needs to land");
DEFINE_int32 (backlog_timeout_ms, 10'000,
              "timeout for fetching the stored events of a game");

/**
 * NoticeSink that prints notices to the console.
 */
class ConsoleNotices : public unite4::NoticeSink
{

private:

  /** Lock for writing to std::cerr.  */
  std::mutex mut;

public:

  void
  Notice (const std::string& msg) override
  {
    std::lock_guard<std::mutex> lock(mut);
    std::cerr << "Notice: " << msg << std::endl;
  }

};

/**
 * DropAnimator that lets each piece fall for a fixed number of frames.
 */
class TimerAnimator : public connectfour::DropAnimator
{

private:

  /** A piece that is currently falling.  */
  struct Drop
  {
    connectfour::PlayerMove move;
    int ticksLeft;
  };

  const int ticksPerDrop;

  std::vector<Drop> drops;

public:

  explicit TimerAnimator (const int t)
    : ticksPerDrop(t)
  {}

  void
  StartDrop (const connectfour::PlayerMove& mv) override
  {
    drops.push_back ({mv, ticksPerDrop});
  }

  void
  Clear () override
  {
    drops.clear ();
  }

  /**
   * Advances all falling pieces by one frame and settles those that
   * have landed.
   */
  void
  Advance (connectfour::GameSession& session)
  {
    std::vector<connectfour::PlayerMove> landed;
    for (auto it = drops.begin (); it != drops.end ();)
      {
        --it->ticksLeft;
        if (it->ticksLeft > 0)
          {
            ++it;
            continue;
          }
        landed.push_back (it->move);
        it = drops.erase (it);
      }

    for (const auto& mv : landed)
      session.OnMoveSettled (mv);
  }

};

/**
 * Renders the board and status as text.
 */
std::string
Render (const connectfour::GameSession& session)
{
  using connectfour::Board;

  const Board& board = session.GetBoard ();

  std::ostringstream out;
  for (int r = Board::ROWS - 1; r >= 0; --r)
    {
      out << '|';
      for (int c = 0; c < Board::COLUMNS; ++c)
        switch (board.GetCell (c, r))
          {
          case 1:
            out << " X";
            break;
          case 2:
            out << " O";
            break;
          default:
            out << " .";
            break;
          }
      out << " |\n";
    }

  out << ' ';
  for (int c = 0; c < Board::COLUMNS; ++c)
    out << ' ' << (c + 1);
  out << "\n\n";

  switch (session.GetState ().GetLocalPlayer ())
    {
    case 1:
      out << "You play X.  ";
      break;
    case 2:
      out << "You play O.  ";
      break;
    default:
      break;
    }
  out << session.GetStatusText () << '\n';

  return out.str ();
}

/**
 * Reads commands from stdin and queues them for the frame loop.  Returns
 * after "q" or the end of input.
 */
void
ReadCommands (unite4::BoundedQueue<std::string>& commands)
{
  std::string line;
  while (std::getline (std::cin, line))
    {
      if (line == "q")
        break;
      if (!commands.TryPush (std::move (line)))
        std::cout << "Too many commands, ignoring input" << std::endl;
    }

  /* The frame loop only stops on "q", so it must not get lost.  */
  while (!commands.TryPush ("q"))
    std::this_thread::sleep_for (std::chrono::milliseconds (10));
}

/**
 * Executes one user command.  Returns false if the client should quit.
 */
bool
ExecuteCommand (connectfour::GameSession& session, const std::string& cmd)
{
  if (cmd == "q")
    return false;

  if (cmd == "r")
    {
      if (!session.RequestReplay ())
        std::cout << "The game is still running" << std::endl;
      return true;
    }

  if (cmd.size () == 1 && cmd[0] >= '1' && cmd[0] <= '7')
    {
      const int column = cmd[0] - '1';
      const auto outcome = session.SubmitLocalMove (column);
      if (outcome != connectfour::MoveOutcome::ACCEPTED)
        std::cout << "Move not possible" << std::endl;
      return true;
    }

  if (!cmd.empty ())
    std::cout << "Unknown command, use 1-7, r or q" << std::endl;
  return true;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Play Connect Four over relays");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_tick_ms <= 0 || FLAGS_drop_ticks <= 0
        || FLAGS_backlog_timeout_ms <= 0)
    {
      std::cerr << "Error: --tick_ms, --drop_ticks and --backlog_timeout_ms"
                << " must be positive" << std::endl;
      return EXIT_FAILURE;
    }

  connectfour::JsonFileSettings settings(FLAGS_settings_file);
  const auto identity = connectfour::LoadOrCreateIdentity (settings);

  std::string username = FLAGS_username;
  if (username.empty ())
    username = settings.Get (connectfour::SettingsStore::USERNAME);
  else if (!settings.Set (connectfour::SettingsStore::USERNAME, username))
    LOG (WARNING) << "Could not save the username";

  std::string relayList = FLAGS_relays;
  if (relayList.empty ())
    relayList = settings.Get (connectfour::SettingsStore::RELAYS);
  else if (!settings.Set (connectfour::SettingsStore::RELAYS, relayList))
    LOG (WARNING) << "Could not save the relay list";

  std::string gameId = FLAGS_game_id;
  if (gameId.empty ())
    {
      unite4::CryptoRand rnd;
      gameId = rnd.NewSessionId ();
      std::cout << "Created new game, share this ID with your opponent: "
                << gameId << std::endl;
    }

  const std::string tag = connectfour::GameTag (FLAGS_app_domain, gameId);
  LOG (INFO) << "Playing as " << identity->GetPublicKeyHex () << " in " << tag;

  auto bridge = std::make_shared<unite4::ChannelBridge> ();

  ConsoleNotices notices;
  connectfour::AnnouncementDetector detector;
  unite4::NetworkActor actor(*identity, tag, connectfour::EVENT_KIND, bridge);
  for (const auto& url : unite4::ParseRelayList (relayList))
    actor.AddRelay (unite4::OpenRpcRelay (url));
  actor.SetNoticeSink (notices);
  actor.SetPeerDetector (detector);
  actor.SetBacklogTimeout (
      std::chrono::milliseconds (FLAGS_backlog_timeout_ms));

  connectfour::GameSession session(bridge, identity->GetPublicKeyHex (), tag,
                                   username);
  TimerAnimator animator(FLAGS_drop_ticks);
  session.SetAnimator (animator);

  actor.Start ();

  unite4::BoundedQueue<std::string> commands("commands", 100);
  std::thread input([&commands] ()
    {
      ReadCommands (commands);
    });

  std::cout << "Commands: 1-7 drop a piece, r replays, q quits" << std::endl;

  const auto tick = std::chrono::milliseconds (FLAGS_tick_ms);
  std::string lastRendered;
  bool running = true;
  while (running)
    {
      const auto frameEnd = std::chrono::steady_clock::now () + tick;

      for (const auto& cmd : commands.PopAll ())
        if (!ExecuteCommand (session, cmd))
          running = false;

      session.Tick ();
      animator.Advance (session);

      const std::string rendered = Render (session);
      if (rendered != lastRendered)
        {
          std::cout << '\n' << rendered << std::flush;
          lastRendered = rendered;
        }

      std::this_thread::sleep_until (frameEnd);
    }

  input.join ();
  actor.Stop ();

  google::protobuf::ShutdownProtobufLibrary ();
  return EXIT_SUCCESS;
}
