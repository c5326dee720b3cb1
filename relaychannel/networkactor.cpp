// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "networkactor.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <utility>

namespace unite4
{

namespace
{

/**
 * Time to wait between loop iterations when there is no relay that could
 * block in Receive.  This keeps the loop from spinning.
 */
constexpr auto IDLE_WAIT = std::chrono::milliseconds (100);

} // anonymous namespace

NetworkActor::NetworkActor (const Identity& id, const std::string& t,
                            const int k, std::shared_ptr<ChannelBridge> b)
  : identity(id), topic(t), kind(k), bridge(std::move (b)),
    backlogTimeout(DEFAULT_BACKLOG_TIMEOUT), stopLoop(false)
{
  CHECK (bridge != nullptr);

  liveFilter.kinds = {kind};
  liveFilter.topic = topic;
}

NetworkActor::~NetworkActor ()
{
  Stop ();
}

void
NetworkActor::AddRelay (std::unique_ptr<RelayConnection> conn)
{
  CHECK (loop == nullptr) << "Relays must be added before starting";

  Relay r;
  r.conn = std::move (conn);
  relays.push_back (std::move (r));
}

void
NetworkActor::Start ()
{
  LOG (INFO) << "Starting network actor for " << topic;
  CHECK (loop == nullptr) << "The network actor is already running";

  stopLoop = false;
  loop = std::make_unique<std::thread> ([this] ()
    {
      RunLoop ();
    });
}

void
NetworkActor::Stop ()
{
  if (loop == nullptr)
    return;

  LOG (INFO) << "Stopping network actor...";
  stopLoop = true;
  loop->join ();
  loop.reset ();
}

void
NetworkActor::ReportTransportError (const std::string& msg)
{
  LOG (ERROR) << msg;
  if (notices != nullptr)
    notices->Notice (msg);
}

void
NetworkActor::ConnectRelays ()
{
  for (auto& r : relays)
    try
      {
        r.conn->Connect ();
        r.seq = r.conn->GetSequence ();
        r.connected = true;
        LOG (INFO) << "Relay added: " << r.conn->GetUrl ();
      }
    catch (const RelayError& exc)
      {
        ReportTransportError ("Error adding relay " + r.conn->GetUrl ()
                                + ": " + exc.what ());
      }

  const bool any = std::any_of (relays.begin (), relays.end (),
                                [] (const Relay& r)
                                  {
                                    return r.connected;
                                  });
  if (!any)
    ReportTransportError ("Not connected to any relay, playing offline");
}

std::vector<RelayEvent>
NetworkActor::FetchBacklog (bool& failed)
{
  RelayFilter filter;
  filter.kinds = {kind};
  filter.topic = topic;

  unsigned queried = 0;
  unsigned answered = 0;

  std::vector<RelayEvent> res;
  for (auto& r : relays)
    {
      if (!r.connected)
        continue;

      std::vector<RelayEvent> events;
      ++queried;
      try
        {
          events = r.conn->Query (filter, backlogTimeout);
          ++answered;
        }
      catch (const RelayError& exc)
        {
          ReportTransportError ("Error fetching stored events: "
                                  + std::string (exc.what ()));
          continue;
        }

      /* Relays return the newest events first.  Reverse them, so that
         the stable sort below keeps arrival order for events with the
         same timestamp.  */
      std::reverse (events.begin (), events.end ());
      for (auto& ev : events)
        {
          if (!filter.Matches (ev))
            {
              VLOG (1) << "Relay returned non-matching event " << ev.id;
              continue;
            }
          if (!seenIds.insert (ev.id).second)
            continue;
          res.push_back (std::move (ev));
        }
    }

  std::stable_sort (res.begin (), res.end (),
                    [] (const RelayEvent& a, const RelayEvent& b)
                      {
                        return a.createdAt < b.createdAt;
                      });

  failed = (queried > 0 && answered == 0);
  return res;
}

void
NetworkActor::NarrowTo (const std::string& author)
{
  if (peer == author)
    return;

  LOG (INFO) << "Subscribing to events of " << author << " only";
  peer = author;
  liveFilter.authors = {author};
  liveFilter.since = CurrentTimestamp ();
}

void
NetworkActor::DeliverBacklog ()
{
  bool failed;
  const auto events = FetchBacklog (failed);
  if (failed)
    ReportTransportError ("No relay returned the stored events of the game");
  else
    LOG (INFO) << "Fetched backlog of " << events.size () << " events";

  InboundMessage msg;
  msg.backlog = true;
  msg.failed = failed;
  for (const auto& ev : events)
    {
      ReceivedEvent entry;
      entry.author = ev.pubkey;
      entry.content = ev.content;

      if (peerDetector != nullptr && ev.pubkey != identity.GetPublicKeyHex ()
            && peerDetector->IsPeerAnnouncement (entry, true))
        NarrowTo (ev.pubkey);

      msg.events.push_back (std::move (entry));
    }

  if (!bridge->inbound.TryPush (std::move (msg)))
    LOG (ERROR) << "Could not deliver the backlog to the game";
}

void
NetworkActor::PublishPending ()
{
  for (const auto& payload : bridge->outbound.PopAll ())
    {
      const RelayEvent ev = CreateSignedEvent (identity, kind, topic, payload,
                                               CurrentTimestamp ());
      VLOG (1) << "Sending event " << ev.id << ": " << payload;
      seenIds.insert (ev.id);

      bool sent = false;
      for (auto& r : relays)
        {
          if (!r.connected)
            continue;
          try
            {
              r.conn->Publish (ev);
              sent = true;
            }
          catch (const RelayError& exc)
            {
              ReportTransportError ("Error sending message: "
                                      + std::string (exc.what ()));
            }
        }

      if (!sent)
        LOG (WARNING) << "Message could not be sent to any relay: " << payload;
    }
}

void
NetworkActor::ReceiveLive ()
{
  bool waited = false;
  for (auto& r : relays)
    {
      if (!r.connected)
        continue;

      std::vector<RelayEvent> events;
      try
        {
          events = r.conn->Receive (liveFilter, r.seq);
          waited = true;
          if (r.failing)
            LOG (INFO) << "Relay " << r.conn->GetUrl () << " is back";
          r.failing = false;
        }
      catch (const RelayError& exc)
        {
          if (!r.failing)
            ReportTransportError ("Error receiving events: "
                                    + std::string (exc.what ()));
          r.failing = true;
          continue;
        }

      for (auto& ev : events)
        {
          if (!liveFilter.Matches (ev))
            continue;
          if (!seenIds.insert (ev.id).second)
            continue;
          if (ev.pubkey == identity.GetPublicKeyHex ())
            continue;

          VLOG (1) << "Received event " << ev.id << " from " << ev.pubkey;

          InboundMessage msg;
          ReceivedEvent entry;
          entry.author = ev.pubkey;
          entry.content = std::move (ev.content);

          if (peerDetector != nullptr
                && peerDetector->IsPeerAnnouncement (entry, false))
            NarrowTo (entry.author);

          msg.events.push_back (std::move (entry));
          if (!bridge->inbound.TryPush (std::move (msg)))
            VLOG (1) << "Dropped live event " << ev.id;
        }
    }

  if (!waited)
    std::this_thread::sleep_for (IDLE_WAIT);
}

void
NetworkActor::RunLoop ()
{
  ConnectRelays ();
  DeliverBacklog ();

  while (!stopLoop)
    {
      PublishPending ();
      ReceiveLive ();
    }

  /* Send whatever the frame loop queued last (e.g. a reset) before
     the actor goes away.  */
  PublishPending ();
  LOG (INFO) << "Network actor finished";
}

} // namespace unite4
