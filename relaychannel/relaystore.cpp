// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relaystore.hpp"

#include <glog/logging.h>

namespace unite4
{

bool
RelayStore::Add (const RelayEvent& ev)
{
  std::lock_guard<std::mutex> lock(mut);

  if (ids.count (ev.id) > 0)
    {
      VLOG (1) << "Ignoring duplicate event " << ev.id;
      return false;
    }

  VLOG (1) << "Storing event " << ev.id << " as #" << events.size ();
  ids.insert (ev.id);
  events.push_back (ev);
  cvNewEvent.notify_all ();

  return true;
}

std::vector<RelayEvent>
RelayStore::Query (const RelayFilter& f, const size_t limit) const
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<RelayEvent> res;
  for (auto it = events.rbegin (); it != events.rend (); ++it)
    {
      if (limit != 0 && res.size () >= limit)
        break;
      if (f.Matches (*it))
        res.push_back (*it);
    }

  return res;
}

uint64_t
RelayStore::GetSequence () const
{
  std::lock_guard<std::mutex> lock(mut);
  return events.size ();
}

std::vector<RelayEvent>
RelayStore::Receive (const RelayFilter& f, uint64_t& seq,
                     const std::chrono::milliseconds timeout) const
{
  std::unique_lock<std::mutex> lock(mut);

  if (seq >= events.size ())
    cvNewEvent.wait_for (lock, timeout, [this, seq] ()
      {
        return seq < events.size ();
      });

  std::vector<RelayEvent> res;
  for (; seq < events.size (); ++seq)
    if (f.Matches (events[seq]))
      res.push_back (events[seq]);

  return res;
}

} // namespace unite4
