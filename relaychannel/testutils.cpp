// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include <sstream>
#include <thread>

namespace unite4
{

void
StoreRelay::Connect ()
{
  if (failConnect)
    throw RelayError ("cannot connect to " + GetUrl ());
}

void
StoreRelay::Publish (const RelayEvent& ev)
{
  if (failPublish)
    throw RelayError ("publish failed at " + GetUrl ());
  store.Add (ev);
}

std::vector<RelayEvent>
StoreRelay::Query (const RelayFilter& f, const std::chrono::milliseconds timeout)
{
  if (failQuery)
    throw RelayError ("query timed out at " + GetUrl ());
  return store.Query (f, 0);
}

uint64_t
StoreRelay::GetSequence ()
{
  return store.GetSequence ();
}

std::vector<RelayEvent>
StoreRelay::Receive (const RelayFilter& f, uint64_t& seq)
{
  if (failReceive)
    {
      std::this_thread::sleep_for (POLL_TIMEOUT);
      throw RelayError ("receive failed at " + GetUrl ());
    }
  return store.Receive (f, seq, POLL_TIMEOUT);
}

void
RecordingNotices::Notice (const std::string& msg)
{
  std::lock_guard<std::mutex> lock(mut);
  notices.push_back (msg);
}

std::vector<std::string>
RecordingNotices::Get () const
{
  std::lock_guard<std::mutex> lock(mut);
  return notices;
}

Json::Value
ParseJson (const std::string& str)
{
  Json::Value val;
  std::istringstream in(str);
  in >> val;
  return val;
}

bool
WaitFor (const std::function<bool ()>& pred)
{
  const auto deadline
      = std::chrono::steady_clock::now () + std::chrono::seconds (5);
  while (std::chrono::steady_clock::now () < deadline)
    {
      if (pred ())
        return true;
      std::this_thread::sleep_for (std::chrono::milliseconds (5));
    }

  return pred ();
}

} // namespace unite4
