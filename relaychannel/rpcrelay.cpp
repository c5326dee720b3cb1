// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcrelay.hpp"

#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace unite4
{

namespace
{

/**
 * Timeout for the receive connector.  It must be well above the poll
 * timeout that servers apply to receive calls.
 */
constexpr long RECEIVE_TIMEOUT_MS = 30'000;

/**
 * Largest sequence number that can be passed to the receive method,
 * whose parameter is a plain JSON-RPC integer.
 */
constexpr uint64_t MAX_SEQUENCE = std::numeric_limits<int>::max ();

/**
 * Turns a JSON-RPC failure into a RelayError with context.
 */
RelayError
TranslateError (const std::string& url, const std::string& method,
                const jsonrpc::JsonRpcException& exc)
{
  std::ostringstream msg;
  msg << "relay " << url << " failed for " << method << ": " << exc.what ();
  return RelayError (msg.str ());
}

/**
 * Extracts the sequence number from a getseq / receive response.
 */
uint64_t
ExtractSequence (const std::string& url, const Json::Value& resp)
{
  if (!resp.isObject () || !resp["seq"].isUInt64 ())
    throw RelayError ("relay " + url + " returned an invalid sequence");

  const uint64_t res = resp["seq"].asUInt64 ();
  if (res > MAX_SEQUENCE)
    throw RelayError ("relay " + url + " returned too large a sequence");

  return res;
}

} // anonymous namespace

RpcRelay::RpcRelay (const std::string& url)
  : RelayConnection(url),
    connector(url), receiveConnector(url),
    rpc(connector), receiveRpc(receiveConnector)
{
  receiveConnector.SetTimeout (RECEIVE_TIMEOUT_MS);
}

std::vector<RelayEvent>
RpcRelay::ParseEvents (const Json::Value& arr)
{
  std::vector<RelayEvent> res;
  for (const auto& entry : arr)
    {
      RelayEvent ev;
      if (!RelayEvent::FromJson (entry, ev))
        {
          LOG (WARNING) << "Relay returned malformed event:\n" << entry;
          continue;
        }
      res.push_back (std::move (ev));
    }

  return res;
}

void
RpcRelay::Connect ()
{
  LOG (INFO) << "Connecting to relay " << GetUrl ();
  GetSequence ();
}

void
RpcRelay::Publish (const RelayEvent& ev)
{
  VLOG (1) << "Publishing event " << ev.id << " to " << GetUrl ();
  try
    {
      if (!rpc.publish (ev.ToJson ()))
        VLOG (1) << "Relay " << GetUrl () << " already had event " << ev.id;
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      throw TranslateError (GetUrl (), "publish", exc);
    }
}

std::vector<RelayEvent>
RpcRelay::Query (const RelayFilter& f, const std::chrono::milliseconds timeout)
{
  connector.SetTimeout (timeout.count ());

  Json::Value res;
  try
    {
      res = rpc.query (f.ToJson (), QUERY_LIMIT);
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      throw TranslateError (GetUrl (), "query", exc);
    }

  if (!res.isArray ())
    throw RelayError ("relay " + GetUrl () + " returned invalid query result");

  return ParseEvents (res);
}

uint64_t
RpcRelay::GetSequence ()
{
  try
    {
      return ExtractSequence (GetUrl (), rpc.getseq ());
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      throw TranslateError (GetUrl (), "getseq", exc);
    }
}

std::vector<RelayEvent>
RpcRelay::Receive (const RelayFilter& f, uint64_t& seq)
{
  if (seq > MAX_SEQUENCE)
    throw RelayError ("sequence " + std::to_string (seq)
                        + " is out of range for relay " + GetUrl ());

  Json::Value res;
  try
    {
      res = receiveRpc.receive (f.ToJson (), static_cast<int> (seq));
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      throw TranslateError (GetUrl (), "receive", exc);
    }

  const uint64_t newSeq = ExtractSequence (GetUrl (), res);
  if (!res["events"].isArray ())
    throw RelayError ("relay " + GetUrl () + " returned invalid events");

  seq = newSeq;
  return ParseEvents (res["events"]);
}

std::unique_ptr<RelayConnection>
OpenRpcRelay (const std::string& url)
{
  return std::make_unique<RpcRelay> (url);
}

} // namespace unite4
