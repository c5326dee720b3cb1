// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relayserver.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

namespace unite4
{

namespace
{

RelayFilter
ParseFilterParam (const Json::Value& val)
{
  RelayFilter res;
  if (!RelayFilter::FromJson (val, res))
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "invalid filter");
  return res;
}

Json::Value
EventsToJson (const std::vector<RelayEvent>& events)
{
  Json::Value res(Json::arrayValue);
  for (const auto& ev : events)
    res.append (ev.ToJson ());
  return res;
}

} // anonymous namespace

bool
RelayRpcServer::publish (const Json::Value& event)
{
  RelayEvent ev;
  if (!RelayEvent::FromJson (event, ev))
    {
      LOG (WARNING) << "Rejecting malformed event:\n" << event;
      throw jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS, "malformed event");
    }

  if (!ev.IsValid ())
    {
      LOG (WARNING) << "Rejecting event with invalid ID or signature";
      throw jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS, "invalid signature");
    }

  return store.Add (ev);
}

Json::Value
RelayRpcServer::query (const Json::Value& filter, const int limit)
{
  if (limit < 0)
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "limit must not be negative");

  return EventsToJson (store.Query (ParseFilterParam (filter), limit));
}

Json::Value
RelayRpcServer::getseq ()
{
  Json::Value res(Json::objectValue);
  res["seq"] = static_cast<Json::UInt64> (store.GetSequence ());
  return res;
}

Json::Value
RelayRpcServer::receive (const Json::Value& filter, const int seq)
{
  if (seq < 0)
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "seq must not be negative");

  const RelayFilter f = ParseFilterParam (filter);
  uint64_t cur = seq;
  const auto events = store.Receive (f, cur, pollTimeout);

  Json::Value res(Json::objectValue);
  res["seq"] = static_cast<Json::UInt64> (cur);
  res["events"] = EventsToJson (events);

  return res;
}

} // namespace unite4
