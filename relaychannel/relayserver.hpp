// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_RELAYSERVER_HPP
#define RELAYCHANNEL_RELAYSERVER_HPP

#include "relaystore.hpp"

#include "rpc-stubs/relayrpcserverstub.h"

#include <jsonrpccpp/server.h>

#include <json/json.h>

#include <chrono>

namespace unite4
{

/**
 * JSON-RPC server exposing a RelayStore as relay.  It verifies the IDs and
 * signatures of published events, so that clients can rely on the author
 * of stored events.
 */
class RelayRpcServer : public RelayRpcServerStub
{

private:

  /** The underlying event store.  */
  RelayStore& store;

  /** How long receive calls wait for new events.  */
  const std::chrono::milliseconds pollTimeout;

public:

  explicit RelayRpcServer (RelayStore& s, std::chrono::milliseconds t,
                           jsonrpc::AbstractServerConnector& conn)
    : RelayRpcServerStub(conn), store(s), pollTimeout(t)
  {}

  bool publish (const Json::Value& event) override;
  Json::Value query (const Json::Value& filter, int limit) override;
  Json::Value getseq () override;
  Json::Value receive (const Json::Value& filter, int seq) override;

};

} // namespace unite4

#endif // RELAYCHANNEL_RELAYSERVER_HPP
