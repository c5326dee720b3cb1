// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_RPCRELAY_HPP
#define RELAYCHANNEL_RPCRELAY_HPP

#include "relay.hpp"

#include "rpc-stubs/relayrpcclient.h"

#include <jsonrpccpp/client/connectors/httpclient.h>

#include <memory>
#include <string>
#include <vector>

namespace unite4
{

/**
 * RelayConnection that talks to a relay server through JSON-RPC over HTTP
 * (see RelayRpcServer for the server side).
 */
class RpcRelay : public RelayConnection
{

private:

  /**
   * The HTTP connector used for publishing and querying.  Live delivery
   * uses its own connector, since it has a different timeout.
   */
  jsonrpc::HttpClient connector;

  /** The HTTP connector used for receive calls.  */
  jsonrpc::HttpClient receiveConnector;

  RelayRpcClient rpc;
  RelayRpcClient receiveRpc;

  /**
   * Parses an array of events returned from the server.  Malformed entries
   * are skipped.
   */
  static std::vector<RelayEvent> ParseEvents (const Json::Value& arr);

public:

  /**
   * Maximum number of events requested from a relay for a backlog query.
   */
  static constexpr int QUERY_LIMIT = 1'000;

  explicit RpcRelay (const std::string& url);

  void Connect () override;
  void Publish (const RelayEvent& ev) override;
  std::vector<RelayEvent> Query (const RelayFilter& f,
                                 std::chrono::milliseconds timeout) override;
  uint64_t GetSequence () override;
  std::vector<RelayEvent> Receive (const RelayFilter& f,
                                   uint64_t& seq) override;

};

/**
 * Opens RpcRelay connections for relay URLs (for use with NetworkActor).
 */
std::unique_ptr<RelayConnection> OpenRpcRelay (const std::string& url);

} // namespace unite4

#endif // RELAYCHANNEL_RPCRELAY_HPP
