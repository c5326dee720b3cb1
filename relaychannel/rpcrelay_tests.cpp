// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcrelay.hpp"

#include "relayserver.hpp"
#include "relaystore.hpp"
#include "testutils.hpp"

#include <jsonrpccpp/common/exception.h>
#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

namespace unite4
{
namespace
{

using testing::IsEmpty;

constexpr int KIND = 4444;
const std::string TOPIC = "example.org game_id=rpc";

/** Port used for the test relay server.  */
constexpr int HTTP_PORT = 32'150;

/** URL to connect to the test relay server.  */
const std::string HTTP_URL = "http://localhost:32150";

/**
 * Test fixture that runs a RelayRpcServer over HTTP with an in-memory
 * store, and connects an RpcRelay to it.
 */
class RpcRelayTests : public testing::Test
{

protected:

  RelayStore store;

  jsonrpc::HttpServer httpServer;
  RelayRpcServer server;

  RpcRelay relay;

  std::unique_ptr<Identity> alice;

  RpcRelayTests ()
    : httpServer(HTTP_PORT),
      server(store, std::chrono::milliseconds (10), httpServer),
      relay(HTTP_URL),
      alice(Identity::Generate ())
  {
    server.StartListening ();
  }

  ~RpcRelayTests ()
  {
    server.StopListening ();
  }

  RelayFilter
  TopicFilter () const
  {
    RelayFilter res;
    res.kinds = {KIND};
    res.topic = TOPIC;
    return res;
  }

  RelayEvent
  Event (const std::string& content) const
  {
    return CreateSignedEvent (*alice, KIND, TOPIC, content, 100);
  }

};

TEST_F (RpcRelayTests, PublishAndQuery)
{
  relay.Connect ();

  const auto first = Event ("first");
  relay.Publish (first);
  relay.Publish (Event ("second"));
  relay.Publish (CreateSignedEvent (*alice, KIND, "other", "x", 100));

  /* Publishing again is fine, the relay just ignores it.  */
  relay.Publish (first);
  EXPECT_EQ (store.GetSequence (), 3);

  const auto events = relay.Query (TopicFilter (), std::chrono::seconds (1));
  ASSERT_EQ (events.size (), 2);
  EXPECT_EQ (events[0].content, "second");
  EXPECT_EQ (events[1].content, "first");
  EXPECT_EQ (events[1].id, first.id);
  EXPECT_TRUE (events[1].IsValid ());
}

TEST_F (RpcRelayTests, InvalidEventRejected)
{
  auto ev = Event ("original");
  ev.content = "forged";
  EXPECT_THROW (relay.Publish (ev), RelayError);

  ev.id = ev.ComputeId ();
  EXPECT_THROW (relay.Publish (ev), RelayError);

  EXPECT_EQ (store.GetSequence (), 0);
}

TEST_F (RpcRelayTests, Receive)
{
  uint64_t seq = relay.GetSequence ();
  EXPECT_EQ (seq, 0);

  EXPECT_THAT (relay.Receive (TopicFilter (), seq), IsEmpty ());
  EXPECT_EQ (seq, 0);

  store.Add (Event ("a"));
  store.Add (CreateSignedEvent (*alice, KIND, "other", "b", 100));
  store.Add (Event ("c"));

  const auto events = relay.Receive (TopicFilter (), seq);
  EXPECT_EQ (seq, 3);
  ASSERT_EQ (events.size (), 2);
  EXPECT_EQ (events[0].content, "a");
  EXPECT_EQ (events[1].content, "c");
}

TEST_F (RpcRelayTests, SequenceOutOfRange)
{
  uint64_t seq = std::numeric_limits<int>::max ();
  ++seq;
  EXPECT_THROW (relay.Receive (TopicFilter (), seq), RelayError);
  EXPECT_EQ (seq, 1ull << 31);
}

TEST_F (RpcRelayTests, ServerValidatesParams)
{
  EXPECT_THROW (server.query (ParseJson ("{}"), -1),
                jsonrpc::JsonRpcException);
  EXPECT_THROW (server.query (ParseJson (R"({"foo": 1})"), 10),
                jsonrpc::JsonRpcException);
  EXPECT_THROW (server.receive (ParseJson ("{}"), -1),
                jsonrpc::JsonRpcException);
  EXPECT_THROW (server.publish (ParseJson (R"({"id": "abc"})")),
                jsonrpc::JsonRpcException);

  EXPECT_EQ (server.getseq (), ParseJson (R"({"seq": 0})"));
}

TEST (RpcRelayUnreachableTests, Throws)
{
  RpcRelay relay("http://localhost:1");
  EXPECT_THROW (relay.Connect (), RelayError);
  EXPECT_THROW (relay.Query (RelayFilter (), std::chrono::milliseconds (100)),
                RelayError);
}

} // anonymous namespace
} // namespace unite4
