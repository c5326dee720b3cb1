// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "channelbridge.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

namespace unite4
{
namespace
{

using testing::ElementsAre;
using testing::IsEmpty;

TEST (BoundedQueueTests, Fifo)
{
  BoundedQueue<std::string> q("test", 10);
  EXPECT_TRUE (q.TryPush ("a"));
  EXPECT_TRUE (q.TryPush ("b"));
  EXPECT_TRUE (q.TryPush ("c"));
  EXPECT_EQ (q.Size (), 3);

  std::string out;
  ASSERT_TRUE (q.TryPop (out));
  EXPECT_EQ (out, "a");
  EXPECT_THAT (q.PopAll (), ElementsAre ("b", "c"));

  EXPECT_FALSE (q.TryPop (out));
  EXPECT_THAT (q.PopAll (), IsEmpty ());
  EXPECT_EQ (q.Size (), 0);
}

TEST (BoundedQueueTests, OverflowDrops)
{
  BoundedQueue<int> q("test", 2);
  EXPECT_EQ (q.GetCapacity (), 2);

  EXPECT_TRUE (q.TryPush (1));
  EXPECT_TRUE (q.TryPush (2));
  EXPECT_FALSE (q.TryPush (3));
  EXPECT_FALSE (q.TryPush (4));
  EXPECT_EQ (q.GetDropped (), 2);

  int out;
  ASSERT_TRUE (q.TryPop (out));
  EXPECT_EQ (out, 1);
  EXPECT_TRUE (q.TryPush (5));
  EXPECT_THAT (q.PopAll (), ElementsAre (2, 5));
  EXPECT_EQ (q.GetDropped (), 2);
}

TEST (BoundedQueueTests, ZeroCapacity)
{
  EXPECT_DEATH (BoundedQueue<int> ("test", 0), "positive capacity");
}

TEST (BoundedQueueTests, ProducerAndConsumer)
{
  constexpr size_t count = 10'000;
  BoundedQueue<int> q("test", 100);

  std::thread producer([&q] ()
    {
      for (size_t i = 0; i < count; ++i)
        while (!q.TryPush (static_cast<int> (i)))
          std::this_thread::yield ();
    });

  std::vector<int> received;
  while (received.size () < count)
    {
      int out;
      if (q.TryPop (out))
        received.push_back (out);
      else
        std::this_thread::yield ();
    }
  producer.join ();

  for (size_t i = 0; i < count; ++i)
    ASSERT_EQ (received[i], static_cast<int> (i));
}

TEST (ChannelBridgeTests, Capacity)
{
  ChannelBridge defaultBridge;
  EXPECT_EQ (defaultBridge.outbound.GetCapacity (), 1'000);
  EXPECT_EQ (defaultBridge.inbound.GetCapacity (), 1'000);

  ChannelBridge small(1);
  EXPECT_TRUE (small.outbound.TryPush ("payload"));
  EXPECT_FALSE (small.outbound.TryPush ("payload"));

  InboundMessage msg;
  msg.events.push_back ({"author", "content"});
  EXPECT_TRUE (small.inbound.TryPush (std::move (msg)));
  EXPECT_FALSE (small.inbound.TryPush (InboundMessage ()));

  InboundMessage out;
  ASSERT_TRUE (small.inbound.TryPop (out));
  EXPECT_FALSE (out.backlog);
  ASSERT_EQ (out.events.size (), 1);
  EXPECT_EQ (out.events[0].author, "author");
  EXPECT_EQ (out.events[0].content, "content");
}

} // anonymous namespace
} // namespace unite4
