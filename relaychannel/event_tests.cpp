// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "event.hpp"

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace unite4
{
namespace
{

using testing::ElementsAre;

constexpr int KIND = 4444;
const std::string TOPIC = "example.org game_id=abc";

class RelayEventTests : public testing::Test
{

protected:

  std::unique_ptr<Identity> alice;

  RelayEventTests ()
    : alice(Identity::Generate ())
  {}

};

TEST_F (RelayEventTests, CreateSigned)
{
  const auto ev = CreateSignedEvent (*alice, KIND, TOPIC, "hello", 1'000);

  EXPECT_EQ (ev.pubkey, alice->GetPublicKeyHex ());
  EXPECT_EQ (ev.createdAt, 1'000);
  EXPECT_EQ (ev.kind, KIND);
  EXPECT_EQ (ev.content, "hello");
  EXPECT_THAT (ev.tags, ElementsAre (RelayEvent::Tag ({"t", TOPIC})));
  EXPECT_TRUE (ev.HasTag (TOPIC_TAG, TOPIC));
  EXPECT_FALSE (ev.HasTag (TOPIC_TAG, "other"));

  EXPECT_EQ (ev.id, ev.ComputeId ());
  EXPECT_EQ (ev.id.size (), 64);
  EXPECT_TRUE (ev.IsValid ());
}

TEST_F (RelayEventTests, IdDependsOnContent)
{
  const auto a = CreateSignedEvent (*alice, KIND, TOPIC, "foo", 1'000);
  const auto b = CreateSignedEvent (*alice, KIND, TOPIC, "bar", 1'000);
  const auto c = CreateSignedEvent (*alice, KIND, TOPIC, "foo", 1'001);
  const auto d = CreateSignedEvent (*alice, KIND, TOPIC, "foo", 1'000);

  EXPECT_NE (a.id, b.id);
  EXPECT_NE (a.id, c.id);
  EXPECT_EQ (a.id, d.id);
}

TEST_F (RelayEventTests, TamperingIsDetected)
{
  const auto orig = CreateSignedEvent (*alice, KIND, TOPIC, "move", 1'000);

  auto ev = orig;
  ev.content = "other move";
  EXPECT_FALSE (ev.IsValid ());

  /* Recomputing the ID does not help without a new signature.  */
  ev.id = ev.ComputeId ();
  EXPECT_FALSE (ev.IsValid ());

  auto mallory = Identity::Generate ();
  ev = orig;
  ev.pubkey = mallory->GetPublicKeyHex ();
  ev.id = ev.ComputeId ();
  EXPECT_FALSE (ev.IsValid ());
}

TEST_F (RelayEventTests, JsonRoundTrip)
{
  const auto ev = CreateSignedEvent (*alice, KIND, TOPIC, "{\"x\":1}", 42);

  RelayEvent parsed;
  ASSERT_TRUE (RelayEvent::FromJson (ev.ToJson (), parsed));
  EXPECT_EQ (parsed.id, ev.id);
  EXPECT_EQ (parsed.pubkey, ev.pubkey);
  EXPECT_EQ (parsed.createdAt, ev.createdAt);
  EXPECT_EQ (parsed.kind, ev.kind);
  EXPECT_EQ (parsed.tags, ev.tags);
  EXPECT_EQ (parsed.content, ev.content);
  EXPECT_EQ (parsed.sig, ev.sig);
  EXPECT_TRUE (parsed.IsValid ());
}

TEST_F (RelayEventTests, MalformedJson)
{
  const auto valid = CreateSignedEvent (*alice, KIND, TOPIC, "x", 42).ToJson ();
  RelayEvent ev;

  EXPECT_FALSE (RelayEvent::FromJson (ParseJson ("[]"), ev));
  EXPECT_FALSE (RelayEvent::FromJson (ParseJson ("\"event\""), ev));

  for (const std::string field : {"id", "pubkey", "created_at", "kind",
                                  "tags", "content", "sig"})
    {
      Json::Value val = valid;
      val.removeMember (field);
      EXPECT_FALSE (RelayEvent::FromJson (val, ev)) << "Missing " << field;
    }

  Json::Value val = valid;
  val["kind"] = "4444";
  EXPECT_FALSE (RelayEvent::FromJson (val, ev));

  val = valid;
  val["created_at"] = 1.5;
  EXPECT_FALSE (RelayEvent::FromJson (val, ev));

  val = valid;
  val["tags"] = ParseJson (R"([["t", 5]])");
  EXPECT_FALSE (RelayEvent::FromJson (val, ev));

  val = valid;
  val["tags"] = ParseJson (R"(["t"])");
  EXPECT_FALSE (RelayEvent::FromJson (val, ev));
}

class RelayFilterTests : public RelayEventTests
{

protected:

  std::unique_ptr<Identity> bob;

  RelayFilterTests ()
    : bob(Identity::Generate ())
  {}

};

TEST_F (RelayFilterTests, EmptyMatchesEverything)
{
  const RelayFilter f;
  EXPECT_TRUE (f.Matches (CreateSignedEvent (*alice, 1, "", "", 0)));
  EXPECT_TRUE (f.Matches (CreateSignedEvent (*bob, KIND, TOPIC, "x", 100)));
}

TEST_F (RelayFilterTests, Fields)
{
  RelayFilter f;
  f.kinds = {KIND};
  f.topic = TOPIC;
  f.authors = {bob->GetPublicKeyHex ()};
  f.since = 100;

  EXPECT_TRUE (f.Matches (CreateSignedEvent (*bob, KIND, TOPIC, "x", 100)));
  EXPECT_TRUE (f.Matches (CreateSignedEvent (*bob, KIND, TOPIC, "x", 200)));

  EXPECT_FALSE (f.Matches (CreateSignedEvent (*bob, 1, TOPIC, "x", 100)));
  EXPECT_FALSE (f.Matches (CreateSignedEvent (*bob, KIND, "other", "x", 100)));
  EXPECT_FALSE (f.Matches (CreateSignedEvent (*alice, KIND, TOPIC, "x", 100)));
  EXPECT_FALSE (f.Matches (CreateSignedEvent (*bob, KIND, TOPIC, "x", 99)));
}

TEST_F (RelayFilterTests, JsonRoundTrip)
{
  RelayFilter f;
  f.kinds = {KIND, 1};
  f.topic = TOPIC;
  f.authors = {alice->GetPublicKeyHex (), bob->GetPublicKeyHex ()};
  f.since = 123;

  const Json::Value val = f.ToJson ();
  EXPECT_EQ (val["#t"], ParseJson ("[\"" + TOPIC + "\"]"));

  RelayFilter parsed;
  ASSERT_TRUE (RelayFilter::FromJson (val, parsed));
  EXPECT_EQ (parsed.kinds, f.kinds);
  EXPECT_EQ (parsed.topic, f.topic);
  EXPECT_EQ (parsed.authors, f.authors);
  EXPECT_EQ (parsed.since, f.since);

  ASSERT_TRUE (RelayFilter::FromJson (ParseJson ("{}"), parsed));
  EXPECT_TRUE (parsed.kinds.empty ());
  EXPECT_EQ (parsed.topic, "");
  EXPECT_TRUE (parsed.authors.empty ());
  EXPECT_EQ (parsed.since, 0);
}

TEST_F (RelayFilterTests, MalformedJson)
{
  RelayFilter f;
  for (const std::string str : {
          "[]",
          R"({"kinds": 4444})",
          R"({"kinds": ["4444"]})",
          R"({"#t": "topic"})",
          R"({"#t": ["a", "b"]})",
          R"({"authors": [1]})",
          R"({"since": "now"})",
          R"({"limit": 10})",
        })
    EXPECT_FALSE (RelayFilter::FromJson (ParseJson (str), f)) << str;
}

} // anonymous namespace
} // namespace unite4
