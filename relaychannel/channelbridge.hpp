// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RELAYCHANNEL_CHANNELBRIDGE_HPP
#define RELAYCHANNEL_CHANNELBRIDGE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace unite4
{

/**
 * A bounded FIFO queue between exactly one producer and one consumer
 * thread.  Neither side ever waits for the other:  Pushing to a full queue
 * drops the element and reports the failure, and popping from an empty queue
 * returns immediately.
 */
template <typename T>
  class BoundedQueue
{

private:

  /** Name of the queue for log messages.  */
  const std::string name;

  /** Maximum number of queued elements.  */
  const size_t capacity;

  /** Lock for the elements.  */
  mutable std::mutex mut;

  std::deque<T> elements;

  /** Number of elements dropped so far because the queue was full.  */
  size_t dropped = 0;

public:

  explicit BoundedQueue (const std::string& n, size_t c);

  BoundedQueue () = delete;
  BoundedQueue (const BoundedQueue<T>&) = delete;
  void operator= (const BoundedQueue<T>&) = delete;

  /**
   * Tries to enqueue an element.  Returns false (and logs an error) if the
   * queue is at capacity, in which case the element is dropped.
   */
  bool TryPush (T&& elem);

  /**
   * Dequeues the oldest element into out and returns true, or returns false
   * if the queue is empty.
   */
  bool TryPop (T& out);

  /**
   * Dequeues all currently available elements.
   */
  std::vector<T> PopAll ();

  size_t Size () const;

  size_t
  GetCapacity () const
  {
    return capacity;
  }

  /**
   * Returns how many elements have been dropped due to overflow.
   */
  size_t GetDropped () const;

};

/**
 * A single event received from a relay, as handed to the frame loop.
 */
struct ReceivedEvent
{

  /** Identity (hex public key) of the author.  */
  std::string author;

  /** The (undecoded) payload.  */
  std::string content;

};

/**
 * One element of the inbound queue.  The backlog snapshot fetched during
 * matchmaking is delivered as a single message, so that the frame loop
 * sees it as a whole.  Live events come one per message.
 */
struct InboundMessage
{

  /** True if this is the backlog snapshot (oldest event first).  */
  bool backlog = false;

  /**
   * Set on a backlog snapshot if relays were connected but none of them
   * answered the query.  The snapshot is then empty but says nothing
   * about the game's history.
   */
  bool failed = false;

  std::vector<ReceivedEvent> events;

};

/**
 * The two queues connecting the network actor and the frame loop.  The
 * outbound queue carries encoded payloads that should be published, the
 * inbound queue carries events received from relays.
 */
class ChannelBridge
{

public:

  /** Default capacity of each queue.  */
  static constexpr size_t DEFAULT_CAPACITY = 1'000;

  /** Frame loop to network actor.  */
  BoundedQueue<std::string> outbound;

  /** Network actor to frame loop.  */
  BoundedQueue<InboundMessage> inbound;

  explicit ChannelBridge (size_t capacity = DEFAULT_CAPACITY)
    : outbound("outbound", capacity), inbound("inbound", capacity)
  {}

  ChannelBridge (const ChannelBridge&) = delete;
  void operator= (const ChannelBridge&) = delete;

};

} // namespace unite4

#include "channelbridge.tpp"

#endif // RELAYCHANNEL_CHANNELBRIDGE_HPP
