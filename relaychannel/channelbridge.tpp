// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/* Template implementation code for channelbridge.hpp.  */

#include <glog/logging.h>

#include <utility>

namespace unite4
{

template <typename T>
  BoundedQueue<T>::BoundedQueue (const std::string& n, const size_t c)
  : name(n), capacity(c)
{
  CHECK_GT (capacity, 0) << "Queue " << name << " needs a positive capacity";
}

template <typename T>
  bool
  BoundedQueue<T>::TryPush (T&& elem)
{
  std::lock_guard<std::mutex> lock(mut);

  if (elements.size () >= capacity)
    {
      ++dropped;
      LOG (ERROR)
          << "Queue " << name << " is full (capacity " << capacity
          << "), dropping message";
      return false;
    }

  elements.push_back (std::move (elem));
  return true;
}

template <typename T>
  bool
  BoundedQueue<T>::TryPop (T& out)
{
  std::lock_guard<std::mutex> lock(mut);

  if (elements.empty ())
    return false;

  out = std::move (elements.front ());
  elements.pop_front ();
  return true;
}

template <typename T>
  std::vector<T>
  BoundedQueue<T>::PopAll ()
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<T> res;
  res.reserve (elements.size ());
  for (auto& e : elements)
    res.push_back (std::move (e));
  elements.clear ();

  return res;
}

template <typename T>
  size_t
  BoundedQueue<T>::Size () const
{
  std::lock_guard<std::mutex> lock(mut);
  return elements.size ();
}

template <typename T>
  size_t
  BoundedQueue<T>::GetDropped () const
{
  std::lock_guard<std::mutex> lock(mut);
  return dropped;
}

} // namespace unite4
