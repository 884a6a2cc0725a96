/** @file

  Bounded blocking FIFO with a close signal.

  @section license License

  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace cdnstrip
{
/** A FIFO of at most @c capacity items shared by producers and consumers.
 *
 * @c push blocks while the queue is full, @c pop blocks while it is empty and
 * open. After @c close the remaining items are still handed out, then @c pop
 * reports the queue drained.
 */
template <typename T> class BoundedQueue
{
  using self_type = BoundedQueue;

public:
  /// @a capacity is clamped to at least one slot.
  explicit BoundedQueue(size_t capacity) : _capacity(capacity ? capacity : 1) {}

  BoundedQueue(self_type const &)         = delete;
  self_type &operator=(self_type const &) = delete;

  /** Add @a item, waiting for a free slot.
   *
   * @return @c false if the queue was closed, @a item is not queued.
   */
  bool
  push(T &&item)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _not_full.wait(lock, [this] { return _closed || _items.size() < _capacity; });
    if (_closed) {
      return false;
    }
    _items.push_back(std::move(item));
    _not_empty.notify_one();
    return true;
  }

  /** Remove the oldest item, waiting while the queue is empty and open.
   *
   * @return @c false if the queue is closed and drained, @a out is not changed.
   */
  bool
  pop(T &out)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _not_empty.wait(lock, [this] { return _closed || !_items.empty(); });
    if (_items.empty()) {
      return false;
    }
    out = std::move(_items.front());
    _items.pop_front();
    _not_full.notify_one();
    return true;
  }

  /// No more items will be pushed. Wakes every waiting thread.
  void
  close()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _closed = true;
    _not_empty.notify_all();
    _not_full.notify_all();
  }

  bool
  closed() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
  }

  size_t
  size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _items.size();
  }

  size_t
  capacity() const
  {
    return _capacity;
  }

private:
  mutable std::mutex      _mutex;
  std::condition_variable _not_empty;
  std::condition_variable _not_full;
  std::deque<T>           _items;
  size_t const            _capacity;
  bool                    _closed = false;
};

} // namespace cdnstrip
