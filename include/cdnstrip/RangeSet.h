/** @file

  Address ranges of CDN providers and the read-only set used for classification.

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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "swoc/TextView.h"
#include "swoc/swoc_ip.h"

namespace cdnstrip
{
/** An address prefix, @c network / @c prefix.
 *
 * The network address has every bit past the prefix cleared and the prefix is
 * valid for the address family (0..32 for IPv4, 0..128 for IPv6).
 */
struct AddressRange {
  swoc::IPRange range; ///< Covered addresses, network to broadcast inclusive.
  swoc::IPAddr  network;
  unsigned      prefix = 0;

  /** Parse a range literal of the form @c address/prefix.
   *
   * @return The range, or nothing if @a text is not a well formed literal.
   */
  static std::optional<AddressRange> parse(swoc::TextView text);

  /// @return The canonical literal, e.g. "203.0.113.0/24".
  std::string literal() const;

  bool
  contains(swoc::IPAddr const &addr) const
  {
    return range.contains(addr);
  }
};

/** The set of CDN ranges.
 *
 * Built once from range literals before any classification starts and never
 * modified afterwards, so it can be shared between threads without locking.
 * Membership is answered from an interval index, duplicate and overlapping
 * ranges do not change the answer.
 */
class RangeSet
{
  using self_type = RangeSet;

public:
  RangeSet() = default;

  /** Construct from range literals.
   *
   * Malformed literals are dropped.
   */
  explicit RangeSet(std::vector<std::string> const &literals);

  RangeSet(self_type const &)            = delete;
  self_type &operator=(self_type const &) = delete;

  /// @return @c true if @a addr is inside at least one range.
  bool contains(swoc::IPAddr const &addr) const;

  /// @return Number of ranges loaded, duplicates included.
  size_t
  size() const
  {
    return _ranges.size();
  }

  bool
  empty() const
  {
    return _ranges.empty();
  }

  /// @return Number of literals that were dropped as malformed.
  size_t
  dropped() const
  {
    return _dropped;
  }

  /// @return The canonical literal of every loaded range, in load order.
  std::vector<std::string> literals() const;

  std::vector<AddressRange> const &
  ranges() const
  {
    return _ranges;
  }

private:
  std::vector<AddressRange> _ranges;
  swoc::IPRangeSet          _index;
  size_t                    _dropped = 0;
};

using RangeSetPtr = std::shared_ptr<RangeSet const>;

} // namespace cdnstrip
