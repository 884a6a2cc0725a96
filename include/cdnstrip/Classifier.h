/** @file

  Address membership verdicts.

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

#include "swoc/TextView.h"
#include "swoc/swoc_ip.h"

#include "cdnstrip/InputNormalizer.h"
#include "cdnstrip/RangeSet.h"

namespace cdnstrip
{
enum class Verdict {
  Invalid,      ///< The task has no resolved address.
  MatchesRange, ///< The address is inside a CDN range.
  NoMatch,      ///< The address is outside every CDN range.
};

/// Test a resolved address against @a ranges.
inline Verdict
classify(swoc::IPAddr const &addr, RangeSet const &ranges)
{
  return ranges.contains(addr) ? Verdict::MatchesRange : Verdict::NoMatch;
}

/// Classify a task, a task without an address is @c Verdict::Invalid and never reaches the range lookup.
inline Verdict
classify(ClassificationTask const &task, RangeSet const &ranges)
{
  if (!task.addr) {
    return Verdict::Invalid;
  }
  return classify(*task.addr, ranges);
}

swoc::TextView verdict_name(Verdict v);

} // namespace cdnstrip
