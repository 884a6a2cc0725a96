/** @file

  Verdict counters and the per task critical section.

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

#include <cstdint>
#include <mutex>

#include "cdnstrip/Classifier.h"
#include "cdnstrip/Sink.h"

namespace cdnstrip
{
struct Counters {
  uint64_t valid   = 0; ///< No CDN match, written to the sink.
  uint64_t invalid = 0; ///< No resolved address.
  uint64_t matched = 0; ///< Inside a CDN range.

  uint64_t
  total() const
  {
    return valid + invalid + matched;
  }
};

/** Owner of the counters and the sink.
 *
 * Each recorded task increments exactly one counter and, for @c Verdict::NoMatch,
 * writes to the sink, both under one lock so that counts and output always agree.
 */
class Aggregator
{
public:
  explicit Aggregator(Sink &sink) : _sink(sink) {}

  Aggregator(Aggregator const &)            = delete;
  Aggregator &operator=(Aggregator const &) = delete;

  void record(ClassificationTask const &task, Verdict verdict);

  /// @return A consistent copy of the counters.
  Counters counters() const;

  Sink &
  sink()
  {
    return _sink;
  }

private:
  mutable std::mutex _mutex;
  Counters           _counters;
  Sink              &_sink;
};

} // namespace cdnstrip
