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

#include "cdnstrip/Aggregator.h"

namespace cdnstrip
{
void
Aggregator::record(ClassificationTask const &task, Verdict verdict)
{
  std::lock_guard<std::mutex> lock(_mutex);
  switch (verdict) {
  case Verdict::Invalid:
    ++_counters.invalid;
    break;
  case Verdict::MatchesRange:
    ++_counters.matched;
    break;
  case Verdict::NoMatch:
    ++_counters.valid;
    _sink.write(task);
    break;
  }
}

Counters
Aggregator::counters() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _counters;
}

} // namespace cdnstrip
