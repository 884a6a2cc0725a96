/** @file

  Concurrent classification of the normalized input.

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
#include <istream>

#include "swoc/Errata.h"

#include "cdnstrip/Aggregator.h"
#include "cdnstrip/BoundedQueue.h"
#include "cdnstrip/InputNormalizer.h"
#include "cdnstrip/RangeSet.h"

namespace cdnstrip
{
struct PipelineStats {
  uint64_t lines = 0; ///< Input lines read.
  uint64_t tasks = 0; ///< Tasks produced by normalization.
};

/** Producer / worker pool over a bounded queue.
 *
 * The thread calling @c run is the only producer. It normalizes the input and
 * blocks while the queue is full. @c threads workers classify tasks and record
 * them in the aggregator in no particular order.
 */
class Pipeline
{
public:
  /**
   * @param ranges CDN ranges, shared read only with every worker.
   * @param normalizer Input line normalization.
   * @param aggregator Destination of every verdict.
   * @param threads Worker count, at least one.
   * @param queue_depth Queue slots per worker, at least one.
   */
  Pipeline(RangeSetPtr ranges, InputNormalizer normalizer, Aggregator &aggregator, unsigned threads = 1, unsigned queue_depth = 1);

  /** Classify every line of @a input.
   *
   * Returns after the input is exhausted, the queue is drained and every worker
   * has exited. Fails without reading @a input if the workers cannot be started.
   */
  swoc::Rv<PipelineStats> run(std::istream &input);

  unsigned
  threads() const
  {
    return _threads;
  }

  size_t
  queue_capacity() const
  {
    return static_cast<size_t>(_threads) * _queue_depth;
  }

private:
  void worker(BoundedQueue<ClassificationTask> &queue, unsigned id);

  RangeSetPtr     _ranges;
  InputNormalizer _normalizer;
  Aggregator     &_aggregator;
  unsigned        _threads;
  unsigned        _queue_depth;
};

} // namespace cdnstrip
