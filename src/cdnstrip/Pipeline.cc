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

#include <cinttypes>
#include <exception>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "cdnstrip/Pipeline.h"
#include "cdnstrip/Classifier.h"
#include "cdnstrip/Diags.h"
#include "cdnstrip/ErrataUtil.h"

namespace cdnstrip
{
namespace
{
  DbgCtl dbg_ctl{"cdnstrip_pipeline"};
} // namespace

Pipeline::Pipeline(RangeSetPtr ranges, InputNormalizer normalizer, Aggregator &aggregator, unsigned threads, unsigned queue_depth)
  : _ranges(std::move(ranges)),
    _normalizer(normalizer),
    _aggregator(aggregator),
    _threads(threads ? threads : 1),
    _queue_depth(queue_depth ? queue_depth : 1)
{
  if (!_ranges) {
    _ranges = std::make_shared<RangeSet const>();
  }
}

void
Pipeline::worker(BoundedQueue<ClassificationTask> &queue, unsigned id)
{
  RangeSet const    &ranges = *_ranges;
  ClassificationTask task;
  uint64_t           n = 0;

  while (queue.pop(task)) {
    Verdict verdict = classify(task, ranges);
    _aggregator.record(task, verdict);
    ++n;
  }
  Dbg(dbg_ctl, "worker %u done, %" PRIu64 " tasks", id, n);
}

swoc::Rv<PipelineStats>
Pipeline::run(std::istream &input)
{
  PipelineStats                    stats;
  BoundedQueue<ClassificationTask> queue(queue_capacity());
  std::vector<std::thread>         workers;

  // No reallocation once workers run.
  try {
    workers.reserve(_threads);
  } catch (std::exception const &e) {
    return {stats, swoc::Errata(ERRATA_ERROR, "unable to allocate {} workers: {}", _threads, e.what())};
  }
  for (unsigned i = 0; i < _threads; ++i) {
    try {
      workers.emplace_back(&Pipeline::worker, this, std::ref(queue), i);
    } catch (std::system_error const &e) {
      queue.close();
      for (auto &t : workers) {
        t.join();
      }
      return {stats, swoc::Errata(e.code(), ERRATA_ERROR, "unable to start worker {} of {}: {}", i + 1, _threads, e.what())};
    }
  }
  Dbg(dbg_ctl, "started %u workers, queue capacity %zu", _threads, queue.capacity());

  InputNormalizer::Emitter const emit = [&](ClassificationTask &&task) {
    if (queue.push(std::move(task))) {
      ++stats.tasks;
    }
  };

  std::string line;
  while (std::getline(input, line)) {
    ++stats.lines;
    _normalizer.normalize(line, emit);
  }
  if (input.bad()) {
    Error("input read failed after %" PRIu64 " lines", stats.lines);
  }

  queue.close();
  for (auto &t : workers) {
    t.join();
  }
  Dbg(dbg_ctl, "%" PRIu64 " lines, %" PRIu64 " tasks", stats.lines, stats.tasks);
  return {stats, swoc::Errata{}};
}

} // namespace cdnstrip
