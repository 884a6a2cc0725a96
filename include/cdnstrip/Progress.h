/** @file

  Terminal status line with a spinner and the verdict counters.

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

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "cdnstrip/Aggregator.h"

namespace cdnstrip
{
/** Status display refreshed from its own thread.
 *
 * Only an observer: it reads counter snapshots and never blocks the pipeline.
 * It draws only if enabled and the stream is a terminal, the first failed write
 * turns it off.
 */
class Progress
{
public:
  static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{100};

  Progress(FILE *out, bool enabled, std::chrono::milliseconds interval = DEFAULT_INTERVAL);
  ~Progress();

  Progress(Progress const &)            = delete;
  Progress &operator=(Progress const &) = delete;

  /// Start the refresh thread, if the display is active.
  void start();

  /** Stop refreshing and write the final line.
   *
   * Safe to call more than once and from a diagnostics cleanup hook.
   */
  void stop();

  /// Show @a text after the spinner.
  void status(std::string_view text);

  /// Show the counters of @a aggregator after the spinner from now on.
  void watch(Aggregator const &aggregator);

  /// @return @c true if the display draws.
  bool active() const;

  /// @return The status text currently displayed.
  std::string text() const;

  /// @return "  [ VALID: v | INVALID: i | CDN: m ]"
  static std::string counters_text(Counters const &c);

private:
  void run();
  bool draw(std::string_view lead, std::string_view text, bool final);

  FILE                     *_out;
  bool                      _enabled;
  std::chrono::milliseconds _interval;

  mutable std::mutex      _mutex;
  std::condition_variable _wakeup;
  std::string             _status;
  Aggregator const       *_aggregator = nullptr;
  bool                    _stopping   = false;
  bool                    _stopped    = false;
  std::thread             _thread;
};

} // namespace cdnstrip
