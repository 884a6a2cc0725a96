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

#include <array>

#include <unistd.h>

#include "swoc/bwf_base.h"

#include "cdnstrip/Progress.h"

namespace cdnstrip
{
namespace
{
  constexpr std::array<std::string_view, 8> SPINNER = {"⣾", "⣽", "⣻", "⢿", "⡿", "⣟", "⣯", "⣷"};
  constexpr std::string_view                DONE    = "[✔]";
} // namespace

Progress::Progress(FILE *out, bool enabled, std::chrono::milliseconds interval)
  : _out(out), _enabled(enabled && out != nullptr && isatty(fileno(out))), _interval(interval)
{
}

Progress::~Progress()
{
  this->stop();
}

bool
Progress::active() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _enabled;
}

std::string
Progress::counters_text(Counters const &c)
{
  std::string text;
  swoc::bwprint(text, "  [ VALID: {} | INVALID: {} | CDN: {} ]", c.valid, c.invalid, c.matched);
  return text;
}

std::string
Progress::text() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  if (_aggregator) {
    return counters_text(_aggregator->counters());
  }
  return _status;
}

void
Progress::status(std::string_view text)
{
  std::lock_guard<std::mutex> lock(_mutex);
  _status.assign(" ").append(text);
  _aggregator = nullptr;
}

void
Progress::watch(Aggregator const &aggregator)
{
  std::lock_guard<std::mutex> lock(_mutex);
  _aggregator = &aggregator;
}

void
Progress::start()
{
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_enabled || _thread.joinable() || _stopped) {
    return;
  }
  _thread = std::thread(&Progress::run, this);
}

void
Progress::stop()
{
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopped) {
      return;
    }
    _stopped  = true;
    _stopping = true;
  }
  _wakeup.notify_all();
  if (_thread.joinable()) {
    _thread.join();
    std::string const final_text = this->text();
    std::lock_guard<std::mutex> lock(_mutex);
    if (_enabled) {
      this->draw(DONE, final_text, true);
    }
  }
}

// Called with the lock held.
bool
Progress::draw(std::string_view lead, std::string_view text, bool final)
{
  if (fprintf(_out, "\r\033[K%.*s%.*s%s", static_cast<int>(lead.size()), lead.data(), static_cast<int>(text.size()), text.data(),
              final ? "\n" : "") < 0 ||
      fflush(_out) != 0) {
    _enabled = false;
    return false;
  }
  return true;
}

void
Progress::run()
{
  size_t frame = 0;
  while (true) {
    std::string text = this->text();

    std::unique_lock<std::mutex> lock(_mutex);
    if (_stopping || !_enabled) {
      break;
    }
    if (!this->draw(SPINNER[frame], text, false)) {
      break;
    }
    frame = (frame + 1) % SPINNER.size();
    _wakeup.wait_for(lock, _interval, [this] { return _stopping; });
  }
}

} // namespace cdnstrip
