/** @file

  Unit tests for classification and aggregation.

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

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "cdnstrip/Aggregator.h"
#include "cdnstrip/Classifier.h"

using namespace cdnstrip;

namespace
{
class LineSink : public Sink
{
public:
  using Sink::Sink;

  std::vector<std::string> lines;

protected:
  bool
  write_line(std::string_view line) override
  {
    lines.emplace_back(line);
    return true;
  }
};

ClassificationTask
task_for(char const *text)
{
  ClassificationTask task;
  task.raw = std::make_shared<std::string const>(text);
  swoc::IPAddr addr;
  if (addr.load(text)) {
    task.addr = addr;
  }
  return task;
}
} // namespace

TEST_CASE("Classify", "[classify]")
{
  RangeSet ranges{std::vector<std::string>{"203.0.113.0/24", "2606:4700::/32"}};

  REQUIRE(classify(*task_for("203.0.113.5").addr, ranges) == Verdict::MatchesRange);
  REQUIRE(classify(*task_for("203.0.114.5").addr, ranges) == Verdict::NoMatch);
  REQUIRE(classify(*task_for("2606:4700::6810:84e5").addr, ranges) == Verdict::MatchesRange);
  REQUIRE(classify(task_for("not an address"), ranges) == Verdict::Invalid);

  // same verdict on every call
  auto task = task_for("203.0.113.77");
  for (int i = 0; i < 16; ++i) {
    REQUIRE(classify(task, ranges) == Verdict::MatchesRange);
  }

  REQUIRE(verdict_name(Verdict::Invalid) == "invalid");
  REQUIRE(verdict_name(Verdict::MatchesRange) == "cdn");
  REQUIRE(verdict_name(Verdict::NoMatch) == "valid");
}

TEST_CASE("Classify from several threads", "[classify]")
{
  RangeSet const ranges{std::vector<std::string>{"203.0.113.0/24", "198.51.100.128/25", "2606:4700::/32"}};

  std::vector<ClassificationTask> tasks;
  for (auto text : {"203.0.113.1", "203.0.114.1", "198.51.100.127", "198.51.100.128", "2606:4700::1", "2606:4701::1", "junk"}) {
    tasks.push_back(task_for(text));
  }
  std::vector<Verdict> expected;
  for (auto const &task : tasks) {
    expected.push_back(classify(task, ranges));
  }
  REQUIRE(expected == std::vector<Verdict>{Verdict::MatchesRange, Verdict::NoMatch, Verdict::NoMatch, Verdict::MatchesRange,
                                           Verdict::MatchesRange, Verdict::NoMatch, Verdict::Invalid});

  constexpr int                     N_THREADS = 8;
  constexpr int                     N_ROUNDS  = 2000;
  std::vector<std::vector<Verdict>> seen(N_THREADS);
  std::vector<std::thread>          threads;
  for (int t = 0; t < N_THREADS; ++t) {
    threads.emplace_back([&, t]() {
      for (int round = 0; round < N_ROUNDS; ++round) {
        for (auto const &task : tasks) {
          seen[t].push_back(classify(task, ranges));
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  for (auto const &verdicts : seen) {
    REQUIRE(verdicts.size() == tasks.size() * N_ROUNDS);
    size_t mismatches = 0;
    for (size_t i = 0; i < verdicts.size(); ++i) {
      mismatches += verdicts[i] != expected[i % tasks.size()];
    }
    REQUIRE(mismatches == 0);
  }
}

TEST_CASE("Aggregator", "[classify]")
{
  SECTION("counts and writes only unmatched addresses")
  {
    LineSink   sink;
    Aggregator aggregator{sink};

    aggregator.record(task_for("198.51.100.1"), Verdict::NoMatch);
    aggregator.record(task_for("203.0.113.5"), Verdict::MatchesRange);
    aggregator.record(task_for("bogus"), Verdict::Invalid);
    aggregator.record(task_for("198.51.100.2"), Verdict::NoMatch);

    auto c = aggregator.counters();
    REQUIRE(c.valid == 2);
    REQUIRE(c.matched == 1);
    REQUIRE(c.invalid == 1);
    REQUIRE(c.total() == 4);
    REQUIRE(sink.lines == std::vector<std::string>{"198.51.100.1", "198.51.100.2"});
    REQUIRE_FALSE(sink.failed());
  }

  SECTION("raw mode writes the input line")
  {
    LineSink   sink{OutputMode::Raw};
    Aggregator aggregator{sink};

    ClassificationTask task = task_for("198.51.100.9");
    task.raw                = std::make_shared<std::string const>("https://198.51.100.9/index.html");
    aggregator.record(task, Verdict::NoMatch);

    REQUIRE(sink.lines == std::vector<std::string>{"https://198.51.100.9/index.html"});
  }
}
