/** @file

  Unit tests for the classification pipeline.

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

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <catch2/catch.hpp>

#include "swoc/bwf_base.h"
#include "swoc/swoc_file.h"

#include "cdnstrip/Pipeline.h"
#include "cdnstrip/Sink.h"

using namespace cdnstrip;

namespace
{
// Called under the aggregator lock.
class MemorySink : public Sink
{
public:
  using Sink::Sink;

  std::vector<std::string> lines;
  bool                     fail = false;

protected:
  bool
  write_line(std::string_view line) override
  {
    if (fail) {
      return false;
    }
    lines.emplace_back(line);
    return true;
  }
};

RangeSetPtr
cdn_ranges()
{
  return std::make_shared<RangeSet const>(std::vector<std::string>{"203.0.113.0/24", "198.51.100.128/25"});
}

std::string const input_data = "203.0.113.5\n"
                               "203.0.114.5\n"
                               "\n"
                               "example.com\n"
                               "http://198.51.100.200/login\n"
                               "https://192.0.2.10:8443/\n"
                               "2001:db8::1\n"
                               "198.51.100.124/31\n"
                               "198.51.100.128/31\n";
} // namespace

TEST_CASE("Pipeline classification", "[pipeline]")
{
  for (unsigned threads : {1u, 4u}) {
    MemorySink sink;
    Aggregator aggregator{sink};
    Pipeline   pipeline{cdn_ranges(), InputNormalizer{}, aggregator, threads, 2};

    std::istringstream input{input_data};
    auto               run = pipeline.run(input);
    REQUIRE(run.is_ok());
    auto const &stats = run.result();
    auto        c     = aggregator.counters();

    REQUIRE(pipeline.threads() == threads);
    REQUIRE(pipeline.queue_capacity() == threads * 2);
    REQUIRE(stats.lines == 9);
    // 1 + 1 + 1 + 1 + 2 + 2
    REQUIRE(stats.tasks == 8);
    REQUIRE(c.total() == stats.tasks);
    REQUIRE(c.invalid == 0);
    // 203.0.113.5, 198.51.100.200, 198.51.100.128, 198.51.100.129
    REQUIRE(c.matched == 4);
    REQUIRE(c.valid == 4);

    std::set<std::string> written{sink.lines.begin(), sink.lines.end()};
    REQUIRE(written == std::set<std::string>{"203.0.114.5", "192.0.2.10", "198.51.100.124", "198.51.100.125"});
    REQUIRE(sink.lines.size() == c.valid);
    REQUIRE_FALSE(sink.failed());
  }
}

TEST_CASE("Pipeline raw output", "[pipeline]")
{
  MemorySink sink{OutputMode::Raw};
  Aggregator aggregator{sink};
  Pipeline   pipeline{cdn_ranges(), InputNormalizer{}, aggregator, 2, 1};

  std::istringstream input{input_data};
  REQUIRE(pipeline.run(input).is_ok());

  std::multiset<std::string> written{sink.lines.begin(), sink.lines.end()};
  REQUIRE(written == std::multiset<std::string>{"203.0.114.5", "https://192.0.2.10:8443/", "198.51.100.124/31", "198.51.100.124/31"});
}

TEST_CASE("Pipeline IPv6", "[pipeline]")
{
  MemorySink sink;
  Aggregator aggregator{sink};
  auto       ranges = std::make_shared<RangeSet const>(std::vector<std::string>{"2001:db8::/32"});
  Pipeline   pipeline{ranges, InputNormalizer{true}, aggregator};

  std::istringstream input{"2001:db8::1\n2001:db9::1\n"};
  auto               run = pipeline.run(input);
  REQUIRE(run.is_ok());
  auto const &stats = run.result();

  REQUIRE(stats.tasks == 2);
  REQUIRE(aggregator.counters().matched == 1);
  REQUIRE(aggregator.counters().valid == 1);
  REQUIRE(sink.lines.size() == 1);
}

TEST_CASE("Pipeline without ranges", "[pipeline]")
{
  MemorySink sink;
  Aggregator aggregator{sink};
  Pipeline   pipeline{nullptr, InputNormalizer{}, aggregator, 0, 0};

  REQUIRE(pipeline.threads() == 1);
  REQUIRE(pipeline.queue_capacity() == 1);

  std::istringstream input{"203.0.113.5\n"};
  REQUIRE(pipeline.run(input).is_ok());
  REQUIRE(aggregator.counters().valid == 1);
}

TEST_CASE("Pipeline sink failure", "[pipeline]")
{
  MemorySink sink;
  sink.fail = true;
  Aggregator aggregator{sink};
  Pipeline   pipeline{cdn_ranges(), InputNormalizer{}, aggregator, 2, 1};

  std::istringstream input{input_data};
  auto               run = pipeline.run(input);
  REQUIRE(run.is_ok());
  auto const &stats = run.result();

  // the run completes and still counts every task
  REQUIRE(aggregator.counters().total() == stats.tasks);
  REQUIRE(sink.failed());
  REQUIRE(sink.lines.empty());
}

TEST_CASE("FileSink", "[pipeline]")
{
  std::string path;
  swoc::bwprint(path, "{}/cdnstrip_sink.{}", swoc::file::temp_directory_path().c_str(), ::getpid());

  {
    FileSink sink;
    REQUIRE(sink.open(path).is_ok());
    REQUIRE(sink.path() == path);
    Aggregator aggregator{sink};
    Pipeline   pipeline{cdn_ranges(), InputNormalizer{}, aggregator, 1, 1};

    std::istringstream input{"203.0.113.5\n192.0.2.1\n192.0.2.2\n"};
    REQUIRE(pipeline.run(input).is_ok());
    sink.flush();
    REQUIRE_FALSE(sink.failed());
  }

  std::ifstream            f{path};
  std::vector<std::string> lines;
  for (std::string line; std::getline(f, line);) {
    lines.push_back(line);
  }
  std::sort(lines.begin(), lines.end());
  REQUIRE(lines == std::vector<std::string>{"192.0.2.1", "192.0.2.2"});
  std::remove(path.c_str());
}

TEST_CASE("FileSink unwritable location", "[pipeline]")
{
  FileSink sink;
  auto     errata = sink.open("/nonexistent-dir/cdnstrip/out.txt");
  REQUIRE_FALSE(errata.is_ok());
  REQUIRE(errata.code().value() == ENOENT);
}

TEST_CASE("Pipeline large block through a small queue", "[pipeline]")
{
  MemorySink sink;
  Aggregator aggregator{sink};
  auto       ranges = std::make_shared<RangeSet const>(std::vector<std::string>{"10.20.128.0/17"});
  Pipeline   pipeline{ranges, InputNormalizer{}, aggregator, 4, 1};
  REQUIRE(pipeline.queue_capacity() == 4);

  std::istringstream input{"10.20.0.0/16\n"};
  auto               run = pipeline.run(input);
  REQUIRE(run.is_ok());
  auto const &stats = run.result();
  auto        c     = aggregator.counters();

  REQUIRE(stats.lines == 1);
  REQUIRE(stats.tasks == 65536);
  REQUIRE(c.total() == 65536);
  REQUIRE(c.matched == 32768);
  REQUIRE(c.valid == 32768);
  REQUIRE(sink.lines.size() == c.valid);

  std::set<std::string> written{sink.lines.begin(), sink.lines.end()};
  REQUIRE(written.size() == 32768);
  REQUIRE(written.count("10.20.0.0") == 1);
  REQUIRE(written.count("10.20.127.255") == 1);
  REQUIRE(written.count("10.20.128.0") == 0);
}

TEST_CASE("Run files", "[pipeline]")
{
  std::string in_path;
  std::string out_path;
  swoc::bwprint(in_path, "{}/cdnstrip_run_in.{}", swoc::file::temp_directory_path().c_str(), ::getpid());
  swoc::bwprint(out_path, "{}/cdnstrip_run_out.{}", swoc::file::temp_directory_path().c_str(), ::getpid());
  {
    std::ofstream f{out_path};
    f << "previous run\n";
  }

  SECTION("missing input leaves the output alone")
  {
    std::remove(in_path.c_str());
    FileSource source;
    FileSink   sink;
    auto       errata = open_run_files(source, in_path, sink, out_path);
    REQUIRE_FALSE(errata.is_ok());
    REQUIRE(sink.path().empty());

    std::ifstream f{out_path};
    std::string   line;
    REQUIRE(std::getline(f, line));
    REQUIRE(line == "previous run");
  }

  SECTION("input then output")
  {
    {
      std::ofstream f{in_path};
      f << "192.0.2.1\n";
    }
    FileSource source;
    FileSink   sink;
    REQUIRE(open_run_files(source, in_path, sink, out_path).is_ok());
    REQUIRE(source.path() == in_path);
    REQUIRE(sink.path() == out_path);

    std::string line;
    REQUIRE(std::getline(source.stream(), line));
    REQUIRE(line == "192.0.2.1");
  }

  std::remove(in_path.c_str());
  std::remove(out_path.c_str());
}
