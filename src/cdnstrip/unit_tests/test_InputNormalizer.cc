/** @file

  Unit tests for input line normalization.

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

#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "cdnstrip/Classifier.h"
#include "cdnstrip/InputNormalizer.h"

using namespace cdnstrip;

namespace
{
std::vector<ClassificationTask>
normalize(InputNormalizer const &normalizer, swoc::TextView line)
{
  std::vector<ClassificationTask> tasks;
  auto n = normalizer.normalize(line, [&](ClassificationTask &&task) { tasks.push_back(std::move(task)); });
  REQUIRE(n == tasks.size());
  return tasks;
}

std::vector<std::string>
canonical(std::vector<ClassificationTask> const &tasks)
{
  std::vector<std::string> zret;
  for (auto const &task : tasks) {
    zret.push_back(task.canonical());
  }
  return zret;
}
} // namespace

TEST_CASE("Normalize literal addresses", "[input]")
{
  InputNormalizer normalizer;

  auto tasks = normalize(normalizer, "  203.0.113.5 \r");
  REQUIRE(tasks.size() == 1);
  REQUIRE(tasks[0].addr);
  REQUIRE(tasks[0].canonical() == "203.0.113.5");
  REQUIRE(tasks[0].raw_text() == "203.0.113.5");

  REQUIRE(normalize(normalizer, "").empty());
  REQUIRE(normalize(normalizer, "   \t").empty());
  REQUIRE(normalize(normalizer, "example.com").empty());
  REQUIRE(normalize(normalizer, "300.1.1.1").empty());
}

TEST_CASE("Normalize CIDR blocks", "[input]")
{
  InputNormalizer normalizer;

  SECTION("expansion is complete")
  {
    auto tasks = normalize(normalizer, "192.168.0.0/30");
    REQUIRE(canonical(tasks) == std::vector<std::string>{"192.168.0.0", "192.168.0.1", "192.168.0.2", "192.168.0.3"});
    // every task of a block shares the original line
    for (auto const &task : tasks) {
      REQUIRE(task.raw.get() == tasks[0].raw.get());
      REQUIRE(task.raw_text() == "192.168.0.0/30");
    }
  }

  SECTION("single address block")
  {
    REQUIRE(canonical(normalize(normalizer, "10.9.8.7/32")) == std::vector<std::string>{"10.9.8.7"});
  }

  SECTION("malformed block")
  {
    REQUIRE(normalize(normalizer, "10.0.0.0/33").empty());
    REQUIRE(normalize(normalizer, "10.0.0.0/abc").empty());
  }
}

TEST_CASE("Normalize IPv6", "[input]")
{
  SECTION("suppressed by default")
  {
    InputNormalizer normalizer;
    REQUIRE(normalize(normalizer, "2001:db8::1").empty());
    REQUIRE(normalize(normalizer, "2001:db8::/126").empty());
    REQUIRE(normalize(normalizer, "http://[2001:db8::1]/").empty());
  }

  SECTION("enabled")
  {
    InputNormalizer normalizer{true};
    REQUIRE(normalizer.ipv6());
    auto tasks = normalize(normalizer, "2001:db8::1");
    REQUIRE(tasks.size() == 1);
    REQUIRE(tasks[0].addr->is_ip6());

    REQUIRE(normalize(normalizer, "2001:db8::/126").size() == 4);
    REQUIRE(normalize(normalizer, "http://[2001:db8::1]:8443/").size() == 1);
  }

  SECTION("IPv4-mapped addresses are IPv4")
  {
    InputNormalizer normalizer{true};
    RangeSet        ranges{std::vector<std::string>{"203.0.113.0/24"}};

    auto tasks = normalize(normalizer, "::ffff:203.0.113.5");
    REQUIRE(tasks.size() == 1);
    REQUIRE(tasks[0].addr->is_ip4());
    REQUIRE(tasks[0].canonical() == "203.0.113.5");
    REQUIRE(tasks[0].raw_text() == "::ffff:203.0.113.5");
    REQUIRE(classify(tasks[0], ranges) == Verdict::MatchesRange);

    REQUIRE(classify(normalize(normalizer, "::ffff:198.51.100.1")[0], ranges) == Verdict::NoMatch);
  }
}

TEST_CASE("URL host extraction", "[input]")
{
  auto host = InputNormalizer::url_host("http://example.com/path");
  REQUIRE(host);
  REQUIRE(*host == "example.com");

  REQUIRE(*InputNormalizer::url_host("https://user:pw@203.0.113.9:8080/x?y") == "203.0.113.9");
  REQUIRE(*InputNormalizer::url_host("https://203.0.113.9?q=1") == "203.0.113.9");
  REQUIRE(*InputNormalizer::url_host("http://[2001:db8::1]:80/") == "2001:db8::1");
  REQUIRE_FALSE(InputNormalizer::url_host("http:/example.com"));
  REQUIRE_FALSE(InputNormalizer::url_host("http://example.com:port/"));
  REQUIRE_FALSE(InputNormalizer::url_host("http://[2001:db8::1/"));
}

TEST_CASE("Normalize URLs", "[input]")
{
  InputNormalizer normalizer;

  // a host name is not an address
  REQUIRE(normalize(normalizer, "http://example.com/path").empty());

  auto tasks = normalize(normalizer, "https://198.51.100.7:8443/login");
  REQUIRE(tasks.size() == 1);
  REQUIRE(tasks[0].canonical() == "198.51.100.7");
  REQUIRE(tasks[0].raw_text() == "https://198.51.100.7:8443/login");

  REQUIRE(normalize(normalizer, "http://198.51.100.0/31").size() == 1);
}

TEST_CASE("Expand ranges", "[input]")
{
  swoc::IPRange range;
  REQUIRE(range.load("198.51.100.254-198.51.100.255"));

  std::vector<swoc::IPAddr> seen;
  auto n = InputNormalizer::expand(range, [&](swoc::IPAddr const &addr) { seen.push_back(addr); });
  REQUIRE(n == 2);
  REQUIRE(seen.size() == 2);

  swoc::IPAddr last;
  REQUIRE(last.load("198.51.100.255"));
  REQUIRE(seen.back() == last);

  REQUIRE(InputNormalizer::expand(swoc::IPRange{}, [&](swoc::IPAddr const &) { FAIL("empty range visited"); }) == 0);
}
