/** @file

  Unit tests for range literal parsing and the range set.

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

#include <catch2/catch.hpp>

#include "cdnstrip/RangeSet.h"

using namespace cdnstrip;

namespace
{
swoc::IPAddr
addr(char const *text)
{
  swoc::IPAddr zret;
  REQUIRE(zret.load(text));
  return zret;
}
} // namespace

TEST_CASE("AddressRange parse", "[ranges]")
{
  SECTION("IPv4 literal")
  {
    auto r = AddressRange::parse("203.0.113.0/24");
    REQUIRE(r);
    REQUIRE(r->prefix == 24);
    REQUIRE(r->network == addr("203.0.113.0"));
    REQUIRE(r->literal() == "203.0.113.0/24");
    REQUIRE(r->contains(addr("203.0.113.255")));
    REQUIRE_FALSE(r->contains(addr("203.0.114.0")));
  }

  SECTION("surrounding whitespace")
  {
    auto r = AddressRange::parse("  198.51.100.0/25 \r");
    REQUIRE(r);
    REQUIRE(r->literal() == "198.51.100.0/25");
  }

  SECTION("single address block")
  {
    auto r = AddressRange::parse("192.0.2.7/32");
    REQUIRE(r);
    REQUIRE(r->contains(addr("192.0.2.7")));
    REQUIRE_FALSE(r->contains(addr("192.0.2.8")));
  }

  SECTION("IPv6 literal")
  {
    auto r = AddressRange::parse("2400:cb00::/32");
    REQUIRE(r);
    REQUIRE(r->prefix == 32);
    REQUIRE(r->contains(addr("2400:cb00:1::5")));
    REQUIRE_FALSE(r->contains(addr("2400:cb01::1")));
  }

  SECTION("malformed")
  {
    REQUIRE_FALSE(AddressRange::parse(""));
    REQUIRE_FALSE(AddressRange::parse("garbage"));
    REQUIRE_FALSE(AddressRange::parse("203.0.113.0"));
    REQUIRE_FALSE(AddressRange::parse("203.0.113.0/"));
    REQUIRE_FALSE(AddressRange::parse("/24"));
    REQUIRE_FALSE(AddressRange::parse("203.0.113.0/33"));
    REQUIRE_FALSE(AddressRange::parse("203.0.113.0/2x"));
    REQUIRE_FALSE(AddressRange::parse("2400:cb00::/129"));
  }
}

TEST_CASE("RangeSet membership", "[ranges]")
{
  RangeSet ranges{std::vector<std::string>{"203.0.113.0/24"}};

  REQUIRE(ranges.size() == 1);
  REQUIRE(ranges.ranges().front().prefix == 24);
  REQUIRE(ranges.contains(addr("203.0.113.5")));
  REQUIRE_FALSE(ranges.contains(addr("203.0.114.5")));
  REQUIRE_FALSE(ranges.contains(addr("2001:db8::1")));
}

TEST_CASE("RangeSet tolerates malformed literals", "[ranges]")
{
  RangeSet ranges{std::vector<std::string>{"198.51.100.0/24", "not a range", "10.0.0.0/99"}};

  REQUIRE(ranges.size() == 1);
  REQUIRE(ranges.dropped() == 2);
  REQUIRE(ranges.literals() == std::vector<std::string>{"198.51.100.0/24"});
  REQUIRE(ranges.contains(addr("198.51.100.200")));
}

TEST_CASE("RangeSet duplicates and overlaps", "[ranges]")
{
  RangeSet ranges{std::vector<std::string>{"10.0.0.0/8", "10.1.0.0/16", "10.0.0.0/8", "2a04:4e40::/32"}};

  REQUIRE(ranges.size() == 4);
  REQUIRE(ranges.contains(addr("10.1.2.3")));
  REQUIRE(ranges.contains(addr("10.255.255.255")));
  REQUIRE_FALSE(ranges.contains(addr("11.0.0.0")));
  REQUIRE(ranges.contains(addr("2a04:4e40::1")));
}

TEST_CASE("RangeSet empty", "[ranges]")
{
  RangeSet ranges;
  REQUIRE(ranges.empty());
  REQUIRE_FALSE(ranges.contains(addr("203.0.113.5")));
}
