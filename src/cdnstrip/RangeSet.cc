/** @file

  Range literal parsing and the CDN range set.

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

#include <cctype>

#include "swoc/bwf_base.h"
#include "swoc/bwf_ip.h"

#include "cdnstrip/RangeSet.h"
#include "cdnstrip/Diags.h"

namespace cdnstrip
{
namespace
{
  DbgCtl dbg_ctl{"cdnstrip_ranges"};

  constexpr unsigned IP4_WIDTH = 32;
  constexpr unsigned IP6_WIDTH = 128;
} // namespace

std::optional<AddressRange>
AddressRange::parse(swoc::TextView text)
{
  text.trim_if(&isspace);
  swoc::TextView addr_text  = text;
  swoc::TextView width_text = addr_text.split_suffix_at('/');
  if (addr_text.empty() || width_text.empty()) {
    return {};
  }

  swoc::IPAddr addr;
  if (!addr.load(addr_text)) {
    return {};
  }

  swoc::TextView parsed;
  auto           width = swoc::svtou(width_text, &parsed, 10);
  if (parsed.size() != width_text.size() || width > (addr.is_ip4() ? IP4_WIDTH : IP6_WIDTH)) {
    return {};
  }

  AddressRange zret;
  if (!zret.range.load(text)) {
    return {};
  }
  zret.network = zret.range.min();
  zret.prefix  = static_cast<unsigned>(width);
  return zret;
}

std::string
AddressRange::literal() const
{
  std::string text;
  swoc::bwprint(text, "{}/{}", network, prefix);
  return text;
}

RangeSet::RangeSet(std::vector<std::string> const &literals)
{
  _ranges.reserve(literals.size());
  for (auto const &literal : literals) {
    if (auto range = AddressRange::parse(literal); range) {
      _index.mark(range->range);
      _ranges.push_back(std::move(*range));
    } else {
      ++_dropped;
      Dbg(dbg_ctl, "dropped malformed range literal '%s'", literal.c_str());
    }
  }
  Dbg(dbg_ctl, "loaded %zu ranges, %zu dropped", _ranges.size(), _dropped);
}

bool
RangeSet::contains(swoc::IPAddr const &addr) const
{
  return _index.contains(addr);
}

std::vector<std::string>
RangeSet::literals() const
{
  std::vector<std::string> zret;
  zret.reserve(_ranges.size());
  for (auto const &range : _ranges) {
    zret.push_back(range.literal());
  }
  return zret;
}

} // namespace cdnstrip
