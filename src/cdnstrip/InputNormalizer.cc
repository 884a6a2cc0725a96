/** @file

  Input line normalization: URL host extraction, address family filtering
  and CIDR expansion.

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
#include <cstring>

#include <netinet/in.h>

#include "swoc/bwf_base.h"
#include "swoc/bwf_ip.h"

#include "cdnstrip/InputNormalizer.h"
#include "cdnstrip/RangeSet.h"
#include "cdnstrip/Diags.h"

using swoc::TextView;

namespace cdnstrip
{
namespace
{
  DbgCtl dbg_ctl{"cdnstrip_input"};

  bool
  is_port(TextView text)
  {
    return text.find_if([](char c) { return !isdigit(static_cast<unsigned char>(c)); }) == TextView::npos;
  }

  // ::ffff:a.b.c.d is classified as the IPv4 address a.b.c.d.
  swoc::IPAddr
  unmapped(swoc::IPAddr const &addr)
  {
    if (addr.is_ip6()) {
      in6_addr a6 = addr.ip6().network_order();
      if (IN6_IS_ADDR_V4MAPPED(&a6)) {
        in_addr_t a4;
        memcpy(&a4, &a6.s6_addr[12], sizeof(a4));
        return swoc::IPAddr{swoc::IP4Addr{a4}};
      }
    }
    return addr;
  }
} // namespace

std::string
ClassificationTask::canonical() const
{
  std::string text;
  if (addr) {
    swoc::bwprint(text, "{}", *addr);
  }
  return text;
}

std::optional<TextView>
InputNormalizer::url_host(TextView url)
{
  auto scheme_end = url.find("://");
  if (scheme_end == TextView::npos) {
    return {};
  }

  TextView authority = url.substr(scheme_end + 3);
  authority          = authority.prefix(authority.find_first_of("/?#"));
  if (authority.find_if(&isspace) != TextView::npos) {
    return {};
  }
  // user information
  if (auto at = authority.rfind('@'); at != TextView::npos) {
    authority.remove_prefix(at + 1);
  }

  TextView host;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == TextView::npos) {
      return {};
    }
    host      = authority.substr(1, close - 1);
    auto tail = authority.substr(close + 1);
    if (!tail.empty() && (tail.front() != ':' || !is_port(tail.substr(1)))) {
      return {};
    }
  } else {
    host = authority;
    if (auto colon = host.rfind(':'); colon != TextView::npos) {
      if (!is_port(host.substr(colon + 1))) {
        return {};
      }
      host = host.prefix(colon);
    }
  }
  return host;
}

size_t
InputNormalizer::expand(swoc::IPRange const &range, AddrVisitor const &visit)
{
  size_t n = 0;
  if (range.is_ip4()) {
    auto const &r = range.ip4();
    for (swoc::IP4Addr addr = r.min();; ++addr) {
      visit(swoc::IPAddr{addr});
      ++n;
      if (addr == r.max()) {
        break;
      }
    }
  } else if (range.is_ip6()) {
    auto const &r = range.ip6();
    for (swoc::IP6Addr addr = r.min();; ++addr) {
      visit(swoc::IPAddr{addr});
      ++n;
      if (addr == r.max()) {
        break;
      }
    }
  }
  return n;
}

size_t
InputNormalizer::normalize(TextView line, Emitter const &emit) const
{
  line.trim_if(&isspace);
  if (line.empty()) {
    return 0;
  }

  TextView token = line;
  if (line.starts_with("http")) {
    if (auto host = url_host(line); host) {
      token = *host;
    } else {
      Dbg(dbg_ctl, "'%.*s' is not a parsable URL, using the line", static_cast<int>(line.size()), line.data());
    }
  }

  if (!_ipv6 && token.find(':') != TextView::npos) {
    Dbg(dbg_ctl, "skipped IPv6 '%.*s'", static_cast<int>(token.size()), token.data());
    return 0;
  }

  auto raw = std::make_shared<std::string const>(line);

  if (swoc::IPAddr addr; addr.load(token)) {
    emit(ClassificationTask{raw, unmapped(addr)});
    return 1;
  }

  if (token.find('/') != TextView::npos) {
    if (auto block = AddressRange::parse(token); block) {
      return expand(block->range, [&](swoc::IPAddr const &addr) { emit(ClassificationTask{raw, unmapped(addr)}); });
    }
  }

  Dbg(dbg_ctl, "dropped '%.*s', not an address or CIDR block", static_cast<int>(token.size()), token.data());
  return 0;
}

} // namespace cdnstrip
