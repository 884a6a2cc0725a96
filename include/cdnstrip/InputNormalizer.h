/** @file

  Turn raw input lines into classification tasks.

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

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "swoc/TextView.h"
#include "swoc/swoc_ip.h"

namespace cdnstrip
{
/** One candidate address awaiting a verdict.
 *
 * Every task expanded from the same input line shares that line's text.
 */
struct ClassificationTask {
  std::shared_ptr<std::string const> raw;  ///< Trimmed input line.
  std::optional<swoc::IPAddr>        addr; ///< Resolved address, if normalization succeeded.

  std::string const &
  raw_text() const
  {
    static std::string const empty;
    return raw ? *raw : empty;
  }

  /// @return Canonical text of the resolved address, empty if unresolved.
  std::string canonical() const;
};

class InputNormalizer
{
public:
  using Emitter     = std::function<void(ClassificationTask &&)>;
  using AddrVisitor = std::function<void(swoc::IPAddr const &)>;

  /// @a ipv6 enables classification of IPv6 addresses, they are discarded otherwise.
  explicit InputNormalizer(bool ipv6 = false) : _ipv6(ipv6) {}

  /** Normalize one input line.
   *
   * Each task is handed to @a emit as soon as it is produced, a CIDR block is
   * expanded one address at a time and never held in memory as a list.
   *
   * @return Number of tasks emitted.
   */
  size_t normalize(swoc::TextView line, Emitter const &emit) const;

  /** Extract the host of an @c http or @c https URL.
   *
   * Brackets around an IPv6 host, user information and the port are removed.
   *
   * @return The host, or nothing if @a url is not a parsable URL.
   */
  static std::optional<swoc::TextView> url_host(swoc::TextView url);

  /** Visit every address in @a range, network and broadcast addresses included.
   *
   * @return Number of addresses visited.
   */
  static size_t expand(swoc::IPRange const &range, AddrVisitor const &visit);

  bool
  ipv6() const
  {
    return _ipv6;
  }

private:
  bool _ipv6 = false;
};

} // namespace cdnstrip
