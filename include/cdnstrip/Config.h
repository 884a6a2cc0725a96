/** @file

  Run configuration: built-in defaults, the YAML configuration file,
  environment variables and command line options, in that precedence.

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

#include <string>
#include <string_view>
#include <vector>

#include "swoc/Errata.h"

#include "cdnstrip/ArgParser.h"
#include "cdnstrip/RangeSource.h"

namespace YAML
{
class Node;
}

namespace cdnstrip
{
struct Config {
  static constexpr unsigned MAX_THREADS     = 1024;
  static constexpr unsigned MAX_QUEUE_DEPTH = 1024;

  unsigned    threads     = 1; ///< Worker count.
  unsigned    queue_depth = 1; ///< Queue slots per worker.
  bool        ipv6        = false;
  bool        raw         = false;
  bool        progress    = true;
  std::string debug_tags;

  std::string input  = "-";
  std::string output = "-";

  std::string cache_path; ///< Empty for the default location.
  bool        skip_cache = false;

  bool                     builtin_ranges = true;
  std::vector<std::string> range_files;

  /// Load a YAML configuration file. Values present in the file replace the current ones.
  swoc::Errata load(std::string const &path);

  /// Parse YAML configuration text.
  swoc::Errata parse(std::string_view content);

  /** Apply environment variables and command line options from @a args.
   *
   * Command line values win over environment values.
   */
  swoc::Errata apply(Arguments const &args);

  /// @return The range cache location, the default one if none is configured.
  swoc::Rv<swoc::file::path> cache_file() const;

  /// @return The range providers in acquisition order.
  ProviderList providers() const;

private:
  swoc::Errata decode(YAML::Node const &root);
};

/// Replace a leading "~/" in @a path with the home directory of the current user.
std::string expand_home(std::string const &path);

} // namespace cdnstrip
