/** @file

  Run configuration loading.

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

#include <exception>
#include <set>

#include <yaml-cpp/yaml.h>

#include "swoc/TextView.h"

#include "cdnstrip/Config.h"
#include "cdnstrip/ErrataUtil.h"

namespace cdnstrip
{
namespace
{
  DbgCtl dbg_ctl{"cdnstrip_config"};

  constexpr char CFG_ROOT[]        = "cdnstrip";
  constexpr char CFG_THREADS[]     = "threads";
  constexpr char CFG_QUEUE_DEPTH[] = "queue_depth";
  constexpr char CFG_IPV6[]        = "ipv6";
  constexpr char CFG_RAW[]         = "raw";
  constexpr char CFG_PROGRESS[]    = "progress";
  constexpr char CFG_DEBUG_TAGS[]  = "debug_tags";
  constexpr char CFG_CACHE[]       = "cache";
  constexpr char CFG_PATH[]        = "path";
  constexpr char CFG_SKIP[]        = "skip";
  constexpr char CFG_RANGES[]      = "ranges";
  constexpr char CFG_BUILTIN[]     = "builtin";
  constexpr char CFG_FILES[]       = "files";

  const std::set<std::string> valid_config_keys = {CFG_THREADS,  CFG_QUEUE_DEPTH, CFG_IPV6,  CFG_RAW,
                                                   CFG_PROGRESS, CFG_DEBUG_TAGS,  CFG_CACHE, CFG_RANGES};
  const std::set<std::string> valid_cache_keys  = {CFG_PATH, CFG_SKIP};
  const std::set<std::string> valid_ranges_keys = {CFG_BUILTIN, CFG_FILES};

  void
  warn_unsupported_keys(YAML::Node const &node, std::set<std::string> const &valid, char const *section)
  {
    for (auto const &elem : node) {
      auto key = elem.first.as<std::string>();
      if (valid.find(key) == valid.end()) {
        Warning("unsupported key '%s' in %s configuration", key.c_str(), section);
      }
    }
  }

  unsigned
  positive_value(YAML::Node const &node, char const *name, unsigned max)
  {
    auto value = node.as<long long>();
    if (value < 1 || value > max) {
      throw YAML::ParserException(node.Mark(), std::string("\"") + name + "\" must be between 1 and " + std::to_string(max));
    }
    return static_cast<unsigned>(value);
  }

  YAML::Node
  section_node(YAML::Node const &node, char const *name)
  {
    YAML::Node section = node[name];
    if (!section.IsNull() && !section.IsMap()) {
      throw YAML::ParserException(section.Mark(), std::string("\"") + name + "\" must be a map");
    }
    return section;
  }

  // The command line value if the option was given, otherwise its environment value.
  std::string
  option_or_env(ArgumentData const &data)
  {
    if (data && data.size() > 0) {
      return data.value();
    }
    return data.env();
  }

  swoc::Errata
  parse_count(std::string const &text, char const *name, unsigned max, unsigned &out)
  {
    swoc::TextView src{text};
    swoc::TextView parsed;
    auto           value = swoc::svtou(src, &parsed, 10);
    if (src.empty() || parsed.size() != src.size() || value < 1 || value > max) {
      return swoc::Errata(ERRATA_ERROR, "invalid {} '{}', expected an integer from 1 to {}", name, text, max);
    }
    out = static_cast<unsigned>(value);
    return {};
  }
} // namespace

std::string
expand_home(std::string const &path)
{
  if (path == "~" || (path.size() > 1 && path[0] == '~' && path[1] == '/')) {
    if (auto home = home_directory(); home.is_ok()) {
      return home.result() + path.substr(1);
    }
  }
  return path;
}

swoc::Errata
Config::decode(YAML::Node const &root)
{
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap() || !root[CFG_ROOT]) {
    return swoc::Errata(ERRATA_ERROR, "expected a toplevel '{}' node", CFG_ROOT);
  }

  YAML::Node node = root[CFG_ROOT];
  if (node.IsNull()) {
    return {};
  }
  if (!node.IsMap()) {
    return swoc::Errata(ERRATA_ERROR, "'{}' must be a map", CFG_ROOT);
  }
  warn_unsupported_keys(node, valid_config_keys, CFG_ROOT);

  if (node[CFG_THREADS]) {
    threads = positive_value(node[CFG_THREADS], CFG_THREADS, MAX_THREADS);
  }
  if (node[CFG_QUEUE_DEPTH]) {
    queue_depth = positive_value(node[CFG_QUEUE_DEPTH], CFG_QUEUE_DEPTH, MAX_QUEUE_DEPTH);
  }
  if (node[CFG_IPV6]) {
    ipv6 = node[CFG_IPV6].as<bool>();
  }
  if (node[CFG_RAW]) {
    raw = node[CFG_RAW].as<bool>();
  }
  if (node[CFG_PROGRESS]) {
    progress = node[CFG_PROGRESS].as<bool>();
  }
  if (node[CFG_DEBUG_TAGS]) {
    debug_tags = node[CFG_DEBUG_TAGS].as<std::string>();
  }

  if (node[CFG_CACHE]) {
    YAML::Node cache = section_node(node, CFG_CACHE);
    if (cache.IsMap()) {
      warn_unsupported_keys(cache, valid_cache_keys, CFG_CACHE);
      if (cache[CFG_PATH]) {
        cache_path = cache[CFG_PATH].as<std::string>();
      }
      if (cache[CFG_SKIP]) {
        skip_cache = cache[CFG_SKIP].as<bool>();
      }
    }
  }

  if (node[CFG_RANGES]) {
    YAML::Node ranges = section_node(node, CFG_RANGES);
    if (ranges.IsMap()) {
      warn_unsupported_keys(ranges, valid_ranges_keys, CFG_RANGES);
      if (ranges[CFG_BUILTIN]) {
        builtin_ranges = ranges[CFG_BUILTIN].as<bool>();
      }
      if (YAML::Node files = ranges[CFG_FILES]; files) {
        if (files.IsSequence()) {
          for (auto const &file : files) {
            range_files.push_back(file.as<std::string>());
          }
        } else if (files.IsScalar()) {
          range_files.push_back(files.as<std::string>());
        } else if (!files.IsNull()) {
          throw YAML::ParserException(files.Mark(), std::string("\"") + CFG_FILES + "\" must be a sequence of file names");
        }
      }
    }
  }

  return {};
}

swoc::Errata
Config::parse(std::string_view content)
{
  try {
    return this->decode(YAML::Load(std::string{content}));
  } catch (std::exception &ex) {
    return swoc::Errata(ERRATA_ERROR, "invalid configuration: {}", ex.what());
  }
}

swoc::Errata
Config::load(std::string const &path)
{
  Dbg(dbg_ctl, "loading configuration from '%s'", path.c_str());
  try {
    return this->decode(YAML::LoadFile(path));
  } catch (std::exception &ex) {
    return swoc::Errata(ERRATA_ERROR, "configuration file '{}': {}", path, ex.what());
  }
}

swoc::Errata
Config::apply(Arguments const &args)
{
  if (auto text = option_or_env(args.get("threads")); !text.empty()) {
    if (auto errata = parse_count(text, "thread count", MAX_THREADS, threads); !errata.is_ok()) {
      return errata;
    }
  }
  if (auto data = args.get("input"); data.size() > 0) {
    input = data.value();
  }
  if (auto data = args.get("output"); data.size() > 0) {
    output = data.value();
  }
  if (args.get("raw")) {
    raw = true;
  }
  if (args.get("skip-cache")) {
    skip_cache = true;
  }
  if (args.get("ipv6")) {
    ipv6 = true;
  }
  if (args.get("quiet")) {
    progress = false;
  }
  if (auto data = args.get("debug-tags"); data && data.size() > 0) {
    debug_tags = data.value();
  }
  if (auto text = option_or_env(args.get("cache-file")); !text.empty()) {
    cache_path = text;
  }
  for (auto const &file : args.get("ranges")) {
    range_files.push_back(file);
  }

  if (input.empty()) {
    return swoc::Errata(ERRATA_ERROR, "an input file name is required, '-' for standard input");
  }
  if (output.empty()) {
    return swoc::Errata(ERRATA_ERROR, "an output file name is required, '-' for standard output");
  }
  Dbg(dbg_ctl, "threads=%u queue_depth=%u ipv6=%d raw=%d skip_cache=%d input='%s' output='%s'", threads, queue_depth, ipv6, raw,
      skip_cache, input.c_str(), output.c_str());
  return {};
}

swoc::Rv<swoc::file::path>
Config::cache_file() const
{
  if (cache_path.empty()) {
    return RangeCache::default_path();
  }
  return {swoc::file::path{expand_home(cache_path)}, swoc::Errata{}};
}

ProviderList
Config::providers() const
{
  ProviderList zret;
  if (builtin_ranges) {
    zret = BuiltinProvider::all();
  }
  for (auto const &file : range_files) {
    zret.emplace_back(std::make_unique<FileProvider>(swoc::file::path{expand_home(file)}));
  }
  return zret;
}

} // namespace cdnstrip
