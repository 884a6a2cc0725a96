/** @file

  CDN range providers, the range cache and the startup choice between them.

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
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iterator>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include "swoc/bwf_base.h"

#include "cdnstrip/RangeSource.h"
#include "cdnstrip/ErrataUtil.h"

using swoc::TextView;

namespace cdnstrip
{
namespace
{
  DbgCtl dbg_ctl{"cdnstrip_source"};

  // Published edge ranges.
  constexpr std::string_view CLOUDFLARE_RANGES[] = {
    "173.245.48.0/20", "103.21.244.0/22", "103.22.200.0/22", "103.31.4.0/22",   "141.101.64.0/18", "108.162.192.0/18",
    "190.93.240.0/20", "188.114.96.0/20", "197.234.240.0/22", "198.41.128.0/17", "162.158.0.0/15",  "104.16.0.0/13",
    "104.24.0.0/14",   "172.64.0.0/13",   "131.0.72.0/22",    "2400:cb00::/32",  "2606:4700::/32",  "2803:f800::/32",
    "2405:b500::/32",  "2405:8100::/32",  "2a06:98c0::/29",   "2c0f:f248::/32",
  };

  constexpr std::string_view FASTLY_RANGES[] = {
    "23.235.32.0/20",  "43.249.72.0/22",  "103.244.50.0/24", "103.245.222.0/23", "103.245.224.0/24", "104.156.80.0/20",
    "140.248.64.0/18", "140.248.128.0/17", "146.75.0.0/17",  "151.101.0.0/16",   "157.52.64.0/18",   "167.82.0.0/17",
    "167.82.128.0/20", "167.82.160.0/20", "167.82.224.0/20", "172.111.64.0/18",  "185.31.16.0/22",   "199.27.72.0/21",
    "199.232.0.0/16",  "2a04:4e40::/32",  "2a04:4e42::/32",
  };

  constexpr std::string_view INCAPSULA_RANGES[] = {
    "199.83.128.0/21", "198.143.32.0/19", "149.126.72.0/21", "103.28.248.0/22", "45.64.64.0/22",    "185.11.124.0/22",
    "192.230.64.0/18", "107.154.0.0/16",  "45.60.0.0/16",    "45.223.0.0/16",   "131.125.128.0/17", "2a02:e980::/29",
  };

  constexpr std::string_view SUCURI_RANGES[] = {
    "192.88.134.0/23", "185.93.228.0/22", "66.248.200.0/22", "208.109.0.0/22", "2a02:fe80::/29",
  };

  // Create @a dir and any missing parents.
  bool
  create_directory(std::string const &dir)
  {
    struct stat buffer;
    if (stat(dir.c_str(), &buffer) == 0) {
      return S_ISDIR(buffer.st_mode);
    }

    std::string s = dir;
    if (s.empty() || s.back() != '/') {
      s.push_back('/');
    }
    // create directory one layer by one layer
    for (size_t pos = s.find('/', 1); pos != std::string::npos; pos = s.find('/', pos + 1)) {
      if (mkdir(s.substr(0, pos).c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != 0 && errno != EEXIST) {
        return false;
      }
    }
    return true;
  }
} // namespace

swoc::Errata
BuiltinProvider::fetch(std::vector<std::string> &literals) const
{
  for (auto const &literal : _literals) {
    literals.emplace_back(literal);
  }
  return {};
}

ProviderList
BuiltinProvider::all()
{
  ProviderList zret;
  zret.emplace_back(std::make_unique<BuiltinProvider>("cloudflare", swoc::MemSpan<std::string_view const>{CLOUDFLARE_RANGES}));
  zret.emplace_back(std::make_unique<BuiltinProvider>("fastly", swoc::MemSpan<std::string_view const>{FASTLY_RANGES}));
  zret.emplace_back(std::make_unique<BuiltinProvider>("incapsula", swoc::MemSpan<std::string_view const>{INCAPSULA_RANGES}));
  zret.emplace_back(std::make_unique<BuiltinProvider>("sucuri", swoc::MemSpan<std::string_view const>{SUCURI_RANGES}));
  return zret;
}

swoc::Errata
FileProvider::fetch(std::vector<std::string> &literals) const
{
  std::error_code ec;
  std::string     content = swoc::file::load(_path, ec);
  if (ec) {
    return swoc::Errata(ec, ERRATA_ERROR, "unable to read range file '{}'", _path.c_str());
  }

  std::vector<std::string> found;
  TextView                 text{content};
  unsigned                 line_no = 0;
  while (text) {
    ++line_no;
    auto line = text.take_prefix_at('\n').trim_if(&isspace);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (!AddressRange::parse(line)) {
      return swoc::Errata(ERRATA_ERROR, "{}:{} malformed range literal '{}'", _path.c_str(), line_no, line);
    }
    found.emplace_back(line);
  }
  Dbg(dbg_ctl, "%zu ranges from '%s'", found.size(), _path.c_str());
  literals.insert(literals.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  return {};
}

swoc::Rv<std::vector<std::string>>
acquire_ranges(ProviderList const &providers)
{
  std::vector<std::string> literals;
  swoc::Errata             errata;
  bool                     failed = false;

  for (auto const &provider : providers) {
    std::vector<std::string> fetched;
    auto                     result = provider->fetch(fetched);
    if (!result.is_ok()) {
      failed = true;
      errata.note(result);
      errata.note(ERRATA_ERROR, "range provider '{}' failed", provider->name());
      continue;
    }
    Dbg(dbg_ctl, "provider '%s' supplied %zu ranges", provider->name().c_str(), fetched.size());
    literals.insert(literals.end(), std::make_move_iterator(fetched.begin()), std::make_move_iterator(fetched.end()));
  }

  if (failed) {
    return {std::vector<std::string>{}, std::move(errata)};
  }
  if (literals.empty()) {
    return {std::vector<std::string>{}, swoc::Errata(ERRATA_ERROR, "no CDN ranges were acquired")};
  }
  return {std::move(literals), std::move(errata)};
}

swoc::Rv<std::string>
home_directory()
{
  if (passwd const *pwd = getpwuid(geteuid()); pwd && pwd->pw_dir && *pwd->pw_dir) {
    return {std::string{pwd->pw_dir}, swoc::Errata{}};
  }
  if (char const *env = getenv("HOME"); env && *env) {
    return {std::string{env}, swoc::Errata{}};
  }
  return {std::string{}, swoc::Errata(ERRATA_ERROR, "unable to determine the home directory of the current user")};
}

swoc::Rv<swoc::file::path>
RangeCache::default_path()
{
  auto home = home_directory();
  if (!home.is_ok()) {
    return {swoc::file::path{}, std::move(home.errata())};
  }
  return {swoc::file::path{home.result()} / ".config" / "cdnstrip.cache", swoc::Errata{}};
}

std::optional<std::vector<std::string>>
RangeCache::load() const
{
  std::error_code ec;
  std::string     content = swoc::file::load(_path, ec);
  if (ec) {
    Dbg(dbg_ctl, "no usable cache at '%s': %s", _path.c_str(), ec.message().c_str());
    return {};
  }

  std::vector<std::string> lines;
  TextView                 text{content};
  while (text) {
    auto line = text.take_prefix_at('\n').trim_if(&isspace);
    if (!line.empty()) {
      lines.emplace_back(line);
    }
  }
  return lines;
}

swoc::Errata
RangeCache::persist(std::vector<std::string> const &literals) const
{
  auto parent = _path.parent_path();
  if (!parent.empty() && !create_directory(parent.string())) {
    return swoc::Errata(make_errno_code(), ERRATA_ERROR, "unable to create directory '{}'", parent.c_str());
  }

  FILE *fp = fopen(_path.c_str(), "w");
  if (fp == nullptr) {
    return swoc::Errata(make_errno_code(), ERRATA_ERROR, "unable to open cache file '{}'", _path.c_str());
  }

  bool ok = true;
  for (size_t i = 0; ok && i < literals.size(); ++i) {
    if (i != 0) {
      ok = fputc('\n', fp) != EOF;
    }
    ok = ok && fwrite(literals[i].data(), 1, literals[i].size(), fp) == literals[i].size();
  }
  int const write_errno = errno;
  if (fclose(fp) != 0) {
    ok = false;
  } else if (!ok) {
    errno = write_errno;
  }
  if (!ok) {
    return swoc::Errata(make_errno_code(), ERRATA_ERROR, "unable to write cache file '{}'", _path.c_str());
  }
  Dbg(dbg_ctl, "wrote %zu ranges to '%s'", literals.size(), _path.c_str());
  return {};
}

std::optional<RangeSetPtr>
try_load_cache(RangeCache const &cache)
{
  auto lines = cache.load();
  if (!lines) {
    return {};
  }
  auto ranges = std::make_shared<RangeSet const>(*lines);
  if (ranges->empty()) {
    Dbg(dbg_ctl, "cache '%s' holds no valid range", cache.path().c_str());
    return {};
  }
  if (ranges->dropped()) {
    Dbg(dbg_ctl, "cache '%s': %zu malformed lines dropped", cache.path().c_str(), ranges->dropped());
  }
  return RangeSetPtr{std::move(ranges)};
}

swoc::Rv<RangeSetPtr>
obtain_ranges(RangeCache const &cache, bool skip_cache, ProviderList const &providers, PhaseCallback const &phase)
{
  auto report = [&](std::string_view text) {
    if (phase) {
      phase(text);
    }
  };

  if (!skip_cache) {
    report("Loading cache file...");
    if (auto cached = try_load_cache(cache); cached) {
      Dbg(dbg_ctl, "using %zu cached ranges", (*cached)->size());
      return {std::move(*cached), swoc::Errata{}};
    }
  }

  report("Loading all CDN ranges...");
  auto acquired = acquire_ranges(providers);
  if (!acquired.is_ok()) {
    return {RangeSetPtr{}, std::move(acquired.errata())};
  }

  auto ranges = std::make_shared<RangeSet const>(acquired.result());
  if (ranges->empty()) {
    return {RangeSetPtr{}, swoc::Errata(ERRATA_ERROR, "no valid CDN range among {} acquired literals", acquired.result().size())};
  }

  report("Creating new cache file...");
  if (auto errata = cache.persist(ranges->literals()); !errata.is_ok()) {
    Warning("range cache '%s' not updated: %s", cache.path().c_str(), errata_text(errata).c_str());
  }
  return {RangeSetPtr{std::move(ranges)}, swoc::Errata{}};
}

} // namespace cdnstrip
