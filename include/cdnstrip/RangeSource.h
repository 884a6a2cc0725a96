/** @file

  Where CDN ranges come from: providers, the local cache and the choice
  between them.

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
#include <string_view>
#include <vector>

#include "swoc/Errata.h"
#include "swoc/MemSpan.h"
#include "swoc/TextView.h"
#include "swoc/swoc_file.h"

#include "cdnstrip/RangeSet.h"

namespace cdnstrip
{
/// A source of range literals.
class RangeProvider
{
public:
  virtual ~RangeProvider() = default;

  virtual std::string name() const = 0;

  /** Append the range literals of this provider to @a literals.
   *
   * @return Errors if the provider could not deliver its ranges. Nothing is
   * appended in that case.
   */
  virtual swoc::Errata fetch(std::vector<std::string> &literals) const = 0;
};

using ProviderList = std::vector<std::unique_ptr<RangeProvider>>;

/// Published edge ranges of a well known provider, compiled in.
class BuiltinProvider : public RangeProvider
{
public:
  BuiltinProvider(std::string_view name, swoc::MemSpan<std::string_view const> literals) : _name(name), _literals(literals) {}

  std::string
  name() const override
  {
    return std::string{_name};
  }

  swoc::Errata fetch(std::vector<std::string> &literals) const override;

  /// @return A provider for each compiled in range table.
  static ProviderList all();

private:
  std::string_view                      _name;
  swoc::MemSpan<std::string_view const> _literals;
};

/** Range literals from a text file, one per line.
 *
 * Blank lines and lines starting with '#' are ignored. Any other line must be a
 * well formed literal, a malformed line fails the provider.
 */
class FileProvider : public RangeProvider
{
public:
  explicit FileProvider(swoc::file::path path) : _path(std::move(path)) {}

  std::string
  name() const override
  {
    return _path.string();
  }

  swoc::Errata fetch(std::vector<std::string> &literals) const override;

private:
  swoc::file::path _path;
};

/** Collect the literals of every provider, in order.
 *
 * Fails if any provider fails or if no literal was collected.
 */
swoc::Rv<std::vector<std::string>> acquire_ranges(ProviderList const &providers);

/// @return The home directory of the current user, from the password database or @c HOME.
swoc::Rv<std::string> home_directory();

/** The local copy of the last acquired range literals.
 *
 * The file holds one canonical literal per line with no trailing newline.
 */
class RangeCache
{
public:
  explicit RangeCache(swoc::file::path path) : _path(std::move(path)) {}

  /// @return $HOME/.config/cdnstrip.cache for the current user.
  static swoc::Rv<swoc::file::path> default_path();

  /** Read the cached lines.
   *
   * @return The lines, or nothing if the file is absent or unreadable.
   */
  std::optional<std::vector<std::string>> load() const;

  /** Replace the cache with @a literals, creating the parent directory if needed.
   */
  swoc::Errata persist(std::vector<std::string> const &literals) const;

  swoc::file::path const &
  path() const
  {
    return _path;
  }

private:
  swoc::file::path _path;
};

/** Build the range set from the cache.
 *
 * Malformed cache lines are dropped.
 *
 * @return The ranges, or nothing if the cache is absent or holds no valid range.
 */
std::optional<RangeSetPtr> try_load_cache(RangeCache const &cache);

/// Report the current startup phase, e.g. to the progress display.
using PhaseCallback = std::function<void(std::string_view)>;

/** Obtain the CDN ranges: the cache if usable, otherwise the providers.
 *
 * Freshly acquired ranges are written back to the cache. A failure to write
 * the cache is logged, it does not fail this call.
 *
 * @param cache The range cache.
 * @param skip_cache Do not read the cache, always acquire and rewrite it.
 * @param providers Sources used when the cache is not.
 * @param phase Optional phase reporting.
 */
swoc::Rv<RangeSetPtr> obtain_ranges(RangeCache const &cache, bool skip_cache, ProviderList const &providers,
                                    PhaseCallback const &phase = nullptr);

} // namespace cdnstrip
