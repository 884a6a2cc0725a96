/** @file

  Output of addresses outside every CDN range.

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

#include <cstdio>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>

#include "swoc/Errata.h"

#include "cdnstrip/InputNormalizer.h"

namespace cdnstrip
{
enum class OutputMode {
  Canonical, ///< Write the resolved address.
  Raw,       ///< Write the original input line.
};

/** Destination for tasks with no CDN match.
 *
 * Callers serialize @c write, the sink does no locking of its own.
 */
class Sink
{
public:
  explicit Sink(OutputMode mode = OutputMode::Canonical) : _mode(mode) {}
  virtual ~Sink() = default;

  /// Write one newline terminated line for @a task in the configured mode.
  void write(ClassificationTask const &task);

  OutputMode
  mode() const
  {
    return _mode;
  }

  /// @return @c true if any write failed.
  bool
  failed() const
  {
    return _failed;
  }

  /// Push buffered output to the destination.
  void flush();

protected:
  /// Write @a line followed by a newline. @return @c false on failure.
  virtual bool write_line(std::string_view line) = 0;

  virtual bool
  flush_output()
  {
    return true;
  }

private:
  OutputMode _mode;
  bool       _failed = false;
};

/// A sink on a file or on standard output.
class FileSink : public Sink
{
  using self_type  = FileSink;
  using super_type = Sink;

public:
  explicit FileSink(OutputMode mode = OutputMode::Canonical) : super_type(mode) {}
  ~FileSink() override;

  FileSink(self_type const &)             = delete;
  self_type &operator=(self_type const &) = delete;

  /** Open the destination, "-" is standard output.
   *
   * A file is created or truncated.
   */
  swoc::Errata open(std::string const &path);

  std::string const &
  path() const
  {
    return _path;
  }

protected:
  bool write_line(std::string_view line) override;
  bool flush_output() override;

private:
  std::string _path;
  FILE       *_fp    = nullptr;
  bool        _owned = false;
};

/// The input of a run, a file or standard input.
class FileSource
{
public:
  /// Open @a path for reading, "-" is standard input.
  swoc::Errata open(std::string const &path);

  std::istream &stream();

  std::string const &
  path() const
  {
    return _path;
  }

private:
  std::string   _path;
  std::ifstream _file;
};

/** Open the input of a run and then its output.
 *
 * The output is not touched if the input cannot be opened.
 */
swoc::Errata open_run_files(FileSource &source, std::string const &input, FileSink &sink, std::string const &output);

} // namespace cdnstrip
