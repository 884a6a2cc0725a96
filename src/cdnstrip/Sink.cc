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

#include <cerrno>
#include <cstring>
#include <iostream>

#include "cdnstrip/Sink.h"
#include "cdnstrip/ErrataUtil.h"

namespace cdnstrip
{
void
Sink::write(ClassificationTask const &task)
{
  bool ok;
  if (_mode == OutputMode::Raw) {
    ok = this->write_line(task.raw_text());
  } else {
    ok = this->write_line(task.canonical());
  }
  if (!ok && !_failed) {
    _failed = true;
    Error("output write failed: %s", strerror(errno));
  }
}

void
Sink::flush()
{
  if (!this->flush_output() && !_failed) {
    _failed = true;
    Error("output flush failed: %s", strerror(errno));
  }
}

FileSink::~FileSink()
{
  if (_fp) {
    fflush(_fp);
    if (_owned) {
      fclose(_fp);
    }
  }
}

swoc::Errata
FileSink::open(std::string const &path)
{
  _path = path;
  if (path == "-") {
    _fp    = stdout;
    _owned = false;
    return {};
  }
  _fp = fopen(path.c_str(), "w");
  if (_fp == nullptr) {
    return swoc::Errata(make_errno_code(), ERRATA_ERROR, "unable to open output file '{}'", path);
  }
  _owned = true;
  return {};
}

bool
FileSink::flush_output()
{
  return _fp == nullptr || fflush(_fp) == 0;
}

bool
FileSink::write_line(std::string_view line)
{
  if (_fp == nullptr) {
    return false;
  }
  if (fwrite(line.data(), 1, line.size(), _fp) != line.size()) {
    return false;
  }
  return fputc('\n', _fp) != EOF;
}

swoc::Errata
FileSource::open(std::string const &path)
{
  _path = path;
  if (path == "-") {
    return {};
  }
  _file.open(path);
  if (!_file.is_open()) {
    return swoc::Errata(make_errno_code(), ERRATA_ERROR, "unable to open input file '{}'", path);
  }
  return {};
}

std::istream &
FileSource::stream()
{
  if (_file.is_open()) {
    return _file;
  }
  return std::cin;
}

swoc::Errata
open_run_files(FileSource &source, std::string const &input, FileSink &sink, std::string const &output)
{
  if (auto errata = source.open(input); !errata.is_ok()) {
    return errata;
  }
  return sink.open(output);
}

} // namespace cdnstrip
