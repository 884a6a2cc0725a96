/** @file

  Run-time diagnostics implementation.

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

/****************************************************************************

  Diags.cc

  This file contains code to manipulate run-time diagnostics, and print
  warnings and errors at runtime.  Debugging tags are supported, allowing
  run-time conditionals affecting diagnostics.

  Joe User should only need to use the macros at the bottom of Diags.h

 ****************************************************************************/

#include <algorithm>
#include <cctype>
#include <cinttypes>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <pthread.h>
#include <sys/time.h>

#include "swoc/TextView.h"

#include "cdnstrip/Diags.h"

Diags *DiagsPtr::_diags_ptr = nullptr;

void
DiagsPtr::set(Diags *new_ptr)
{
  _diags_ptr = new_ptr;
}

//////////////////////////////////////////////////////////////////////////////
//
//      Diags::Diags(prefix, bdt, output)
//
//      This is the constructor for the Diags class.  The constructor takes
//      a prefix printed on every line and a string called the "base debug
//      tags" (bdt).  If bdt is not NULL, and not "", debug output is
//      enabled for those tags.
//
//////////////////////////////////////////////////////////////////////////////

Diags::Diags(std::string_view prefix_string, const char *bdt, FILE *output)
  : base_debug_tags(bdt ? bdt : ""), prefix_str(prefix_string), _output(output ? output : stderr)
{
  if (!base_debug_tags.empty()) {
    activate_taglist(base_debug_tags.c_str());
  }
}

Diags::~Diags()
{
  deactivate_all();
}

//////////////////////////////////////////////////////////////////////////////
//
//      void Diags::print_va(...)
//
//      This is the lowest-level diagnostic printing routine, that does the
//      work of formatting and outputting diagnostic and error messages,
//      in the standard format.
//
//      This routine takes an optional <debug_tag>, which is printed in
//      parentheses if its value is not NULL.  It takes a <diags_level>,
//      which is converted to a prefix string.
//      print_va takes an optional source location structure pointer <loc>,
//      which can be NULL.  If <loc> is not NULL, the source code location
//      is converted to a string, and printed between angle brackets.
//      Finally, it takes a printf format string <format_string>, and a
//      va_list list of varargs.
//
//      The line is formatted completely before the output lock is taken,
//      one write per message.
//
//////////////////////////////////////////////////////////////////////////////

void
Diags::print_va(const char *debug_tag, DiagsLevel diags_level, const SourceLocation *loc, const char *format_string,
                va_list ap) const
{
  char   line_buf[2048];
  size_t n = 0;

  auto append = [&](int written) {
    if (written > 0) {
      n = std::min(n + static_cast<size_t>(written), sizeof(line_buf) - 1);
    }
  };

  //////////////////////////////////////////////////////
  // prepend timestamp, then the prefix and thread id //
  //////////////////////////////////////////////////////

  struct timeval tp;
  gettimeofday(&tp, nullptr);
  time_t    cur_clock = tp.tv_sec;
  struct tm tm_buf;
  localtime_r(&cur_clock, &tm_buf);

  char timestamp_buf[48];
  strftime(timestamp_buf, sizeof(timestamp_buf), "%b %d %H:%M:%S", &tm_buf);
  append(snprintf(line_buf + n, sizeof(line_buf) - n, "[%s.%03d] ", timestamp_buf, static_cast<int>(tp.tv_usec / 1000)));

  if (!prefix_str.empty()) {
    append(snprintf(line_buf + n, sizeof(line_buf) - n, "%s ", prefix_str.c_str()));
  }

  // add the thread id
  append(snprintf(line_buf + n, sizeof(line_buf) - n, "{0x%" PRIx64 "} ", static_cast<uint64_t>(pthread_self())));

  //////////////////////////////////////
  // start with the diag level prefix //
  //////////////////////////////////////

  append(snprintf(line_buf + n, sizeof(line_buf) - n, "%s: ", level_name(diags_level)));

  /////////////////////////////
  // append location, if any //
  /////////////////////////////

  if (loc && loc->valid()) {
    char buf[256];
    if (char const *lp = loc->str(buf, sizeof(buf)); lp) {
      append(snprintf(line_buf + n, sizeof(line_buf) - n, "<%s> ", lp));
    }
  }

  //////////////////////////
  // append debugging tag //
  //////////////////////////

  if (debug_tag) {
    append(snprintf(line_buf + n, sizeof(line_buf) - n, "(%s) ", debug_tag));
  }

  ////////////////////////////
  // and finally, the text  //
  ////////////////////////////

  va_list tmp;
  va_copy(tmp, ap);
  append(vsnprintf(line_buf + n, sizeof(line_buf) - n, format_string, tmp));
  va_end(tmp);

  if (n == 0 || line_buf[n - 1] != '\n') {
    if (n >= sizeof(line_buf) - 1) {
      n = sizeof(line_buf) - 2;
    }
    line_buf[n++] = '\n';
  }
  line_buf[n] = '\0';

  std::lock_guard<std::mutex> lock(_output_lock);
  fputs(line_buf, _output);
  fflush(_output);
}

void
Diags::error_va(DiagsLevel level, const SourceLocation *loc, const char *format_string, va_list ap) const
{
  bool const with_location = show_location == SHOW_LOCATION_ALL || (show_location == SHOW_LOCATION_DEBUG && level <= DL_Debug);

  print_va(nullptr, level, with_location ? loc : nullptr, format_string, ap);

  if (DiagsLevel_IsTerminal(level)) {
    if (cleanup_func) {
      cleanup_func();
    }
    ::exit(DIAGS_FATAL_EXIT_STATUS);
  }
}

//////////////////////////////////////////////////////////////////////////////
//
//      bool Diags::tag_activated(char * tag)
//
//      This routine inquires if a particular <tag> in the tag table is
//      activated, returning true if it is, false if it isn't.  If <tag> is
//      NULL, true is returned.  The call uses a lock to get atomic access
//      to the tag table.
//
//////////////////////////////////////////////////////////////////////////////

bool
Diags::tag_activated(const char *tag) const
{
  if (tag == nullptr) {
    return true;
  }

  std::string_view const      name{tag};
  std::lock_guard<std::mutex> lock(_tag_table_lock);
  for (auto const &active : _activated_tags) {
    if (name.substr(0, active.size()) == active) {
      return true;
    }
  }
  return false;
}

//////////////////////////////////////////////////////////////////////////////
//
//      void Diags::activate_taglist(char * taglist)
//
//      This routine replaces the tag table with the tags in the vertical-bar
//      or comma separated taglist.  The replacement is done under a lock.
//      If <taglist> is NULL, this routine exits immediately.
//
//////////////////////////////////////////////////////////////////////////////

void
Diags::activate_taglist(const char *taglist)
{
  if (taglist == nullptr) {
    return;
  }

  std::vector<std::string> tags;
  swoc::TextView           src{taglist, strlen(taglist)};
  while (src) {
    auto token = src.take_prefix_if([](char c) { return c == '|' || c == ','; }).trim_if(&isspace);
    if (!token.empty()) {
      tags.emplace_back(token);
    }
  }

  std::lock_guard<std::mutex> lock(_tag_table_lock);
  _activated_tags = std::move(tags);
  _debug_enabled.store(!_activated_tags.empty(), std::memory_order_relaxed);
}

//////////////////////////////////////////////////////////////////////////////
//
//      void Diags::deactivate_all()
//
//      This routine deactivates all tags in the tag table.  The deactivation
//      is done under a lock.  When done, the taglist will be empty.
//
//////////////////////////////////////////////////////////////////////////////

void
Diags::deactivate_all()
{
  std::lock_guard<std::mutex> lock(_tag_table_lock);
  _activated_tags.clear();
  _debug_enabled.store(false, std::memory_order_relaxed);
}

//////////////////////////////////////////////////////////////////////////////
//
//      const char *Diags::level_name(DiagsLevel dl)
//
//      This routine returns a string name corresponding to the error
//      level <dl>, suitable for us as an output log entry prefix.
//
//////////////////////////////////////////////////////////////////////////////

const char *
Diags::level_name(DiagsLevel dl) const
{
  switch (dl) {
  case DL_Diag:
    return ("DIAG");
  case DL_Debug:
    return ("DEBUG");
  case DL_Status:
    return ("STATUS");
  case DL_Note:
    return ("NOTE");
  case DL_Warning:
    return ("WARNING");
  case DL_Error:
    return ("ERROR");
  case DL_Fatal:
    return ("FATAL");
  case DL_Alert:
    return ("ALERT");
  case DL_Emergency:
    return ("EMERGENCY");
  default:
    return ("DIAG");
  }
}
