/** @file

  Run-time diagnostics: notices, warnings, errors and tagged debug output.

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

  Diags.h

  This file contains code to manipulate run-time diagnostics, and print
  warnings and errors at runtime.  Debugging tags are supported, allowing
  run-time conditionals affecting diagnostics.

 ****************************************************************************/

#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "cdnstrip/SourceLocation.h"

#ifndef CDNSTRIP_USE_DIAGS
#define CDNSTRIP_USE_DIAGS 1
#endif

#if defined(__GNUC__)
#define CDNSTRIP_PRINTFLIKE(fmt, arg) __attribute__((format(printf, fmt, arg)))
#else
#define CDNSTRIP_PRINTFLIKE(fmt, arg)
#endif

#ifndef unlikely
#if defined(__GNUC__)
#define unlikely(x) __builtin_expect(!!(x), 0)
#else
#define unlikely(x) (x)
#endif
#endif

// Do not renumber, used as an array index and as @c swoc::Errata severities.
enum DiagsLevel {
  DL_Diag = 0,
  DL_Debug,
  DL_Status,
  DL_Note,
  DL_Warning,
  DL_Error,
  DL_Fatal,
  DL_Alert,
  DL_Emergency,
  DL_Undefined
};

#define DiagsLevel_Count DL_Undefined

#define DiagsLevel_IsTerminal(_l) (((_l) >= DL_Fatal) && ((_l) < DL_Undefined))

enum DiagsShowLocation { SHOW_LOCATION_NONE = 0, SHOW_LOCATION_DEBUG, SHOW_LOCATION_ALL };

/// Process exit status after a terminal diagnostic.
constexpr int DIAGS_FATAL_EXIT_STATUS = 1;

// Cleanup Function Prototype - Called before the process exits on a terminal
//   diagnostic to cleanup process state
using DiagsCleanupFunc = void (*)();

//////////////////////////////////////////////////////////////////////////////
//
//      class Diags
//
//      The Diags class is used for global configuration of the run-time
//      diagnostics system.  This class provides the following services:
//
//      * run-time notices, debugging, warnings, errors
//      * debugging tags to selectively enable & disable diagnostics
//      * a cleanup hook run before a terminal diagnostic exits
//
//////////////////////////////////////////////////////////////////////////////

class Diags
{
public:
  Diags(std::string_view prefix_string, const char *base_debug_tags, FILE *output = stderr);
  ~Diags();

  Diags(Diags const &)            = delete;
  Diags &operator=(Diags const &) = delete;

  DiagsShowLocation show_location = SHOW_LOCATION_DEBUG;
  DiagsCleanupFunc  cleanup_func  = nullptr;

  ///////////////////////////
  // conditional debugging //
  ///////////////////////////

  // Call this first before doing anything else for debug output, it is a
  // single flag read.
  bool
  on() const
  {
    return _debug_enabled.load(std::memory_order_relaxed);
  }

  // Returns true if tag is enabled.
  bool
  on(const char *tag) const
  {
    return unlikely(this->on()) && tag_activated(tag);
  }

  /// An activated tag matches every tag it is a prefix of.
  bool tag_activated(const char *tag) const;

  /////////////////////////////
  // raw printing interfaces //
  /////////////////////////////

  /// Print the log message without respect to whether the tag is enabled.
  void
  print(const char *tag, DiagsLevel level, const SourceLocation *loc, const char *fmt, ...) const CDNSTRIP_PRINTFLIKE(5, 6)
  {
    va_list ap;
    va_start(ap, fmt);
    print_va(tag, level, loc, fmt, ap);
    va_end(ap);
  }

  void print_va(const char *tag, DiagsLevel level, const SourceLocation *loc, const char *fmt, va_list ap) const;

  void
  error(DiagsLevel level, const SourceLocation *loc, const char *fmt, ...) const CDNSTRIP_PRINTFLIKE(4, 5)
  {
    va_list ap;
    va_start(ap, fmt);
    error_va(level, loc, fmt, ap);
    va_end(ap);
  }

  /// Terminal levels run @c cleanup_func and then exit the process.
  void error_va(DiagsLevel level, const SourceLocation *loc, const char *fmt, va_list ap) const;

  /** Activate debug tags.
   *
   * @param taglist Tags separated by '|' or ','. An empty list disables debug output.
   */
  void activate_taglist(const char *taglist);

  void deactivate_all();

  const char *level_name(DiagsLevel dl) const;

  const std::string base_debug_tags; // internal copy of default debug tags

private:
  const std::string prefix_str;
  FILE             *_output;

  std::atomic<bool>        _debug_enabled{false};
  mutable std::mutex       _tag_table_lock; // prevents reconfig/read races
  std::vector<std::string> _activated_tags;
  mutable std::mutex       _output_lock;
};

class DiagsPtr
{
public:
  friend Diags *diags();
  static void   set(Diags *new_ptr);

private:
  static Diags *_diags_ptr;
};

inline Diags *
diags()
{
  return DiagsPtr::_diags_ptr;
}

// Debug output control for a single tag. Construct as a static or a member so
// the tag text outlives the control.
class DbgCtl
{
public:
  explicit DbgCtl(char const *tag) : _tag(tag) {}

  char const *
  tag() const
  {
    return _tag;
  }

  bool
  on() const
  {
    return diags()->tag_activated(_tag);
  }

private:
  char const *const _tag;
};

//////////////////////////////////////////////////////////////////////////
//                                                                      //
//      Macros                                                          //
//                                                                      //
//      The following are diagnostic macros that wrap up the compiler   //
//      __FILE__, __FUNCTION__, and __LINE__ macros into a location     //
//      at the call site and then invoke the diags instance with the    //
//      remaining arguments.                                            //
//                                                                      //
//////////////////////////////////////////////////////////////////////////

#define DiagsError(LEVEL, ...)                                         \
  do {                                                                 \
    static const SourceLocation DiagsError_loc = MakeSourceLocation(); \
    diags()->error(LEVEL, &DiagsError_loc, __VA_ARGS__);               \
  } while (false)

#define Note(...)    DiagsError(DL_Note, __VA_ARGS__)    // Log significant information
#define Warning(...) DiagsError(DL_Warning, __VA_ARGS__) // Log concerning information
#define Error(...)   DiagsError(DL_Error, __VA_ARGS__)   // Log operational failure
#define Fatal(...)   DiagsError(DL_Fatal, __VA_ARGS__)   // Log failure, cleanup and exit

#if CDNSTRIP_USE_DIAGS

// printf-like debug output.  First parameter must be an instance of DbgCtl.
//
#define Dbg(CTL, ...)                                                  \
  do {                                                                 \
    if (unlikely(diags()->on()) && (CTL).on()) {                       \
      static const SourceLocation Dbg_loc = MakeSourceLocation();      \
      diags()->print((CTL).tag(), DL_Debug, &Dbg_loc, __VA_ARGS__);    \
    }                                                                  \
  } while (false)

#else // CDNSTRIP_USE_DIAGS

#define Dbg(...)

#endif // CDNSTRIP_USE_DIAGS
