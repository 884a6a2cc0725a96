/** @file

  Errata severities and reporting helpers bound to diagnostics levels.

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

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

#include "swoc/TextView.h"
#include "swoc/Errata.h"

#include "cdnstrip/Diags.h"

static constexpr swoc::Errata::Severity ERRATA_DIAG{DL_Diag};
static constexpr swoc::Errata::Severity ERRATA_DEBUG{DL_Debug};
static constexpr swoc::Errata::Severity ERRATA_STATUS{DL_Status};
static constexpr swoc::Errata::Severity ERRATA_NOTE{DL_Note};
static constexpr swoc::Errata::Severity ERRATA_WARN{DL_Warning};
static constexpr swoc::Errata::Severity ERRATA_ERROR{DL_Error};
static constexpr swoc::Errata::Severity ERRATA_FATAL{DL_Fatal};

inline DiagsLevel
diags_level_of(swoc::Errata::Severity s)
{
  return static_cast<DiagsLevel>(static_cast<int>(s));
}

namespace cdnstrip
{
inline std::error_code
make_errno_code()
{
  return {errno, std::system_category()};
}

inline std::error_code
make_errno_code(int err)
{
  return {err, std::system_category()};
}

/// Join the annotation texts of @a errata into a single line separated by "; ".
std::string errata_text(swoc::Errata const &errata);

/** Log every annotation of @a errata through diags at the annotation severity.
 *
 * @param errata Annotations to log.
 * @param floor Annotations without a severity, or below this level, are logged at this level.
 */
void log_errata(swoc::Errata const &errata, DiagsLevel floor = DL_Note);

/** Top level handler for a failed startup operation.
 *
 * Logs @a errata prefixed by @a operation and raises @c Fatal, which runs the
 * diags cleanup hook and terminates the process.
 */
void fatal_errata(std::string_view operation, swoc::Errata const &errata);

} // namespace cdnstrip
