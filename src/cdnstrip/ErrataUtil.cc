/** @file

  Errata reporting through diags.

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

#include <algorithm>

#include "swoc/Errata.h"

#include "cdnstrip/ErrataUtil.h"

namespace cdnstrip
{
std::string
errata_text(swoc::Errata const &errata)
{
  std::string text;
  for (auto const &annotation : errata) {
    if (!text.empty()) {
      text += "; ";
    }
    text.append(annotation.text().data(), annotation.text().size());
  }
  if (auto const &code = errata.code(); code) {
    if (!text.empty()) {
      text += "; ";
    }
    text += code.message();
  }
  return text;
}

void
log_errata(swoc::Errata const &errata, DiagsLevel floor)
{
  static const SourceLocation loc = MakeSourceLocation();

  for (auto const &annotation : errata) {
    DiagsLevel level = floor;
    if (annotation.has_severity()) {
      level = std::max(floor, diags_level_of(annotation.severity()));
    }
    // Terminal levels are reserved for fatal_errata.
    level = std::min(level, DL_Error);
    diags()->error(level, &loc, "%.*s", static_cast<int>(annotation.text().size()), annotation.text().data());
  }
}

void
fatal_errata(std::string_view operation, swoc::Errata const &errata)
{
  std::string const text = errata_text(errata);
  Fatal("[%.*s] %s", static_cast<int>(operation.size()), operation.data(), text.empty() ? "failed" : text.c_str());
}

} // namespace cdnstrip
