/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief
 **
 **
 **/

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/verdict.h"

namespace assertp4 {

/** Final result of one run.
 *  assertion_errors is printed only when it is non-empty.
 */
struct VerdictReport
{
  VerdictReport() : verdict(ERROR), time_ms(0) {}

  Verdict verdict;
  std::int64_t time_ms;
  std::string details;  ///< newline-joined stage logs, or the failure
  std::vector<std::string> assertion_errors;
};

}  // namespace assertp4
