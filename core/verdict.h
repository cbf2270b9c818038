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

#include <iostream>
#include <string>

namespace assertp4 {

typedef enum
{
  UNKNOWN = -1,  ///< no violation found before the time budget ran out
  FALSE = 0,     ///< an assertion can be violated
  TRUE = 1,      ///< no assertion is violated in the explored state space
  ERROR = 2      ///< the program could not be processed
} Verdict;

/** @return the report spelling of r: "true", "false", "unknown" or "error" */
std::string to_string(Verdict r);

std::ostream & operator<<(std::ostream & o, Verdict r);

}  // namespace assertp4
