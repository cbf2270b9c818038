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

#include "core/verdict.h"

#include "utils/exceptions.h"

namespace assertp4 {

std::string to_string(Verdict r)
{
  if (r == TRUE) {
    return "true";
  } else if (r == FALSE) {
    return "false";
  } else if (r == UNKNOWN) {
    return "unknown";
  } else if (r == ERROR) {
    return "error";
  } else {
    throw AssertP4Exception("Unhandled verdict");
  }
}

std::ostream & operator<<(std::ostream & o, Verdict r)
{
  o << to_string(r);
  return o;
}

}  // namespace assertp4
