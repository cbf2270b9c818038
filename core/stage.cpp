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

#include "core/stage.h"

#include "utils/exceptions.h"

namespace assertp4 {

std::string to_string(Stage s)
{
  switch (s) {
    case FRONTEND_COMPILE: return "p4c";
    case IR_TRANSLATE: return "p4-to-c";
    case NATIVE_COMPILE: return "clang";
    case SYMBOLIC_EXECUTION: return "klee";
    default: throw AssertP4Exception("Unhandled stage");
  }
}

std::string to_string(StageStatus s)
{
  switch (s) {
    case STAGE_OK: return "ok";
    case STAGE_FAILED: return "failed";
    case STAGE_TIMED_OUT: return "timed out";
    default: throw AssertP4Exception("Unhandled stage status");
  }
}

std::ostream & operator<<(std::ostream & o, Stage s)
{
  o << to_string(s);
  return o;
}

std::ostream & operator<<(std::ostream & o, StageStatus s)
{
  o << to_string(s);
  return o;
}

}  // namespace assertp4
