/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Description and result of one external tool invocation.
 **
 **
 **/

#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace assertp4 {

// The four pipeline stages, in execution order
enum Stage
{
  FRONTEND_COMPILE = 0,  ///< P4 source -> JSON intermediate representation
  IR_TRANSLATE,          ///< JSON -> C text on standard output
  NATIVE_COMPILE,        ///< C -> LLVM bitcode
  SYMBOLIC_EXECUTION     ///< bitcode -> KLEE output directory
};

enum StageStatus
{
  STAGE_OK = 0,     ///< exited with status zero
  STAGE_FAILED,     ///< exited non-zero or was killed by a signal
  STAGE_TIMED_OUT   ///< killed after exceeding its timeout
};

/** Immutable description of one stage.
 *  argv[0] is looked up on PATH.
 */
struct StageSpec
{
  Stage stage;
  std::vector<std::string> argv;
  std::string cwd;  ///< empty means inherit
  std::chrono::milliseconds timeout;
  /** files that must exist after a successful run */
  std::vector<std::string> expected_artifacts;
  /** if non-empty, the pipeline writes captured stdout to this file */
  std::string stdout_artifact;
};

struct StageResult
{
  StageResult() : status(STAGE_FAILED), exit_code(-1), duration(0) {}

  StageStatus status;
  int exit_code;  ///< -1 after a timeout, 128 + signo when killed
  std::string out;
  std::string err;
  std::chrono::milliseconds duration;

  bool ok() const { return status == STAGE_OK; }
  bool timed_out() const { return status == STAGE_TIMED_OUT; }

  /** standard output followed by standard error */
  std::string combined() const { return out + err; }
};

std::string to_string(Stage s);

std::string to_string(StageStatus s);

std::ostream & operator<<(std::ostream & o, Stage s);

std::ostream & operator<<(std::ostream & o, StageStatus s);

}  // namespace assertp4
