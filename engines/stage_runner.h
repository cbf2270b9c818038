/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Runs one stage as a child process.
 **
 **
 **/

#pragma once

#include <chrono>

#include "core/stage.h"

namespace assertp4 {

class StageRunner
{
 public:
  StageRunner() {}

  virtual ~StageRunner() {}

  /** Run spec to completion or until its timeout expires.
   *  A timeout is reported through the result, not by throwing.
   *  Throws AssertP4Exception if the process cannot be started and
   *  InterruptedException if a termination signal arrives meanwhile.
   */
  virtual StageResult run(const StageSpec & spec) = 0;
};

/** StageRunner backed by fork/exec.
 *
 *  The child gets /dev/null as stdin and two pipes for stdout and
 *  stderr, and leads its own process group. The parent multiplexes both
 *  pipes with poll() while watching the deadline, so a child that fills
 *  one pipe while the parent waits on the other cannot deadlock. On
 *  timeout the whole process group receives SIGKILL and whatever was
 *  captured so far is returned.
 */
class ProcessStageRunner : public StageRunner
{
 public:
  ProcessStageRunner();

  /** @param kill_grace how long to keep draining pipes after the
   *         process group was killed, in case an escaped descendant
   *         still holds them open
   */
  explicit ProcessStageRunner(std::chrono::milliseconds kill_grace);

  ~ProcessStageRunner() {}

  StageResult run(const StageSpec & spec) override;

 protected:
  std::chrono::milliseconds kill_grace_;
};

}  // namespace assertp4
