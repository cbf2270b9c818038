/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Sequences the four stages of one verification run.
 **
 ** p4c -> P4_to_C -> clang -> KLEE, each consuming the artifact of the
 ** previous one inside a private working directory. A failure in one of
 ** the first three stages ends the run with an error report; the last
 ** stage always goes on to classification, even after a timeout.
 **
 **/

#pragma once

#include <string>
#include <vector>

#include "core/artifacts.h"
#include "core/classifier.h"
#include "core/report.h"
#include "core/run_config.h"
#include "core/stage.h"
#include "engines/stage_runner.h"
#include "utils/timestamp.h"

namespace assertp4 {

struct PipelineOutcome
{
  PipelineOutcome() : verification_ran(false), interrupt_signal(0) {}

  VerdictReport report;
  bool verification_ran;  ///< KLEE ran to exit or to its timeout
  int interrupt_signal;   ///< non-zero if a termination signal ended the run
  std::string work_dir;   ///< already removed when run() returns
  std::vector<Stage> stages_run;
  std::vector<std::string> log;  ///< one labelled entry per finished stage
};

/** Process exit status for an outcome: 0 once verification ran,
 *  1 for failures before that point
 */
int exit_code(const PipelineOutcome & outcome);

class Pipeline
{
 public:
  /** @param runner executes the stages; must outlive the pipeline
   *  @param config copied
   */
  Pipeline(StageRunner & runner, const RunConfig & config);

  Pipeline(StageRunner & runner,
           const RunConfig & config,
           const VerdictClassifier & classifier);

  ~Pipeline() {}

  /** Never throws for failures of the run itself; every failure becomes
   *  an error report. The working directory is gone when this returns.
   */
  PipelineOutcome run();

  /** The four stage descriptions for a given set of artifact paths */
  std::vector<StageSpec> stage_specs(const ArtifactSet & artifacts) const;

 protected:
  void run_stages(const std::string & work_dir, PipelineOutcome & outcome);

  void finish(const ClassifierInput & in, PipelineOutcome & outcome);

  void fail(const std::string & details, PipelineOutcome & outcome);

  StageRunner & runner_;
  RunConfig config_;
  VerdictClassifier classifier_;
  assertp4_time_stamp start_;
};

}  // namespace assertp4
