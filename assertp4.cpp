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

#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "core/report.h"
#include "engines/pipeline.h"
#include "engines/stage_runner.h"
#include "options/options.h"
#include "printers/json_report_printer.h"
#include "utils/exceptions.h"
#include "utils/logger.h"
#include "utils/signals.h"
#include "utils/timestamp.h"

using namespace assertp4;
using namespace std;

int main(int argc, char ** argv)
{
  auto begin_time_stamp = timestamp();

  AssertP4Options options;
  OptionsStatus status = options.parse_and_set_options(argc, argv);
  if (status == OPTIONS_EXIT) return 0;
  if (status == OPTIONS_USAGE_ERROR) {
    print_error_document(options.error_message_, cerr);
    return 1;
  }

  // set logger verbosity -- can only be set once
  logger.set_verbosity(options.verbosity_);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(options.source_file_, ec)) {
    print_error_document("P4 file not found: " + options.source_file_, cout);
    return 1;
  }

  PipelineOutcome outcome;
  try {
    // Termination signals are only recorded; the stage runner reacts to
    // them so the working directory is removed before we go down.
    install_interrupt_handlers();

    ProcessStageRunner runner;
    Pipeline pipeline(runner, options.run_config());
    outcome = pipeline.run();
  }
  catch (std::exception & e) {
    outcome.report.verdict = ERROR;
    outcome.report.time_ms =
        time_duration_to_ms(timestamp_diff(begin_time_stamp, timestamp()));
    outcome.report.details = e.what();
  }

  print_report(outcome.report, cout);

  logger.log(1,
             "assertp4 wall clock time (s): {}",
             time_duration_to_sec_string(
                 timestamp_diff(begin_time_stamp, timestamp())));

  if (outcome.interrupt_signal != 0) {
    cout.flush();
    reraise_interrupt(outcome.interrupt_signal);
  }

  return exit_code(outcome);
}
