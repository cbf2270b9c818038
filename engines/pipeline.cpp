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

#include "engines/pipeline.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "core/evidence.h"
#include "core/workdir.h"
#include "utils/exceptions.h"
#include "utils/logger.h"
#include "utils/signals.h"
#include "utils/str_util.h"

using namespace std::chrono;

namespace fs = std::filesystem;

namespace assertp4 {

namespace {

// how each stage shows up in the log and in error reports
struct StageMessages
{
  std::string log_label;
  std::string failure;  ///< followed by a newline and the stage output
  std::string timeout;
  std::string error;    ///< followed by the exception message
};

const StageMessages & stage_messages(Stage s)
{
  static const StageMessages p4c = { "=== P4C Compilation ===",
                                     "P4C compilation failed:",
                                     "P4C timeout",
                                     "P4C error: " };
  static const StageMessages translate = { "=== P4 to C Translation ===",
                                           "P4 to C translation failed:",
                                           "P4 to C translation timeout",
                                           "P4 to C translation error: " };
  static const StageMessages clang = { "=== Clang Compilation ===",
                                       "Clang compilation failed:",
                                       "Clang compilation timeout",
                                       "Clang error: " };
  // a KLEE failure is classified rather than reported, and its timeout
  // entry is a log label
  static const StageMessages klee = { "=== KLEE Execution ===",
                                      "",
                                      "=== KLEE Execution (Timeout) ===",
                                      "KLEE error: " };
  switch (s) {
    case FRONTEND_COMPILE: return p4c;
    case IR_TRANSLATE: return translate;
    case NATIVE_COMPILE: return clang;
    case SYMBOLIC_EXECUTION: return klee;
    default: throw AssertP4Exception("Unhandled stage");
  }
}

StageSpec make_spec(Stage stage,
                    const std::vector<std::string> & argv,
                    unsigned int timeout_s)
{
  StageSpec spec;
  spec.stage = stage;
  spec.argv = argv;
  spec.timeout = seconds(timeout_s);
  return spec;
}

void write_file(const std::string & path, const std::string & text)
{
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    throw AssertP4Exception("Cannot open " + path + " for writing");
  }
  out << text;
  out.close();
  if (!out) {
    throw AssertP4Exception("Failed to write " + path);
  }
}

std::string absolute_path(const std::string & p)
{
  std::error_code ec;
  fs::path abs = fs::absolute(p, ec);
  return ec ? p : abs.string();
}

}  // namespace

int exit_code(const PipelineOutcome & outcome)
{
  return outcome.verification_ran ? 0 : 1;
}

Pipeline::Pipeline(StageRunner & runner, const RunConfig & config)
    : Pipeline(runner, config, VerdictClassifier())
{
}

Pipeline::Pipeline(StageRunner & runner,
                   const RunConfig & config,
                   const VerdictClassifier & classifier)
    : runner_(runner),
      config_(config),
      classifier_(classifier),
      start_(timestamp())
{
}

std::vector<StageSpec> Pipeline::stage_specs(const ArtifactSet & a) const
{
  const ToolchainConfig & t = config_.tools;
  std::vector<StageSpec> specs;

  StageSpec p4c = make_spec(FRONTEND_COMPILE,
                            { t.p4c, config_.source_file, "--toJSON", a.ir_file },
                            t.p4c_timeout_s);
  p4c.expected_artifacts = { a.ir_file };
  specs.push_back(p4c);

  // the translator runs in its own directory, so hand it absolute paths
  std::vector<std::string> translate_argv = { t.python, t.translator, a.ir_file };
  if (!config_.rules_file.empty()) {
    std::error_code ec;
    if (fs::is_regular_file(config_.rules_file, ec)) {
      translate_argv.push_back(absolute_path(config_.rules_file));
    } else {
      logger.log(0,
                 "Warning: forwarding rules file {} not found, ignoring it",
                 config_.rules_file);
    }
  }
  StageSpec translate =
      make_spec(IR_TRANSLATE, translate_argv, t.translate_timeout_s);
  translate.cwd = t.translator_dir;
  translate.stdout_artifact = a.c_file;
  translate.expected_artifacts = { a.c_file };
  specs.push_back(translate);

  StageSpec clang = make_spec(
      NATIVE_COMPILE,
      { t.clang, "-emit-llvm", "-g", "-c", a.c_file, "-o", a.bitcode_file },
      t.clang_timeout_s);
  clang.expected_artifacts = { a.bitcode_file };
  specs.push_back(clang);

  // KLEE creates its output directory and refuses an existing one
  specs.push_back(make_spec(SYMBOLIC_EXECUTION,
                            { t.klee,
                              "--search=" + t.klee_search,
                              "--output-dir=" + a.klee_out_dir,
                              "--optimize",
                              a.bitcode_file },
                            config_.timeout_s));
  return specs;
}

PipelineOutcome Pipeline::run()
{
  PipelineOutcome outcome;
  start_ = timestamp();
  try {
    WorkDir work_dir(absolute_path(
        config_.work_root.empty() ? default_work_root() : config_.work_root));
    outcome.work_dir = work_dir.path();
    run_stages(work_dir.path(), outcome);
  }
  catch (InterruptedException & e) {
    // the working directory has been released by now
    outcome.interrupt_signal = e.signal_number();
    outcome.verification_ran = false;
    fail(e.what(), outcome);
  }
  catch (std::exception & e) {
    fail(e.what(), outcome);
  }
  if (logger.enabled(2)) {
    logger.log(2, "Stage log:\n{}", Join(outcome.log, "\n"));
  }
  return outcome;
}

void Pipeline::run_stages(const std::string & work_dir,
                          PipelineOutcome & outcome)
{
  const ArtifactSet artifacts = make_artifact_set(config_.source_file, work_dir);
  const std::vector<StageSpec> specs = stage_specs(artifacts);

  for (const StageSpec & spec : specs) {
    const StageMessages & msg = stage_messages(spec.stage);

    StageResult result;
    outcome.stages_run.push_back(spec.stage);
    try {
      result = runner_.run(spec);
    }
    catch (InterruptedException &) {
      throw;
    }
    catch (std::exception & e) {
      fail(msg.error + e.what(), outcome);
      return;
    }

    if (spec.stage == SYMBOLIC_EXECUTION) {
      const std::string output = result.combined();
      if (result.timed_out()) {
        std::string entry = msg.timeout + "\nTimeout after "
                            + std::to_string(config_.timeout_s) + "s";
        if (!output.empty()) {
          entry += "\n" + output;
        }
        outcome.log.push_back(entry);
      } else {
        outcome.log.push_back(msg.log_label + "\n" + output);
      }
      outcome.verification_ran = true;

      ClassifierInput in;
      in.output = output;
      in.timed_out = result.timed_out();
      in.exit_status = result.exit_code;
      in.evidence = scan_evidence(artifacts.klee_out_dir);
      finish(in, outcome);
      return;
    }

    // the translator's stdout is the C program, only its stderr is log
    const bool stdout_is_artifact = !spec.stdout_artifact.empty();
    const std::string output =
        stdout_is_artifact ? result.err : result.combined();
    outcome.log.push_back(msg.log_label + "\n"
                          + (stdout_is_artifact ? "stderr: " : "") + output);

    if (result.timed_out()) {
      fail(msg.timeout, outcome);
      return;
    }
    if (!result.ok()) {
      fail(msg.failure + "\n" + output, outcome);
      return;
    }

    if (stdout_is_artifact) {
      try {
        write_file(spec.stdout_artifact, result.out);
      }
      catch (AssertP4Exception & e) {
        fail(msg.error + e.what(), outcome);
        return;
      }
    }

    for (const auto & artifact : spec.expected_artifacts) {
      std::error_code ec;
      if (!fs::is_regular_file(artifact, ec)) {
        logger.log(1, "{} did not produce {}", to_string(spec.stage), artifact);
        fail(msg.failure + "\n" + output, outcome);
        return;
      }
    }
  }
}

void Pipeline::finish(const ClassifierInput & in, PipelineOutcome & outcome)
{
  VerdictReport & report = outcome.report;
  report.verdict = classifier_.classify(in);
  report.time_ms = time_duration_to_ms(timestamp_diff(start_, timestamp()));
  report.details = Join(outcome.log, "\n");
  report.assertion_errors = in.evidence;
}

void Pipeline::fail(const std::string & details, PipelineOutcome & outcome)
{
  VerdictReport & report = outcome.report;
  report.verdict = ERROR;
  report.time_ms = time_duration_to_ms(timestamp_diff(start_, timestamp()));
  report.details = details;
  report.assertion_errors.clear();
}

}  // namespace assertp4
