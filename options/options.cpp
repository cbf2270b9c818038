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

#include "options/options.h"

#include <climits>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "optionparser.h"
#include "utils/exceptions.h"
#include "utils/str_util.h"

#ifndef ASSERTP4_VERSION
#define ASSERTP4_VERSION "unknown"
#endif

using namespace std;

/************************************* Option Handling setup
 * *****************************************/
// from optionparser-1.7 examples -- example_arg.cc
enum optionIndex
{
  UNKNOWN_OPTION,
  HELP,
  VERSION,
  VERBOSITY,
  P4C,
  PYTHON,
  TRANSLATOR,
  TRANSLATOR_DIR,
  CLANG,
  KLEE,
  KLEE_SEARCH,
  P4C_TIMEOUT,
  TRANSLATE_TIMEOUT,
  CLANG_TIMEOUT,
  WORK_ROOT
};

// The checks stay silent: standard error carries only the JSON usage
// document when the command line is rejected.
struct Arg : public option::Arg
{
  static option::ArgStatus Numeric(const option::Option & option, bool)
  {
    if (option.arg != 0 && assertp4::StrIsDigits(option.arg)) {
      return option::ARG_OK;
    }
    return option::ARG_ILLEGAL;
  }

  static option::ArgStatus NonEmpty(const option::Option & option, bool)
  {
    if (option.arg != 0 && option.arg[0] != 0) return option::ARG_OK;
    return option::ARG_ILLEGAL;
  }
};

const option::Descriptor usage[] = {
  { UNKNOWN_OPTION,
    0,
    "",
    "",
    Arg::None,
    "USAGE: assertp4 [options] [run] <p4 file> [forwarding rules file] "
    "[timeout seconds]\n\n"
    "Checks the assertions of a P4 program with p4c, P4_to_C, clang and "
    "KLEE,\nand prints one JSON verdict document on standard output.\n\n"
    "Options:" },
  { HELP, 0, "", "help", Arg::None, "  --help \tPrint usage and exit." },
  { VERSION,
    0,
    "",
    "version",
    Arg::None,
    "  --version \tPrint version and exit." },
  { VERBOSITY,
    0,
    "v",
    "verbosity",
    Arg::Numeric,
    "  --verbosity, -v \tVerbosity for printing to stderr." },
  { P4C,
    0,
    "",
    "p4c",
    Arg::NonEmpty,
    "  --p4c <cmd> \tP4 front-end compiler (default: p4c-bm2-ss)." },
  { PYTHON,
    0,
    "",
    "python",
    Arg::NonEmpty,
    "  --python <cmd> \tInterpreter for the translator (default: python)." },
  { TRANSLATOR,
    0,
    "",
    "translator",
    Arg::NonEmpty,
    "  --translator <path> \tP4 JSON to C translator script "
    "(default: /assert-p4/src/P4_to_C.py)." },
  { TRANSLATOR_DIR,
    0,
    "",
    "translator-dir",
    Arg::NonEmpty,
    "  --translator-dir <dir> \tWorking directory of the translator "
    "(default: /assert-p4/src)." },
  { CLANG,
    0,
    "",
    "clang",
    Arg::NonEmpty,
    "  --clang <cmd> \tC to LLVM bitcode compiler (default: clang)." },
  { KLEE,
    0,
    "",
    "klee",
    Arg::NonEmpty,
    "  --klee <cmd> \tSymbolic execution engine (default: klee)." },
  { KLEE_SEARCH,
    0,
    "",
    "klee-search",
    Arg::NonEmpty,
    "  --klee-search <strategy> \tKLEE search heuristic (default: dfs)." },
  { P4C_TIMEOUT,
    0,
    "",
    "p4c-timeout",
    Arg::Numeric,
    "  --p4c-timeout <s> \tTimeout of the P4 compilation (default: 60)." },
  { TRANSLATE_TIMEOUT,
    0,
    "",
    "translate-timeout",
    Arg::Numeric,
    "  --translate-timeout <s> \tTimeout of the translation to C "
    "(default: 120)." },
  { CLANG_TIMEOUT,
    0,
    "",
    "clang-timeout",
    Arg::Numeric,
    "  --clang-timeout <s> \tTimeout of the bitcode compilation "
    "(default: 60)." },
  { WORK_ROOT,
    0,
    "",
    "work-root",
    Arg::NonEmpty,
    "  --work-root <dir> \tWhere the per-run working directory is created "
    "(default: $TMPDIR or /tmp)." },
  { 0, 0, 0, 0, 0, 0 }
};
/*********************************** end Option Handling setup
 * ***************************************/

namespace assertp4 {

namespace {

unsigned int to_seconds(const char * arg, const std::string & what)
{
  unsigned long v = std::stoul(arg);
  if (v > UINT_MAX / 1000) {
    throw AssertP4Exception(what + " is too large.");
  }
  return static_cast<unsigned int>(v);
}

unsigned int to_verbosity(const char * arg)
{
  unsigned long v = std::stoul(arg);
  if (v > UINT_MAX) {
    throw AssertP4Exception("Verbosity is too large.");
  }
  return static_cast<unsigned int>(v);
}

}  // namespace

OptionsStatus AssertP4Options::parse_and_set_options(int argc, char ** argv)
{
  argc -= (argc > 0);
  argv += (argc > 0);  // skip program name argv[0] if present
  // GNU mode: options may follow the positional arguments
  option::Stats stats(true, usage, argc, argv);
  std::vector<option::Option> options(stats.options_max);
  std::vector<option::Option> buffer(stats.buffer_max);
  option::Parser parse(true, usage, argc, argv, &options[0], &buffer[0]);

  error_message_ = USAGE_LINE;
  if (parse.error()) return OPTIONS_USAGE_ERROR;

  if (options[HELP]) {
    option::printUsage(cout, usage);
    // want to exit main at top-level
    return OPTIONS_EXIT;
  }

  if (options[VERSION]) {
    cout << ASSERTP4_VERSION << endl;
    return OPTIONS_EXIT;
  }

  if (options[UNKNOWN_OPTION]) {
    return OPTIONS_USAGE_ERROR;
  }

  std::vector<std::string> positional;
  for (int i = 0; i < parse.nonOptionsCount(); ++i) {
    positional.push_back(parse.nonOption(i));
  }
  // accept the "run <file>" spelling as well
  if (positional.size() >= 2 && positional[0] == "run") {
    positional.erase(positional.begin());
  }
  if (positional.empty() || positional.size() > 3) {
    return OPTIONS_USAGE_ERROR;
  }

  try {
    source_file_ = positional[0];
    if (positional.size() > 1 && !StrIsDigits(positional[1])) {
      rules_file_ = positional[1];
    }
    if (positional.size() > 1 && StrIsDigits(positional.back())) {
      timeout_s_ = to_seconds(positional.back().c_str(), "Timeout");
    }

    for (int i = 0; i < parse.optionsCount(); ++i) {
      option::Option & opt = buffer[i];
      switch (opt.index()) {
        case HELP:
        case VERSION:
          // not possible, because handled further above and exits the program
          break;
        case VERBOSITY: verbosity_ = to_verbosity(opt.arg); break;
        case P4C: tools_.p4c = opt.arg; break;
        case PYTHON: tools_.python = opt.arg; break;
        case TRANSLATOR: tools_.translator = opt.arg; break;
        case TRANSLATOR_DIR: tools_.translator_dir = opt.arg; break;
        case CLANG: tools_.clang = opt.arg; break;
        case KLEE: tools_.klee = opt.arg; break;
        case KLEE_SEARCH: tools_.klee_search = opt.arg; break;
        case P4C_TIMEOUT:
          tools_.p4c_timeout_s = to_seconds(opt.arg, "--p4c-timeout");
          break;
        case TRANSLATE_TIMEOUT:
          tools_.translate_timeout_s =
              to_seconds(opt.arg, "--translate-timeout");
          break;
        case CLANG_TIMEOUT:
          tools_.clang_timeout_s = to_seconds(opt.arg, "--clang-timeout");
          break;
        case WORK_ROOT: work_root_ = opt.arg; break;
        case UNKNOWN_OPTION:
          // not possible because rejected above
          break;
        default: throw AssertP4Exception("Unhandled option");
      }
    }
  }
  catch (AssertP4Exception & e) {
    error_message_ = std::string(e.what()) + " " + USAGE_LINE;
    return OPTIONS_USAGE_ERROR;
  }
  catch (std::out_of_range &) {
    return OPTIONS_USAGE_ERROR;
  }

  error_message_.clear();
  return OPTIONS_OK;
}

OptionsStatus AssertP4Options::parse_and_set_options(
    std::vector<std::string> & opts)
{
  // add one for dummy program name
  int size = opts.size() + 1;
  std::string progname("assertp4");
  std::vector<char *> cstrings({ &progname[0] });
  cstrings.reserve(size);
  for (auto & o : opts) {
    cstrings.push_back(&o[0]);
  }
  return parse_and_set_options(size, cstrings.data());
}

RunConfig AssertP4Options::run_config() const
{
  RunConfig config;
  config.source_file = source_file_;
  config.rules_file = rules_file_;
  config.timeout_s = timeout_s_;
  config.work_root = work_root_;
  config.tools = tools_;
  return config;
}

}  // namespace assertp4
