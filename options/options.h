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
#include <vector>

#include "core/run_config.h"

namespace assertp4 {

const std::string USAGE_LINE =
    "Usage: assertp4 <p4_file> [forwarding_rules.txt] [timeout_seconds]";

enum OptionsStatus
{
  OPTIONS_OK = 0,       ///< options set, go ahead with the run
  OPTIONS_EXIT,         ///< help or version printed, exit successfully
  OPTIONS_USAGE_ERROR   ///< bad command line, see error_message_
};

/*************************************** Options class
 * ************************************************/

class AssertP4Options
{
 public:
  AssertP4Options()
      : verbosity_(default_verbosity_), timeout_s_(default_timeout_s_)
  {
  }

  ~AssertP4Options(){};

  /** Parse and set options given argc and argv from main
   *
   *  Positional arguments: [run] <p4_file> [rules_file] [timeout_seconds].
   *  The second one is the rules file unless it is all digits; the last
   *  one is the timeout if it is all digits.
   */
  OptionsStatus parse_and_set_options(int argc, char ** argv);

  /** Parse and set options given vector of options
   *  @param opts vector of command line options, without program name
   */
  OptionsStatus parse_and_set_options(std::vector<std::string> & opts);

  /** Configuration for one run built from the parsed options */
  RunConfig run_config() const;

  unsigned int verbosity_;
  std::string source_file_;
  std::string rules_file_;
  unsigned int timeout_s_;  ///< budget for the KLEE stage
  std::string work_root_;
  ToolchainConfig tools_;
  std::string error_message_;  ///< set on OPTIONS_USAGE_ERROR

 private:
  // Default options
  static const unsigned int default_verbosity_ = 0;
  static const unsigned int default_timeout_s_ = 300;
};

}  // namespace assertp4
