/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Maps the outcome of the symbolic execution stage to a verdict.
 **
 ** The decision is an ordered table of rules. Rules are tried by
 ** ascending priority and the first one whose predicate holds decides.
 ** The default table is:
 **
 **   1  violation   failure marker in output, or any evidence  -> false
 **   2  timeout     the stage timed out                        -> unknown
 **   3  completed   "KLEE: done:" in output and no evidence    -> true
 **   4  crashed     non-zero exit status                       -> error
 **   5  clean-exit  anything else                              -> true
 **
 **/

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/verdict.h"

namespace assertp4 {

// markers printed by KLEE
const std::string ASSERTION_FAIL_MARKER = "ASSERTION FAIL";
const std::string ABORT_FAILURE_MARKER = "abort failure";
const std::string COMPLETION_MARKER = "KLEE: done:";

/** Everything the classifier looks at. */
struct ClassifierInput
{
  ClassifierInput() : timed_out(false), exit_status(0) {}

  std::string output;  ///< combined stdout+stderr of the KLEE stage
  bool timed_out;
  int exit_status;
  std::vector<std::string> evidence;  ///< contents of *.assert.err files
};

struct VerdictRule
{
  unsigned int priority;  ///< lower runs first
  std::string name;
  std::function<bool(const ClassifierInput &)> applies;
  Verdict verdict;
};

/** The rules described at the top of this file */
std::vector<VerdictRule> default_verdict_rules();

class VerdictClassifier
{
 public:
  VerdictClassifier();

  /** @param rules any order; sorted by priority on construction.
   *  Throws AssertP4Exception if two rules share a priority.
   */
  explicit VerdictClassifier(std::vector<VerdictRule> rules);

  Verdict classify(const ClassifierInput & in) const;

  /** The rule that decides in.
   *  Throws AssertP4Exception if no rule applies.
   */
  const VerdictRule & deciding_rule(const ClassifierInput & in) const;

  const std::vector<VerdictRule> & rules() const { return rules_; }

 protected:
  std::vector<VerdictRule> rules_;
};

}  // namespace assertp4
