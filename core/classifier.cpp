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

#include "core/classifier.h"

#include <algorithm>
#include <utility>

#include "utils/exceptions.h"
#include "utils/logger.h"
#include "utils/str_util.h"

namespace assertp4 {

std::vector<VerdictRule> default_verdict_rules()
{
  std::vector<VerdictRule> rules;

  // evidence outranks a timeout or a bad exit status: a violation found
  // just before the budget expired is still a violation
  rules.push_back({ 1,
                    "violation",
                    [](const ClassifierInput & in) {
                      return StrContains(in.output, ASSERTION_FAIL_MARKER)
                             || StrContains(in.output, ABORT_FAILURE_MARKER)
                             || !in.evidence.empty();
                    },
                    FALSE });

  rules.push_back({ 2,
                    "timeout",
                    [](const ClassifierInput & in) { return in.timed_out; },
                    UNKNOWN });

  rules.push_back({ 3,
                    "completed",
                    [](const ClassifierInput & in) {
                      return StrContains(in.output, COMPLETION_MARKER)
                             && in.evidence.empty();
                    },
                    TRUE });

  rules.push_back({ 4,
                    "crashed",
                    [](const ClassifierInput & in) {
                      return in.exit_status != 0;
                    },
                    ERROR });

  rules.push_back({ 5,
                    "clean-exit",
                    [](const ClassifierInput &) { return true; },
                    TRUE });

  return rules;
}

VerdictClassifier::VerdictClassifier()
    : VerdictClassifier(default_verdict_rules())
{
}

VerdictClassifier::VerdictClassifier(std::vector<VerdictRule> rules)
    : rules_(std::move(rules))
{
  std::stable_sort(rules_.begin(),
                   rules_.end(),
                   [](const VerdictRule & a, const VerdictRule & b) {
                     return a.priority < b.priority;
                   });
  for (size_t i = 1; i < rules_.size(); ++i) {
    if (rules_[i - 1].priority == rules_[i].priority) {
      throw AssertP4Exception("Verdict rules " + rules_[i - 1].name + " and "
                              + rules_[i].name + " share priority "
                              + std::to_string(rules_[i].priority));
    }
  }
}

const VerdictRule & VerdictClassifier::deciding_rule(
    const ClassifierInput & in) const
{
  for (const auto & rule : rules_) {
    if (rule.applies(in)) {
      return rule;
    }
  }
  throw AssertP4Exception("No verdict rule applies");
}

Verdict VerdictClassifier::classify(const ClassifierInput & in) const
{
  const VerdictRule & rule = deciding_rule(in);
  logger.log(1,
             "Verdict {} from rule {} ({})",
             to_string(rule.verdict),
             rule.priority,
             rule.name);
  return rule.verdict;
}

}  // namespace assertp4
