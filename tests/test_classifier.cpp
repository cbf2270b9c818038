#include <string>
#include <vector>

#include "core/classifier.h"
#include "core/verdict.h"
#include "gtest/gtest.h"
#include "utils/exceptions.h"

using namespace assertp4;
using namespace std;

namespace assertp4_tests {

ClassifierInput make_input(const string & output,
                           bool timed_out = false,
                           int exit_status = 0,
                           const vector<string> & evidence = {})
{
  ClassifierInput in;
  in.output = output;
  in.timed_out = timed_out;
  in.exit_status = exit_status;
  in.evidence = evidence;
  return in;
}

class ClassifierUnitTests : public ::testing::Test
{
 protected:
  VerdictClassifier classifier;
};

TEST_F(ClassifierUnitTests, CompletedRunIsTrue)
{
  ClassifierInput in =
      make_input("KLEE: done: total instructions = 1024\n"
                 "KLEE: done: completed paths = 4\n");
  EXPECT_EQ(classifier.classify(in), TRUE);
  EXPECT_EQ(classifier.deciding_rule(in).name, "completed");
}

TEST_F(ClassifierUnitTests, AssertionFailMarkerIsFalse)
{
  ClassifierInput in = make_input(
      "KLEE: ERROR: model.c:88: ASSERTION FAIL: ipv4.ttl > 0\n"
      "KLEE: done: completed paths = 3\n");
  EXPECT_EQ(classifier.classify(in), FALSE);
}

TEST_F(ClassifierUnitTests, AbortFailureMarkerIsFalse)
{
  ClassifierInput in = make_input("KLEE: ERROR: abort failure\n");
  EXPECT_EQ(classifier.classify(in), FALSE);
}

TEST_F(ClassifierUnitTests, MarkersAreCaseSensitive)
{
  ClassifierInput in = make_input("assertion fail\nKLEE: done: ok\n");
  EXPECT_EQ(classifier.classify(in), TRUE);
}

TEST_F(ClassifierUnitTests, EvidenceAloneIsFalse)
{
  ClassifierInput in =
      make_input("KLEE: done: completed paths = 2\n", false, 0, { "Error: x" });
  EXPECT_EQ(classifier.classify(in), FALSE);
  EXPECT_EQ(classifier.deciding_rule(in).priority, 1u);
}

TEST_F(ClassifierUnitTests, TimeoutWithoutEvidenceIsUnknown)
{
  ClassifierInput in = make_input("KLEE: output directory is klee-out\n", true);
  EXPECT_EQ(classifier.classify(in), UNKNOWN);
}

TEST_F(ClassifierUnitTests, TimeoutBeatsCompletionMarker)
{
  ClassifierInput in = make_input("KLEE: done: partial\n", true, -1);
  EXPECT_EQ(classifier.classify(in), UNKNOWN);
}

TEST_F(ClassifierUnitTests, EvidenceBeatsTimeout)
{
  ClassifierInput in =
      make_input("", true, -1, { "Error: ASSERTION FAIL\nFile: model.c\n" });
  EXPECT_EQ(classifier.classify(in), FALSE);
}

TEST_F(ClassifierUnitTests, MarkerBeatsTimeout)
{
  ClassifierInput in = make_input("ASSERTION FAIL: x\n", true, -1);
  EXPECT_EQ(classifier.classify(in), FALSE);
}

TEST_F(ClassifierUnitTests, CrashWithoutMarkersIsError)
{
  ClassifierInput in = make_input("Segmentation fault\n", false, 139);
  EXPECT_EQ(classifier.classify(in), ERROR);
  EXPECT_EQ(classifier.deciding_rule(in).name, "crashed");
}

TEST_F(ClassifierUnitTests, CompletionBeatsNonZeroExit)
{
  ClassifierInput in = make_input("KLEE: done: generated tests = 1\n", false, 1);
  EXPECT_EQ(classifier.classify(in), TRUE);
}

TEST_F(ClassifierUnitTests, CleanExitWithoutMarkersIsTrue)
{
  ClassifierInput in = make_input("");
  EXPECT_EQ(classifier.classify(in), TRUE);
  EXPECT_EQ(classifier.deciding_rule(in).name, "clean-exit");
}

TEST_F(ClassifierUnitTests, DefaultRulesAreOrdered)
{
  const vector<VerdictRule> & rules = classifier.rules();
  ASSERT_EQ(rules.size(), 5u);
  for (size_t i = 0; i < rules.size(); ++i) {
    EXPECT_EQ(rules[i].priority, i + 1);
  }
  EXPECT_EQ(rules[0].verdict, FALSE);
  EXPECT_EQ(rules[1].verdict, UNKNOWN);
  EXPECT_EQ(rules[2].verdict, TRUE);
  EXPECT_EQ(rules[3].verdict, ERROR);
  EXPECT_EQ(rules[4].verdict, TRUE);
}

TEST(CustomClassifierTests, RulesAreSortedByPriority)
{
  vector<VerdictRule> rules;
  rules.push_back(
      { 20, "fallback", [](const ClassifierInput &) { return true; }, TRUE });
  rules.push_back({ 10,
                    "slow",
                    [](const ClassifierInput & in) { return in.timed_out; },
                    ERROR });
  VerdictClassifier classifier(rules);

  EXPECT_EQ(classifier.rules().front().name, "slow");
  EXPECT_EQ(classifier.classify(make_input("", true)), ERROR);
  EXPECT_EQ(classifier.classify(make_input("", false)), TRUE);
}

TEST(CustomClassifierTests, DuplicatePriorityThrows)
{
  vector<VerdictRule> rules;
  rules.push_back(
      { 1, "a", [](const ClassifierInput &) { return true; }, TRUE });
  rules.push_back(
      { 1, "b", [](const ClassifierInput &) { return true; }, FALSE });
  EXPECT_THROW(VerdictClassifier c(rules), AssertP4Exception);
}

TEST(CustomClassifierTests, NoApplicableRuleThrows)
{
  vector<VerdictRule> rules;
  rules.push_back({ 1,
                    "never",
                    [](const ClassifierInput &) { return false; },
                    TRUE });
  VerdictClassifier classifier(rules);
  EXPECT_THROW(classifier.classify(make_input("")), AssertP4Exception);
}

TEST(VerdictTests, Spelling)
{
  EXPECT_EQ(to_string(TRUE), "true");
  EXPECT_EQ(to_string(FALSE), "false");
  EXPECT_EQ(to_string(UNKNOWN), "unknown");
  EXPECT_EQ(to_string(ERROR), "error");
}

}  // namespace assertp4_tests
