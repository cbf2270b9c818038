#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/evidence.h"
#include "core/workdir.h"
#include "gtest/gtest.h"
#include "tests/common_tools.h"

using namespace assertp4;
using namespace std;

namespace fs = std::filesystem;

namespace assertp4_tests {

class EvidenceUnitTests : public ::testing::Test
{
 protected:
  void SetUp() override
  {
    scratch.reset(new WorkDir(default_work_root()));
    out_dir = (fs::path(scratch->path()) / "klee-out").string();
    fs::create_directory(out_dir);
  }

  string file(const string & name) const
  {
    return (fs::path(out_dir) / name).string();
  }

  unique_ptr<WorkDir> scratch;
  string out_dir;
};

TEST_F(EvidenceUnitTests, MissingDirectoryIsEmpty)
{
  EXPECT_TRUE(scan_evidence(file("does-not-exist")).empty());
}

TEST_F(EvidenceUnitTests, EmptyDirectoryIsEmpty)
{
  EXPECT_TRUE(scan_evidence(out_dir).empty());
}

TEST_F(EvidenceUnitTests, OnlyAssertErrFilesCount)
{
  write_text(file("test000001.ktest"), "binary");
  write_text(file("test000001.ptr.err"), "Error: memory error");
  write_text(file("info"), "KLEE: done");
  write_text(file("test000002.assert.err"), "Error: ASSERTION FAIL");

  vector<string> ev = scan_evidence(out_dir);
  ASSERT_EQ(ev.size(), 1u);
  EXPECT_EQ(ev[0], "Error: ASSERTION FAIL");
}

TEST_F(EvidenceUnitTests, FullTextInNameOrder)
{
  write_text(file("test000003.assert.err"), "third\nline two\n");
  write_text(file("test000001.assert.err"), "first\n");
  write_text(file("test000002.assert.err"), "");

  vector<string> ev = scan_evidence(out_dir);
  ASSERT_EQ(ev.size(), 3u);
  EXPECT_EQ(ev[0], "first\n");
  EXPECT_EQ(ev[1], "");
  EXPECT_EQ(ev[2], "third\nline two\n");
}

TEST_F(EvidenceUnitTests, SubdirectoriesAreNotScanned)
{
  fs::create_directory(file("nested"));
  write_text(file("nested/test000001.assert.err"), "hidden");
  fs::create_directory(file("dir.assert.err"));

  EXPECT_TRUE(scan_evidence(out_dir).empty());
}

}  // namespace assertp4_tests
