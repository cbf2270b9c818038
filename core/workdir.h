/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Scoped temporary directory owned by a single run.
 **
 **
 **/

#pragma once

#include <string>

namespace assertp4 {

/** Creates a fresh private directory under a root on construction and
 *  removes it, recursively, on destruction. Not copyable: exactly one
 *  owner per directory.
 */
class WorkDir
{
 public:
  /** @param root parent directory; throws AssertP4Exception if the
   *         directory cannot be created
   */
  explicit WorkDir(const std::string & root);

  ~WorkDir();

  WorkDir(const WorkDir &) = delete;
  WorkDir & operator=(const WorkDir &) = delete;

  const std::string & path() const { return path_; }

  /** Remove the directory now. Safe to call more than once.
   *  @return false if something was left behind
   */
  bool release();

 private:
  std::string path_;
  bool released_;
};

/** $TMPDIR if set and non-empty, otherwise /tmp */
std::string default_work_root();

}  // namespace assertp4
