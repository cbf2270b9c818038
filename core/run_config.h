/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Everything a run needs to know, fixed before it starts.
 **
 **
 **/

#pragma once

#include <string>

namespace assertp4 {

/** Commands and budgets for the four external tools */
struct ToolchainConfig
{
  ToolchainConfig()
      : p4c("p4c-bm2-ss"),
        python("python"),
        translator("/assert-p4/src/P4_to_C.py"),
        translator_dir("/assert-p4/src"),
        clang("clang"),
        klee("klee"),
        klee_search("dfs"),
        p4c_timeout_s(60),
        translate_timeout_s(120),
        clang_timeout_s(60)
  {
  }

  std::string p4c;
  std::string python;
  std::string translator;
  std::string translator_dir;  ///< working directory of the translator
  std::string clang;
  std::string klee;
  std::string klee_search;  ///< value of KLEE's --search
  unsigned int p4c_timeout_s;
  unsigned int translate_timeout_s;
  unsigned int clang_timeout_s;
};

struct RunConfig
{
  RunConfig() : timeout_s(300) {}

  std::string source_file;
  std::string rules_file;  ///< empty if none was given
  unsigned int timeout_s;  ///< budget of the symbolic execution stage
  std::string work_root;   ///< parent of the working directory; empty = default
  ToolchainConfig tools;
};

}  // namespace assertp4
