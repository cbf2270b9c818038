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

#include <string>

namespace assertp4 {

/** Paths of every file a run produces, all inside the working directory.
 *  Derived from the base name of the source file, so the same source
 *  always maps to the same names.
 */
struct ArtifactSet
{
  std::string ir_file;        ///< <stem>.json written by p4c
  std::string c_file;         ///< <stem>.c, translator stdout
  std::string bitcode_file;   ///< <stem>.bc written by clang
  std::string klee_out_dir;   ///< klee-out, created by KLEE itself
};

ArtifactSet make_artifact_set(const std::string & source_file,
                              const std::string & work_dir);

}  // namespace assertp4
