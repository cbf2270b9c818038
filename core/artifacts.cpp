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

#include "core/artifacts.h"

#include <filesystem>

#include "utils/exceptions.h"
#include "utils/str_util.h"

namespace assertp4 {

ArtifactSet make_artifact_set(const std::string & source_file,
                              const std::string & work_dir)
{
  const std::string stem = FileStem(source_file);
  if (stem.empty()) {
    throw AssertP4Exception("Cannot derive artifact names from '"
                            + source_file + "'");
  }

  const std::filesystem::path dir(work_dir);
  ArtifactSet a;
  a.ir_file = (dir / (stem + ".json")).string();
  a.c_file = (dir / (stem + ".c")).string();
  a.bitcode_file = (dir / (stem + ".bc")).string();
  a.klee_out_dir = (dir / "klee-out").string();
  return a;
}

}  // namespace assertp4
