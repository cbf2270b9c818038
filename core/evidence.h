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
#include <vector>

namespace assertp4 {

// KLEE writes one of these per assertion violation it finds
const std::string EVIDENCE_SUFFIX = ".assert.err";

/** Read every *.assert.err file directly inside klee_out_dir.
 *  Best effort: a missing directory gives an empty result and files
 *  that cannot be read are skipped. Results are ordered by file name.
 *  @return the full text of each evidence file
 */
std::vector<std::string> scan_evidence(const std::string & klee_out_dir);

}  // namespace assertp4
