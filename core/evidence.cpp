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

#include "core/evidence.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "utils/logger.h"
#include "utils/str_util.h"

namespace fs = std::filesystem;

namespace assertp4 {

std::vector<std::string> scan_evidence(const std::string & klee_out_dir)
{
  std::vector<std::string> texts;

  std::error_code ec;
  if (!fs::is_directory(klee_out_dir, ec)) {
    return texts;
  }

  std::vector<fs::path> files;
  for (fs::directory_iterator it(klee_out_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    std::error_code type_ec;
    if (StrEndsWith(name, EVIDENCE_SUFFIX) && it->is_regular_file(type_ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    logger.log(1, "Stopped scanning {}: {}", klee_out_dir, ec.message());
  }
  std::sort(files.begin(), files.end());

  for (const auto & f : files) {
    std::ifstream in(f, std::ios::in | std::ios::binary);
    if (!in) {
      logger.log(1, "Skipping unreadable evidence file {}", f.string());
      continue;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
      logger.log(1, "Skipping unreadable evidence file {}", f.string());
      continue;
    }
    texts.push_back(buf.str());
  }

  logger.log(1, "Found {} evidence file(s) in {}", texts.size(), klee_out_dir);
  return texts;
}

}  // namespace assertp4
