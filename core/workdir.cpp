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

#include "core/workdir.h"

#include <stdlib.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include "utils/exceptions.h"
#include "utils/logger.h"

namespace assertp4 {

WorkDir::WorkDir(const std::string & root) : released_(false)
{
  std::string templ = (std::filesystem::path(root) / "assertp4-XXXXXX").string();
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw AssertP4Exception("Failed to create working directory in " + root
                            + ": " + std::strerror(errno));
  }
  path_ = buf.data();
  logger.log(2, "Created working directory {}", path_);
}

WorkDir::~WorkDir() { release(); }

bool WorkDir::release()
{
  if (released_) {
    return true;
  }
  released_ = true;

  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    logger.log(
        0, "Warning: failed to remove working directory {}: {}", path_, ec.message());
    return false;
  }
  logger.log(2, "Removed working directory {}", path_);
  return true;
}

std::string default_work_root()
{
  const char * tmp = std::getenv("TMPDIR");
  if (tmp != nullptr && tmp[0] != '\0') {
    return tmp;
  }
  return "/tmp";
}

}  // namespace assertp4
