/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief string helpers shared by option parsing and the pipeline
 **
 **
 **/

#include "utils/str_util.h"

#include <filesystem>

namespace assertp4 {

bool StrIsDigits(const std::string & str)
{
  if (str.empty()) return false;
  for (char c : str) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::string Join(const std::vector<std::string> & in,
                 const std::string & delim)
{
  std::string ret;
  bool first = true;
  for (const auto & s : in) {
    if (!first) ret += delim;
    ret += s;
    first = false;
  }
  return ret;
}

bool StrContains(const std::string & str, const std::string & sub)
{
  return str.find(sub) != std::string::npos;
}

bool StrEndsWith(const std::string & str, const std::string & suffix)
{
  return str.length() >= suffix.length()
         && str.compare(str.length() - suffix.length(), suffix.length(), suffix)
                == 0;
}

std::string FileStem(const std::string & path)
{
  // a leading dot is not an extension: ".p4" stays ".p4"
  return std::filesystem::path(path).stem().string();
}

std::string CommandLine(const std::vector<std::string> & argv)
{
  std::string ret;
  for (const auto & a : argv) {
    if (!ret.empty()) ret += ' ';
    if (a.find_first_of(" \t'\"") != std::string::npos) {
      ret += "'" + a + "'";
    } else {
      ret += a;
    }
  }
  return ret;
}

}  // namespace assertp4
