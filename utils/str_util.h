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

#pragma once

#include <string>
#include <vector>

namespace assertp4 {

/// True iff str is non-empty and made only of the digits 0-9
bool StrIsDigits(const std::string & str);

/// Python-style join, return a string that joins the list by the delim
std::string Join(const std::vector<std::string> & in,
                 const std::string & delim);

/// Finds out if str contains sub
bool StrContains(const std::string & str, const std::string & sub);

/// Finds out if str ends with suffix
bool StrEndsWith(const std::string & str, const std::string & suffix);

/// Base name of a path with its last extension removed, e.g. "a/b.p4" -> "b"
std::string FileStem(const std::string & path);

/// Join an argument vector into a single line for logging
std::string CommandLine(const std::vector<std::string> & argv);

}  // namespace assertp4
