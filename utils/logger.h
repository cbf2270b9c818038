/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Verbosity-filtered diagnostics on standard error.
 **
 ** Standard output is reserved for the JSON report.
 **/

#pragma once

// use the header only implementation
#define FMT_HEADER_ONLY

#include <iostream>
#include <string>

#include "fmt/format.h"
#include "utils/exceptions.h"

namespace assertp4 {

// Meant to be used as a singleton class -- instantiated as logger below
class Log
{
 public:
  Log() : verbosity(0), verbosity_set(false) {}

  Log(size_t v) : verbosity(v), verbosity_set(true) {}

  /* Write one line built from a Python-style format string
   * @param level printed when the verbosity is at least this level
   * @param output_stream where the line goes
   * @param format the format string
   * @param args comma separated list of inputs for the format string
   */
  template <typename... Args>
  void log_to_stream(size_t level,
                     std::ostream & output_stream,
                     const std::string & format,
                     const Args &... args) const
  {
    if (enabled(level)) {
      output_stream << fmt::vformat(format, fmt::make_format_args(args...))
                    << std::endl;
    }
  }

  /* Same as log_to_stream, on standard error */
  template <typename... Args>
  void log(size_t level, const std::string & format, const Args &... args) const
  {
    log_to_stream(level, std::cerr, format, args...);
  }

  bool enabled(size_t level) const { return level <= verbosity; }

  /* set verbosity -- can only be set once
   * @param v the verbosity to set
   */
  void set_verbosity(size_t v)
  {
    if (verbosity_set) {
      throw AssertP4Exception("Can only set logger verbosity once.");
    }
    verbosity = v;
    verbosity_set = true;
  }

 protected:
  size_t verbosity;
  bool verbosity_set;
};

// globally available logger instance
extern Log logger;

}  // namespace assertp4
