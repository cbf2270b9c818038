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

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

/*************************************** time stamp functions
 * ************************************************/

namespace assertp4 {

// Monotonic stamps for run and stage durations

typedef std::chrono::steady_clock assertp4_clock;
typedef std::chrono::time_point<assertp4_clock> assertp4_time_stamp;
typedef std::chrono::duration<long long int, std::nano> assertp4_time_duration;

// take current time stamp
inline assertp4_time_stamp timestamp() { return assertp4_clock::now(); }

// compute duration in nanoseconds between two given time stamps
inline assertp4_time_duration timestamp_diff(assertp4_time_stamp begin,
                                             assertp4_time_stamp end)
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(end - begin);
}

// whole milliseconds, truncated
inline std::int64_t time_duration_to_ms(assertp4_time_duration d)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

// convert duration in nanoseconds computed by 'timestamp_diff' to a string
inline std::string time_duration_to_sec_string(assertp4_time_duration d)
{
  std::ostringstream out;
  out << d.count() * 1e-9;
  return out.str();
}

}  // namespace assertp4
