/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Emits the single JSON document a run produces.
 **
 **
 **/

#pragma once

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/report.h"

namespace assertp4 {

/** {"verdict", "time_ms", "details"[, "assertion_errors"]} in that order */
nlohmann::ordered_json report_to_json(const VerdictReport & report);

/** Serialize without throwing. Invalid UTF-8 in tool output is replaced
 *  and non-ASCII is escaped. If serialization still fails, an error
 *  document is printed instead.
 */
void print_report(const VerdictReport & report,
                  std::ostream & output_stream = std::cout);

/** {"error": message, "verdict": "error"}, for failures that happen
 *  before a run starts (usage, missing input)
 */
void print_error_document(const std::string & message,
                          std::ostream & output_stream);

std::string dump_document(const nlohmann::ordered_json & doc);

}  // namespace assertp4
