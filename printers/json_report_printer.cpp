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

#include "printers/json_report_printer.h"

#include <exception>

#include "utils/logger.h"

using nlohmann::ordered_json;

namespace assertp4 {

ordered_json report_to_json(const VerdictReport & report)
{
  ordered_json doc = {
    { "verdict", to_string(report.verdict) },
    { "time_ms", report.time_ms },
    { "details", report.details },
  };
  if (!report.assertion_errors.empty()) {
    doc["assertion_errors"] = report.assertion_errors;
  }
  return doc;
}

std::string dump_document(const ordered_json & doc)
{
  return doc.dump(-1, ' ', true, ordered_json::error_handler_t::replace);
}

void print_report(const VerdictReport & report, std::ostream & output_stream)
{
  std::string text;
  try {
    text = dump_document(report_to_json(report));
  }
  catch (std::exception & e) {
    logger.log(0, "Failed to assemble report: {}", e.what());
    // hand-built so that nothing here can throw again
    text = "{\"verdict\":\"error\",\"time_ms\":" + std::to_string(report.time_ms)
           + ",\"details\":\"report assembly failed\"}";
  }
  output_stream << text << std::endl;
}

void print_error_document(const std::string & message,
                          std::ostream & output_stream)
{
  ordered_json doc = { { "error", message }, { "verdict", "error" } };
  output_stream << dump_document(doc) << std::endl;
}

}  // namespace assertp4
