// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUMFMT_CLI_H
#define NUMFMT_CLI_H

#include <iosfwd>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace numfmt {

class JsonLog;
class NumberFormatter;

struct ConvertOptions {
    int precision = 14;
    int scale = 2;
    std::string thousands_sep = ".";
    std::string decimal_sep = ",";
};

bool is_known_command(absl::string_view command);

// Runs `command` ("to_db" or "from_db") over each input in turn, printing one
// result per line to `out` ("NULL" for an empty to_db result).  Stops at the
// first rejected value: its message goes to `err` as "error: <message>", a
// "validation" record is appended to the default file of `log`, and 1 is
// returned.  Returns 0 if every value converted.
int run_conversions(const NumberFormatter& fmt, JsonLog& log, absl::string_view command, const std::vector<std::string>& inputs, const ConvertOptions& opts, std::ostream& out, std::ostream& err);

} // namespace numfmt

#endif // NUMFMT_CLI_H

// End of File
