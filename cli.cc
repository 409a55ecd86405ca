// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include "cli.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

#include <json/json.h>

#include "format_number.h"
#include "log.h"

namespace numfmt {

bool is_known_command(absl::string_view command)
{
    return command == "to_db" || command == "from_db";
}

static void log_rejection(JsonLog& log, absl::string_view command, const std::string& input, const ValidationError& e, std::ostream& err)
{
    Json::Value context(Json::objectValue);
    context["command"] = std::string(command);
    context["kind"] = e.key();
    context["input"] = input;
    if (!log.Write("", "validation", e.what(), context)) {
        err << "WARNING: rejection of \"" << input << "\" was not logged." << std::endl;
    }
}

int run_conversions(const NumberFormatter& fmt, JsonLog& log, absl::string_view command, const std::vector<std::string>& inputs, const ConvertOptions& opts, std::ostream& out, std::ostream& err)
{
    if (!is_known_command(command)) {
        err << "error: unknown command '" << command << "'" << std::endl;
        return 1;
    }
    for (const std::string& input : inputs) {
        try {
            if (command == "to_db") {
                std::optional<std::string> db = fmt.ToDb(input, opts.precision, opts.scale);
                out << (db ? *db : "NULL") << std::endl;
            } else {
                out << fmt.FromDb(input, opts.scale, opts.thousands_sep, opts.decimal_sep) << std::endl;
            }
        } catch (const ValidationError& e) {
            err << "error: " << e.what() << std::endl;
            log_rejection(log, command, input, e, err);
            return 1;
        }
    }
    return 0;
}

} // namespace numfmt

// End of File
