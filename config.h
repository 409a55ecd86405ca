// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUMFMT_CONFIG_H
#define NUMFMT_CONFIG_H

#include <stdint.h>

#include <initializer_list>
#include <limits>
#include <string>

#include "absl/strings/string_view.h"

#include "boost/filesystem.hpp"

#include <json/json.h>

namespace numfmt {

struct Config {
    // Directory containing language/ (and vendor/) catalogs.
    std::string root = ".";
    // Locale of user-facing messages, "xx" or "xx_YY".
    std::string language = "da";
    // Log file recording text lookups which fell back to the default text.
    std::string txt_log_file = "numfmt_txt.jsonl";
    std::string log_path = "var/logs";
    std::string log_default_file = "numfmt.log";
    int64_t log_max_bytes = 2 * 1024 * 1024;
    // Number of rotated log files to keep, or -1 to keep all of them.
    int log_max_files = 10;
};

// Reads a JSON configuration file of the form
//
//     {
//         "root": ".",
//         "locale": {"language": "da"},
//         "txt": {"log": {"file": "numfmt_txt.jsonl"}},
//         "log": {"path": "var/logs", "default_file": "numfmt.log",
//                 "max_bytes": 2097152, "max_files": 10}
//     }
//
// Every key is optional.  Unknown keys, values of the wrong type and out of
// range integers are rejected with std::invalid_argument; a file which can't
// be read or parsed results in std::runtime_error.
Config LoadConfig(const boost::filesystem::path& path);

// As above, but from an already-parsed document.
Config ParseConfig(const Json::Value& root);

// Typed accessors for one level of a JSON object.  A missing (or null) key
// yields the default; a present key of the wrong type, or an integer outside
// [min, max], throws std::invalid_argument naming the key.
std::string GetString(const Json::Value& obj, absl::string_view key, const std::string& def);
int64_t GetInt(const Json::Value& obj, absl::string_view key, int64_t def, int64_t min = std::numeric_limits<int64_t>::min(), int64_t max = std::numeric_limits<int64_t>::max());
// Returns the named sub-object, or a null value if it is absent.
const Json::Value& GetObject(const Json::Value& obj, absl::string_view key);

void AssertNoUnknownKeys(const Json::Value& obj, std::initializer_list<absl::string_view> allowed, absl::string_view where);

} // namespace numfmt

#endif // NUMFMT_CONFIG_H

// End of File
