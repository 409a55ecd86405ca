// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUMFMT_LOG_H
#define NUMFMT_LOG_H

#include <stdint.h>

#include <mutex>
#include <optional>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"

#include "boost/filesystem.hpp"

#include <json/json.h>

namespace numfmt {

// Appends one compact JSON object per line to files in a single directory:
//
//     {"category":"...","context":{...},"message":...,"timestamp":"..."}
//
// Files which would grow past the size limit are rotated first: "f" becomes
// "f.1", "f.1" becomes "f.2", and so on, with the oldest rotated files
// beyond the retention count removed.
class JsonLog {
protected:
    std::mutex m_mut;

    boost::filesystem::path m_dir;
    std::string m_default_file = "numfmt.log";
    int64_t m_max_bytes = 2 * 1024 * 1024;
    std::optional<int> m_max_files = 10;

    void Rotate(const boost::filesystem::path& path);

public:
    JsonLog(const boost::filesystem::path& dir, bool auto_create = false);
    // Non-copyable:
    JsonLog(const JsonLog&) = delete;
    JsonLog& operator=(const JsonLog&) = delete;

    inline const boost::filesystem::path& GetDir() const {
        return m_dir;
    }

    void SetDefaultFile(const std::string& file);
    // A limit of zero or less disables rotation.
    void SetMaxFileSize(int64_t bytes);
    // std::nullopt keeps every rotated file.
    void SetMaxRotatedFiles(std::optional<int> count);

    // An empty file name selects the default file.  Returns false if the
    // record could not be written; the reason is reported on stderr.
    bool Write(absl::string_view file, absl::string_view category, const Json::Value& message, const Json::Value& context = Json::Value(Json::objectValue));

    // Exposed for testing.
    static std::string FormatLine(absl::Time timestamp, absl::string_view category, const Json::Value& message, const Json::Value& context);
};

} // namespace numfmt

#endif // NUMFMT_LOG_H

// End of File
