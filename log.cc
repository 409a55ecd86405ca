// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include "log.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include <stdint.h>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "boost/filesystem.hpp"
#include "boost/filesystem/fstream.hpp"

#include <json/json.h>

namespace numfmt {

static bool is_plain_file_name(absl::string_view file)
{
    if (file.empty() || file == "." || file == "..") {
        return false;
    }
    return !absl::StrContains(file, "/") && !absl::StrContains(file, "\\");
}

JsonLog::JsonLog(const boost::filesystem::path& dir, bool auto_create)
    : m_dir(dir)
{
    boost::system::error_code ec;
    if (!boost::filesystem::exists(m_dir, ec)) {
        if (!auto_create) {
            std::string msg(absl::StrCat("Log directory \"", m_dir.string(), "\" does not exist."));
            std::cerr << msg << std::endl;
            throw std::runtime_error(msg);
        }
        boost::filesystem::create_directories(m_dir, ec);
        if (ec) {
            std::string msg(absl::StrCat("Unable to create log directory \"", m_dir.string(), "\": ", ec.message()));
            std::cerr << msg << std::endl;
            throw std::runtime_error(msg);
        }
    }
    if (!boost::filesystem::is_directory(m_dir, ec)) {
        std::string msg(absl::StrCat("Log path \"", m_dir.string(), "\" is not a directory."));
        std::cerr << msg << std::endl;
        throw std::runtime_error(msg);
    }
}

void JsonLog::SetDefaultFile(const std::string& file)
{
    if (!is_plain_file_name(file)) {
        throw std::invalid_argument(absl::StrCat("Invalid log file name '", file, "'.  Filename only, no directories."));
    }
    const std::lock_guard<std::mutex> lock(m_mut);
    m_default_file = file;
}

void JsonLog::SetMaxFileSize(int64_t bytes)
{
    const std::lock_guard<std::mutex> lock(m_mut);
    m_max_bytes = bytes;
}

void JsonLog::SetMaxRotatedFiles(std::optional<int> count)
{
    if (count && *count < 0) {
        throw std::invalid_argument("Number of rotated log files cannot be negative.");
    }
    const std::lock_guard<std::mutex> lock(m_mut);
    m_max_files = count;
}

std::string JsonLog::FormatLine(absl::Time timestamp, absl::string_view category, const Json::Value& message, const Json::Value& context)
{
    Json::Value record(Json::objectValue);
    record["timestamp"] = absl::FormatTime(absl::RFC3339_full, timestamp, absl::UTCTimeZone());
    record["category"] = std::string(category);
    record["message"] = message;
    record["context"] = context;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, record);
}

void JsonLog::Rotate(const boost::filesystem::path& path)
{
    // Caller holds m_mut.
    using std::to_string;
    boost::system::error_code ec;
    auto rotated = [&path](int n) {
        return boost::filesystem::path(absl::StrCat(path.string(), ".", to_string(n)));
    };

    // Drops f.first, f.first+1, ... up to the first gap.  This also clears
    // out rotations left behind under a larger retention limit.
    auto prune_from = [&rotated](int first) {
        boost::system::error_code ec;
        for (int i = first; boost::filesystem::exists(rotated(i), ec); ++i) {
            boost::filesystem::remove(rotated(i), ec);
            if (ec) {
                std::cerr << "WARNING: Unable to remove old log file \"" << rotated(i).string() << "\": " << ec.message() << std::endl;
                return;
            }
        }
    };

    if (m_max_files && *m_max_files == 0) {
        prune_from(1);
        boost::filesystem::remove(path, ec);
        if (ec) {
            std::cerr << "WARNING: Unable to remove full log file \"" << path.string() << "\": " << ec.message() << std::endl;
        }
        return;
    }

    // Find the last slot that needs shifting.  With a retention limit the
    // oldest file (and anything past it) is dropped; without one the chain
    // grows by one.
    int last = 0;
    if (m_max_files) {
        last = *m_max_files;
        prune_from(last);
        --last;
    } else {
        while (boost::filesystem::exists(rotated(last + 1), ec)) {
            ++last;
        }
    }
    for (int i = last; i >= 1; --i) {
        if (!boost::filesystem::exists(rotated(i), ec)) {
            continue;
        }
        boost::filesystem::rename(rotated(i), rotated(i + 1), ec);
        if (ec) {
            std::cerr << "WARNING: Unable to rotate log file \"" << rotated(i).string() << "\": " << ec.message() << std::endl;
        }
    }
    boost::filesystem::rename(path, rotated(1), ec);
    if (ec) {
        std::cerr << "WARNING: Unable to rotate log file \"" << path.string() << "\": " << ec.message() << std::endl;
    }
}

bool JsonLog::Write(absl::string_view file, absl::string_view category, const Json::Value& message, const Json::Value& context)
{
    if (!file.empty() && !is_plain_file_name(file)) {
        throw std::invalid_argument(absl::StrCat("Invalid log file name '", file, "'.  Filename only, no directories."));
    }
    const std::string line = FormatLine(absl::Now(), category, message, context);

    const std::lock_guard<std::mutex> lock(m_mut);
    boost::filesystem::path path = m_dir / (file.empty() ? m_default_file : std::string(file));

    if (m_max_bytes > 0) {
        boost::system::error_code ec;
        uintmax_t size = boost::filesystem::file_size(path, ec);
        if (!ec && size > 0 && static_cast<int64_t>(size + line.size() + 1) > m_max_bytes) {
            Rotate(path);
        }
    }

    boost::filesystem::ofstream out(path, boost::filesystem::ofstream::app);
    if (!out) {
        std::cerr << "WARNING: Unable to open/create log file \"" << path.string() << "\" to record: " << line << std::endl;
        return false;
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        std::cerr << "WARNING: Unable to write to log file \"" << path.string() << "\": " << line << std::endl;
        return false;
    }
    return true;
}

} // namespace numfmt

// End of File
