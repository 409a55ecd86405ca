// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef NUMFMT_TEXT_H
#define NUMFMT_TEXT_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "absl/strings/string_view.h"

#include "boost/filesystem.hpp"

#include <json/json.h>

namespace numfmt {

class JsonLog;

typedef std::map<std::string, std::string> TextVars;

// Resolves a user-facing message.  Arguments are, in order: the message key,
// the catalog file (e.g. "format_number"), the layer ("app" or
// "vendor/package"), the text to use if the key cannot be resolved, and the
// values for any %PLACEHOLDER% tokens in the message.
typedef std::function<std::string(
        absl::string_view key,
        absl::string_view file,
        absl::string_view layer,
        absl::string_view default_text,
        const TextVars& vars
    )> TextLookup;

// Replaces each %NAME% token with vars["name"].  Variable names are matched
// case-insensitively by upper-casing them, and substitution is done in a
// single pass so that inserted values are never re-expanded.
std::string interpolate(absl::string_view text, const TextVars& vars);

// A TextLookup which ignores the catalog entirely and returns the default
// text, with placeholders filled in.
std::string passthrough_text(absl::string_view key, absl::string_view file, absl::string_view layer, absl::string_view default_text, const TextVars& vars);

// Returns true for "xx" or "xx_YY" locale names.
bool is_valid_language(absl::string_view lang);

// Language files are JSON objects mapping keys to strings, stored at
// <root>/language/<lang>/<file>.json for the application layer, or at
// <root>/vendor/<vendor>/<package>/language/<lang>/<file>.json for a package.
// Files are loaded on first use and cached for the lifetime of the catalog.
// A missing file or key is not an error: the default text is returned and
// the miss is recorded in the attached log, if any.
class TextCatalog {
protected:
    std::mutex m_mut;

    boost::filesystem::path m_root;
    std::string m_language;

    JsonLog* m_log;
    std::string m_miss_file;

    // Parsed catalogs, keyed by absolute file path.  A null entry records a
    // file that could not be loaded, so we don't retry it on every lookup.
    std::map<std::string, std::shared_ptr<const Json::Value>> m_cache;

    boost::filesystem::path ResolveBasePath(absl::string_view layer) const;
    std::shared_ptr<const Json::Value> LoadFile(const boost::filesystem::path& path, std::string& reason);
    void LogMiss(const boost::filesystem::path& path, absl::string_view key, const std::string& reason);

public:
    TextCatalog(const boost::filesystem::path& root, const std::string& language, JsonLog* log = nullptr, const std::string& miss_file = "");
    // Non-copyable:
    TextCatalog(const TextCatalog&) = delete;
    TextCatalog& operator=(const TextCatalog&) = delete;

    inline const std::string& GetLanguage() const {
        return m_language;
    }

    std::string Get(absl::string_view key, absl::string_view file, absl::string_view layer = "app", absl::string_view default_text = "", const TextVars& vars = TextVars());

    // The returned function refers to this catalog, which must outlive it.
    TextLookup Lookup();
};

} // namespace numfmt

#endif // NUMFMT_TEXT_H

// End of File
