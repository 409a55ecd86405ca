// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include "text.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

#include "boost/filesystem.hpp"
#include "boost/filesystem/fstream.hpp"

#include <json/json.h>

#include "log.h"

namespace numfmt {

std::string interpolate(absl::string_view text, const TextVars& vars)
{
    if (vars.empty()) {
        return std::string(text);
    }
    std::vector<std::pair<std::string, std::string>> replacements;
    replacements.reserve(vars.size());
    for (const auto& var : vars) {
        replacements.emplace_back(absl::StrCat("%", absl::AsciiStrToUpper(var.first), "%"), var.second);
    }
    return absl::StrReplaceAll(text, replacements);
}

std::string passthrough_text(absl::string_view key, absl::string_view file, absl::string_view layer, absl::string_view default_text, const TextVars& vars)
{
    return interpolate(default_text, vars);
}

bool is_valid_language(absl::string_view lang)
{
    if (lang.size() != 2 && lang.size() != 5) {
        return false;
    }
    if (!absl::ascii_islower(lang[0]) || !absl::ascii_islower(lang[1])) {
        return false;
    }
    if (lang.size() == 5) {
        if (lang[2] != '_' || !absl::ascii_isupper(lang[3]) || !absl::ascii_isupper(lang[4])) {
            return false;
        }
    }
    return true;
}

static bool is_slug_char(char c)
{
    return absl::ascii_isalnum(c) || c == '.' || c == '_' || c == '-';
}

// A package layer is "vendor/package", each side a non-empty run of
// [A-Za-z0-9._-] that is not a relative path component.
static bool is_valid_slug(absl::string_view slug)
{
    std::vector<absl::string_view> parts = absl::StrSplit(slug, '/');
    if (parts.size() != 2) {
        return false;
    }
    for (absl::string_view part : parts) {
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
        for (char c : part) {
            if (!is_slug_char(c)) {
                return false;
            }
        }
    }
    return true;
}

// File names are relative paths such as "format_number" or "member/profile".
static bool is_valid_file_name(absl::string_view file)
{
    if (file.empty() || absl::StrContains(file, "..")) {
        return false;
    }
    if (!absl::ascii_isalnum(file.front()) || !absl::ascii_isalnum(file.back())) {
        return false;
    }
    for (char c : file) {
        if (!absl::ascii_isalnum(c) && c != '/' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

TextCatalog::TextCatalog(const boost::filesystem::path& root, const std::string& language, JsonLog* log, const std::string& miss_file)
    : m_root(root)
    , m_language(language)
    , m_log(log)
    , m_miss_file(miss_file)
{
    if (!is_valid_language(m_language)) {
        throw std::invalid_argument(absl::StrCat("Invalid language '", m_language, "'.  Expected 'xx' or 'xx_YY' (e.g. 'da' or 'da_DK')."));
    }
    // Checked here so that a bad name can't surface later from inside a lookup.
    if (absl::StrContains(m_miss_file, "/") || absl::StrContains(m_miss_file, "\\") || m_miss_file == "." || m_miss_file == "..") {
        throw std::invalid_argument(absl::StrCat("Invalid text miss log file '", m_miss_file, "'.  Filename only, no directories."));
    }
}

boost::filesystem::path TextCatalog::ResolveBasePath(absl::string_view layer) const
{
    if (layer == "app") {
        return m_root / "language";
    }
    absl::string_view slug = layer;
    while (!slug.empty() && slug.front() == '/') {
        slug.remove_prefix(1);
    }
    while (!slug.empty() && slug.back() == '/') {
        slug.remove_suffix(1);
    }
    if (!is_valid_slug(slug)) {
        throw std::invalid_argument(absl::StrCat("Invalid text layer '", layer, "'.  Expected 'vendor/package', e.g. 'numfmt/core'."));
    }
    return m_root / "vendor" / std::string(slug) / "language";
}

std::shared_ptr<const Json::Value> TextCatalog::LoadFile(const boost::filesystem::path& path, std::string& reason)
{
    // Caller holds m_mut.
    auto itr = m_cache.find(path.string());
    if (itr != m_cache.end()) {
        if (!itr->second) {
            reason = "file_unavailable";
        }
        return itr->second;
    }

    std::shared_ptr<const Json::Value> result;
    boost::filesystem::ifstream in(path);
    if (!in) {
        reason = "file_unavailable";
    } else {
        Json::CharReaderBuilder builder;
        auto root = std::make_shared<Json::Value>();
        std::string errs;
        if (!Json::parseFromStream(builder, in, root.get(), &errs)) {
            std::cerr << "WARNING: Unable to parse language file \"" << path.string() << "\": " << errs << std::endl;
            reason = "file_malformed";
        } else if (!root->isObject()) {
            std::cerr << "WARNING: Language file \"" << path.string() << "\" does not contain a JSON object." << std::endl;
            reason = "file_malformed";
        } else {
            result = root;
        }
    }
    m_cache[path.string()] = result;
    return result;
}

void TextCatalog::LogMiss(const boost::filesystem::path& path, absl::string_view key, const std::string& reason)
{
    if (!m_log) {
        return;
    }
    Json::Value context(Json::objectValue);
    context["file"] = path.string();
    context["key"] = std::string(key);
    context["language"] = m_language;
    context["reason"] = reason;
    // The log reports its own I/O failures; a lost miss record does not
    // affect the lookup result.
    m_log->Write(m_miss_file, "txt", "Text lookup fell back to default", context);
}

std::string TextCatalog::Get(absl::string_view key, absl::string_view file, absl::string_view layer, absl::string_view default_text, const TextVars& vars)
{
    boost::filesystem::path base = ResolveBasePath(layer);
    if (!is_valid_file_name(file)) {
        throw std::invalid_argument(absl::StrCat("Invalid language file name '", file, "'."));
    }
    boost::filesystem::path path = base / m_language / absl::StrCat(file, ".json");

    std::string text;
    std::string reason;
    {
        const std::lock_guard<std::mutex> lock(m_mut);
        std::shared_ptr<const Json::Value> catalog = LoadFile(path, reason);
        if (catalog) {
            const Json::Value* value = catalog->find(key.data(), key.data() + key.size());
            if (!value) {
                reason = "key_missing";
            } else if (!value->isString()) {
                reason = "value_not_string";
            } else {
                text = value->asString();
            }
        }
    }

    if (!reason.empty()) {
        LogMiss(path, key, reason);
        text = std::string(default_text);
    }
    return interpolate(text, vars);
}

TextLookup TextCatalog::Lookup()
{
    return [this](absl::string_view key, absl::string_view file, absl::string_view layer, absl::string_view default_text, const TextVars& vars) {
        return this->Get(key, file, layer, default_text, vars);
    };
}

} // namespace numfmt

// End of File
