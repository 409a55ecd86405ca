// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include "config.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include <stdint.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"

#include "boost/filesystem.hpp"
#include "boost/filesystem/fstream.hpp"

#include <json/json.h>

namespace numfmt {

static const Json::Value* find_key(const Json::Value& obj, absl::string_view key)
{
    if (!obj.isObject()) {
        return nullptr;
    }
    const Json::Value* value = obj.find(key.data(), key.data() + key.size());
    if (!value || value->isNull()) {
        return nullptr;
    }
    return value;
}

std::string GetString(const Json::Value& obj, absl::string_view key, const std::string& def)
{
    const Json::Value* value = find_key(obj, key);
    if (!value) {
        return def;
    }
    if (!value->isString()) {
        throw std::invalid_argument(absl::StrCat("Config key '", key, "' must be a string."));
    }
    return value->asString();
}

int64_t GetInt(const Json::Value& obj, absl::string_view key, int64_t def, int64_t min, int64_t max)
{
    using std::to_string;
    const Json::Value* value = find_key(obj, key);
    if (!value) {
        return def;
    }
    if (!value->isIntegral() || !value->isInt64()) {
        throw std::invalid_argument(absl::StrCat("Config key '", key, "' must be an integer."));
    }
    int64_t i = value->asInt64();
    if (i < min || i > max) {
        throw std::invalid_argument(absl::StrCat("Config key '", key, "' must be between ", to_string(min), " and ", to_string(max), ", got ", to_string(i), "."));
    }
    return i;
}

const Json::Value& GetObject(const Json::Value& obj, absl::string_view key)
{
    const Json::Value* value = find_key(obj, key);
    if (!value) {
        return Json::Value::nullSingleton();
    }
    if (!value->isObject()) {
        throw std::invalid_argument(absl::StrCat("Config key '", key, "' must be an object."));
    }
    return *value;
}

void AssertNoUnknownKeys(const Json::Value& obj, std::initializer_list<absl::string_view> allowed, absl::string_view where)
{
    if (obj.isNull()) {
        return;
    }
    if (!obj.isObject()) {
        throw std::invalid_argument(absl::StrCat("Config section '", where, "' must be an object."));
    }
    for (const std::string& name : obj.getMemberNames()) {
        bool found = false;
        for (absl::string_view key : allowed) {
            if (name == key) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::invalid_argument(absl::StrCat("Unknown config key '", name, "' in section '", where, "'.  Allowed keys: ", absl::StrJoin(allowed, ", "), "."));
        }
    }
}

Config ParseConfig(const Json::Value& root)
{
    Config cfg;
    AssertNoUnknownKeys(root, {"root", "locale", "txt", "log"}, "(top level)");

    cfg.root = GetString(root, "root", cfg.root);

    const Json::Value& locale = GetObject(root, "locale");
    AssertNoUnknownKeys(locale, {"language"}, "locale");
    cfg.language = GetString(locale, "language", cfg.language);

    const Json::Value& txt = GetObject(root, "txt");
    AssertNoUnknownKeys(txt, {"log"}, "txt");
    const Json::Value& txt_log = GetObject(txt, "log");
    AssertNoUnknownKeys(txt_log, {"file"}, "txt.log");
    cfg.txt_log_file = GetString(txt_log, "file", cfg.txt_log_file);

    const Json::Value& log = GetObject(root, "log");
    AssertNoUnknownKeys(log, {"path", "default_file", "max_bytes", "max_files"}, "log");
    cfg.log_path = GetString(log, "path", cfg.log_path);
    cfg.log_default_file = GetString(log, "default_file", cfg.log_default_file);
    cfg.log_max_bytes = GetInt(log, "max_bytes", cfg.log_max_bytes, 0);
    cfg.log_max_files = static_cast<int>(GetInt(log, "max_files", cfg.log_max_files, -1, 1000));

    if (cfg.root.empty()) {
        throw std::invalid_argument("Config key 'root' cannot be empty.");
    }
    if (cfg.log_path.empty()) {
        throw std::invalid_argument("Config key 'log.path' cannot be empty.");
    }
    return cfg;
}

Config LoadConfig(const boost::filesystem::path& path)
{
    boost::filesystem::ifstream in(path);
    if (!in) {
        std::string msg(absl::StrCat("Unable to open config file \"", path.string(), "\"."));
        std::cerr << msg << std::endl;
        throw std::runtime_error(msg);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        std::string msg(absl::StrCat("Unable to parse config file \"", path.string(), "\": ", errs));
        std::cerr << msg << std::endl;
        throw std::runtime_error(msg);
    }
    if (!root.isObject()) {
        std::string msg(absl::StrCat("Config file \"", path.string(), "\" must contain a JSON object."));
        std::cerr << msg << std::endl;
        throw std::runtime_error(msg);
    }
    return ParseConfig(root);
}

} // namespace numfmt

// End of File
