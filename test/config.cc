// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "boost/filesystem.hpp"
#include "boost/filesystem/fstream.hpp"

#include <json/json.h>

#include "config.h"

using namespace numfmt;

static Json::Value parse_json(const std::string& text)
{
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errs;
    std::istringstream ss(text);
    EXPECT_TRUE(Json::parseFromStream(builder, ss, &value, &errs)) << errs;
    return value;
}

TEST(config, defaults) {
    Config cfg = ParseConfig(Json::Value(Json::objectValue));
    EXPECT_EQ(cfg.root, ".");
    EXPECT_EQ(cfg.language, "da");
    EXPECT_EQ(cfg.txt_log_file, "numfmt_txt.jsonl");
    EXPECT_EQ(cfg.log_path, "var/logs");
    EXPECT_EQ(cfg.log_default_file, "numfmt.log");
    EXPECT_EQ(cfg.log_max_bytes, 2 * 1024 * 1024);
    EXPECT_EQ(cfg.log_max_files, 10);
}

TEST(config, full) {
    Config cfg = ParseConfig(parse_json(
        "{"
            "\"root\": \"/srv/app\","
            "\"locale\": {\"language\": \"en_US\"},"
            "\"txt\": {\"log\": {\"file\": \"misses.jsonl\"}},"
            "\"log\": {"
                "\"path\": \"/var/log/numfmt\","
                "\"default_file\": \"app.log\","
                "\"max_bytes\": 4096,"
                "\"max_files\": -1"
            "}"
        "}"));
    EXPECT_EQ(cfg.root, "/srv/app");
    EXPECT_EQ(cfg.language, "en_US");
    EXPECT_EQ(cfg.txt_log_file, "misses.jsonl");
    EXPECT_EQ(cfg.log_path, "/var/log/numfmt");
    EXPECT_EQ(cfg.log_default_file, "app.log");
    EXPECT_EQ(cfg.log_max_bytes, 4096);
    EXPECT_EQ(cfg.log_max_files, -1);
}

TEST(config, partial) {
    Config cfg = ParseConfig(parse_json("{\"locale\": {\"language\": \"en\"}, \"log\": {\"max_files\": null}}"));
    EXPECT_EQ(cfg.language, "en");
    EXPECT_EQ(cfg.log_max_files, 10);
    EXPECT_EQ(cfg.log_path, "var/logs");
}

TEST(config, rejected) {
    EXPECT_THROW(ParseConfig(parse_json("{\"colour\": \"blue\"}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"locale\": {\"lang\": \"da\"}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"locale\": \"da\"}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"locale\": {\"language\": 5}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"txt\": {\"log\": {\"path\": \"x\"}}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"log\": {\"max_bytes\": \"big\"}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"log\": {\"max_bytes\": 1.5}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"log\": {\"max_bytes\": -1}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"log\": {\"max_files\": 5000}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"log\": {\"max_files\": -2}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"log\": {\"path\": \"\"}}")), std::invalid_argument);
    EXPECT_THROW(ParseConfig(parse_json("{\"root\": \"\"}")), std::invalid_argument);
}

TEST(config, error_names_key) {
    try {
        ParseConfig(parse_json("{\"log\": {\"max_files\": 5000}}"));
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("max_files"), std::string::npos) << e.what();
    }
    try {
        ParseConfig(parse_json("{\"log\": {\"colour\": 1}}"));
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("colour"), std::string::npos) << e.what();
    }
}

TEST(config, getters) {
    Json::Value obj = parse_json("{\"s\": \"x\", \"i\": 7, \"b\": true, \"o\": {}, \"n\": null}");
    EXPECT_EQ(GetString(obj, "s", "d"), "x");
    EXPECT_EQ(GetString(obj, "missing", "d"), "d");
    EXPECT_EQ(GetString(obj, "n", "d"), "d");
    EXPECT_THROW(GetString(obj, "i", "d"), std::invalid_argument);

    EXPECT_EQ(GetInt(obj, "i", 0), 7);
    EXPECT_EQ(GetInt(obj, "missing", 3), 3);
    EXPECT_EQ(GetInt(obj, "i", 0, 7, 7), 7);
    EXPECT_THROW(GetInt(obj, "i", 0, 8), std::invalid_argument);
    EXPECT_THROW(GetInt(obj, "i", 0, 0, 6), std::invalid_argument);
    EXPECT_THROW(GetInt(obj, "s", 0), std::invalid_argument);
    EXPECT_THROW(GetInt(obj, "b", 0), std::invalid_argument);

    EXPECT_TRUE(GetObject(obj, "o").isObject());
    EXPECT_TRUE(GetObject(obj, "missing").isNull());
    EXPECT_THROW(GetObject(obj, "s"), std::invalid_argument);

    EXPECT_NO_THROW(AssertNoUnknownKeys(obj, {"s", "i", "b", "o", "n"}, "test"));
    EXPECT_THROW(AssertNoUnknownKeys(obj, {"s", "i"}, "test"), std::invalid_argument);
    EXPECT_NO_THROW(AssertNoUnknownKeys(Json::Value(), {}, "test"));
}

TEST(config, load_file) {
    boost::filesystem::path dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("numfmt-config-%%%%-%%%%-%%%%");
    boost::filesystem::create_directories(dir);
    {
        boost::filesystem::ofstream out(dir / "good.conf");
        out << "{\"locale\": {\"language\": \"en\"}, \"log\": {\"path\": \"logs\"}}";
    }
    {
        boost::filesystem::ofstream out(dir / "broken.conf");
        out << "{\"locale\": ";
    }
    {
        boost::filesystem::ofstream out(dir / "array.conf");
        out << "[1, 2, 3]";
    }

    Config cfg = LoadConfig(dir / "good.conf");
    EXPECT_EQ(cfg.language, "en");
    EXPECT_EQ(cfg.log_path, "logs");
    EXPECT_THROW(LoadConfig(dir / "broken.conf"), std::runtime_error);
    EXPECT_THROW(LoadConfig(dir / "array.conf"), std::runtime_error);
    EXPECT_THROW(LoadConfig(dir / "missing.conf"), std::runtime_error);

    boost::filesystem::remove_all(dir);
}

// End of File
