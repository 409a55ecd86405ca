// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <iostream>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

#include "absl/strings/str_cat.h"

#include "boost/filesystem.hpp"

#include "cli.h"
#include "config.h"
#include "format_number.h"
#include "log.h"
#include "text.h"

ABSL_FLAG(std::string, config, "numfmt.conf", "configuration file, used only if it exists");
ABSL_FLAG(std::string, language, "", "language of error messages; overrides the configuration file");
ABSL_FLAG(std::string, root, "", "directory containing the language catalogs; overrides the configuration file");
ABSL_FLAG(int, precision, 14, "total number of digits for to_db (DECIMAL precision)");
ABSL_FLAG(int, scale, 2, "number of fractional digits (DECIMAL scale)");
ABSL_FLAG(std::string, thousands_sep, ".", "thousands separator for from_db: \"\", \".\" or \" \"");
ABSL_FLAG(std::string, decimal_sep, ",", "decimal separator for from_db: \",\" or \".\"");

using numfmt::Config;
using numfmt::JsonLog;
using numfmt::NumberFormatter;
using numfmt::TextCatalog;

int main(int argc, char **argv)
{
    absl::SetProgramUsageMessage(absl::StrCat("Strict conversion of decimal numbers between display and database formats.\n",
        argv[0], " to_db <value>... [--precision=P] [--scale=S]\n",
        argv[0], " from_db <value>... [--scale=S] [--thousands_sep=.] [--decimal_sep=,]"));
    std::vector<char*> args = absl::ParseCommandLine(argc, argv);
    if (args.size() < 2) {
        std::cerr << absl::ProgramUsageMessage() << std::endl;
        return 1;
    }
    const std::string command = args[1];
    if (!numfmt::is_known_command(command)) {
        std::cerr << "error: unknown command '" << command << "'" << std::endl;
        std::cerr << absl::ProgramUsageMessage() << std::endl;
        return 1;
    }

    Config cfg;
    std::unique_ptr<JsonLog> log;
    std::unique_ptr<TextCatalog> catalog;
    try {
        // Load config file, if present
        const boost::filesystem::path config_path(absl::GetFlag(FLAGS_config));
        if (boost::filesystem::exists(config_path)) {
            cfg = numfmt::LoadConfig(config_path);
        }
        if (!absl::GetFlag(FLAGS_language).empty()) {
            cfg.language = absl::GetFlag(FLAGS_language);
        }
        if (!absl::GetFlag(FLAGS_root).empty()) {
            cfg.root = absl::GetFlag(FLAGS_root);
        }

        log = std::make_unique<JsonLog>(cfg.log_path, true);
        log->SetDefaultFile(cfg.log_default_file);
        log->SetMaxFileSize(cfg.log_max_bytes);
        log->SetMaxRotatedFiles(cfg.log_max_files < 0 ? std::nullopt : std::optional<int>(cfg.log_max_files));

        catalog = std::make_unique<TextCatalog>(cfg.root, cfg.language, log.get(), cfg.txt_log_file);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    const NumberFormatter fmt(catalog->Lookup());
    numfmt::ConvertOptions opts;
    opts.precision = absl::GetFlag(FLAGS_precision);
    opts.scale = absl::GetFlag(FLAGS_scale);
    opts.thousands_sep = absl::GetFlag(FLAGS_thousands_sep);
    opts.decimal_sep = absl::GetFlag(FLAGS_decimal_sep);
    const std::vector<std::string> inputs(args.begin() + 2, args.end());
    return numfmt::run_conversions(fmt, *log, command, inputs, opts, std::cout, std::cerr);
}

// End of File
