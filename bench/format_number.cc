// Copyright (c) 2022 Mark Friedenbach
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <benchmark/benchmark.h>

#include <optional>
#include <string>

#include "format_number.h"

using numfmt::NumberFormatter;
using numfmt::ValidationError;

// Benchmark conversion of user input to database values
static void NumberFormatter_to_db(benchmark::State& state) {
    const NumberFormatter fmt;
    const std::optional<std::string> raw = std::string("-1.234.567,89");
    std::optional<std::string> db;
    for (auto _ : state) {
        db = fmt.ToDb(raw, 14, 2);
        benchmark::DoNotOptimize(db);
    }
}
BENCHMARK(NumberFormatter_to_db);

static void NumberFormatter_to_db_rejected(benchmark::State& state) {
    const NumberFormatter fmt;
    const std::optional<std::string> raw = std::string("1.234,567");
    for (auto _ : state) {
        try {
            fmt.ToDb(raw, 14, 2);
        } catch (const ValidationError& e) {
            int kind = e.kind();
            benchmark::DoNotOptimize(kind);
        }
    }
}
BENCHMARK(NumberFormatter_to_db_rejected);

static void NumberFormatter_from_db(benchmark::State& state) {
    const NumberFormatter fmt;
    const std::optional<std::string> db = std::string("-1234567.89");
    std::string ui;
    for (auto _ : state) {
        ui = fmt.FromDb(db, 2, ".", ",");
        benchmark::DoNotOptimize(ui);
    }
}
BENCHMARK(NumberFormatter_from_db);

static void NumberFormatter_round_trip(benchmark::State& state) {
    const NumberFormatter fmt;
    std::optional<std::string> db = std::string("-1234567.89");
    for (auto _ : state) {
        db = fmt.ToDb(fmt.FromDb(db, 2, " ", ","), 14, 2);
    }
}
BENCHMARK(NumberFormatter_round_trip);

// End of File
