/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lobsim/book/TradeLogger.hpp"
#include "lobsim/serialization/json_util.hpp"
#include "lobsim/simulation/Simulation.hpp"
#include "lobsim/util/common.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"lobsim v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Simulation config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path logDir{"logs"};
    app.add_option("-o,--log-dir", logDir, "Directory for the trade log and run summary");

    bool debug = false;
    app.add_flag("--debug", debug, "Log every step and engine event");

    CLI11_PARSE(app, argc, argv);

    fmt::println("{}", app.get_description());

    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);

    try {
        auto simulation = lobsim::simulation::Simulation::fromConfig(config);

        fs::create_directories(logDir);
        lobsim::book::TradeLogger tradeLogger{
            logDir / "trades.csv", simulation->book()->signals().trade};

        simulation->simulate();

        rapidjson::Document json;
        simulation->jsonSerialize(json);
        std::ofstream ofs{logDir / "summary.json"};
        lobsim::json::dumpJson(json, ofs, {.indent = lobsim::json::IndentOptions{}});

        fmt::println(
            " - {} trades written to '{}'",
            tradeLogger.recordCount(),
            tradeLogger.filepath().generic_string());
    }
    catch (const std::exception& e) {
        spdlog::critical(e.what());
        return 1;
    }

    fmt::println(" - simulation finished, exiting");

    return 0;
}

//-------------------------------------------------------------------------
