/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and the configuration structs
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace fundmetrics;
using namespace fundmetrics::data;
using Catch::Matchers::WithinAbs;

namespace {

std::string write_temp(const std::string& name, const std::string& content)
{
    auto path = std::filesystem::temp_directory_path() / ("fundmetrics_" + name);
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST_CASE("CSV line parsing", "[DataLoader]") {
    SECTION("Plain cells") {
        auto cells = DataLoader::parse_csv_line("a,b,,d");
        REQUIRE(cells == std::vector<std::string>{"a", "b", "", "d"});
    }

    SECTION("Quoted cells keep commas and doubled quotes") {
        auto cells = DataLoader::parse_csv_line("\"1,234.5\",\"say \"\"hi\"\"\",x");
        REQUIRE(cells.size() == 3);
        REQUIRE(cells[0] == "1,234.5");
        REQUIRE(cells[1] == "say \"hi\"");
    }

    SECTION("Escaping is the inverse of parsing") {
        const std::string cell = "Net Sales, \"Consolidated\"";
        auto parsed = DataLoader::parse_csv_line(DataLoader::escape_csv(cell) + ",next");
        REQUIRE(parsed[0] == cell);
        REQUIRE(DataLoader::escape_csv("plain") == "plain");
    }
}

TEST_CASE("safe_stod", "[DataLoader]") {
    REQUIRE_THAT(DataLoader::safe_stod(" 12.5 "), WithinAbs(12.5, 1e-12));
    REQUIRE(std::isnan(DataLoader::safe_stod("")));
    REQUIRE(std::isnan(DataLoader::safe_stod("nan")));
    REQUIRE(std::isnan(DataLoader::safe_stod("12abc")));
    REQUIRE(std::isnan(DataLoader::safe_stod("abc")));
}

TEST_CASE("Table CSV loading splits header and data rows", "[DataLoader]") {
    std::string csv;
    for (int i = 0; i < 8; ++i) {
        csv += "h" + std::to_string(i) + ",x\r\n";
    }
    csv += "Alpha Ltd,AC01\n\nBeta Ltd,AC02\n";
    auto path = write_temp("table.csv", csv);

    Table table = DataLoader::load_table_csv(path, 8);
    REQUIRE(table.header_rows.size() == 8);
    REQUIRE(table.header_rows[7][0] == "h7");
    REQUIRE(table.header_rows[7][1] == "x");
    REQUIRE(table.data_rows.size() == 2);
    REQUIRE(table.data_rows[1][1] == "AC02");

    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(DataLoader::load_table_csv("/nonexistent/table.csv", 8), std::runtime_error);
}

TEST_CASE("Holdings CSV loading", "[DataLoader]") {
    auto path = write_temp("holdings.csv",
                           "portfolio,entity_code,shares,market_value\n"
                           "GROWTH,AC01,100,2500.5\n"
                           "GROWTH,AC02,50,\n"
                           "VALUE,AC01,10\n"
                           ",AC03,1,1\n");

    auto holdings = DataLoader::load_holdings_csv(path);
    REQUIRE(holdings.size() == 2);
    REQUIRE(holdings[0].portfolio_id == "GROWTH");
    REQUIRE(holdings[0].entity_id == "AC01");
    REQUIRE_THAT(holdings[0].market_value, WithinAbs(2500.5, 1e-9));
    // Missing market value weighs zero
    REQUIRE(holdings[1].market_value == 0.0);

    std::filesystem::remove(path);
}

TEST_CASE("Holdings codes exported as decimals match entity codes", "[DataLoader]") {
    auto path = write_temp("holdings_codes.csv",
                           "portfolio,entity_code,shares,market_value\n"
                           "GROWTH,500325.0,10,1000\n"
                           "GROWTH, 532540 ,5,500\n"
                           "GROWTH,AC01.0,1,1\n");

    auto holdings = DataLoader::load_holdings_csv(path);
    REQUIRE(holdings.size() == 3);
    REQUIRE(holdings[0].entity_id == "500325");
    REQUIRE(holdings[1].entity_id == "532540");
    // Only all-digit codes are cleaned
    REQUIRE(holdings[2].entity_id == "AC01.0");

    std::filesystem::remove(path);
}

TEST_CASE("Engine configuration", "[DataLoader][Config]") {
    SECTION("Defaults for missing sections") {
        auto config = EngineConfig::from_json(nlohmann::json::object());
        REQUIRE(config.data.output_dir == "results");
        REQUIRE(config.header.header_row_count == 8);
        REQUIRE(config.batch.worker_threads == 1);
        REQUIRE(config.log_level == "info");
    }

    SECTION("Values from file") {
        auto path = write_temp("config.json", R"({
            "data": {"input_files": ["a.csv", "b.csv"], "holdings_file": "h.csv"},
            "header": {"header_rows": 9, "period_row": 8},
            "batch": {"bond_rate": 0.07, "worker_threads": 3, "progress_cadence": 5},
            "logging": {"level": "debug"}
        })");

        auto config = EngineConfig::load_from_file(path);
        REQUIRE(config.data.input_files.size() == 2);
        REQUIRE(config.data.holdings_file == "h.csv");
        REQUIRE(config.header.header_row_count == 9);
        REQUIRE(config.header.period_row == 8);
        REQUIRE_THAT(config.batch.bond_rate, WithinAbs(0.07, 1e-12));
        REQUIRE(config.batch.worker_threads == 3);
        REQUIRE(config.batch.progress_cadence == 5);
        REQUIRE(config.log_level == "debug");

        std::filesystem::remove(path);
    }

    SECTION("Invalid values are rejected") {
        REQUIRE_THROWS_AS(batch::BatchConfig::from_json({{"worker_threads", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(schema::HeaderLayout::from_json({{"header_rows", 4}}), std::invalid_argument);
    }

    SECTION("Unreadable or malformed files") {
        REQUIRE_THROWS_AS(EngineConfig::load_from_file("/nonexistent/config.json"), std::runtime_error);
        auto path = write_temp("bad_config.json", "{ not json");
        REQUIRE_THROWS_AS(EngineConfig::load_from_file(path), std::runtime_error);
        std::filesystem::remove(path);
    }
}
