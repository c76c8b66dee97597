/**
 * @file test_column_exporter.cpp
 * @brief Unit tests for ColumnExporter and the metric report writers
 */

#include <catch2/catch_test_macros.hpp>
#include "data/data_loader.hpp"
#include "data/in_memory_record_store.hpp"
#include "data/table_ingestor.hpp"
#include "report/column_exporter.hpp"
#include "report/metrics_report.hpp"
#include "schema/header_classifier.hpp"
#include "test_fixtures.hpp"
#include <filesystem>
#include <fstream>

using namespace fundmetrics;
using namespace fundmetrics::data;
using namespace fundmetrics::schema;
using report::ColumnExporter;

namespace {

void seed(InMemoryRecordStore& store, PeriodRegistry& registry)
{
    Entity alpha;
    alpha.id = alpha.code = "AC01";
    alpha.name = "Alpha Ltd";
    alpha.sector = "IT";
    alpha.free_float = 40.0;
    alpha.isin = "INE000A01";
    store.upsert_entity(alpha);

    Entity beta;
    beta.id = beta.code = "AC02";
    beta.name = "Beta Ltd";
    store.upsert_entity(beta);

    store.upsert_record("AC01", DataKind::VALUATION, PeriodKey::date(2024, 3, 31), {{Category::MARKET_CAP, 2000.0}});
    store.upsert_record("AC01", DataKind::VALUATION, PeriodKey::date(2023, 12, 31), {{Category::MARKET_CAP, 1800.0}});
    store.upsert_record("AC02", DataKind::VALUATION, PeriodKey::date(2024, 3, 31), {{Category::MARKET_CAP, 900.0}});
    store.upsert_record("AC01", DataKind::TRAILING, PeriodKey::year_month(2024, 3), {{Category::TTM_PAT, 100.0}});

    registry = load_registry(store);
}

// identity 0..4 | 5 | TTM PAT 6 | 7 | identifiers 8..10
Table upload(const std::string& period, const std::string& profit)
{
    testing::HeaderBuilder header;
    header.identity().separator().column("TTM PAT", period).separator().identifiers();

    Table table;
    table.header_rows = header.rows();
    table.data_rows = {
        {"Alpha Ltd", "AC01", "IT", "Large", "40", "", profit, "", "500325", "ALPHA", "INE000A01"},
    };
    return table;
}

/// Steps the CLI runs: load state, ingest, export, save state
report::RenderedTable run_once(const DataConfig& config, const Table& table)
{
    PeriodRegistry registry;
    InMemoryRecordStore store;
    DataLoader::load_state(config, registry, store);

    TableIngestor(store, registry).ingest(table);

    BlockProjector projector;
    auto rendered = ColumnExporter(store, projector).render_columns(projector.project(registry),
                                                                    store.list_entities());
    DataLoader::save_state(config, registry, store);
    return rendered;
}

} // namespace

TEST_CASE("Successive runs accumulate uploads", "[ColumnExporter][DataLoader]") {
    const auto dir = std::filesystem::temp_directory_path() / "fundmetrics_state";
    std::filesystem::remove_all(dir);

    DataConfig config;
    config.registry_file = (dir / "period_registry.json").string();
    config.store_file = (dir / "record_store.json").string();

    run_once(config, upload("202403", "100"));
    report::RenderedTable second = run_once(config, upload("202406", "120"));

    // The second export carries both quarters of the TTM PAT block
    auto saved_registry = PeriodRegistry::from_json(DataLoader::load_json(config.registry_file));
    BlockLayout layout = BlockProjector().project(saved_registry);
    const auto latest = *layout.column_for(Category::TTM_PAT, PeriodKey::year_month(2024, 6));
    const auto earlier = *layout.column_for(Category::TTM_PAT, PeriodKey::year_month(2024, 3));

    REQUIRE(second.data_rows.size() == 1);
    const auto& row = second.data_rows[0];
    REQUIRE(row.size() == layout.total_columns());
    REQUIRE(second.header_rows[HeaderLayout().period_row][latest] == "202406");
    REQUIRE(second.header_rows[HeaderLayout().period_row][earlier] == "202403");
    REQUIRE(row[latest] == "120.000000");
    REQUIRE(row[earlier] == "100.000000");

    SECTION("The store file restores what the registry lists") {
        InMemoryRecordStore store;
        const size_t restored = DataLoader::restore_snapshot(DataLoader::load_json(config.store_file), store);
        REQUIRE(restored == 2);
        REQUIRE(store.get_entity("AC01")->bse_code == "500325");
        REQUIRE(store.get_entity("AC01")->free_float == 40.0);

        auto registry = PeriodRegistry::from_json(DataLoader::load_json(config.registry_file));
        REQUIRE(registry.includes(load_registry(store)));
    }

    SECTION("A registry file lost between runs is rebuilt from the store") {
        std::filesystem::remove(config.registry_file);
        PeriodRegistry registry;
        InMemoryRecordStore store;
        DataLoader::load_state(config, registry, store);
        REQUIRE(registry.size(Category::TTM_PAT) == 2);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Malformed store snapshots are rejected", "[DataLoader]") {
    InMemoryRecordStore store;
    const auto wrong_format = nlohmann::json::parse(R"({
        "entities": [{"id": "AC01", "name": "Alpha Ltd"}],
        "records": [{"entity": "AC01", "kind": "trailing", "period": "2024-03-31",
                     "values": {"ttm_pat": 1.0}}]
    })");
    REQUIRE_THROWS_AS(DataLoader::restore_snapshot(wrong_format, store), std::runtime_error);

    const auto foreign_field = nlohmann::json::parse(R"({
        "entities": [],
        "records": [{"entity": "AC01", "kind": "trailing", "period": "202403",
                     "values": {"market_cap": 1.0}}]
    })");
    REQUIRE_THROWS_AS(DataLoader::restore_snapshot(foreign_field, store), std::runtime_error);

    REQUIRE_THROWS_AS(DataLoader::restore_snapshot(nlohmann::json::object(), store), std::runtime_error);
}

TEST_CASE("render_columns fills blocks from stored values", "[ColumnExporter]") {
    InMemoryRecordStore store;
    PeriodRegistry registry;
    seed(store, registry);

    BlockProjector projector;
    BlockLayout layout = projector.project(registry);
    ColumnExporter exporter(store, projector);
    auto table = exporter.render_columns(layout, store.list_entities());

    REQUIRE(table.header_rows.size() == HeaderLayout().header_row_count);
    REQUIRE(table.data_rows.size() == 2);

    const auto& alpha = table.data_rows[0];
    const auto& beta = table.data_rows[1];
    REQUIRE(alpha.size() == layout.total_columns());

    SECTION("Fixed blocks come from the entity master") {
        const Block& identity = layout.block(Category::IDENTITY);
        REQUIRE(alpha[identity.start_col] == "Alpha Ltd");
        REQUIRE(alpha[identity.start_col + 1] == "AC01");
        REQUIRE(alpha[identity.start_col + 4] == "40.000000");
        REQUIRE(beta[identity.start_col + 4].empty());
        REQUIRE(alpha[layout.block(Category::IDENTIFIERS).end_col()] == "INE000A01");
    }

    SECTION("Dynamic blocks by exact period, gaps left blank") {
        const auto recent = *layout.column_for(Category::MARKET_CAP, PeriodKey::date(2024, 3, 31));
        const auto older = *layout.column_for(Category::MARKET_CAP, PeriodKey::date(2023, 12, 31));
        REQUIRE(alpha[recent] == "2000.000000");
        REQUIRE(alpha[older] == "1800.000000");
        REQUIRE(beta[recent] == "900.000000");
        REQUIRE(beta[older].empty());

        const auto pat = *layout.column_for(Category::TTM_PAT, PeriodKey::year_month(2024, 3));
        REQUIRE(alpha[pat] == "100.000000");
        // The registry is shared per kind, so the revenue block exists but is empty
        const auto revenue = *layout.column_for(Category::TTM_REVENUE, PeriodKey::year_month(2024, 3));
        REQUIRE(alpha[revenue].empty());
    }

    SECTION("Separators stay blank") {
        for (size_t column : layout.separator_columns()) {
            REQUIRE(alpha[column].empty());
        }
    }

    SECTION("One bulk read per kind") {
        REQUIRE(store.bulk_reads() == all_data_kinds().size());
        REQUIRE(store.point_reads() == 0);
    }
}

TEST_CASE("Exported sheet re-ingests to the same values", "[ColumnExporter][TableIngestor]") {
    InMemoryRecordStore store;
    PeriodRegistry registry;
    seed(store, registry);

    BlockProjector projector;
    auto table = ColumnExporter(store, projector).render_columns(projector.project(registry), store.list_entities());

    auto path = (std::filesystem::temp_directory_path() / "fundmetrics_export.csv").string();
    ColumnExporter::write_csv(table, path);

    Table loaded = DataLoader::load_table_csv(path, HeaderLayout().header_row_count);
    REQUIRE(loaded.data_rows.size() == 2);

    InMemoryRecordStore copy;
    PeriodRegistry copy_registry;
    IngestStats stats = TableIngestor(copy, copy_registry).ingest(loaded);

    REQUIRE(stats.entities_added == 2);
    REQUIRE(stats.unparseable_periods == 0);
    REQUIRE(copy_registry.includes(load_registry(copy)));

    auto valuation = copy.get_records("AC01", DataKind::VALUATION);
    REQUIRE(valuation.size() == 2);
    REQUIRE(copy.get_entity("AC01")->isin == "INE000A01");

    std::filesystem::remove(path);
}

TEST_CASE("Metric report writers", "[MetricsReport]") {
    MetricRecord record;
    record.key = {"P1", "AC01", PeriodKey::year_month(2024, 3), DataKind::TRAILING};
    record.metrics.set(analytics::Metric::CURRENT_PE, analytics::MetricResult::ok(20.0));

    const auto dir = std::filesystem::temp_directory_path() / "fundmetrics_reports";
    const auto csv_path = (dir / "metrics.csv").string();
    report::write_metrics_csv({record}, csv_path);

    std::ifstream csv(csv_path);
    std::string header, line;
    std::getline(csv, header);
    std::getline(csv, line);
    REQUIRE(header.rfind("portfolio,entity,period,period_kind,patm,", 0) == 0);
    REQUIRE(line.rfind("P1,AC01,202403,trailing,", 0) == 0);
    REQUIRE(line.find("20.000000") != std::string::npos);

    analytics::PortfolioMetricSet aggregate;
    aggregate.portfolio_id = "P1";
    const auto json_path = (dir / "aggregates.json").string();
    report::write_aggregate_json({aggregate}, json_path);

    auto j = DataLoader::load_json(json_path);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["portfolio_id"] == "P1");

    std::filesystem::remove_all(dir);
}
