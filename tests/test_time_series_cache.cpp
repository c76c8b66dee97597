/**
 * @file test_time_series_cache.cpp
 * @brief Unit tests for TimeSeriesBundle and TimeSeriesCache
 */

#include <catch2/catch_test_macros.hpp>
#include "data/in_memory_record_store.hpp"
#include "data/time_series_cache.hpp"

using namespace fundmetrics::data;
using namespace fundmetrics::schema;

namespace {

void seed(InMemoryRecordStore& store, const EntityId& id)
{
    store.upsert_record(id, DataKind::QUARTERLY, PeriodKey::year_month(2023, 12), {{Category::QUARTERLY_REVENUE, 90.0}});
    store.upsert_record(id, DataKind::QUARTERLY, PeriodKey::year_month(2024, 3), {{Category::QUARTERLY_REVENUE, 100.0}});
    store.upsert_record(id, DataKind::QUARTERLY, PeriodKey::year_month(2023, 9), {{Category::QUARTERLY_REVENUE, 80.0}});
    store.upsert_record(id, DataKind::VALUATION, PeriodKey::date(2024, 3, 31), {{Category::MARKET_CAP, 2000.0}});
    store.upsert_record(id, DataKind::VALUATION, PeriodKey::date(2024, 4, 15), {{Category::MARKET_CAP, 2100.0}});
}

} // namespace

TEST_CASE("TimeSeriesCache loads with one bulk read per kind", "[TimeSeriesCache]") {
    InMemoryRecordStore store;
    seed(store, "AC01");
    seed(store, "AC02");
    seed(store, "AC03");

    auto cache = TimeSeriesCache::load(store, {"AC01", "AC02", "AC04"});

    REQUIRE(store.bulk_reads() == all_data_kinds().size());
    REQUIRE(store.point_reads() == 0);

    REQUIRE(cache.contains("AC01"));
    REQUIRE(cache.contains("AC02"));
    REQUIRE_FALSE(cache.contains("AC03"));

    SECTION("Unknown entities get an empty bundle") {
        REQUIRE_FALSE(cache.contains("AC04"));
        REQUIRE(cache.bundle("AC04").empty());
        REQUIRE(cache.bundle("missing").count(DataKind::QUARTERLY) == 0);
    }

    SECTION("Records are most recent first") {
        auto periods = cache.bundle("AC01").periods(DataKind::QUARTERLY);
        REQUIRE(periods.size() == 3);
        REQUIRE(periods[0] == PeriodKey::year_month(2024, 3));
        REQUIRE(periods[2] == PeriodKey::year_month(2023, 9));
    }
}

TEST_CASE("TimeSeriesBundle lookups never look ahead", "[TimeSeriesCache]") {
    InMemoryRecordStore store;
    seed(store, "AC01");
    auto cache = TimeSeriesCache::load(store, {"AC01"});
    const TimeSeriesBundle& bundle = cache.bundle("AC01");

    SECTION("up_to drops newer records") {
        auto range = bundle.up_to(DataKind::QUARTERLY, PeriodKey::year_month(2023, 12));
        REQUIRE(range.size() == 2);
        REQUIRE(range[0].period == PeriodKey::year_month(2023, 12));
        REQUIRE(*range[0].value(Category::QUARTERLY_REVENUE) == 90.0);
    }

    SECTION("Cross-format cutoff compares by month") {
        auto range = bundle.up_to(DataKind::VALUATION, PeriodKey::year_month(2024, 3));
        REQUIRE(range.size() == 1);
        REQUIRE(range[0].period == PeriodKey::date(2024, 3, 31));

        const TimeSeriesRecord* latest = bundle.latest_at_or_before(DataKind::VALUATION, PeriodKey::year_month(2024, 4));
        REQUIRE(latest);
        REQUIRE(latest->period == PeriodKey::date(2024, 4, 15));

        REQUIRE_FALSE(bundle.latest_at_or_before(DataKind::VALUATION, PeriodKey::year_month(2023, 12)));
    }

    SECTION("Exact find") {
        REQUIRE(bundle.find(DataKind::QUARTERLY, PeriodKey::year_month(2023, 9)));
        REQUIRE_FALSE(bundle.find(DataKind::QUARTERLY, PeriodKey::year_month(2023, 6)));
        REQUIRE_FALSE(bundle.find(DataKind::TRAILING, PeriodKey::year_month(2024, 3)));
    }

    SECTION("Empty range before the first record") {
        REQUIRE(bundle.up_to(DataKind::QUARTERLY, PeriodKey::year_month(2020, 1)).empty());
        REQUIRE(bundle.records(DataKind::ANNUAL).empty());
    }
}
