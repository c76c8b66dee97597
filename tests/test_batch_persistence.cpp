/**
 * @file test_batch_persistence.cpp
 * @brief Unit tests for BatchPersistenceAdapter
 */

#include <catch2/catch_test_macros.hpp>
#include "batch/batch_persistence.hpp"
#include "core/errors.hpp"
#include "data/in_memory_record_store.hpp"

using namespace fundmetrics;
using namespace fundmetrics::batch;
using namespace fundmetrics::data;
using namespace fundmetrics::schema;

namespace {

MetricRecord metric_record(const PortfolioId& portfolio, const EntityId& entity, int month, double qoq)
{
    MetricRecord record;
    record.key = {portfolio, entity, PeriodKey::year_month(2024, month), DataKind::TRAILING};
    record.metrics.set(analytics::Metric::QOQ_GROWTH, analytics::MetricResult::ok(qoq));
    return record;
}

/// Store whose inserts conflict a fixed number of times
class ConflictingStore : public InMemoryRecordStore {
public:
    explicit ConflictingStore(int conflicts) : conflicts_left_(conflicts) {}

    void insert_metrics(const std::vector<MetricRecord>& records) override
    {
        ++insert_calls;
        if (conflicts_left_ > 0) {
            --conflicts_left_;
            throw core::PersistenceConflict("key inserted concurrently");
        }
        InMemoryRecordStore::insert_metrics(records);
    }

    int insert_calls = 0;

private:
    int conflicts_left_;
};

} // namespace

TEST_CASE("Persistence splits inserts and updates", "[BatchPersistence]") {
    InMemoryRecordStore store;
    BatchPersistenceAdapter adapter(store);

    std::vector<MetricRecord> batch = {
        metric_record("P1", "AC01", 3, 0.1),
        metric_record("P1", "AC02", 3, 0.2),
    };

    PersistStats first = adapter.bulk_upsert_metrics("P1", batch);
    REQUIRE(first.inserted == 2);
    REQUIRE(first.updated == 0);
    REQUIRE(first.attempts == 1);

    batch.push_back(metric_record("P1", "AC01", 6, 0.3));
    PersistStats second = adapter.bulk_upsert_metrics("P1", batch);
    REQUIRE(second.inserted == 1);
    REQUIRE(second.updated == 2);
    REQUIRE(store.metric_count() == 3);
}

TEST_CASE("Persistence is idempotent", "[BatchPersistence]") {
    InMemoryRecordStore store;
    BatchPersistenceAdapter adapter(store);

    std::vector<MetricRecord> batch = {
        metric_record("P1", "AC01", 3, 0.1),
        metric_record("P1", "AC01", 6, 0.2),
    };

    adapter.bulk_upsert_metrics("P1", batch);
    auto once = store.get_metrics("P1");
    adapter.bulk_upsert_metrics("P1", batch);
    auto twice = store.get_metrics("P1");

    REQUIRE(once.size() == twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        REQUIRE(once[i].key == twice[i].key);
        REQUIRE(once[i].metrics.get(analytics::Metric::QOQ_GROWTH) ==
                twice[i].metrics.get(analytics::Metric::QOQ_GROWTH));
    }
}

TEST_CASE("Duplicate keys in one batch collapse to the last", "[BatchPersistence]") {
    InMemoryRecordStore store;
    BatchPersistenceAdapter adapter(store);

    std::vector<MetricRecord> batch = {
        metric_record("P1", "AC01", 3, 0.1),
        metric_record("P1", "AC01", 3, 0.5),
    };

    PersistStats stats = adapter.bulk_upsert_metrics("P1", batch);
    REQUIRE(stats.duplicates_collapsed == 1);
    REQUIRE(stats.inserted == 1);

    auto stored = store.get_metrics("P1");
    REQUIRE(stored.size() == 1);
    REQUIRE(stored[0].metrics.get(analytics::Metric::QOQ_GROWTH) == 0.5);
}

TEST_CASE("Persistence rejects records of another portfolio", "[BatchPersistence]") {
    InMemoryRecordStore store;
    BatchPersistenceAdapter adapter(store);

    REQUIRE_THROWS_AS(adapter.bulk_upsert_metrics("P1", {metric_record("P2", "AC01", 3, 0.1)}),
                      std::invalid_argument);
    REQUIRE(store.metric_count() == 0);
}

TEST_CASE("Persistence retries a conflict", "[BatchPersistence]") {
    SECTION("One conflict is absorbed by the retry") {
        ConflictingStore store(1);
        BatchPersistenceAdapter adapter(store, 1);

        PersistStats stats = adapter.bulk_upsert_metrics("P1", {metric_record("P1", "AC01", 3, 0.1)});
        REQUIRE(stats.attempts == 2);
        REQUIRE(stats.inserted == 1);
        REQUIRE(store.insert_calls == 2);
        REQUIRE(store.metric_count() == 1);
    }

    SECTION("A second conflict surfaces as a hard failure") {
        ConflictingStore store(2);
        BatchPersistenceAdapter adapter(store, 1);

        try {
            adapter.bulk_upsert_metrics("P1", {metric_record("P1", "AC01", 3, 0.1)});
            FAIL("Expected PersistenceError");
        } catch (const core::PersistenceError& e) {
            REQUIRE(e.portfolio_id() == "P1");
        }
        REQUIRE(store.insert_calls == 2);
        REQUIRE(store.metric_count() == 0);
    }

    SECTION("Negative retry budgets are rejected") {
        InMemoryRecordStore store;
        REQUIRE_THROWS_AS(BatchPersistenceAdapter(store, -1), std::invalid_argument);
    }
}

TEST_CASE("In-memory store metric writes are all-or-nothing", "[BatchPersistence][InMemoryRecordStore]") {
    InMemoryRecordStore store;
    store.insert_metrics({metric_record("P1", "AC01", 3, 0.1)});

    REQUIRE_THROWS_AS(store.insert_metrics({metric_record("P1", "AC02", 3, 0.2), metric_record("P1", "AC01", 3, 0.3)}),
                      core::PersistenceConflict);
    REQUIRE(store.metric_count() == 1);

    REQUIRE_THROWS_AS(store.update_metrics({metric_record("P1", "AC09", 3, 0.2)}), core::PersistenceConflict);
}
