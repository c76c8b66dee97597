/**
 * @file in_memory_record_store.hpp
 * @brief Mutex-guarded RecordStore backed by ordered maps
 */

#ifndef FUNDMETRICS_DATA_IN_MEMORY_RECORD_STORE_HPP
#define FUNDMETRICS_DATA_IN_MEMORY_RECORD_STORE_HPP

#include "data/record_store.hpp"
#include <atomic>
#include <mutex>

namespace fundmetrics {
namespace data {

/**
 * @class InMemoryRecordStore
 * @brief RecordStore for tests, demos and single-process runs
 *
 * Thread safety: every operation takes one internal mutex, so the store
 * may be shared between batch worker threads.
 */
class InMemoryRecordStore : public RecordStore {
public:
    InMemoryRecordStore() = default;

    UpsertOutcome upsert_entity(const Entity& entity) override;
    std::optional<Entity> get_entity(const EntityId& id) const override;
    std::vector<Entity> list_entities() const override;

    std::vector<TimeSeriesRecord> get_records(const EntityId& id, schema::DataKind kind) const override;
    std::vector<TimeSeriesRecord> get_records(schema::DataKind kind,
                                              const std::set<EntityId>& ids) const override;
    UpsertOutcome upsert_record(const EntityId& id, schema::DataKind kind,
                                const schema::PeriodKey& period,
                                const std::map<schema::Category, double>& fields) override;
    std::set<schema::PeriodKey> get_distinct_periods(schema::DataKind kind) const override;

    void upsert_holding(const Holding& holding) override;
    std::vector<Holding> get_holdings(const PortfolioId& portfolio) const override;
    std::vector<PortfolioId> list_portfolios() const override;

    std::set<MetricKey> existing_metric_keys(const PortfolioId& portfolio) const override;
    void insert_metrics(const std::vector<MetricRecord>& records) override;
    void update_metrics(const std::vector<MetricRecord>& records) override;
    std::vector<MetricRecord> get_metrics(const PortfolioId& portfolio) const override;

    void replace_portfolio_aggregate(const analytics::PortfolioMetricSet& aggregate) override;
    std::optional<analytics::PortfolioMetricSet> get_portfolio_aggregate(
        const PortfolioId& portfolio) const override;

    // -- Read counters
    size_t point_reads() const { return point_reads_.load(); }   ///< get_records(id, kind) calls
    size_t bulk_reads() const { return bulk_reads_.load(); }     ///< get_records(kind, ids) calls
    size_t metric_count() const;

private:
    using RecordKey = std::tuple<EntityId, schema::DataKind, schema::PeriodKey>;

    mutable std::mutex mutex_;
    std::map<EntityId, Entity> entities_;
    std::map<RecordKey, TimeSeriesRecord> records_;
    std::map<std::pair<PortfolioId, EntityId>, Holding> holdings_;
    std::map<MetricKey, MetricRecord> metrics_;
    std::map<PortfolioId, analytics::PortfolioMetricSet> aggregates_;

    mutable std::atomic<size_t> point_reads_{0};
    mutable std::atomic<size_t> bulk_reads_{0};
};

} // namespace data
} // namespace fundmetrics

#endif // FUNDMETRICS_DATA_IN_MEMORY_RECORD_STORE_HPP
