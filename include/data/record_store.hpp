/**
 * @file record_store.hpp
 * @brief Keyed record store the engine reads from and writes to
 *
 * The storage engine itself is external. This interface is the whole
 * contract the engine relies on; InMemoryRecordStore is the bundled
 * implementation.
 */

#ifndef FUNDMETRICS_DATA_RECORD_STORE_HPP
#define FUNDMETRICS_DATA_RECORD_STORE_HPP

#include "analytics/metric_set.hpp"
#include "schema/category.hpp"
#include "schema/period_key.hpp"
#include "schema/period_registry.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace fundmetrics {
namespace data {

using EntityId = std::string;
using PortfolioId = std::string;

/**
 * @struct Entity
 * @brief Identity and identifier fields of one security
 */
struct Entity {
    EntityId id;                         ///< Stable key; the entity code
    std::string name;
    std::string code;
    std::string sector;
    std::string cap;                     ///< Size bucket (large, mid, small)
    std::optional<double> free_float;    ///< Free-float percentage
    std::string bse_code;
    std::string nse_code;
    std::string isin;
};

/**
 * @struct TimeSeriesRecord
 * @brief Measured values of one entity, one data kind, one period
 *
 * Holds one field per category of its kind; a field is absent when the
 * source cell was blank.
 */
struct TimeSeriesRecord {
    EntityId entity_id;
    schema::DataKind kind;
    schema::PeriodKey period;
    std::map<schema::Category, double> values;

    std::optional<double> value(schema::Category category) const;
};

/**
 * @struct Holding
 * @brief Position of an entity in a portfolio
 *
 * There is no stored weight: weights are derived from market values on
 * every aggregation.
 */
struct Holding {
    PortfolioId portfolio_id;
    EntityId entity_id;
    double shares = 0.0;
    double market_value = 0.0;
};

/**
 * @struct MetricKey
 * @brief Identity of a computed metric record
 */
struct MetricKey {
    PortfolioId portfolio_id;
    EntityId entity_id;
    schema::PeriodKey period;
    schema::DataKind period_kind;

    bool operator<(const MetricKey& other) const
    {
        return std::tie(portfolio_id, entity_id, period, period_kind) <
               std::tie(other.portfolio_id, other.entity_id, other.period, other.period_kind);
    }
    bool operator==(const MetricKey& other) const
    {
        return portfolio_id == other.portfolio_id && entity_id == other.entity_id &&
               period == other.period && period_kind == other.period_kind;
    }
};

/**
 * @struct MetricRecord
 * @brief Computed metrics stored under a MetricKey
 */
struct MetricRecord {
    MetricKey key;
    analytics::MetricSet metrics;
};

enum class UpsertOutcome {
    INSERTED,
    UPDATED
};

/**
 * @class RecordStore
 * @brief Abstract keyed store
 *
 * Implementations must make insert_metrics and update_metrics
 * all-or-nothing, and must raise core::PersistenceConflict when an insert
 * meets an existing key or an update meets a missing one.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // -- Entities
    virtual UpsertOutcome upsert_entity(const Entity& entity) = 0;
    virtual std::optional<Entity> get_entity(const EntityId& id) const = 0;
    virtual std::vector<Entity> list_entities() const = 0;

    // -- Time series
    virtual std::vector<TimeSeriesRecord> get_records(const EntityId& id, schema::DataKind kind) const = 0;

    /**
     * @brief Bulk read of one kind for many entities
     * @param kind Data kind to read
     * @param ids Entities to include
     * @return Records in no particular order
     */
    virtual std::vector<TimeSeriesRecord> get_records(schema::DataKind kind,
                                                      const std::set<EntityId>& ids) const = 0;

    /**
     * @brief Insert or overwrite a record's fields
     *
     * Fields present in the call replace stored values; other stored fields
     * of the same record are kept.
     */
    virtual UpsertOutcome upsert_record(const EntityId& id, schema::DataKind kind,
                                        const schema::PeriodKey& period,
                                        const std::map<schema::Category, double>& fields) = 0;

    virtual std::set<schema::PeriodKey> get_distinct_periods(schema::DataKind kind) const = 0;

    // -- Holdings
    virtual void upsert_holding(const Holding& holding) = 0;
    virtual std::vector<Holding> get_holdings(const PortfolioId& portfolio) const = 0;
    virtual std::vector<PortfolioId> list_portfolios() const = 0;

    // -- Computed metrics
    virtual std::set<MetricKey> existing_metric_keys(const PortfolioId& portfolio) const = 0;
    virtual void insert_metrics(const std::vector<MetricRecord>& records) = 0;
    virtual void update_metrics(const std::vector<MetricRecord>& records) = 0;
    virtual std::vector<MetricRecord> get_metrics(const PortfolioId& portfolio) const = 0;

    // -- Portfolio aggregates
    virtual void replace_portfolio_aggregate(const analytics::PortfolioMetricSet& aggregate) = 0;
    virtual std::optional<analytics::PortfolioMetricSet> get_portfolio_aggregate(
        const PortfolioId& portfolio) const = 0;
};

/**
 * @brief Rebuild a Period Registry from stored periods
 *
 * Every category of a kind receives all periods stored for that kind.
 */
schema::PeriodRegistry load_registry(const RecordStore& store);

} // namespace data
} // namespace fundmetrics

#endif // FUNDMETRICS_DATA_RECORD_STORE_HPP
