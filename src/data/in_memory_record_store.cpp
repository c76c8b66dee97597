/**
 * @file in_memory_record_store.cpp
 * @brief Implementation of InMemoryRecordStore
 */

#include "data/in_memory_record_store.hpp"
#include "core/errors.hpp"
#include <stdexcept>

namespace fundmetrics {
namespace data {

// ============================================================================
// InMemoryRecordStore - Entities
// ============================================================================

UpsertOutcome InMemoryRecordStore::upsert_entity(const Entity& entity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = entities_.insert_or_assign(entity.id, entity);
    return result.second ? UpsertOutcome::INSERTED : UpsertOutcome::UPDATED;
}

std::optional<Entity> InMemoryRecordStore::get_entity(const EntityId& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Entity> InMemoryRecordStore::list_entities() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entity> out;
    out.reserve(entities_.size());
    for (const auto& entry : entities_)
    {
        out.push_back(entry.second);
    }
    return out;
}

// ============================================================================
// InMemoryRecordStore - Time series
// ============================================================================

std::vector<TimeSeriesRecord> InMemoryRecordStore::get_records(const EntityId& id,
                                                               schema::DataKind kind) const
{
    ++point_reads_;
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TimeSeriesRecord> out;
    for (const auto& entry : records_)
    {
        if (entry.second.entity_id == id && entry.second.kind == kind)
        {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<TimeSeriesRecord> InMemoryRecordStore::get_records(schema::DataKind kind,
                                                               const std::set<EntityId>& ids) const
{
    ++bulk_reads_;
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TimeSeriesRecord> out;
    for (const auto& entry : records_)
    {
        if (entry.second.kind == kind && ids.count(entry.second.entity_id))
        {
            out.push_back(entry.second);
        }
    }
    return out;
}

UpsertOutcome InMemoryRecordStore::upsert_record(const EntityId& id, schema::DataKind kind,
                                                 const schema::PeriodKey& period,
                                                 const std::map<schema::Category, double>& fields)
{
    for (const auto& field : fields)
    {
        if (!schema::is_time_series(field.first) || schema::data_kind(field.first) != kind)
        {
            throw std::invalid_argument("upsert_record: field '" + schema::to_string(field.first) +
                                        "' does not belong to kind '" + schema::to_string(kind) + "'");
        }
    }
    if (period.format() != schema::period_format(kind))
    {
        throw std::invalid_argument("upsert_record: period " + period.to_string() +
                                    " does not match kind '" + schema::to_string(kind) + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    RecordKey key{id, kind, period};
    auto it = records_.find(key);
    if (it == records_.end())
    {
        records_.emplace(key, TimeSeriesRecord{id, kind, period, fields});
        return UpsertOutcome::INSERTED;
    }
    for (const auto& field : fields)
    {
        it->second.values[field.first] = field.second;
    }
    return UpsertOutcome::UPDATED;
}

std::set<schema::PeriodKey> InMemoryRecordStore::get_distinct_periods(schema::DataKind kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<schema::PeriodKey> out;
    for (const auto& entry : records_)
    {
        if (entry.second.kind == kind)
        {
            out.insert(entry.second.period);
        }
    }
    return out;
}

// ============================================================================
// InMemoryRecordStore - Holdings
// ============================================================================

void InMemoryRecordStore::upsert_holding(const Holding& holding)
{
    std::lock_guard<std::mutex> lock(mutex_);
    holdings_[{holding.portfolio_id, holding.entity_id}] = holding;
}

std::vector<Holding> InMemoryRecordStore::get_holdings(const PortfolioId& portfolio) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Holding> out;
    for (const auto& entry : holdings_)
    {
        if (entry.first.first == portfolio)
        {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<PortfolioId> InMemoryRecordStore::list_portfolios() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PortfolioId> out;
    for (const auto& entry : holdings_)
    {
        if (out.empty() || out.back() != entry.first.first)
        {
            out.push_back(entry.first.first);
        }
    }
    return out;
}

// ============================================================================
// InMemoryRecordStore - Metrics
// ============================================================================

std::set<MetricKey> InMemoryRecordStore::existing_metric_keys(const PortfolioId& portfolio) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<MetricKey> out;
    for (const auto& entry : metrics_)
    {
        if (entry.first.portfolio_id == portfolio)
        {
            out.insert(entry.first);
        }
    }
    return out;
}

void InMemoryRecordStore::insert_metrics(const std::vector<MetricRecord>& records)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<MetricKey> batch;
    for (const auto& record : records)
    {
        if (metrics_.count(record.key) || !batch.insert(record.key).second)
        {
            throw core::PersistenceConflict("insert_metrics: key already exists for entity " +
                                            record.key.entity_id + " period " +
                                            record.key.period.to_string());
        }
    }
    for (const auto& record : records)
    {
        metrics_.emplace(record.key, record);
    }
}

void InMemoryRecordStore::update_metrics(const std::vector<MetricRecord>& records)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records)
    {
        if (!metrics_.count(record.key))
        {
            throw core::PersistenceConflict("update_metrics: no record for entity " +
                                            record.key.entity_id + " period " +
                                            record.key.period.to_string());
        }
    }
    for (const auto& record : records)
    {
        metrics_.at(record.key) = record;
    }
}

std::vector<MetricRecord> InMemoryRecordStore::get_metrics(const PortfolioId& portfolio) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MetricRecord> out;
    for (const auto& entry : metrics_)
    {
        if (entry.first.portfolio_id == portfolio)
        {
            out.push_back(entry.second);
        }
    }
    return out;
}

size_t InMemoryRecordStore::metric_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.size();
}

// ============================================================================
// InMemoryRecordStore - Aggregates
// ============================================================================

void InMemoryRecordStore::replace_portfolio_aggregate(const analytics::PortfolioMetricSet& aggregate)
{
    std::lock_guard<std::mutex> lock(mutex_);
    aggregates_.insert_or_assign(aggregate.portfolio_id, aggregate);
}

std::optional<analytics::PortfolioMetricSet> InMemoryRecordStore::get_portfolio_aggregate(
    const PortfolioId& portfolio) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aggregates_.find(portfolio);
    if (it == aggregates_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace data
} // namespace fundmetrics
