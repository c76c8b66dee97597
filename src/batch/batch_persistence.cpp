/**
 * @file batch_persistence.cpp
 * @brief Implementation of BatchPersistenceAdapter
 */

#include "batch/batch_persistence.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <stdexcept>

namespace fundmetrics {
namespace batch {

BatchPersistenceAdapter::BatchPersistenceAdapter(data::RecordStore& store, int max_retries)
    : store_(store), max_retries_(max_retries)
{
    if (max_retries < 0)
    {
        throw std::invalid_argument("BatchPersistenceAdapter: max_retries must be non-negative");
    }
}

std::mutex& BatchPersistenceAdapter::portfolio_mutex(const data::PortfolioId& portfolio)
{
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = portfolio_mutexes_[portfolio];
    if (!slot)
    {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

PersistStats BatchPersistenceAdapter::bulk_upsert_metrics(const data::PortfolioId& portfolio,
                                                          const std::vector<data::MetricRecord>& records)
{
    PersistStats stats;

    // Collapse duplicate keys; the last record for a key wins
    std::map<data::MetricKey, const data::MetricRecord*> latest;
    for (const auto& record : records)
    {
        if (record.key.portfolio_id != portfolio)
        {
            throw std::invalid_argument("bulk_upsert_metrics: record for portfolio '" +
                                        record.key.portfolio_id + "' passed for '" + portfolio + "'");
        }
        latest[record.key] = &record;
    }
    stats.duplicates_collapsed = records.size() - latest.size();

    if (latest.empty())
    {
        return stats;
    }

    std::lock_guard<std::mutex> lock(portfolio_mutex(portfolio));
    auto& log = *core::logger();

    for (int attempt = 0; attempt <= max_retries_; ++attempt)
    {
        stats.attempts = attempt + 1;
        try
        {
            const auto existing = store_.existing_metric_keys(portfolio);

            std::vector<data::MetricRecord> to_update;
            std::vector<data::MetricRecord> to_insert;
            for (const auto& entry : latest)
            {
                if (existing.count(entry.first))
                {
                    to_update.push_back(*entry.second);
                }
                else
                {
                    to_insert.push_back(*entry.second);
                }
            }

            if (!to_update.empty())
            {
                store_.update_metrics(to_update);
            }
            if (!to_insert.empty())
            {
                store_.insert_metrics(to_insert);
            }

            stats.updated = to_update.size();
            stats.inserted = to_insert.size();
            log.debug("Portfolio {}: persisted {} metric records ({} inserted, {} updated)",
                      portfolio, latest.size(), stats.inserted, stats.updated);
            return stats;
        }
        catch (const core::PersistenceConflict& e)
        {
            if (attempt < max_retries_)
            {
                log.warn("Portfolio {}: persistence conflict, retrying ({})", portfolio, e.what());
                continue;
            }
            log.error("Portfolio {}: persistence failed after {} attempts: {}",
                      portfolio, stats.attempts, e.what());
            throw core::PersistenceError(portfolio, "Persisting metrics for portfolio '" + portfolio +
                                                        "' failed after " + std::to_string(stats.attempts) +
                                                        " attempts: " + e.what());
        }
    }

    // Unreachable: the loop either returns or throws on its last attempt
    throw core::PersistenceError(portfolio, "Persisting metrics for portfolio '" + portfolio + "' failed");
}

void BatchPersistenceAdapter::replace_aggregate(const analytics::PortfolioMetricSet& aggregate)
{
    std::lock_guard<std::mutex> lock(portfolio_mutex(aggregate.portfolio_id));
    store_.replace_portfolio_aggregate(aggregate);
}

} // namespace batch
} // namespace fundmetrics
