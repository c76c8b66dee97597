/**
 * @file batch_persistence.hpp
 * @brief Idempotent bulk upsert of computed metrics
 */

#ifndef FUNDMETRICS_BATCH_BATCH_PERSISTENCE_HPP
#define FUNDMETRICS_BATCH_BATCH_PERSISTENCE_HPP

#include "data/record_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace fundmetrics {
namespace batch {

/**
 * @struct PersistStats
 * @brief Outcome of one bulk upsert
 */
struct PersistStats {
    size_t inserted = 0;
    size_t updated = 0;
    size_t duplicates_collapsed = 0;  ///< Records superseded by a later one in the same batch
    int attempts = 0;
};

/**
 * @class BatchPersistenceAdapter
 * @brief Read-then-split upsert, serialised per portfolio
 *
 * For each call the adapter reads the portfolio's existing keys once,
 * splits the batch into updates and inserts, and applies both. The whole
 * cycle runs under a per-portfolio lock, so overlapping runs for the same
 * portfolio cannot lose updates while runs for different portfolios never
 * wait on each other.
 *
 * A core::PersistenceConflict restarts the cycle up to max_retries times;
 * after that the failure surfaces as core::PersistenceError.
 */
class BatchPersistenceAdapter {
public:
    explicit BatchPersistenceAdapter(data::RecordStore& store, int max_retries = 1);

    /**
     * @brief Upsert metric records of one portfolio
     * @param portfolio Portfolio every record must belong to
     * @param records Records to persist; for duplicate keys the last wins
     * @return Insert/update counts
     * @throws std::invalid_argument if a record belongs to another portfolio
     * @throws core::PersistenceError when retries are exhausted
     */
    PersistStats bulk_upsert_metrics(const data::PortfolioId& portfolio,
                                     const std::vector<data::MetricRecord>& records);

    /**
     * @brief Replace a portfolio's aggregate wholesale
     */
    void replace_aggregate(const analytics::PortfolioMetricSet& aggregate);

    int max_retries() const { return max_retries_; }

private:
    std::mutex& portfolio_mutex(const data::PortfolioId& portfolio);

    data::RecordStore& store_;
    int max_retries_;
    std::mutex registry_mutex_;
    std::map<data::PortfolioId, std::unique_ptr<std::mutex>> portfolio_mutexes_;
};

} // namespace batch
} // namespace fundmetrics

#endif // FUNDMETRICS_BATCH_BATCH_PERSISTENCE_HPP
