/**
 * @file metrics_batch_runner.hpp
 * @brief Portfolio-wide metric calculation runs
 *
 * One run per portfolio: load the holdings, load the time-series cache
 * once, compute every entity's metrics (optionally data-parallel across
 * entities), persist them, then aggregate. A bulk run over many
 * portfolios may be cancelled between portfolios, never inside one.
 */

#ifndef FUNDMETRICS_BATCH_METRICS_BATCH_RUNNER_HPP
#define FUNDMETRICS_BATCH_METRICS_BATCH_RUNNER_HPP

#include "analytics/metrics_calculator.hpp"
#include "analytics/portfolio_aggregator.hpp"
#include "batch/batch_persistence.hpp"
#include "data/record_store.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fundmetrics {
namespace batch {

/**
 * @struct BatchConfig
 * @brief Calculation run parameters
 */
struct BatchConfig {
    double bond_rate = analytics::MetricsCalculator::DEFAULT_BOND_RATE;
    size_t max_periods = 0;          ///< Periods per entity, most recent first; 0 = all
    size_t worker_threads = 1;       ///< Threads computing entities in parallel
    size_t progress_cadence = 25;    ///< Entities between progress reports
    int max_persist_retries = 1;     ///< Retries after a persistence conflict

    static BatchConfig from_json(const nlohmann::json& j);
};

enum class RunStatus {
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string to_string(RunStatus status);

/**
 * @struct ProgressUpdate
 * @brief Snapshot delivered to the progress callback
 */
struct ProgressUpdate {
    std::string portfolio_id;
    size_t processed = 0;
    size_t total = 0;
    std::string current_entity;   ///< Entity name, or id when the name is unknown
    RunStatus status = RunStatus::RUNNING;
};

/// Invoked on the thread that called run_portfolio()/run_all()
using ProgressCallback = std::function<void(const ProgressUpdate&)>;

enum class EntityOutcome {
    SUCCEEDED,   ///< Every metric computed from data
    PARTIAL,     ///< Some metrics defaulted for lack of data
    FAILED       ///< Computation threw; metrics defaulted to 0
};

std::string to_string(EntityOutcome outcome);

struct EntityResult {
    data::EntityId entity_id;
    EntityOutcome outcome = EntityOutcome::SUCCEEDED;
    size_t periods = 0;
    std::string error;
};

/**
 * @struct PortfolioRunResult
 * @brief Outcome of one portfolio
 */
struct PortfolioRunResult {
    data::PortfolioId portfolio_id;
    std::vector<EntityResult> entities;
    size_t succeeded = 0;
    size_t partial = 0;
    size_t failed = 0;
    PersistStats persist;
    bool persisted = false;
    std::string error;                                    ///< Persistence or run failure
    std::optional<analytics::PortfolioMetricSet> aggregate;
};

/**
 * @struct BatchSummary
 * @brief Outcome of a multi-portfolio run
 */
struct BatchSummary {
    std::vector<PortfolioRunResult> portfolios;
    size_t succeeded = 0;
    size_t partial = 0;
    size_t failed = 0;
    size_t portfolio_errors = 0;
    bool cancelled = false;

    /**
     * @brief Print run summary to stdout
     */
    void print_summary() const;
};

/**
 * @class MetricsBatchRunner
 * @brief Drives calculation, persistence and aggregation
 *
 * Usage Example:
 * @code
 * MetricsBatchRunner runner(store, config, [](const ProgressUpdate &p) {
 *     std::cout << p.processed << "/" << p.total << "\n";
 * });
 * auto summary = runner.run_all(store.list_portfolios(), &cancel_flag);
 * @endcode
 */
class MetricsBatchRunner {
public:
    MetricsBatchRunner(data::RecordStore& store, BatchConfig config = BatchConfig(),
                       ProgressCallback progress = ProgressCallback(),
                       analytics::PortfolioAggregator aggregator = analytics::PortfolioAggregator());

    /**
     * @brief Compute, persist and aggregate one portfolio
     *
     * Per-entity failures are isolated and counted. A persistence failure
     * is recorded on the result, not thrown.
     */
    PortfolioRunResult run_portfolio(const data::PortfolioId& portfolio);

    /**
     * @brief Run several portfolios in order
     * @param portfolios Portfolios to run
     * @param cancel Checked before each portfolio; may be null
     */
    BatchSummary run_all(const std::vector<data::PortfolioId>& portfolios,
                         const std::atomic<bool>* cancel = nullptr);

    const BatchConfig& config() const { return config_; }

private:
    struct EntityComputation {
        EntityResult result;
        std::vector<data::MetricRecord> records;
        analytics::MetricSet latest;
    };

    EntityComputation compute_entity(const data::PortfolioId& portfolio,
                                     const data::EntityId& entity,
                                     const data::TimeSeriesCache& cache) const;

    void report(const ProgressUpdate& update) const;

    data::RecordStore& store_;
    BatchConfig config_;
    ProgressCallback progress_;
    analytics::MetricsCalculator calculator_;
    analytics::PortfolioAggregator aggregator_;
    BatchPersistenceAdapter persistence_;
};

} // namespace batch
} // namespace fundmetrics

#endif // FUNDMETRICS_BATCH_METRICS_BATCH_RUNNER_HPP
