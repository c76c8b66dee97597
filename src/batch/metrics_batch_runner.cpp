/**
 * @file metrics_batch_runner.cpp
 * @brief Implementation of MetricsBatchRunner
 */

#include "batch/metrics_batch_runner.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>

namespace fundmetrics {
namespace batch {

// ============================================================================
// Configuration and enums
// ============================================================================

BatchConfig BatchConfig::from_json(const nlohmann::json& j)
{
    BatchConfig config;
    config.bond_rate = j.value("bond_rate", config.bond_rate);
    config.max_periods = j.value("max_periods", config.max_periods);
    config.worker_threads = j.value("worker_threads", config.worker_threads);
    config.progress_cadence = j.value("progress_cadence", config.progress_cadence);
    config.max_persist_retries = j.value("max_persist_retries", config.max_persist_retries);

    if (config.worker_threads == 0)
    {
        throw std::invalid_argument("BatchConfig: worker_threads must be at least 1");
    }
    if (config.progress_cadence == 0)
    {
        throw std::invalid_argument("BatchConfig: progress_cadence must be at least 1");
    }
    return config;
}

std::string to_string(RunStatus status)
{
    switch (status)
    {
    case RunStatus::RUNNING:   return "running";
    case RunStatus::COMPLETED: return "completed";
    case RunStatus::FAILED:    return "failed";
    case RunStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string to_string(EntityOutcome outcome)
{
    switch (outcome)
    {
    case EntityOutcome::SUCCEEDED: return "succeeded";
    case EntityOutcome::PARTIAL:   return "partial";
    case EntityOutcome::FAILED:    return "failed";
    }
    return "unknown";
}

void BatchSummary::print_summary() const
{
    std::cout << "\nMetrics Batch Summary\n";
    std::cout << std::string(60, '=') << "\n";
    for (const auto& p : portfolios)
    {
        std::cout << "  " << std::setw(16) << std::left << p.portfolio_id << std::right
                  << " entities: " << std::setw(5) << p.entities.size()
                  << "  ok: " << std::setw(5) << p.succeeded
                  << "  partial: " << std::setw(5) << p.partial
                  << "  failed: " << std::setw(5) << p.failed;
        if (!p.error.empty())
        {
            std::cout << "  ERROR: " << p.error;
        }
        std::cout << "\n";
    }
    std::cout << std::string(60, '-') << "\n";
    std::cout << "Succeeded: " << succeeded << "  Partial: " << partial
              << "  Failed: " << failed << "\n";
    std::cout << "Portfolio errors: " << portfolio_errors << "\n";
    if (cancelled)
    {
        std::cout << "Run cancelled before all portfolios were processed\n";
    }
    std::cout << std::string(60, '=') << "\n";
}

// ============================================================================
// MetricsBatchRunner
// ============================================================================

MetricsBatchRunner::MetricsBatchRunner(data::RecordStore& store, BatchConfig config,
                                       ProgressCallback progress,
                                       analytics::PortfolioAggregator aggregator)
    : store_(store),
      config_(std::move(config)),
      progress_(std::move(progress)),
      calculator_(config_.bond_rate),
      aggregator_(std::move(aggregator)),
      persistence_(store, config_.max_persist_retries)
{
    config_.worker_threads = std::max<size_t>(1, config_.worker_threads);
    config_.progress_cadence = std::max<size_t>(1, config_.progress_cadence);
}

void MetricsBatchRunner::report(const ProgressUpdate& update) const
{
    if (progress_)
    {
        progress_(update);
    }
}

MetricsBatchRunner::EntityComputation MetricsBatchRunner::compute_entity(
    const data::PortfolioId& portfolio,
    const data::EntityId& entity,
    const data::TimeSeriesCache& cache) const
{
    EntityComputation computation;
    computation.result.entity_id = entity;

    try
    {
        const auto& bundle = cache.bundle(entity);
        const auto periods = analytics::MetricsCalculator::analysis_periods(bundle, config_.max_periods);

        if (periods.empty())
        {
            core::logger()->warn("No trailing or quarterly data for entity {}; metrics default to 0", entity);
            computation.result.outcome = EntityOutcome::PARTIAL;
            return computation;
        }

        bool partial = false;
        for (const auto& p : periods)
        {
            analytics::MetricSet metrics = calculator_.compute(entity, p.period, bundle);
            partial = partial || metrics.count(analytics::MetricStatus::INSUFFICIENT_DATA) > 0;
            computation.records.push_back({{portfolio, entity, p.period, p.kind}, std::move(metrics)});
        }

        computation.latest = computation.records.front().metrics;
        computation.result.periods = computation.records.size();
        computation.result.outcome = partial ? EntityOutcome::PARTIAL : EntityOutcome::SUCCEEDED;
    }
    catch (const std::exception& e)
    {
        core::logger()->error("Metrics failed for entity {} in portfolio {}: {}", entity, portfolio, e.what());
        computation.records.clear();
        computation.latest = analytics::MetricSet();
        computation.result.outcome = EntityOutcome::FAILED;
        computation.result.periods = 0;
        computation.result.error = e.what();
    }
    return computation;
}

PortfolioRunResult MetricsBatchRunner::run_portfolio(const data::PortfolioId& portfolio)
{
    auto& log = *core::logger();
    PortfolioRunResult result;
    result.portfolio_id = portfolio;

    const auto holdings = store_.get_holdings(portfolio);
    const size_t total = holdings.size();
    log.info("Portfolio {}: computing metrics for {} holdings", portfolio, total);

    std::set<data::EntityId> ids;
    std::vector<std::string> names;
    names.reserve(total);
    for (const auto& holding : holdings)
    {
        ids.insert(holding.entity_id);
        auto entity = store_.get_entity(holding.entity_id);
        names.push_back(entity && !entity->name.empty() ? entity->name : holding.entity_id);
    }

    report({portfolio, 0, total, "", RunStatus::RUNNING});

    const data::TimeSeriesCache cache = data::TimeSeriesCache::load(store_, ids);

    // Waves of progress_cadence entities; each wave is split across workers
    std::vector<EntityComputation> computations(total);
    for (size_t wave_start = 0; wave_start < total; wave_start += config_.progress_cadence)
    {
        const size_t wave_end = std::min(total, wave_start + config_.progress_cadence);
        const size_t wave_size = wave_end - wave_start;
        const size_t workers = std::min(config_.worker_threads, wave_size);

        if (workers <= 1)
        {
            for (size_t i = wave_start; i < wave_end; ++i)
            {
                computations[i] = compute_entity(portfolio, holdings[i].entity_id, cache);
            }
        }
        else
        {
            const size_t chunk = (wave_size + workers - 1) / workers;
            std::vector<std::future<void>> futures;
            for (size_t begin = wave_start; begin < wave_end; begin += chunk)
            {
                const size_t end = std::min(wave_end, begin + chunk);
                futures.push_back(std::async(std::launch::async, [this, &portfolio, &holdings, &cache,
                                                                  &computations, begin, end]() {
                    for (size_t i = begin; i < end; ++i)
                    {
                        computations[i] = compute_entity(portfolio, holdings[i].entity_id, cache);
                    }
                }));
            }
            for (auto& future : futures)
            {
                future.get();
            }
        }

        report({portfolio, wave_end, total, names[wave_end - 1], RunStatus::RUNNING});
    }

    std::vector<data::MetricRecord> records;
    std::vector<analytics::HoldingMetrics> holding_metrics;
    holding_metrics.reserve(total);
    for (size_t i = 0; i < total; ++i)
    {
        auto& c = computations[i];
        switch (c.result.outcome)
        {
        case EntityOutcome::SUCCEEDED: ++result.succeeded; break;
        case EntityOutcome::PARTIAL:   ++result.partial; break;
        case EntityOutcome::FAILED:    ++result.failed; break;
        }
        records.insert(records.end(), std::make_move_iterator(c.records.begin()),
                       std::make_move_iterator(c.records.end()));
        holding_metrics.push_back({holdings[i].entity_id, holdings[i].market_value, c.latest});
        result.entities.push_back(std::move(c.result));
    }

    try
    {
        result.persist = persistence_.bulk_upsert_metrics(portfolio, records);
        result.aggregate = aggregator_.aggregate(portfolio, holding_metrics);
        persistence_.replace_aggregate(*result.aggregate);
        result.persisted = true;
    }
    catch (const core::PersistenceError& e)
    {
        result.error = e.what();
        log.error("Portfolio {}: {}", portfolio, e.what());
    }

    const RunStatus status = result.persisted ? RunStatus::COMPLETED : RunStatus::FAILED;
    report({portfolio, total, total, total ? names.back() : "", status});

    log.info("Portfolio {}: {} succeeded, {} partial, {} failed; {} records inserted, {} updated",
             portfolio, result.succeeded, result.partial, result.failed,
             result.persist.inserted, result.persist.updated);
    return result;
}

BatchSummary MetricsBatchRunner::run_all(const std::vector<data::PortfolioId>& portfolios,
                                         const std::atomic<bool>* cancel)
{
    auto& log = *core::logger();
    BatchSummary summary;

    for (const auto& portfolio : portfolios)
    {
        if (cancel && cancel->load())
        {
            summary.cancelled = true;
            log.warn("Batch cancelled: {} of {} portfolios processed",
                     summary.portfolios.size(), portfolios.size());
            report({portfolio, 0, 0, "", RunStatus::CANCELLED});
            break;
        }

        PortfolioRunResult result;
        try
        {
            result = run_portfolio(portfolio);
        }
        catch (const std::exception& e)
        {
            result = PortfolioRunResult();
            result.portfolio_id = portfolio;
            result.error = e.what();
            log.error("Portfolio {} aborted: {}", portfolio, e.what());
        }

        summary.succeeded += result.succeeded;
        summary.partial += result.partial;
        summary.failed += result.failed;
        if (!result.error.empty())
        {
            ++summary.portfolio_errors;
        }
        summary.portfolios.push_back(std::move(result));
    }

    log.info("Batch finished: {} portfolios, {} succeeded, {} partial, {} failed entities, {} portfolio errors",
             summary.portfolios.size(), summary.succeeded, summary.partial, summary.failed,
             summary.portfolio_errors);
    return summary;
}

} // namespace batch
} // namespace fundmetrics
