/**
 * @file metrics_calculator.hpp
 * @brief Per-entity, per-period metric computation
 *
 * Every computation runs against an in-memory TimeSeriesBundle and
 * performs no I/O. Missing data yields a MetricResult with status
 * INSUFFICIENT_DATA and value 0.0, never an exception.
 */

#ifndef FUNDMETRICS_ANALYTICS_METRICS_CALCULATOR_HPP
#define FUNDMETRICS_ANALYTICS_METRICS_CALCULATOR_HPP

#include "analytics/metric_set.hpp"
#include "data/time_series_cache.hpp"
#include "schema/period_key.hpp"
#include <vector>

namespace fundmetrics {
namespace analytics {

/**
 * @struct AnalysisPeriod
 * @brief A period an entity's metrics are computed for
 */
struct AnalysisPeriod {
    schema::PeriodKey period;
    schema::DataKind kind;   ///< TRAILING if a trailing record exists, else QUARTERLY
};

/**
 * @class MetricsCalculator
 * @brief Computes the 22-metric set from a bundle
 *
 * Stateless apart from the configured bond rate; safe to share between
 * threads.
 *
 * Usage Example:
 * @code
 * MetricsCalculator calc(0.06);
 * for (const auto &p : MetricsCalculator::analysis_periods(bundle, 8))
 *     MetricSet m = calc.compute("TCS", p.period, bundle);
 * @endcode
 */
class MetricsCalculator {
public:
    static constexpr double DEFAULT_BOND_RATE = 0.06;
    static constexpr size_t SHORT_WINDOW = 8;     ///< Quarters in the 2-year average
    static constexpr size_t LONG_WINDOW = 20;     ///< Quarters in the 5-year average
    static constexpr size_t RANGE_WINDOW = 10;    ///< Quarters in the PR low/high range
    static constexpr size_t CAGR_RECORDS = 24;    ///< Trailing records needed for 6-year CAGR
    static constexpr double CAGR_YEARS = 6.0;

    explicit MetricsCalculator(double bond_rate = DEFAULT_BOND_RATE);

    /**
     * @brief Compute all metrics for one entity and period
     *
     * Only records at or before period are used. An entity with no
     * records at all gets an all-zero set and a "no data" log line.
     *
     * @param entity Entity id, used for logging only
     * @param period Target period
     * @param bundle The entity's cached records
     * @return Complete metric set; never throws for missing data
     */
    MetricSet compute(const data::EntityId& entity,
                      const schema::PeriodKey& period,
                      const data::TimeSeriesBundle& bundle) const;

    /**
     * @brief Periods to compute for an entity
     *
     * Union of its trailing and quarterly periods, most recent first.
     *
     * @param bundle The entity's cached records
     * @param limit Keep at most this many periods; 0 keeps all
     */
    static std::vector<AnalysisPeriod> analysis_periods(const data::TimeSeriesBundle& bundle,
                                                        size_t limit = 0);

    // ========================================================================
    // Individual metrics
    // ========================================================================

    /// Trailing profit / trailing revenue * 100
    static MetricResult patm(const data::TimeSeriesRecord* trailing);

    /// Quarter t vs t-1 quarterly revenue
    static MetricResult qoq_growth(const data::RecordRange& quarterly);

    /// Quarter t vs the 4th-back record (index 3)
    static MetricResult yoy_growth(const data::RecordRange& quarterly);

    /**
     * @brief 6-year CAGR of a trailing field
     *
     * Compares the latest record with the 24th (index 23). Non-positive
     * endpoints make the growth undefined.
     */
    static MetricResult six_year_cagr(const data::RecordRange& trailing, schema::Category field);

    /**
     * @brief Valuation / trailing-field ratios, most recent first
     *
     * Pairs each of the latest max_pairs valuation records with the latest
     * trailing record at or before the valuation's month. Pairs with a
     * missing or zero denominator are skipped.
     */
    static std::vector<double> ratio_series(const data::RecordRange& valuation,
                                            const data::TimeSeriesBundle& bundle,
                                            schema::Category denominator,
                                            size_t max_pairs = LONG_WINDOW);

    /// Latest valuation / latest trailing field, both at or before the period
    static MetricResult current_ratio(const data::TimeSeriesRecord* valuation,
                                      const data::TimeSeriesRecord* trailing,
                                      schema::Category denominator);

    /// Mean of the first window values; partial windows are insufficient
    static MetricResult window_average(const std::vector<double>& series, size_t window);

    /// (average - current) / current
    static MetricResult reval_deval(const MetricResult& average, const MetricResult& current);

    /// Min or max over the first RANGE_WINDOW values
    static MetricResult range_low(const std::vector<double>& series);
    static MetricResult range_high(const std::vector<double>& series);

    /// 100 / PE
    static MetricResult earnings_yield(const MetricResult& current_pe);

    /// Mean of trailing revenue growth and trailing profit growth
    static MetricResult growth_rate(const data::RecordRange& trailing);

    double bond_rate() const { return bond_rate_; }

private:
    double bond_rate_;
};

} // namespace analytics
} // namespace fundmetrics

#endif // FUNDMETRICS_ANALYTICS_METRICS_CALCULATOR_HPP
