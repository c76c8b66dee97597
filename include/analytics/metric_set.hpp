/**
 * @file metric_set.hpp
 * @brief The 22 per-entity metrics and their portfolio-level counterpart
 */

#ifndef FUNDMETRICS_ANALYTICS_METRIC_SET_HPP
#define FUNDMETRICS_ANALYTICS_METRIC_SET_HPP

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <string>
#include <vector>

namespace fundmetrics {
namespace analytics {

/**
 * @enum Metric
 * @brief Output metrics, in report order
 */
enum class Metric {
    PATM,
    QOQ_GROWTH,
    YOY_GROWTH,
    REVENUE_6YR_CAGR,
    PAT_6YR_CAGR,
    CURRENT_PE,
    PE_2YR_AVG,
    PE_5YR_AVG,
    PE_2YR_REVAL_DEVAL,
    PE_5YR_REVAL_DEVAL,
    CURRENT_PR,
    PR_2YR_AVG,
    PR_5YR_AVG,
    PR_2YR_REVAL_DEVAL,
    PR_5YR_REVAL_DEVAL,
    PR_10Q_LOW,
    PR_10Q_HIGH,
    ALPHA_BOND_CAGR,
    ALPHA_ABSOLUTE,
    PE_YIELD,
    GROWTH_RATE,
    BOND_RATE
};

constexpr size_t kMetricCount = 22;

/// All metrics in report order
const std::vector<Metric>& all_metrics();

std::string to_string(Metric metric);

/// @throws std::invalid_argument for unknown names
Metric metric_from_string(const std::string& name);

/**
 * @enum MetricStatus
 * @brief Why a metric holds the value it holds
 */
enum class MetricStatus {
    OK,                 ///< Computed from data
    INSUFFICIENT_DATA,  ///< Defaulted to 0.0: too few records or a zero denominator
    NOT_MODELLED        ///< Defaulted to 0.0: needs an input this engine does not have
};

std::string to_string(MetricStatus status);

/**
 * @struct MetricResult
 * @brief Value plus status; missing data is a status, never an exception
 */
struct MetricResult {
    double value = 0.0;
    MetricStatus status = MetricStatus::INSUFFICIENT_DATA;

    static MetricResult ok(double v) { return {v, MetricStatus::OK}; }
    static MetricResult insufficient() { return {0.0, MetricStatus::INSUFFICIENT_DATA}; }
    static MetricResult not_modelled() { return {0.0, MetricStatus::NOT_MODELLED}; }

    bool is_ok() const { return status == MetricStatus::OK; }
};

/**
 * @enum AggregationRule
 * @brief How the portfolio value of a metric is formed
 */
enum class AggregationRule {
    WEIGHTED_MEAN,      ///< Sum of weight * entity value
    RATIO_OF_TOTALS     ///< Ratio recomputed from weighted financial totals
};

AggregationRule aggregation_rule(Metric metric);

/**
 * @struct FinancialTotals
 * @brief Latest raw financials behind the ratio metrics
 */
struct FinancialTotals {
    double valuation = 0.0;         ///< Latest market cap at or before the period
    double trailing_revenue = 0.0;  ///< Latest TTM revenue at or before the period
    double trailing_profit = 0.0;   ///< Latest TTM PAT at or before the period

    // A value of 0.0 with the flag unset means the record or field was missing
    bool has_valuation = false;
    bool has_trailing_revenue = false;
    bool has_trailing_profit = false;
};

/**
 * @enum MetricFamily
 * @brief Groups of metrics that share their inputs
 */
enum class MetricFamily {
    PROFITABILITY,   ///< patm
    GROWTH,          ///< qoq, yoy, growth rate
    LONG_TERM,       ///< 6-year CAGRs
    PE,              ///< PE current, averages, reval/deval, yield
    PR,              ///< PR current, averages, reval/deval, 10-quarter range
    ALPHA,           ///< Benchmark-relative returns
    RATES            ///< Configured bond rate
};

constexpr size_t kMetricFamilyCount = 7;

MetricFamily metric_family(Metric metric);

std::string to_string(MetricFamily family);

/**
 * @struct DataCoverage
 * @brief How much of a portfolio its aggregate rests on
 *
 * Ratio-of-totals metrics read a missing financial as 0, so a low weight
 * share for a financial means the matching portfolio ratio is skewed.
 */
struct DataCoverage {
    double valuation_weight = 0.0;          ///< Weight share with a valuation
    double trailing_revenue_weight = 0.0;   ///< Weight share with a trailing revenue
    double trailing_profit_weight = 0.0;    ///< Weight share with a trailing profit

    size_t valuation_holdings = 0;
    size_t trailing_revenue_holdings = 0;
    size_t trailing_profit_holdings = 0;

    /// Holdings with at least one OK metric, indexed by MetricFamily
    std::array<size_t, kMetricFamilyCount> family_holdings{};

    /// Percentage of holdings with all three financials
    double completeness_pct = 0.0;

    size_t holdings(MetricFamily family) const { return family_holdings[static_cast<size_t>(family)]; }

    nlohmann::json to_json() const;
};

/**
 * @class MetricSet
 * @brief All 22 metrics of one entity for one period
 *
 * A default-constructed set has every metric at 0.0 with status
 * INSUFFICIENT_DATA.
 */
class MetricSet {
public:
    MetricSet() = default;

    double get(Metric metric) const { return results_[index(metric)].value; }
    MetricStatus status(Metric metric) const { return results_[index(metric)].status; }
    const MetricResult& result(Metric metric) const { return results_[index(metric)]; }

    void set(Metric metric, MetricResult result) { results_[index(metric)] = result; }

    size_t count(MetricStatus status) const;

    /// True when every metric value is exactly 0.0
    bool all_zero() const;

    const FinancialTotals& totals() const { return totals_; }
    void set_totals(const FinancialTotals& totals) { totals_ = totals; }

    nlohmann::json to_json() const;

private:
    static size_t index(Metric metric) { return static_cast<size_t>(metric); }

    std::array<MetricResult, kMetricCount> results_{};
    FinancialTotals totals_;
};

/**
 * @struct PortfolioMetricSet
 * @brief Holding-weighted aggregate of a portfolio's metrics
 */
struct PortfolioMetricSet {
    std::string portfolio_id;
    std::array<double, kMetricCount> values{};   ///< Indexed by Metric
    FinancialTotals weighted_totals;             ///< Sums of weight * entity financials
    size_t holdings_count = 0;                   ///< Holdings passed in
    size_t weighted_holdings = 0;                ///< Holdings with positive weight
    double total_market_value = 0.0;
    DataCoverage coverage;
    std::chrono::system_clock::time_point last_updated;

    double get(Metric metric) const { return values[static_cast<size_t>(metric)]; }

    nlohmann::json to_json() const;

    /**
     * @brief Print aggregate to stdout
     */
    void print_summary() const;
};

/// ISO-8601 UTC rendering of a timestamp, e.g. 2024-03-31T10:15:00Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace analytics
} // namespace fundmetrics

#endif // FUNDMETRICS_ANALYTICS_METRIC_SET_HPP
