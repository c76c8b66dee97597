/**
 * @file metrics_calculator.cpp
 * @brief Implementation of MetricsCalculator
 */

#include "analytics/metrics_calculator.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <stdexcept>

namespace fundmetrics {
namespace analytics {

using data::RecordRange;
using data::TimeSeriesBundle;
using data::TimeSeriesRecord;
using schema::Category;
using schema::DataKind;

namespace {

// Growth from previous to current; undefined for a missing or zero base
MetricResult relative_change(const std::optional<double>& current, const std::optional<double>& previous)
{
    if (!current || !previous || *previous == 0.0)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok((*current - *previous) / *previous);
}

MetricResult safe_ratio(const std::optional<double>& numerator, const std::optional<double>& denominator)
{
    if (!numerator || !denominator || *denominator == 0.0)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok(*numerator / *denominator);
}

} // namespace

MetricsCalculator::MetricsCalculator(double bond_rate)
    : bond_rate_(bond_rate)
{
    if (!std::isfinite(bond_rate))
    {
        throw std::invalid_argument("MetricsCalculator: bond rate must be finite");
    }
}

// ============================================================================
// Individual metrics
// ============================================================================

MetricResult MetricsCalculator::patm(const TimeSeriesRecord* trailing)
{
    if (!trailing)
    {
        return MetricResult::insufficient();
    }
    MetricResult ratio = safe_ratio(trailing->value(Category::TTM_PAT), trailing->value(Category::TTM_REVENUE));
    if (!ratio.is_ok())
    {
        return ratio;
    }
    return MetricResult::ok(ratio.value * 100.0);
}

MetricResult MetricsCalculator::qoq_growth(const RecordRange& quarterly)
{
    if (quarterly.size() < 2)
    {
        return MetricResult::insufficient();
    }
    return relative_change(quarterly[0].value(Category::QUARTERLY_REVENUE),
                           quarterly[1].value(Category::QUARTERLY_REVENUE));
}

MetricResult MetricsCalculator::yoy_growth(const RecordRange& quarterly)
{
    if (quarterly.size() < 4)
    {
        return MetricResult::insufficient();
    }
    return relative_change(quarterly[0].value(Category::QUARTERLY_REVENUE),
                           quarterly[3].value(Category::QUARTERLY_REVENUE));
}

MetricResult MetricsCalculator::six_year_cagr(const RecordRange& trailing, Category field)
{
    if (trailing.size() < CAGR_RECORDS)
    {
        return MetricResult::insufficient();
    }
    const auto end = trailing[0].value(field);
    const auto start = trailing[CAGR_RECORDS - 1].value(field);
    if (!start || !end || *start <= 0.0 || *end <= 0.0)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok(std::pow(*end / *start, 1.0 / CAGR_YEARS) - 1.0);
}

std::vector<double> MetricsCalculator::ratio_series(const RecordRange& valuation,
                                                    const TimeSeriesBundle& bundle,
                                                    Category denominator,
                                                    size_t max_pairs)
{
    std::vector<double> series;
    const size_t n = std::min(valuation.size(), max_pairs);
    series.reserve(n);

    for (size_t i = 0; i < n; ++i)
    {
        const auto market_cap = valuation[i].value(Category::MARKET_CAP);
        const TimeSeriesRecord* trailing = bundle.latest_at_or_before(DataKind::TRAILING, valuation[i].period);
        if (!market_cap || !trailing)
        {
            continue;
        }
        MetricResult ratio = safe_ratio(market_cap, trailing->value(denominator));
        if (ratio.is_ok())
        {
            series.push_back(ratio.value);
        }
    }
    return series;
}

MetricResult MetricsCalculator::current_ratio(const TimeSeriesRecord* valuation,
                                              const TimeSeriesRecord* trailing,
                                              Category denominator)
{
    if (!valuation || !trailing)
    {
        return MetricResult::insufficient();
    }
    return safe_ratio(valuation->value(Category::MARKET_CAP), trailing->value(denominator));
}

MetricResult MetricsCalculator::window_average(const std::vector<double>& series, size_t window)
{
    if (window == 0 || series.size() < window)
    {
        return MetricResult::insufficient();
    }
    const double sum = std::accumulate(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(window), 0.0);
    return MetricResult::ok(sum / static_cast<double>(window));
}

MetricResult MetricsCalculator::reval_deval(const MetricResult& average, const MetricResult& current)
{
    if (!average.is_ok() || !current.is_ok() || average.value == 0.0 || current.value == 0.0)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok((average.value - current.value) / current.value);
}

MetricResult MetricsCalculator::range_low(const std::vector<double>& series)
{
    if (series.size() < RANGE_WINDOW)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok(*std::min_element(series.begin(), series.begin() + RANGE_WINDOW));
}

MetricResult MetricsCalculator::range_high(const std::vector<double>& series)
{
    if (series.size() < RANGE_WINDOW)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok(*std::max_element(series.begin(), series.begin() + RANGE_WINDOW));
}

MetricResult MetricsCalculator::earnings_yield(const MetricResult& current_pe)
{
    if (!current_pe.is_ok() || current_pe.value == 0.0)
    {
        return MetricResult::insufficient();
    }
    return MetricResult::ok(100.0 / current_pe.value);
}

MetricResult MetricsCalculator::growth_rate(const RecordRange& trailing)
{
    if (trailing.size() < 2)
    {
        return MetricResult::insufficient();
    }
    const MetricResult revenue = relative_change(trailing[0].value(Category::TTM_REVENUE),
                                                 trailing[1].value(Category::TTM_REVENUE));
    const MetricResult profit = relative_change(trailing[0].value(Category::TTM_PAT),
                                                trailing[1].value(Category::TTM_PAT));
    if (!revenue.is_ok() && !profit.is_ok())
    {
        return MetricResult::insufficient();
    }
    // A side without data contributes zero growth
    return MetricResult::ok((revenue.value + profit.value) / 2.0);
}

// ============================================================================
// Full set
// ============================================================================

MetricSet MetricsCalculator::compute(const data::EntityId& entity,
                                     const schema::PeriodKey& period,
                                     const TimeSeriesBundle& bundle) const
{
    MetricSet metrics;
    if (bundle.empty())
    {
        core::logger()->warn("No data for entity {} at {}; all metrics default to 0", entity, period.to_string());
        return metrics;
    }

    for (DataKind kind : {DataKind::TRAILING, DataKind::QUARTERLY, DataKind::VALUATION})
    {
        if (bundle.count(kind) == 0)
        {
            core::logger()->debug("No {} records for entity {}; dependent metrics default to 0",
                                  schema::to_string(kind), entity);
        }
    }

    const RecordRange valuation = bundle.up_to(DataKind::VALUATION, period);
    const RecordRange trailing = bundle.up_to(DataKind::TRAILING, period);
    const RecordRange quarterly = bundle.up_to(DataKind::QUARTERLY, period);

    const TimeSeriesRecord* latest_valuation = valuation.empty() ? nullptr : &valuation[0];
    const TimeSeriesRecord* latest_trailing = trailing.empty() ? nullptr : &trailing[0];

    metrics.set(Metric::PATM, patm(latest_trailing));
    metrics.set(Metric::QOQ_GROWTH, qoq_growth(quarterly));
    metrics.set(Metric::YOY_GROWTH, yoy_growth(quarterly));
    metrics.set(Metric::REVENUE_6YR_CAGR, six_year_cagr(trailing, Category::TTM_REVENUE));
    metrics.set(Metric::PAT_6YR_CAGR, six_year_cagr(trailing, Category::TTM_PAT));

    // PE family
    const auto pe_series = ratio_series(valuation, bundle, Category::TTM_PAT);
    const MetricResult current_pe = current_ratio(latest_valuation, latest_trailing, Category::TTM_PAT);
    const MetricResult pe_2yr = window_average(pe_series, SHORT_WINDOW);
    const MetricResult pe_5yr = window_average(pe_series, LONG_WINDOW);
    metrics.set(Metric::CURRENT_PE, current_pe);
    metrics.set(Metric::PE_2YR_AVG, pe_2yr);
    metrics.set(Metric::PE_5YR_AVG, pe_5yr);
    metrics.set(Metric::PE_2YR_REVAL_DEVAL, reval_deval(pe_2yr, current_pe));
    metrics.set(Metric::PE_5YR_REVAL_DEVAL, reval_deval(pe_5yr, current_pe));

    // PR family
    const auto pr_series = ratio_series(valuation, bundle, Category::TTM_REVENUE);
    const MetricResult current_pr = current_ratio(latest_valuation, latest_trailing, Category::TTM_REVENUE);
    const MetricResult pr_2yr = window_average(pr_series, SHORT_WINDOW);
    const MetricResult pr_5yr = window_average(pr_series, LONG_WINDOW);
    metrics.set(Metric::CURRENT_PR, current_pr);
    metrics.set(Metric::PR_2YR_AVG, pr_2yr);
    metrics.set(Metric::PR_5YR_AVG, pr_5yr);
    metrics.set(Metric::PR_2YR_REVAL_DEVAL, reval_deval(pr_2yr, current_pr));
    metrics.set(Metric::PR_5YR_REVAL_DEVAL, reval_deval(pr_5yr, current_pr));
    metrics.set(Metric::PR_10Q_LOW, range_low(pr_series));
    metrics.set(Metric::PR_10Q_HIGH, range_high(pr_series));

    // Alpha needs a benchmark return series the engine does not model
    metrics.set(Metric::ALPHA_BOND_CAGR, MetricResult::not_modelled());
    metrics.set(Metric::ALPHA_ABSOLUTE, MetricResult::not_modelled());
    metrics.set(Metric::PE_YIELD, earnings_yield(current_pe));
    metrics.set(Metric::GROWTH_RATE, growth_rate(trailing));
    metrics.set(Metric::BOND_RATE, MetricResult::ok(bond_rate_));

    FinancialTotals totals;
    if (latest_valuation)
    {
        const auto cap = latest_valuation->value(Category::MARKET_CAP);
        totals.valuation = cap.value_or(0.0);
        totals.has_valuation = cap.has_value();
    }
    if (latest_trailing)
    {
        const auto revenue = latest_trailing->value(Category::TTM_REVENUE);
        const auto profit = latest_trailing->value(Category::TTM_PAT);
        totals.trailing_revenue = revenue.value_or(0.0);
        totals.trailing_profit = profit.value_or(0.0);
        totals.has_trailing_revenue = revenue.has_value();
        totals.has_trailing_profit = profit.has_value();
    }
    metrics.set_totals(totals);

    return metrics;
}

std::vector<AnalysisPeriod> MetricsCalculator::analysis_periods(const TimeSeriesBundle& bundle, size_t limit)
{
    std::set<schema::PeriodKey, std::greater<schema::PeriodKey>> keys;
    for (const auto& key : bundle.periods(DataKind::TRAILING))
    {
        keys.insert(key);
    }
    for (const auto& key : bundle.periods(DataKind::QUARTERLY))
    {
        keys.insert(key);
    }

    std::vector<AnalysisPeriod> out;
    for (const auto& key : keys)
    {
        if (limit > 0 && out.size() >= limit)
        {
            break;
        }
        const DataKind kind = bundle.find(DataKind::TRAILING, key) ? DataKind::TRAILING : DataKind::QUARTERLY;
        out.push_back({key, kind});
    }
    return out;
}

} // namespace analytics
} // namespace fundmetrics
