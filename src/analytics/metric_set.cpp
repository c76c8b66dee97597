/**
 * @file metric_set.cpp
 * @brief Metric names, aggregation rules and JSON rendering
 */

#include "analytics/metric_set.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fundmetrics {
namespace analytics {

namespace {

const char* const kMetricNames[kMetricCount] = {
    "patm",
    "qoq_growth",
    "yoy_growth",
    "revenue_6yr_cagr",
    "pat_6yr_cagr",
    "current_pe",
    "pe_2yr_avg",
    "pe_5yr_avg",
    "pe_2yr_reval_deval",
    "pe_5yr_reval_deval",
    "current_pr",
    "pr_2yr_avg",
    "pr_5yr_avg",
    "pr_2yr_reval_deval",
    "pr_5yr_reval_deval",
    "pr_10q_low",
    "pr_10q_high",
    "alpha_bond_cagr",
    "alpha_absolute",
    "pe_yield",
    "growth_rate",
    "bond_rate",
};

} // namespace

const std::vector<Metric>& all_metrics()
{
    static const std::vector<Metric> metrics = []() {
        std::vector<Metric> out;
        for (size_t i = 0; i < kMetricCount; ++i)
        {
            out.push_back(static_cast<Metric>(i));
        }
        return out;
    }();
    return metrics;
}

std::string to_string(Metric metric)
{
    return kMetricNames[static_cast<size_t>(metric)];
}

Metric metric_from_string(const std::string& name)
{
    for (size_t i = 0; i < kMetricCount; ++i)
    {
        if (name == kMetricNames[i])
        {
            return static_cast<Metric>(i);
        }
    }
    throw std::invalid_argument("Unknown metric: " + name);
}

std::string to_string(MetricStatus status)
{
    switch (status)
    {
    case MetricStatus::OK:                return "ok";
    case MetricStatus::INSUFFICIENT_DATA: return "insufficient_data";
    case MetricStatus::NOT_MODELLED:      return "not_modelled";
    }
    return "unknown";
}

AggregationRule aggregation_rule(Metric metric)
{
    switch (metric)
    {
    case Metric::PATM:
    case Metric::CURRENT_PE:
    case Metric::CURRENT_PR:
        return AggregationRule::RATIO_OF_TOTALS;
    default:
        return AggregationRule::WEIGHTED_MEAN;
    }
}

MetricFamily metric_family(Metric metric)
{
    switch (metric)
    {
    case Metric::PATM:
        return MetricFamily::PROFITABILITY;
    case Metric::QOQ_GROWTH:
    case Metric::YOY_GROWTH:
    case Metric::GROWTH_RATE:
        return MetricFamily::GROWTH;
    case Metric::REVENUE_6YR_CAGR:
    case Metric::PAT_6YR_CAGR:
        return MetricFamily::LONG_TERM;
    case Metric::CURRENT_PE:
    case Metric::PE_2YR_AVG:
    case Metric::PE_5YR_AVG:
    case Metric::PE_2YR_REVAL_DEVAL:
    case Metric::PE_5YR_REVAL_DEVAL:
    case Metric::PE_YIELD:
        return MetricFamily::PE;
    case Metric::CURRENT_PR:
    case Metric::PR_2YR_AVG:
    case Metric::PR_5YR_AVG:
    case Metric::PR_2YR_REVAL_DEVAL:
    case Metric::PR_5YR_REVAL_DEVAL:
    case Metric::PR_10Q_LOW:
    case Metric::PR_10Q_HIGH:
        return MetricFamily::PR;
    case Metric::ALPHA_BOND_CAGR:
    case Metric::ALPHA_ABSOLUTE:
        return MetricFamily::ALPHA;
    case Metric::BOND_RATE:
        return MetricFamily::RATES;
    }
    throw std::invalid_argument("Unknown metric");
}

std::string to_string(MetricFamily family)
{
    switch (family)
    {
    case MetricFamily::PROFITABILITY: return "profitability";
    case MetricFamily::GROWTH:        return "growth";
    case MetricFamily::LONG_TERM:     return "long_term";
    case MetricFamily::PE:            return "pe";
    case MetricFamily::PR:            return "pr";
    case MetricFamily::ALPHA:         return "alpha";
    case MetricFamily::RATES:         return "rates";
    }
    return "unknown";
}

nlohmann::json DataCoverage::to_json() const
{
    nlohmann::json families = nlohmann::json::object();
    for (size_t i = 0; i < kMetricFamilyCount; ++i)
    {
        families[to_string(static_cast<MetricFamily>(i))] = family_holdings[i];
    }
    return {
        {"completeness_pct", completeness_pct},
        {"weight_share", {{"valuation", valuation_weight},
                          {"trailing_revenue", trailing_revenue_weight},
                          {"trailing_profit", trailing_profit_weight}}},
        {"holdings_with", {{"valuation", valuation_holdings},
                           {"trailing_revenue", trailing_revenue_holdings},
                           {"trailing_profit", trailing_profit_holdings}}},
        {"family_holdings", families}};
}

size_t MetricSet::count(MetricStatus status) const
{
    return static_cast<size_t>(std::count_if(results_.begin(), results_.end(),
                                             [status](const MetricResult& r) { return r.status == status; }));
}

bool MetricSet::all_zero() const
{
    return std::all_of(results_.begin(), results_.end(),
                       [](const MetricResult& r) { return r.value == 0.0; });
}

nlohmann::json MetricSet::to_json() const
{
    nlohmann::json values = nlohmann::json::object();
    nlohmann::json statuses = nlohmann::json::object();
    for (Metric metric : all_metrics())
    {
        values[to_string(metric)] = get(metric);
        if (status(metric) != MetricStatus::OK)
        {
            statuses[to_string(metric)] = to_string(status(metric));
        }
    }
    return {
        {"values", values},
        {"status", statuses},
        {"totals", {{"valuation", totals_.valuation},
                    {"trailing_revenue", totals_.trailing_revenue},
                    {"trailing_profit", totals_.trailing_profit}}}};
}

std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json PortfolioMetricSet::to_json() const
{
    nlohmann::json metrics = nlohmann::json::object();
    for (Metric metric : all_metrics())
    {
        metrics[to_string(metric)] = get(metric);
    }
    return {
        {"portfolio_id", portfolio_id},
        {"metrics", metrics},
        {"weighted_totals", {{"valuation", weighted_totals.valuation},
                             {"trailing_revenue", weighted_totals.trailing_revenue},
                             {"trailing_profit", weighted_totals.trailing_profit}}},
        {"holdings_count", holdings_count},
        {"weighted_holdings", weighted_holdings},
        {"total_market_value", total_market_value},
        {"coverage", coverage.to_json()},
        {"last_updated", format_timestamp(last_updated)}};
}

void PortfolioMetricSet::print_summary() const
{
    std::cout << "\nPortfolio " << portfolio_id << "\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << "Holdings:           " << holdings_count
              << " (" << weighted_holdings << " weighted)\n";
    std::cout << "Total Market Value: " << std::fixed << std::setprecision(2)
              << total_market_value << "\n";
    std::cout << "Completeness:       " << std::setprecision(1) << coverage.completeness_pct << "%\n";
    std::cout << "Weight with data:   valuation " << std::setprecision(1)
              << coverage.valuation_weight * 100.0 << "%, revenue "
              << coverage.trailing_revenue_weight * 100.0 << "%, profit "
              << coverage.trailing_profit_weight * 100.0 << "%\n";
    std::cout << "Last Updated:       " << format_timestamp(last_updated) << "\n\n";

    for (Metric metric : all_metrics())
    {
        std::cout << "  " << std::setw(22) << std::left << to_string(metric)
                  << std::right << std::setw(14) << std::setprecision(4) << get(metric) << "\n";
    }
    std::cout << std::string(60, '-') << "\n";
}

} // namespace analytics
} // namespace fundmetrics
