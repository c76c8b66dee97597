/**
 * @file test_metrics_calculator.cpp
 * @brief Unit tests for MetricsCalculator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/metrics_calculator.hpp"
#include "core/logging.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <cmath>
#include <memory>
#include <sstream>

using namespace fundmetrics;
using namespace fundmetrics::analytics;
using namespace fundmetrics::data;
using namespace fundmetrics::schema;
using Catch::Matchers::WithinAbs;

namespace {

TimeSeriesRecord record(DataKind kind, const PeriodKey& period, std::map<Category, double> values)
{
    return TimeSeriesRecord{"AC01", kind, period, std::move(values)};
}

int quarter_end_day(int month)
{
    return (month == 3 || month == 12) ? 31 : 30;
}

/// Quarter q back from March 2024 (q = 0 is March 2024)
std::pair<int, int> quarter(int q)
{
    int months = 2024 * 12 + 2 - 3 * q;
    return {months / 12, months % 12 + 1};
}

/**
 * Long history: quarterly revenue 100, 90, 80, 70 (newest first), TTM
 * revenue growing 10% per quarter, profit 10% of revenue and a PR that
 * falls by 0.1 per quarter going back from 3.0.
 */
TimeSeriesBundle long_history(int quarters)
{
    TimeSeriesBundle bundle;
    const double quarterly[] = {100.0, 90.0, 80.0, 70.0};
    for (int q = 0; q < quarters; ++q) {
        const auto ym = quarter(q);
        const PeriodKey month = PeriodKey::year_month(ym.first, ym.second);
        const PeriodKey day = PeriodKey::date(ym.first, ym.second, quarter_end_day(ym.second));

        const double revenue = 1000.0 * std::pow(1.1, -q);
        const double profit = revenue * 0.1;
        const double pr = 3.0 - 0.1 * q;

        bundle.add(record(DataKind::TRAILING, month, {{Category::TTM_REVENUE, revenue}, {Category::TTM_PAT, profit}}));
        bundle.add(record(DataKind::VALUATION, day, {{Category::MARKET_CAP, revenue * pr}}));
        if (q < 4)
            bundle.add(record(DataKind::QUARTERLY, month, {{Category::QUARTERLY_REVENUE, quarterly[q]}}));
    }
    bundle.finalize();
    return bundle;
}

} // namespace

TEST_CASE("Growth metrics from quarterly revenue", "[MetricsCalculator]") {
    TimeSeriesBundle bundle;
    bundle.add(record(DataKind::QUARTERLY, PeriodKey::year_month(2024, 3), {{Category::QUARTERLY_REVENUE, 100.0}}));
    bundle.add(record(DataKind::QUARTERLY, PeriodKey::year_month(2023, 12), {{Category::QUARTERLY_REVENUE, 90.0}}));
    bundle.add(record(DataKind::QUARTERLY, PeriodKey::year_month(2023, 9), {{Category::QUARTERLY_REVENUE, 80.0}}));
    bundle.add(record(DataKind::QUARTERLY, PeriodKey::year_month(2023, 6), {{Category::QUARTERLY_REVENUE, 70.0}}));
    bundle.finalize();

    MetricsCalculator calculator;
    MetricSet metrics = calculator.compute("AC01", PeriodKey::year_month(2024, 3), bundle);

    REQUIRE(metrics.status(Metric::QOQ_GROWTH) == MetricStatus::OK);
    REQUIRE_THAT(metrics.get(Metric::QOQ_GROWTH), WithinAbs(0.1111, 1e-4));
    REQUIRE_THAT(metrics.get(Metric::YOY_GROWTH), WithinAbs(0.4286, 1e-4));

    SECTION("Later records are invisible to an earlier period") {
        MetricSet earlier = calculator.compute("AC01", PeriodKey::year_month(2023, 12), bundle);
        REQUIRE_THAT(earlier.get(Metric::QOQ_GROWTH), WithinAbs(0.125, 1e-9));
        REQUIRE(earlier.status(Metric::YOY_GROWTH) == MetricStatus::INSUFFICIENT_DATA);
        REQUIRE(earlier.get(Metric::YOY_GROWTH) == 0.0);
    }

    SECTION("Missing trailing and valuation data degrade individually") {
        REQUIRE(metrics.status(Metric::PATM) == MetricStatus::INSUFFICIENT_DATA);
        REQUIRE(metrics.status(Metric::CURRENT_PE) == MetricStatus::INSUFFICIENT_DATA);
        REQUIRE(metrics.get(Metric::CURRENT_PE) == 0.0);
    }
}

TEST_CASE("Current valuation ratios", "[MetricsCalculator]") {
    TimeSeriesBundle bundle;
    bundle.add(record(DataKind::TRAILING, PeriodKey::year_month(2024, 3),
                      {{Category::TTM_REVENUE, 1000.0}, {Category::TTM_PAT, 100.0}}));
    bundle.add(record(DataKind::VALUATION, PeriodKey::date(2024, 3, 31), {{Category::MARKET_CAP, 2000.0}}));
    bundle.finalize();

    MetricSet metrics = MetricsCalculator().compute("AC01", PeriodKey::year_month(2024, 3), bundle);

    REQUIRE_THAT(metrics.get(Metric::PATM), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(metrics.get(Metric::CURRENT_PE), WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(metrics.get(Metric::CURRENT_PR), WithinAbs(2.0, 1e-9));
    REQUIRE_THAT(metrics.get(Metric::PE_YIELD), WithinAbs(5.0, 1e-9));

    REQUIRE_THAT(metrics.totals().valuation, WithinAbs(2000.0, 1e-9));
    REQUIRE_THAT(metrics.totals().trailing_revenue, WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(metrics.totals().trailing_profit, WithinAbs(100.0, 1e-9));

    SECTION("Alpha is not modelled and bond rate is the configured constant") {
        REQUIRE(metrics.status(Metric::ALPHA_BOND_CAGR) == MetricStatus::NOT_MODELLED);
        REQUIRE(metrics.status(Metric::ALPHA_ABSOLUTE) == MetricStatus::NOT_MODELLED);
        REQUIRE(metrics.get(Metric::ALPHA_ABSOLUTE) == 0.0);
        REQUIRE_THAT(metrics.get(Metric::BOND_RATE), WithinAbs(0.06, 1e-12));

        MetricSet custom = MetricsCalculator(0.072).compute("AC01", PeriodKey::year_month(2024, 3), bundle);
        REQUIRE_THAT(custom.get(Metric::BOND_RATE), WithinAbs(0.072, 1e-12));
    }

    SECTION("Short histories leave the averages at zero") {
        REQUIRE(metrics.status(Metric::PE_2YR_AVG) == MetricStatus::INSUFFICIENT_DATA);
        REQUIRE(metrics.status(Metric::PR_10Q_LOW) == MetricStatus::INSUFFICIENT_DATA);
        REQUIRE(metrics.status(Metric::REVENUE_6YR_CAGR) == MetricStatus::INSUFFICIENT_DATA);
    }
}

TEST_CASE("Zero denominators are insufficient data, not errors", "[MetricsCalculator]") {
    TimeSeriesBundle bundle;
    bundle.add(record(DataKind::TRAILING, PeriodKey::year_month(2024, 3),
                      {{Category::TTM_REVENUE, 0.0}, {Category::TTM_PAT, 0.0}}));
    bundle.add(record(DataKind::VALUATION, PeriodKey::date(2024, 3, 31), {{Category::MARKET_CAP, 2000.0}}));
    bundle.finalize();

    MetricSet metrics = MetricsCalculator().compute("AC01", PeriodKey::year_month(2024, 3), bundle);
    REQUIRE(metrics.status(Metric::PATM) == MetricStatus::INSUFFICIENT_DATA);
    REQUIRE(metrics.status(Metric::CURRENT_PE) == MetricStatus::INSUFFICIENT_DATA);
    REQUIRE(metrics.status(Metric::PE_YIELD) == MetricStatus::INSUFFICIENT_DATA);
    REQUIRE(metrics.get(Metric::PE_YIELD) == 0.0);
}

TEST_CASE("Long-history metrics", "[MetricsCalculator]") {
    const TimeSeriesBundle bundle = long_history(24);
    MetricSet metrics = MetricsCalculator().compute("AC01", PeriodKey::year_month(2024, 3), bundle);

    SECTION("Six-year CAGR compares the latest record with the 24th") {
        const double expected = std::pow(std::pow(1.1, 23.0), 1.0 / 6.0) - 1.0;
        REQUIRE(metrics.status(Metric::REVENUE_6YR_CAGR) == MetricStatus::OK);
        REQUIRE_THAT(metrics.get(Metric::REVENUE_6YR_CAGR), WithinAbs(expected, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PAT_6YR_CAGR), WithinAbs(expected, 1e-9));

        MetricSet short_history = MetricsCalculator().compute("AC01", PeriodKey::year_month(2024, 3), long_history(23));
        REQUIRE(short_history.status(Metric::REVENUE_6YR_CAGR) == MetricStatus::INSUFFICIENT_DATA);
    }

    SECTION("PR range over the last ten quarters") {
        REQUIRE_THAT(metrics.get(Metric::CURRENT_PR), WithinAbs(3.0, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PR_10Q_HIGH), WithinAbs(3.0, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PR_10Q_LOW), WithinAbs(2.1, 1e-9));
    }

    SECTION("Window averages and revaluation") {
        // PR for quarters 0..7 averages 3.0 - 0.35
        REQUIRE_THAT(metrics.get(Metric::PR_2YR_AVG), WithinAbs(2.65, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PR_5YR_AVG), WithinAbs(2.05, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PR_2YR_REVAL_DEVAL), WithinAbs((2.65 - 3.0) / 3.0, 1e-9));

        // PE is PR / margin
        REQUIRE_THAT(metrics.get(Metric::CURRENT_PE), WithinAbs(30.0, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PE_2YR_AVG), WithinAbs(26.5, 1e-9));
        REQUIRE_THAT(metrics.get(Metric::PE_5YR_REVAL_DEVAL), WithinAbs((20.5 - 30.0) / 30.0, 1e-9));
    }

    SECTION("Growth rate averages revenue and profit growth") {
        REQUIRE_THAT(metrics.get(Metric::GROWTH_RATE), WithinAbs(0.1, 1e-9));
    }
}

TEST_CASE("Empty bundle yields the all-zero set", "[MetricsCalculator]") {
    MetricSet metrics = MetricsCalculator().compute("AC01", PeriodKey::year_month(2024, 3), TimeSeriesBundle());
    REQUIRE(metrics.all_zero());
    REQUIRE(metrics.count(MetricStatus::INSUFFICIENT_DATA) == kMetricCount);
}

TEST_CASE("Missing data kinds are logged and flagged", "[MetricsCalculator]") {
    TimeSeriesBundle bundle;
    bundle.add(record(DataKind::TRAILING, PeriodKey::year_month(2024, 3), {{Category::TTM_REVENUE, 1000.0}}));
    bundle.finalize();

    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = core::logger();
    const auto previous_level = logger->level();
    logger->sinks().push_back(sink);
    logger->set_level(spdlog::level::debug);

    MetricSet metrics = MetricsCalculator().compute("AC01", PeriodKey::year_month(2024, 3), bundle);

    logger->sinks().pop_back();
    logger->set_level(previous_level);
    const std::string output = captured.str();

    SECTION("One line per empty kind") {
        REQUIRE(output.find("No quarterly records for entity AC01") != std::string::npos);
        REQUIRE(output.find("No valuation records for entity AC01") != std::string::npos);
        REQUIRE(output.find("No trailing records") == std::string::npos);
    }

    SECTION("Totals say which financials were present") {
        REQUIRE(metrics.totals().has_trailing_revenue);
        REQUIRE_FALSE(metrics.totals().has_trailing_profit);
        REQUIRE_FALSE(metrics.totals().has_valuation);
        REQUIRE_THAT(metrics.totals().trailing_revenue, WithinAbs(1000.0, 1e-12));
    }
}

TEST_CASE("Analysis periods", "[MetricsCalculator]") {
    TimeSeriesBundle bundle;
    bundle.add(record(DataKind::QUARTERLY, PeriodKey::year_month(2024, 3), {{Category::QUARTERLY_REVENUE, 1.0}}));
    bundle.add(record(DataKind::QUARTERLY, PeriodKey::year_month(2023, 12), {{Category::QUARTERLY_REVENUE, 1.0}}));
    bundle.add(record(DataKind::TRAILING, PeriodKey::year_month(2023, 12), {{Category::TTM_REVENUE, 1.0}}));
    bundle.add(record(DataKind::TRAILING, PeriodKey::year_month(2023, 9), {{Category::TTM_REVENUE, 1.0}}));
    bundle.finalize();

    auto periods = MetricsCalculator::analysis_periods(bundle);
    REQUIRE(periods.size() == 3);
    REQUIRE(periods[0].period == PeriodKey::year_month(2024, 3));
    REQUIRE(periods[0].kind == DataKind::QUARTERLY);
    REQUIRE(periods[1].kind == DataKind::TRAILING);
    REQUIRE(periods[2].period == PeriodKey::year_month(2023, 9));

    REQUIRE(MetricsCalculator::analysis_periods(bundle, 2).size() == 2);
}
