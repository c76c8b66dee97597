/**
 * @file portfolio_aggregator.cpp
 * @brief Implementation of PortfolioAggregator
 */

#include "analytics/portfolio_aggregator.hpp"
#include "core/logging.hpp"
#include <array>
#include <cmath>

namespace fundmetrics
{
    namespace analytics
    {

        PortfolioAggregator::PortfolioAggregator(Clock clock)
            : clock_(std::move(clock))
        {
            if (!clock_)
            {
                clock_ = []()
                { return std::chrono::system_clock::now(); };
            }
        }

        Eigen::VectorXd PortfolioAggregator::compute_weights(const std::vector<HoldingMetrics> &holdings)
        {
            const Eigen::Index n = static_cast<Eigen::Index>(holdings.size());
            Eigen::VectorXd values = Eigen::VectorXd::Zero(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const double mv = holdings[static_cast<size_t>(i)].market_value;
                if (std::isfinite(mv) && mv > 0.0)
                {
                    values(i) = mv;
                }
            }

            const double total = values.sum();
            if (total <= 0.0)
            {
                return Eigen::VectorXd::Zero(n);
            }
            return values / total;
        }

        DataCoverage PortfolioAggregator::assess_coverage(const std::vector<HoldingMetrics> &holdings,
                                                          const Eigen::VectorXd &weights)
        {
            DataCoverage coverage;
            size_t complete = 0;

            for (size_t i = 0; i < holdings.size(); ++i)
            {
                const MetricSet &metrics = holdings[i].metrics;
                const FinancialTotals &totals = metrics.totals();
                const double weight = weights(static_cast<Eigen::Index>(i));

                if (totals.has_valuation)
                {
                    ++coverage.valuation_holdings;
                    coverage.valuation_weight += weight;
                }
                if (totals.has_trailing_revenue)
                {
                    ++coverage.trailing_revenue_holdings;
                    coverage.trailing_revenue_weight += weight;
                }
                if (totals.has_trailing_profit)
                {
                    ++coverage.trailing_profit_holdings;
                    coverage.trailing_profit_weight += weight;
                }
                if (totals.has_valuation && totals.has_trailing_revenue && totals.has_trailing_profit)
                {
                    ++complete;
                }

                std::array<bool, kMetricFamilyCount> seen{};
                for (Metric metric : all_metrics())
                {
                    if (metrics.status(metric) == MetricStatus::OK)
                    {
                        seen[static_cast<size_t>(metric_family(metric))] = true;
                    }
                }
                for (size_t f = 0; f < kMetricFamilyCount; ++f)
                {
                    if (seen[f])
                        ++coverage.family_holdings[f];
                }
            }

            if (!holdings.empty())
            {
                coverage.completeness_pct = 100.0 * static_cast<double>(complete) /
                                            static_cast<double>(holdings.size());
            }
            return coverage;
        }

        PortfolioMetricSet PortfolioAggregator::aggregate(const std::string &portfolio_id,
                                                          const std::vector<HoldingMetrics> &holdings) const
        {
            PortfolioMetricSet result;
            result.portfolio_id = portfolio_id;
            result.holdings_count = holdings.size();
            result.last_updated = clock_();

            const Eigen::VectorXd all_weights = compute_weights(holdings);
            result.coverage = assess_coverage(holdings, all_weights);

            // Zero-weight holdings stay out of the products: inf * 0 is NaN
            std::vector<size_t> weighted;
            for (size_t i = 0; i < holdings.size(); ++i)
            {
                if (all_weights(static_cast<Eigen::Index>(i)) > 0.0)
                {
                    weighted.push_back(i);
                    result.total_market_value += holdings[i].market_value;
                }
            }
            result.weighted_holdings = weighted.size();

            if (result.weighted_holdings == 0)
            {
                core::logger()->warn("Portfolio {}: total market value is zero, aggregate defaults to 0",
                                     portfolio_id);
                return result;
            }

            constexpr double kFullWeight = 1.0 - 1e-9;
            if (result.coverage.trailing_profit_weight < kFullWeight ||
                result.coverage.trailing_revenue_weight < kFullWeight)
            {
                core::logger()->warn("Portfolio {}: trailing profit covers {:.1f}% and revenue {:.1f}% of weight",
                                     portfolio_id, result.coverage.trailing_profit_weight * 100.0,
                                     result.coverage.trailing_revenue_weight * 100.0);
            }

            // Weighted-holding x metric matrix and financial columns
            const Eigen::Index n = static_cast<Eigen::Index>(weighted.size());
            const Eigen::Index m = static_cast<Eigen::Index>(kMetricCount);
            Eigen::VectorXd weights(n);
            Eigen::MatrixXd values(n, m);
            Eigen::VectorXd valuation(n), revenue(n), profit(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const size_t source = weighted[static_cast<size_t>(i)];
                const MetricSet &metrics = holdings[source].metrics;
                weights(i) = all_weights(static_cast<Eigen::Index>(source));
                for (Eigen::Index j = 0; j < m; ++j)
                {
                    values(i, j) = metrics.get(static_cast<Metric>(j));
                }
                valuation(i) = metrics.totals().valuation;
                revenue(i) = metrics.totals().trailing_revenue;
                profit(i) = metrics.totals().trailing_profit;
            }

            const Eigen::VectorXd weighted_means = values.transpose() * weights;

            FinancialTotals &totals = result.weighted_totals;
            totals.valuation = weights.dot(valuation);
            totals.trailing_revenue = weights.dot(revenue);
            totals.trailing_profit = weights.dot(profit);
            totals.has_valuation = result.coverage.valuation_holdings > 0;
            totals.has_trailing_revenue = result.coverage.trailing_revenue_holdings > 0;
            totals.has_trailing_profit = result.coverage.trailing_profit_holdings > 0;

            for (Metric metric : all_metrics())
            {
                const size_t j = static_cast<size_t>(metric);
                if (aggregation_rule(metric) == AggregationRule::WEIGHTED_MEAN)
                {
                    result.values[j] = weighted_means(static_cast<Eigen::Index>(j));
                }
            }

            auto ratio = [](double numerator, double denominator)
            {
                return denominator != 0.0 ? numerator / denominator : 0.0;
            };
            result.values[static_cast<size_t>(Metric::PATM)] =
                ratio(totals.trailing_profit, totals.trailing_revenue) * 100.0;
            result.values[static_cast<size_t>(Metric::CURRENT_PE)] =
                ratio(totals.valuation, totals.trailing_profit);
            result.values[static_cast<size_t>(Metric::CURRENT_PR)] =
                ratio(totals.valuation, totals.trailing_revenue);

            core::logger()->debug("Portfolio {}: aggregated {} of {} holdings, market value {:.2f}",
                                  portfolio_id, result.weighted_holdings, result.holdings_count,
                                  result.total_market_value);
            return result;
        }

    } // namespace analytics
} // namespace fundmetrics
