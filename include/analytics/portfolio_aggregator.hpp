/**
 * @file portfolio_aggregator.hpp
 * @brief Holding-weighted portfolio aggregation
 *
 * Two rules, chosen per metric by aggregation_rule():
 * - WEIGHTED_MEAN: sum of weight_i * metric_i
 * - RATIO_OF_TOTALS: the ratio recomputed from weighted financial totals,
 *   which is what a spreadsheet TOTALS row shows. This is not the weighted
 *   mean of the entity ratios.
 */

#pragma once

#include "analytics/metric_set.hpp"
#include "data/record_store.hpp"
#include <Eigen/Dense>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace fundmetrics
{
    namespace analytics
    {

        /**
         * @struct HoldingMetrics
         * @brief One holding's market value and its entity's metrics
         */
        struct HoldingMetrics
        {
            data::EntityId entity_id;
            double market_value = 0.0;
            MetricSet metrics;
        };

        /**
         * @class PortfolioAggregator
         * @brief Combines entity metrics into a PortfolioMetricSet
         */
        class PortfolioAggregator
        {
        public:
            using Clock = std::function<std::chrono::system_clock::time_point()>;

            /**
             * @brief Constructor
             * @param clock Timestamp source; defaults to the system clock
             */
            explicit PortfolioAggregator(Clock clock = Clock());

            /**
             * @brief Market-value weights, recomputed on every call
             *
             * Non-positive and non-finite market values get weight 0. If the
             * total is zero every weight is zero.
             *
             * @return Weight vector aligned with holdings
             */
            static Eigen::VectorXd compute_weights(const std::vector<HoldingMetrics> &holdings);

            /**
             * @brief Financial and metric-family coverage of the holdings
             * @param weights Output of compute_weights() for the same holdings
             */
            static DataCoverage assess_coverage(const std::vector<HoldingMetrics> &holdings,
                                                const Eigen::VectorXd &weights);

            /**
             * @brief Aggregate a portfolio
             * @param portfolio_id Portfolio the holdings belong to
             * @param holdings Holdings with their entity metrics
             * @return Aggregate with a fresh last_updated timestamp
             */
            PortfolioMetricSet aggregate(const std::string &portfolio_id,
                                         const std::vector<HoldingMetrics> &holdings) const;

        private:
            Clock clock_;
        };

    } // namespace analytics
} // namespace fundmetrics
