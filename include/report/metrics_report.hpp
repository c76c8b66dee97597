/**
 * @file metrics_report.hpp
 * @brief Writers for computed metric records and portfolio aggregates
 */

#ifndef FUNDMETRICS_REPORT_METRICS_REPORT_HPP
#define FUNDMETRICS_REPORT_METRICS_REPORT_HPP

#include "analytics/metric_set.hpp"
#include "data/record_store.hpp"
#include <string>
#include <vector>

namespace fundmetrics {
namespace report {

/**
 * @brief Write one CSV line per metric record
 *
 * Columns: portfolio, entity, period, period_kind, then one column per
 * metric in declaration order.
 */
void write_metrics_csv(const std::vector<data::MetricRecord>& records, const std::string& filepath);

/// Write portfolio aggregates as a JSON array
void write_aggregate_json(const std::vector<analytics::PortfolioMetricSet>& aggregates,
                          const std::string& filepath);

} // namespace report
} // namespace fundmetrics

#endif // FUNDMETRICS_REPORT_METRICS_REPORT_HPP
