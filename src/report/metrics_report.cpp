/**
 * @file metrics_report.cpp
 * @brief Implementation of the metric report writers
 */

#include "report/metrics_report.hpp"
#include "data/data_loader.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fundmetrics {
namespace report {

namespace {

void ensure_parent(const std::string& filepath)
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }
}

} // namespace

void write_metrics_csv(const std::vector<data::MetricRecord>& records, const std::string& filepath)
{
    ensure_parent(filepath);

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "portfolio,entity,period,period_kind";
    for (auto metric : analytics::all_metrics())
    {
        file << "," << analytics::to_string(metric);
    }
    file << "\n";

    file << std::fixed << std::setprecision(6);
    for (const auto& record : records)
    {
        file << data::DataLoader::escape_csv(record.key.portfolio_id) << ","
             << data::DataLoader::escape_csv(record.key.entity_id) << ","
             << record.key.period.to_string() << ","
             << schema::to_string(record.key.period_kind);
        for (auto metric : analytics::all_metrics())
        {
            file << "," << record.metrics.get(metric);
        }
        file << "\n";
    }
}

void write_aggregate_json(const std::vector<analytics::PortfolioMetricSet>& aggregates,
                          const std::string& filepath)
{
    ensure_parent(filepath);

    nlohmann::json j = nlohmann::json::array();
    for (const auto& aggregate : aggregates)
    {
        j.push_back(aggregate.to_json());
    }
    data::DataLoader::save_json(j, filepath);
}

} // namespace report
} // namespace fundmetrics
