/**
 * @file generate_synthetic_sheet.cpp
 * @brief Generate a synthetic fundamentals sheet and holdings file
 */

#include "data/data_loader.hpp"
#include "schema/block_projector.hpp"
#include "schema/period_registry.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <iterator>
#include <random>
#include <sstream>

using namespace fundmetrics;
using schema::Category;
using schema::PeriodKey;

namespace {

std::string fmt(double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

int quarter_end_day(int month)
{
    return (month == 3 || month == 12) ? 31 : 30;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Sheet Generator ===\n" << std::endl;

    std::string output_file = "data/sheets/synthetic_sheet.csv";
    std::string holdings_file = "data/sheets/synthetic_holdings.csv";
    int num_entities = 12;
    int num_quarters = 28;
    unsigned seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--holdings" && i + 1 < argc) {
            holdings_file = argv[++i];
        } else if (arg == "--entities" && i + 1 < argc) {
            num_entities = std::stoi(argv[++i]);
        } else if (arg == "--quarters" && i + 1 < argc) {
            num_quarters = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output FILE      Sheet CSV (default: data/sheets/synthetic_sheet.csv)\n"
                      << "  --holdings FILE    Holdings CSV (default: data/sheets/synthetic_holdings.csv)\n"
                      << "  --entities N       Number of entities (default: 12)\n"
                      << "  --quarters N       Quarters of history (default: 28)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    if (num_entities < 1 || num_quarters < 1) {
        std::cerr << "Error: --entities and --quarters must be positive" << std::endl;
        return 1;
    }

    // Quarter ends walking back from March 2025
    std::vector<std::pair<int, int>> quarters;
    int year = 2025, month = 3;
    for (int q = 0; q < num_quarters; ++q) {
        quarters.emplace_back(year, month);
        month -= 3;
        if (month <= 0) {
            month += 12;
            --year;
        }
    }

    schema::PeriodRegistry registry;
    for (const auto& ym : quarters) {
        const PeriodKey month_key = PeriodKey::year_month(ym.first, ym.second);
        const PeriodKey date_key = PeriodKey::date(ym.first, ym.second, quarter_end_day(ym.second));
        for (auto category : schema::canonical_category_order()) {
            if (!schema::is_time_series(category))
                continue;
            switch (schema::period_format(category)) {
                case schema::PeriodFormat::YEAR_MONTH: registry.observe(category, month_key); break;
                case schema::PeriodFormat::DATE:       registry.observe(category, date_key); break;
                case schema::PeriodFormat::FISCAL_YEAR:
                    if (ym.second == 3)
                        registry.observe(category, PeriodKey::fiscal_year(ym.first - 1));
                    break;
            }
        }
    }

    schema::BlockProjector projector;
    const schema::BlockLayout layout = projector.project(registry);
    std::vector<schema::Row> rows = projector.render_header_rows(layout);

    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> revenue_dist(500.0, 20000.0);
    std::uniform_real_distribution<double> margin_dist(0.04, 0.22);
    std::uniform_real_distribution<double> growth_dist(-0.02, 0.06);
    std::uniform_real_distribution<double> multiple_dist(12.0, 45.0);
    std::uniform_real_distribution<double> float_dist(0.25, 0.75);
    std::normal_distribution<double> noise(0.0, 0.03);

    const std::vector<std::string> sectors = {"Banking", "IT", "FMCG", "Pharma", "Energy", "Auto"};
    const std::vector<std::string> caps = {"Large", "Mid", "Small"};

    std::vector<std::pair<std::string, double>> entity_values;

    for (int e = 0; e < num_entities; ++e) {
        schema::Row row(layout.total_columns());
        std::ostringstream code;
        code << "AC" << std::setw(4) << std::setfill('0') << (e + 1);

        const double free_float = float_dist(gen);
        const double base_revenue = revenue_dist(gen);
        const double margin = margin_dist(gen);
        const double growth = growth_dist(gen);
        const double multiple = multiple_dist(gen);

        // Oldest quarter first so growth compounds forward
        std::map<PeriodKey, double> quarterly_revenue;
        double revenue = base_revenue;
        for (auto it = quarters.rbegin(); it != quarters.rend(); ++it) {
            revenue *= 1.0 + growth + noise(gen);
            quarterly_revenue[PeriodKey::year_month(it->first, it->second)] = revenue;
        }

        double latest_market_cap = 0.0;
        for (const auto& block : layout.blocks()) {
            if (block.category == Category::IDENTITY) {
                row[block.start_col] = "Synthetic Entity " + std::to_string(e + 1);
                row[block.start_col + 1] = code.str();
                row[block.start_col + 2] = sectors[e % sectors.size()];
                row[block.start_col + 3] = caps[e % caps.size()];
                row[block.start_col + 4] = fmt(free_float * 100.0);
                continue;
            }
            if (block.category == Category::IDENTIFIERS) {
                row[block.start_col] = std::to_string(500100 + e);
                row[block.start_col + 1] = "SYN" + std::to_string(e + 1);
                row[block.start_col + 2] = "INE" + code.str() + "01";
                continue;
            }

            for (size_t i = 0; i < block.periods.size(); ++i) {
                const PeriodKey& period = block.periods[i];
                const PeriodKey month_key = period.format() == schema::PeriodFormat::FISCAL_YEAR
                    ? PeriodKey::year_month(period.year() + 1, 3)
                    : PeriodKey::year_month(period.year(), period.month());

                auto found = quarterly_revenue.find(month_key);
                if (found == quarterly_revenue.end())
                    continue;

                double ttm = 0.0;
                int counted = 0;
                for (auto it = std::make_reverse_iterator(std::next(found)); it != quarterly_revenue.rend() && counted < 4; ++it, ++counted)
                    ttm += it->second;
                if (counted < 4)
                    ttm *= 4.0 / counted;

                const double quarter = found->second;
                const double market_cap = ttm * margin * multiple;
                double value = 0.0;

                switch (block.category) {
                    case Category::MARKET_CAP: value = market_cap; break;
                    case Category::MARKET_CAP_FREE_FLOAT: value = market_cap * free_float; break;
                    case Category::TTM_REVENUE: value = ttm; break;
                    case Category::TTM_REVENUE_FREE_FLOAT: value = ttm * free_float; break;
                    case Category::TTM_PAT: value = ttm * margin; break;
                    case Category::TTM_PAT_FREE_FLOAT: value = ttm * margin * free_float; break;
                    case Category::QUARTERLY_REVENUE: value = quarter; break;
                    case Category::QUARTERLY_REVENUE_FREE_FLOAT: value = quarter * free_float; break;
                    case Category::QUARTERLY_PAT: value = quarter * margin; break;
                    case Category::QUARTERLY_PAT_FREE_FLOAT: value = quarter * margin * free_float; break;
                    case Category::ROCE: value = 100.0 * margin * 1.4; break;
                    case Category::ROE: value = 100.0 * margin * 1.1; break;
                    case Category::RETENTION: value = 60.0 + 100.0 * growth; break;
                    case Category::SHARE_PRICE: value = market_cap / 10.0; break;
                    case Category::PRICE_TO_REVENUE: value = market_cap / ttm; break;
                    case Category::PRICE_TO_EARNINGS: value = multiple; break;
                    default: continue;
                }
                if (block.category == Category::MARKET_CAP && i == 0)
                    latest_market_cap = market_cap;
                row[block.start_col + i] = fmt(value);
            }
        }

        entity_values.emplace_back(code.str(), latest_market_cap);
        rows.push_back(std::move(row));
    }

    std::cout << "Saving sheet to " << output_file << "..." << std::endl;
    data::DataLoader::save_csv(rows, output_file);

    // Two portfolios: every entity, and every other entity
    std::uniform_real_distribution<double> share_dist(0.001, 0.02);
    std::vector<schema::Row> holdings = {{"portfolio", "entity_code", "shares", "market_value"}};
    for (size_t e = 0; e < entity_values.size(); ++e) {
        const double fraction = share_dist(gen);
        holdings.push_back({"BROAD", entity_values[e].first, fmt(fraction * 1e6),
                            fmt(fraction * entity_values[e].second)});
        if (e % 2 == 0) {
            holdings.push_back({"FOCUSED", entity_values[e].first, fmt(fraction * 2e6),
                                fmt(2.0 * fraction * entity_values[e].second)});
        }
    }

    std::cout << "Saving holdings to " << holdings_file << "..." << std::endl;
    data::DataLoader::save_csv(holdings, holdings_file);

    std::cout << "\nGenerated " << num_entities << " entities over " << num_quarters
              << " quarters (" << layout.total_columns() << " columns)" << std::endl;
    std::cout << "\nDone!" << std::endl;

    return 0;
}
