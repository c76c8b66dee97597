/**
 * @file table_ingestor.cpp
 * @brief Implementation of TableIngestor
 */

#include "data/table_ingestor.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>

namespace fundmetrics {
namespace data {

using schema::Category;
using schema::DataKind;
using schema::IdentifierField;
using schema::IdentityField;

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string cell_at(const schema::Row& row, std::optional<size_t> column)
{
    if (!column || *column >= row.size())
    {
        return "";
    }
    std::string value = DataLoader::trim(row[*column]);
    return lower(value) == "nan" ? "" : value;
}

bool is_placeholder(const std::string& value)
{
    return lower(value) == "sample";
}

} // namespace

void IngestStats::print_summary() const
{
    std::cout << "  Entities added:      " << entities_added << "\n"
              << "  Entities updated:    " << entities_updated << "\n"
              << "  Records inserted:    " << records_inserted << "\n"
              << "  Records updated:     " << records_updated << "\n"
              << "  Rows skipped:        " << rows_skipped << "\n"
              << "  New periods:         " << new_periods << "\n"
              << "  Unparseable periods: " << unparseable_periods << "\n";
}

TableIngestor::TableIngestor(RecordStore& store, schema::PeriodRegistry& registry,
                             schema::HeaderLayout layout)
    : store_(store), registry_(registry), classifier_(std::move(layout))
{
}

std::optional<double> TableIngestor::parse_cell(const std::string& cell)
{
    static const std::string rupee = "\xE2\x82\xB9";

    std::string cleaned;
    for (size_t i = 0; i < cell.size(); ++i)
    {
        if (cell.compare(i, rupee.size(), rupee) == 0)
        {
            i += rupee.size() - 1;
            continue;
        }
        const char c = cell[i];
        if (c == '$' || c == ',' || std::isspace(static_cast<unsigned char>(c)))
        {
            continue;
        }
        cleaned.push_back(c);
    }

    if (cleaned.size() >= 2 && cleaned.front() == '(' && cleaned.back() == ')')
    {
        cleaned = "-" + cleaned.substr(1, cleaned.size() - 2);
    }

    const std::string folded = lower(cleaned);
    if (cleaned.empty() || cleaned == "-" || folded == "nan" || folded == "sample")
    {
        return std::nullopt;
    }

    const double value = DataLoader::safe_stod(cleaned);
    if (!std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

IngestStats TableIngestor::ingest(const Table& table)
{
    auto& log = *core::logger();

    // Nothing is written unless the header classifies
    const schema::ColumnClassificationMap columns = classifier_.classify(table.header_rows);

    IngestStats stats;
    stats.unparseable_periods = columns.unparseable().size();
    stats.new_periods = registry_.merge(columns);

    const auto name_col = columns.identity_column(IdentityField::NAME);
    const auto code_col = columns.identity_column(IdentityField::CODE);
    const auto sector_col = columns.identity_column(IdentityField::SECTOR);
    const auto cap_col = columns.identity_column(IdentityField::CAP);
    const auto free_float_col = columns.identity_column(IdentityField::FREE_FLOAT);
    const auto bse_col = columns.identifier_column(IdentifierField::BSE_CODE);
    const auto nse_col = columns.identifier_column(IdentifierField::NSE_CODE);
    const auto isin_col = columns.identifier_column(IdentifierField::ISIN);

    std::vector<const schema::ColumnClassification*> series_columns;
    for (const auto& column : columns.columns())
    {
        if (column.is_time_series() && column.period)
        {
            series_columns.push_back(&column);
        }
    }

    for (const auto& row : table.data_rows)
    {
        const std::string name = cell_at(row, name_col);
        const std::string code = DataLoader::clean_code(cell_at(row, code_col));
        if (name.empty() || code.empty() || name.rfind("Sample", 0) == 0)
        {
            ++stats.rows_skipped;
            continue;
        }

        // Keep stored values for fields the upload leaves blank
        Entity entity = store_.get_entity(code).value_or(Entity());
        entity.id = code;
        entity.code = code;
        entity.name = name;

        const std::string sector = cell_at(row, sector_col);
        if (!sector.empty() && !is_placeholder(sector))
            entity.sector = sector;
        const std::string cap = cell_at(row, cap_col);
        if (!cap.empty() && !is_placeholder(cap))
            entity.cap = cap;
        if (auto free_float = parse_cell(cell_at(row, free_float_col)))
            entity.free_float = free_float;
        const std::string bse = DataLoader::clean_code(cell_at(row, bse_col));
        if (!bse.empty())
            entity.bse_code = bse;
        const std::string nse = cell_at(row, nse_col);
        if (!nse.empty())
            entity.nse_code = nse;
        const std::string isin = cell_at(row, isin_col);
        if (!isin.empty())
            entity.isin = isin;

        if (store_.upsert_entity(entity) == UpsertOutcome::INSERTED)
            ++stats.entities_added;
        else
            ++stats.entities_updated;

        // kind -> period -> fields
        std::map<DataKind, std::map<schema::PeriodKey, std::map<Category, double>>> grouped;
        for (const auto* column : series_columns)
        {
            auto value = parse_cell(cell_at(row, column->column_index));
            if (!value)
                continue;
            const Category category = *column->category;
            grouped[schema::data_kind(category)][*column->period][category] = *value;
        }

        for (const auto& kind_entry : grouped)
        {
            for (const auto& period_entry : kind_entry.second)
            {
                const UpsertOutcome outcome =
                    store_.upsert_record(code, kind_entry.first, period_entry.first, period_entry.second);
                if (outcome == UpsertOutcome::INSERTED)
                    ++stats.records_inserted;
                else
                    ++stats.records_updated;
            }
        }
    }

    log.info("Ingested table: {} entities added, {} updated, {} records inserted, {} updated, "
             "{} rows skipped, {} new periods",
             stats.entities_added, stats.entities_updated, stats.records_inserted,
             stats.records_updated, stats.rows_skipped, stats.new_periods);
    return stats;
}

} // namespace data
} // namespace fundmetrics
