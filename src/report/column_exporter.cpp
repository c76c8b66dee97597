/**
 * @file column_exporter.cpp
 * @brief Implementation of ColumnExporter
 */

#include "report/column_exporter.hpp"
#include "core/logging.hpp"
#include "data/data_loader.hpp"
#include "data/time_series_cache.hpp"
#include <iomanip>
#include <set>
#include <sstream>

namespace fundmetrics {
namespace report {

using schema::Category;
using schema::IdentifierField;
using schema::IdentityField;

std::vector<schema::Row> RenderedTable::all_rows() const
{
    std::vector<schema::Row> rows = header_rows;
    rows.insert(rows.end(), data_rows.begin(), data_rows.end());
    return rows;
}

ColumnExporter::ColumnExporter(const data::RecordStore& store, schema::BlockProjector projector)
    : store_(store), projector_(std::move(projector))
{
}

std::string ColumnExporter::format_value(double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}

namespace {

std::string identity_cell(const data::Entity& entity, size_t slot)
{
    switch (static_cast<IdentityField>(slot))
    {
        case IdentityField::NAME:       return entity.name;
        case IdentityField::CODE:       return entity.code;
        case IdentityField::SECTOR:     return entity.sector;
        case IdentityField::CAP:        return entity.cap;
        case IdentityField::FREE_FLOAT:
            return entity.free_float ? ColumnExporter::format_value(*entity.free_float) : "";
    }
    return "";
}

std::string identifier_cell(const data::Entity& entity, size_t slot)
{
    switch (static_cast<IdentifierField>(slot))
    {
        case IdentifierField::BSE_CODE: return entity.bse_code;
        case IdentifierField::NSE_CODE: return entity.nse_code;
        case IdentifierField::ISIN:     return entity.isin;
    }
    return "";
}

} // namespace

RenderedTable ColumnExporter::render_columns(const schema::BlockLayout& layout,
                                             const std::vector<data::Entity>& entities) const
{
    RenderedTable table;
    table.header_rows = projector_.render_header_rows(layout);

    std::set<data::EntityId> ids;
    for (const auto& entity : entities)
    {
        ids.insert(entity.id);
    }
    const data::TimeSeriesCache cache = data::TimeSeriesCache::load(store_, ids);

    table.data_rows.reserve(entities.size());
    for (const auto& entity : entities)
    {
        schema::Row row(layout.total_columns());
        const data::TimeSeriesBundle& bundle = cache.bundle(entity.id);

        for (const auto& block : layout.blocks())
        {
            if (block.category == Category::IDENTITY)
            {
                for (size_t slot = 0; slot < block.width; ++slot)
                    row[block.start_col + slot] = identity_cell(entity, slot);
                continue;
            }
            if (block.category == Category::IDENTIFIERS)
            {
                for (size_t slot = 0; slot < block.width; ++slot)
                    row[block.start_col + slot] = identifier_cell(entity, slot);
                continue;
            }

            const schema::DataKind kind = schema::data_kind(block.category);
            for (size_t i = 0; i < block.periods.size(); ++i)
            {
                const data::TimeSeriesRecord* record = bundle.find(kind, block.periods[i]);
                if (!record)
                    continue;
                if (auto value = record->value(block.category))
                    row[block.start_col + i] = format_value(*value);
            }
        }
        table.data_rows.push_back(std::move(row));
    }

    core::logger()->info("Rendered export: {} columns, {} entities",
                         layout.total_columns(), table.data_rows.size());
    return table;
}

void ColumnExporter::write_csv(const RenderedTable& table, const std::string& filepath)
{
    data::DataLoader::save_csv(table.all_rows(), filepath);
}

} // namespace report
} // namespace fundmetrics
