/**
 * @file column_exporter.hpp
 * @brief Columnar re-export of stored values in canonical block order
 */

#ifndef FUNDMETRICS_REPORT_COLUMN_EXPORTER_HPP
#define FUNDMETRICS_REPORT_COLUMN_EXPORTER_HPP

#include "data/record_store.hpp"
#include "schema/block_projector.hpp"
#include <string>
#include <vector>

namespace fundmetrics {
namespace report {

/**
 * @struct RenderedTable
 * @brief Header rows followed by one row per entity
 */
struct RenderedTable {
    std::vector<schema::Row> header_rows;
    std::vector<schema::Row> data_rows;

    /// Header and data rows in file order
    std::vector<schema::Row> all_rows() const;
};

/**
 * @class ColumnExporter
 * @brief Fills a BlockLayout with entity master data and stored records
 *
 * Usage Example:
 * @code
 * BlockProjector projector(config.header);
 * ColumnExporter exporter(store, projector);
 * auto table = exporter.render_columns(projector.project(registry), store.list_entities());
 * ColumnExporter::write_csv(table, "results/export.csv");
 * @endcode
 */
class ColumnExporter {
public:
    ColumnExporter(const data::RecordStore& store, schema::BlockProjector projector);

    /**
     * @brief Render the layout for the given entities
     *
     * Records are read through one cache load. A period with no stored
     * value renders as a blank cell.
     */
    RenderedTable render_columns(const schema::BlockLayout& layout,
                                 const std::vector<data::Entity>& entities) const;

    static void write_csv(const RenderedTable& table, const std::string& filepath);

    /// Numeric cell text with fixed precision
    static std::string format_value(double value);

private:
    const data::RecordStore& store_;
    schema::BlockProjector projector_;
};

} // namespace report
} // namespace fundmetrics

#endif // FUNDMETRICS_REPORT_COLUMN_EXPORTER_HPP
