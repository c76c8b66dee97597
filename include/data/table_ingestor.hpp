/**
 * @file table_ingestor.hpp
 * @brief Writes a classified input table into the record store
 */

#ifndef FUNDMETRICS_DATA_TABLE_INGESTOR_HPP
#define FUNDMETRICS_DATA_TABLE_INGESTOR_HPP

#include "data/data_loader.hpp"
#include "data/record_store.hpp"
#include "schema/header_classifier.hpp"
#include "schema/period_registry.hpp"
#include <optional>
#include <string>

namespace fundmetrics {
namespace data {

/**
 * @struct IngestStats
 * @brief Counters of one ingest
 */
struct IngestStats {
    size_t entities_added = 0;
    size_t entities_updated = 0;
    size_t records_inserted = 0;
    size_t records_updated = 0;
    size_t rows_skipped = 0;          ///< Blank, sample, or missing name/code
    size_t new_periods = 0;           ///< Keys the registry had not seen
    size_t unparseable_periods = 0;   ///< Columns excluded for a bad period cell

    void print_summary() const;
};

/**
 * @class TableIngestor
 * @brief Classify, register periods, then upsert entities and records
 *
 * The header is classified before anything is written, so a SchemaError
 * leaves both the registry and the store untouched.
 */
class TableIngestor {
public:
    TableIngestor(RecordStore& store, schema::PeriodRegistry& registry,
                  schema::HeaderLayout layout = schema::HeaderLayout());

    /**
     * @brief Ingest one table
     * @throws core::SchemaError if the header cannot be classified
     */
    IngestStats ingest(const Table& table);

    /**
     * @brief Parse a numeric cell
     *
     * Currency symbols, thousands separators and spaces are ignored and
     * "(12.5)" reads as -12.5. Blank, "-", "nan" and "sample" cells have no
     * value.
     */
    static std::optional<double> parse_cell(const std::string& cell);

private:
    RecordStore& store_;
    schema::PeriodRegistry& registry_;
    schema::HeaderClassifier classifier_;
};

} // namespace data
} // namespace fundmetrics

#endif // FUNDMETRICS_DATA_TABLE_INGESTOR_HPP
