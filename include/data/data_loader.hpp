/**
 * @file data_loader.hpp
 * @brief Table, holdings and configuration loading
 *
 * Input tables are CSV exports of the source spreadsheet: a fixed block
 * of header rows followed by one row per entity. Configuration is JSON.
 */

#ifndef FUNDMETRICS_DATA_DATA_LOADER_HPP
#define FUNDMETRICS_DATA_DATA_LOADER_HPP

#include "batch/metrics_batch_runner.hpp"
#include "data/record_store.hpp"
#include "schema/header_classifier.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fundmetrics {
namespace data {

/**
 * @struct Table
 * @brief Raw cells of an input table
 */
struct Table {
    std::vector<schema::Row> header_rows;   ///< The fixed header block
    std::vector<schema::Row> data_rows;     ///< One row per entity
};

/**
 * @struct DataConfig
 * @brief Input and output locations
 */
struct DataConfig {
    std::vector<std::string> input_files;   ///< Tables ingested in order
    std::string holdings_file;              ///< portfolio,entity_code,shares,market_value
    std::string registry_file;              ///< Period registry kept between runs; optional
    std::string store_file;                 ///< Entities and records kept between runs; optional
    std::string output_dir;                 ///< Reports directory

    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    DataConfig data;
    schema::HeaderLayout header;
    batch::BatchConfig batch;
    std::string log_level = "info";

    /**
     * @brief Load complete configuration from JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig load_from_file(const std::string& config_path);

    static EngineConfig from_json(const nlohmann::json& j);
};

/**
 * @class DataLoader
 * @brief Reads and writes the engine's flat files
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load an input table
     *
     * The first header_row_count lines become header rows; the rest become
     * data rows. A file shorter than the header block yields fewer header
     * rows, which the classifier rejects.
     *
     * @param filepath Path to CSV file
     * @param header_row_count Lines in the header block
     * @return Table
     * @throws std::runtime_error if the file cannot be opened
     */
    static Table load_table_csv(const std::string& filepath, size_t header_row_count);

    /**
     * @brief Load holdings
     *
     * Expected format:
     * portfolio,entity_code,shares,market_value
     * GROWTH,TCS,120,450000.0
     *
     * Rows without portfolio or entity code are skipped. Entity codes are
     * cleaned the same way the table ingestor cleans them.
     *
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::vector<Holding> load_holdings_csv(const std::string& filepath);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @throws std::runtime_error if the file cannot be loaded or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Write JSON file, pretty-printed
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_json(const nlohmann::json& j, const std::string& filepath);

    static EngineConfig load_config(const std::string& config_path);

    // ========================================================================
    // Engine State
    // ========================================================================

    /**
     * @brief Entities and time-series records of a store as JSON
     *
     * Holdings and computed metrics are not included: holdings are reloaded
     * from the holdings file and metrics are recomputed on every run.
     */
    static nlohmann::json store_snapshot(const RecordStore& store);

    /**
     * @brief Upsert a snapshot's entities and records into a store
     * @return Number of records restored
     * @throws std::runtime_error on a malformed snapshot
     */
    static size_t restore_snapshot(const nlohmann::json& snapshot, RecordStore& store);

    /**
     * @brief Load the registry and store files named in the config
     *
     * Missing files are skipped. Periods present in the store but not in
     * the registry file are merged into the registry.
     */
    static void load_state(const DataConfig& config, schema::PeriodRegistry& registry, RecordStore& store);

    /// Write the registry and store files named in the config
    static void save_state(const DataConfig& config, const schema::PeriodRegistry& registry,
                           const RecordStore& store);

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Write rows as CSV, quoting cells that need it
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_csv(const std::vector<schema::Row>& rows, const std::string& filepath);

    // ========================================================================
    // Helpers
    // ========================================================================

    /// Split one CSV line; handles quoted cells and doubled quotes
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /// Quote a cell if it contains a comma, quote or line break
    static std::string escape_csv(const std::string& cell);

    static std::string trim(const std::string& str);

    /// Drop the ".0" spreadsheet exports append to integer codes ("500325.0")
    static std::string clean_code(const std::string& code);

    /// Convert string to double, or NaN if conversion fails
    static double safe_stod(const std::string& str);
};

} // namespace data
} // namespace fundmetrics

#endif // FUNDMETRICS_DATA_DATA_LOADER_HPP
