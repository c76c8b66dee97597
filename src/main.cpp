/**
 * @file main.cpp
 * @brief Main entry point for the fundmetrics engine
 *
 * Command-line application that ingests fundamentals tables, computes
 * per-entity metrics for every portfolio, aggregates them and writes reports.
 */

#include "batch/metrics_batch_runner.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "data/data_loader.hpp"
#include "data/in_memory_record_store.hpp"
#include "data/table_ingestor.hpp"
#include "report/column_exporter.hpp"
#include "report/metrics_report.hpp"
#include "schema/block_projector.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace fundmetrics;

namespace {

std::atomic<bool> g_cancel{false};

extern "C" void handle_sigint(int)
{
    g_cancel.store(true);
}

} // namespace

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "fundmetrics v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (overrides data.output_dir)\n"
              << "  --portfolio ID        Portfolio to compute; repeatable (default: all)\n"
              << "  --export              Write the canonical block export\n"
              << "  --verbose             Enable debug logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/engine_config.json --export\n"
              << "  " << program_name << " --config config/engine_config.json --portfolio GROWTH\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       fundmetrics v1.0.0                                       \n"
              << "       Period-indexed fundamentals and portfolio metrics        \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir;
    std::vector<std::string> portfolios;
    bool export_blocks = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--portfolio" && i + 1 < argc)
            {
                args.portfolios.push_back(argv[++i]);
            }
            else if (arg == "--export")
            {
                args.export_blocks = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/7] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);
        core::configure_logging(args.verbose ? "debug" : config.log_level);

        const std::string output_dir = args.output_dir.empty() ? config.data.output_dir : args.output_dir;

        if (args.verbose)
        {
            std::cout << "  - Input files: " << config.data.input_files.size() << "\n"
                      << "  - Holdings: " << config.data.holdings_file << "\n"
                      << "  - Registry file: " << config.data.registry_file << "\n"
                      << "  - Store file: " << config.data.store_file << "\n"
                      << "  - Worker threads: " << config.batch.worker_threads << "\n"
                      << "  - Output: " << output_dir << "\n";
        }

        // ====================================================================
        // 2. Engine State
        // ====================================================================
        std::cout << "[2/7] Loading engine state..." << std::endl;

        schema::PeriodRegistry registry;
        data::InMemoryRecordStore store;
        data::DataLoader::load_state(config.data, registry, store);
        std::cout << "  - " << registry.total() << " known periods, "
                  << store.list_entities().size() << " stored entities" << std::endl;

        // ====================================================================
        // 3. Ingest Tables
        // ====================================================================
        std::cout << "[3/7] Ingesting input tables..." << std::endl;

        data::TableIngestor ingestor(store, registry, config.header);

        for (const auto &path : config.data.input_files)
        {
            auto table = data::DataLoader::load_table_csv(path, config.header.header_row_count);
            try
            {
                auto stats = ingestor.ingest(table);
                std::cout << "  " << path << "\n";
                stats.print_summary();
            }
            catch (const core::SchemaError &e)
            {
                std::cerr << "\nSchema error in " << path << ": " << e.what() << std::endl;
                return 2;
            }
        }

        // ====================================================================
        // 4. Holdings
        // ====================================================================
        std::cout << "[4/7] Loading holdings..." << std::endl;

        auto holdings = data::DataLoader::load_holdings_csv(config.data.holdings_file);
        for (const auto &holding : holdings)
        {
            store.upsert_holding(holding);
        }
        std::cout << "  - " << holdings.size() << " holdings across "
                  << store.list_portfolios().size() << " portfolios" << std::endl;

        // ====================================================================
        // 5. Metrics Batch
        // ====================================================================
        std::cout << "[5/7] Computing metrics..." << std::endl;

        std::signal(SIGINT, handle_sigint);

        batch::ProgressCallback progress;
        if (args.verbose)
        {
            progress = [](const batch::ProgressUpdate &update)
            {
                std::cout << "  - " << update.portfolio_id << ": " << update.processed << "/"
                          << update.total << " " << update.current_entity << " ("
                          << batch::to_string(update.status) << ")" << std::endl;
            };
        }

        batch::MetricsBatchRunner runner(store, config.batch, progress);
        const auto portfolios = args.portfolios.empty() ? store.list_portfolios() : args.portfolios;
        auto summary = runner.run_all(portfolios, &g_cancel);

        // ====================================================================
        // 6. Reports
        // ====================================================================
        std::cout << "[6/7] Writing reports..." << std::endl;

        std::vector<data::MetricRecord> records;
        std::vector<analytics::PortfolioMetricSet> aggregates;
        for (const auto &portfolio : portfolios)
        {
            auto stored = store.get_metrics(portfolio);
            records.insert(records.end(), stored.begin(), stored.end());
            if (auto aggregate = store.get_portfolio_aggregate(portfolio))
            {
                aggregates.push_back(*aggregate);
            }
        }

        const std::string metrics_file = output_dir + "/entity_metrics.csv";
        const std::string aggregate_file = output_dir + "/portfolio_aggregates.json";
        report::write_metrics_csv(records, metrics_file);
        report::write_aggregate_json(aggregates, aggregate_file);
        std::cout << "  - Metrics written to: " << metrics_file << "\n"
                  << "  - Aggregates written to: " << aggregate_file << std::endl;

        if (args.export_blocks)
        {
            schema::BlockProjector projector(config.header);
            report::ColumnExporter exporter(store, projector);
            auto table = exporter.render_columns(projector.project(registry), store.list_entities());

            const std::string export_file = output_dir + "/block_export.csv";
            report::ColumnExporter::write_csv(table, export_file);
            std::cout << "  - Block export written to: " << export_file << std::endl;
        }

        // ====================================================================
        // 7. Save Engine State and Summary
        // ====================================================================
        std::cout << "[7/7] Saving engine state..." << std::endl;

        data::DataLoader::save_state(config.data, registry, store);

        summary.print_summary();

        for (const auto &aggregate : aggregates)
        {
            aggregate.print_summary();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << (summary.cancelled ? "Run cancelled after " : "Run completed in ")
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return summary.cancelled ? 130 : 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
