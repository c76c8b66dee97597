/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and configuration structures
 */

#include "data/data_loader.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fundmetrics
{
    namespace data
    {

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.input_files = j.value("input_files", std::vector<std::string>{});
            config.holdings_file = j.value("holdings_file", "");
            config.registry_file = j.value("registry_file", "");
            config.store_file = j.value("store_file", "");
            config.output_dir = j.value("output_dir", "results");
            return config;
        }

        EngineConfig EngineConfig::from_json(const nlohmann::json &j)
        {
            EngineConfig config;

            if (j.contains("data"))
            {
                config.data = DataConfig::from_json(j["data"]);
            }
            else
            {
                config.data = DataConfig::from_json(nlohmann::json::object());
            }

            if (j.contains("header"))
            {
                config.header = schema::HeaderLayout::from_json(j["header"]);
            }

            if (j.contains("batch"))
            {
                config.batch = batch::BatchConfig::from_json(j["batch"]);
            }

            if (j.contains("logging"))
            {
                config.log_level = j["logging"].value("level", config.log_level);
            }

            return config;
        }

        EngineConfig EngineConfig::load_from_file(const std::string &config_path)
        {
            return DataLoader::load_config(config_path);
        }

        // ===========================
        // CSV Loading - Input tables
        // ===========================

        Table DataLoader::load_table_csv(const std::string &filepath, size_t header_row_count)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            Table table;
            std::string line;
            while (std::getline(file, line))
            {
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }

                if (table.header_rows.size() < header_row_count)
                {
                    table.header_rows.push_back(parse_csv_line(line));
                }
                else if (!line.empty())
                {
                    table.data_rows.push_back(parse_csv_line(line));
                }
            }

            core::logger()->debug("Loaded {}: {} header rows, {} data rows",
                                  filepath, table.header_rows.size(), table.data_rows.size());
            return table;
        }

        // =======================
        // CSV Loading - Holdings
        // =======================

        std::vector<Holding> DataLoader::load_holdings_csv(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open holdings file: " + filepath);
            }

            std::vector<Holding> holdings;
            std::string line;

            // Skip header
            std::getline(file, line);

            size_t line_no = 1;
            while (std::getline(file, line))
            {
                ++line_no;
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 4)
                {
                    core::logger()->warn("{}:{}: expected 4 fields, skipping", filepath, line_no);
                    continue;
                }

                Holding holding;
                holding.portfolio_id = trim(fields[0]);
                holding.entity_id = clean_code(trim(fields[1]));
                if (holding.portfolio_id.empty() || holding.entity_id.empty())
                    continue;

                holding.shares = safe_stod(fields[2]);
                holding.market_value = safe_stod(fields[3]);
                if (holding.market_value != holding.market_value)
                {
                    core::logger()->warn("{}:{}: no market value for {} in {}, weight will be 0",
                                         filepath, line_no, holding.entity_id, holding.portfolio_id);
                    holding.market_value = 0.0;
                }
                if (holding.shares != holding.shares)
                {
                    holding.shares = 0.0;
                }

                holdings.push_back(holding);
            }

            return holdings;
        }

        // ================
        // JSON Loading
        // ================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
            }

            return j;
        }

        void DataLoader::save_json(const nlohmann::json &j, const std::string &filepath)
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            file << j.dump(2) << "\n";
        }

        EngineConfig DataLoader::load_config(const std::string &config_path)
        {
            auto j = load_json(config_path);
            try
            {
                return EngineConfig::from_json(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid configuration in " + config_path + ": " + std::string(e.what()));
            }
        }

        // ==================
        // Engine State
        // ==================

        namespace
        {
            nlohmann::json entity_to_json(const Entity &entity)
            {
                nlohmann::json j = {
                    {"id", entity.id},
                    {"name", entity.name},
                    {"code", entity.code},
                    {"sector", entity.sector},
                    {"cap", entity.cap},
                    {"bse_code", entity.bse_code},
                    {"nse_code", entity.nse_code},
                    {"isin", entity.isin}};
                j["free_float"] = entity.free_float ? nlohmann::json(*entity.free_float) : nlohmann::json();
                return j;
            }

            Entity entity_from_json(const nlohmann::json &j)
            {
                Entity entity;
                entity.id = j.at("id").get<std::string>();
                entity.name = j.value("name", "");
                entity.code = j.value("code", entity.id);
                entity.sector = j.value("sector", "");
                entity.cap = j.value("cap", "");
                entity.bse_code = j.value("bse_code", "");
                entity.nse_code = j.value("nse_code", "");
                entity.isin = j.value("isin", "");
                if (j.contains("free_float") && j["free_float"].is_number())
                {
                    entity.free_float = j["free_float"].get<double>();
                }
                return entity;
            }
        } // namespace

        nlohmann::json DataLoader::store_snapshot(const RecordStore &store)
        {
            const auto entities = store.list_entities();
            std::set<EntityId> ids;

            nlohmann::json entity_array = nlohmann::json::array();
            for (const auto &entity : entities)
            {
                ids.insert(entity.id);
                entity_array.push_back(entity_to_json(entity));
            }

            nlohmann::json record_array = nlohmann::json::array();
            for (schema::DataKind kind : schema::all_data_kinds())
            {
                for (const auto &record : store.get_records(kind, ids))
                {
                    nlohmann::json values = nlohmann::json::object();
                    for (const auto &field : record.values)
                    {
                        values[schema::to_string(field.first)] = field.second;
                    }
                    record_array.push_back({{"entity", record.entity_id},
                                            {"kind", schema::to_string(kind)},
                                            {"period", record.period.to_string()},
                                            {"values", values}});
                }
            }

            return {{"entities", entity_array}, {"records", record_array}};
        }

        size_t DataLoader::restore_snapshot(const nlohmann::json &snapshot, RecordStore &store)
        {
            size_t restored = 0;
            try
            {
                for (const auto &entity : snapshot.at("entities"))
                {
                    store.upsert_entity(entity_from_json(entity));
                }

                for (const auto &record : snapshot.at("records"))
                {
                    const auto kind = schema::data_kind_from_string(record.at("kind").get<std::string>());
                    const std::string period_text = record.at("period").get<std::string>();
                    const auto period = schema::PeriodKey::parse(period_text);
                    if (!period || period->format() != schema::period_format(kind))
                    {
                        throw std::invalid_argument("period '" + period_text + "' does not fit kind " +
                                                    schema::to_string(kind));
                    }

                    std::map<schema::Category, double> fields;
                    for (const auto &value : record.at("values").items())
                    {
                        const auto category = schema::category_from_string(value.key());
                        if (!schema::is_time_series(category) || schema::data_kind(category) != kind)
                        {
                            throw std::invalid_argument("category '" + value.key() + "' is not a field of " +
                                                        schema::to_string(kind));
                        }
                        fields[category] = value.value().get<double>();
                    }

                    store.upsert_record(record.at("entity").get<std::string>(), kind, *period, fields);
                    ++restored;
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Malformed store snapshot: " + std::string(e.what()));
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error("Malformed store snapshot: " + std::string(e.what()));
            }
            return restored;
        }

        void DataLoader::load_state(const DataConfig &config, schema::PeriodRegistry &registry, RecordStore &store)
        {
            auto &log = *core::logger();

            if (!config.registry_file.empty() && std::filesystem::exists(config.registry_file))
            {
                registry = schema::PeriodRegistry::from_json(load_json(config.registry_file));
                log.info("Loaded {} known periods from {}", registry.total(), config.registry_file);
            }

            if (!config.store_file.empty() && std::filesystem::exists(config.store_file))
            {
                const size_t records = restore_snapshot(load_json(config.store_file), store);
                log.info("Restored {} entities and {} records from {}",
                         store.list_entities().size(), records, config.store_file);
            }

            const schema::PeriodRegistry stored = load_registry(store);
            if (!registry.includes(stored))
            {
                const size_t added = registry.merge(stored);
                log.warn("Registry was missing {} stored periods; merged from the store", added);
            }
        }

        void DataLoader::save_state(const DataConfig &config, const schema::PeriodRegistry &registry,
                                    const RecordStore &store)
        {
            if (!config.registry_file.empty())
            {
                save_json(registry.to_json(), config.registry_file);
            }
            if (!config.store_file.empty())
            {
                save_json(store_snapshot(store), config.store_file);
            }
        }

        // ==================
        // Export Methods
        // ==================

        void DataLoader::save_csv(const std::vector<schema::Row> &rows, const std::string &filepath)
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            for (const auto &row : rows)
            {
                for (size_t i = 0; i < row.size(); ++i)
                {
                    if (i > 0)
                        file << ",";
                    file << escape_csv(row[i]);
                }
                file << "\n";
            }
        }

        // =======================
        // Helper Methods
        // =======================

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (size_t i = 0; i < line.size(); ++i)
            {
                const char c = line[i];
                if (c == '"')
                {
                    if (in_quotes && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        token += '"';
                        ++i;
                    }
                    else
                    {
                        in_quotes = !in_quotes;
                    }
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string DataLoader::escape_csv(const std::string &cell)
        {
            if (cell.find_first_of(",\"\r\n") == std::string::npos)
            {
                return cell;
            }
            std::string out = "\"";
            for (char c : cell)
            {
                if (c == '"')
                    out += '"';
                out += c;
            }
            out += '"';
            return out;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        std::string DataLoader::clean_code(const std::string &code)
        {
            if (code.size() > 2 && code.compare(code.size() - 2, 2, ".0") == 0 &&
                std::all_of(code.begin(), code.end() - 2, [](unsigned char c)
                            { return std::isdigit(c); }))
            {
                return code.substr(0, code.size() - 2);
            }
            return code;
        }

        double DataLoader::safe_stod(const std::string &str)
        {
            const std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            try
            {
                size_t consumed = 0;
                const double value = std::stod(trimmed, &consumed);
                return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
            }
            catch (const std::logic_error &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
        }

    } // namespace data
} // namespace fundmetrics
