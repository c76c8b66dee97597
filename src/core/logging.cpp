/**
 * @file logging.cpp
 * @brief Engine logger setup
 */

#include "core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace fundmetrics
{
    namespace core
    {

        std::shared_ptr<spdlog::logger> logger()
        {
            static std::shared_ptr<spdlog::logger> instance = []()
            {
                auto existing = spdlog::get("fundmetrics");
                if (existing)
                {
                    return existing;
                }
                auto created = spdlog::stderr_color_mt("fundmetrics");
                created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
                created->set_level(spdlog::level::info);
                return created;
            }();
            return instance;
        }

        void configure_logging(const std::string &level)
        {
            spdlog::level::level_enum parsed;
            if (level == "trace")
                parsed = spdlog::level::trace;
            else if (level == "debug")
                parsed = spdlog::level::debug;
            else if (level == "info")
                parsed = spdlog::level::info;
            else if (level == "warn" || level == "warning")
                parsed = spdlog::level::warn;
            else if (level == "error")
                parsed = spdlog::level::err;
            else if (level == "off")
                parsed = spdlog::level::off;
            else
                throw std::invalid_argument("Unknown log level: " + level);

            logger()->set_level(parsed);
        }

    } // namespace core
} // namespace fundmetrics
