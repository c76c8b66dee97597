/**
 * @file logging.hpp
 * @brief Shared spdlog logger for the engine
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace fundmetrics
{
    namespace core
    {

        /**
         * @brief Engine logger, created on first use
         *
         * All modules log through this instance so that the CLI can raise or
         * lower verbosity in one place.
         */
        std::shared_ptr<spdlog::logger> logger();

        /**
         * @brief Set the engine log level by name
         * @param level One of trace, debug, info, warn, error, off
         * @throws std::invalid_argument for an unknown level name
         */
        void configure_logging(const std::string &level);

    } // namespace core
} // namespace fundmetrics
