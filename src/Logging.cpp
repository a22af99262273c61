/**
 * @file Logging.cpp
 *
 * This module contains the implementation of the Url::GetLogger function.
 *
 * © 2018 by Richard Walters
 */

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <Url/Logging.hpp>

namespace {

    /**
     * This function looks up the library logger in the spdlog registry,
     * creating it if the application hasn't already registered a logger
     * with the same name.
     *
     * @return
     *     The library logger is returned.
     */
    std::shared_ptr< spdlog::logger > FindOrCreateLogger() {
        auto logger = spdlog::get(Url::LOGGER_NAME);
        if (logger == nullptr) {
            logger = spdlog::stderr_color_mt(Url::LOGGER_NAME);
            logger->set_level(spdlog::level::warn);
            spdlog::cfg::load_env_levels();
        }
        return logger;
    }

}

namespace Url {

    const char* const LOGGER_NAME = "Url";

    std::shared_ptr< spdlog::logger > GetLogger() {
        static const auto logger = FindOrCreateLogger();
        return logger;
    }

}
