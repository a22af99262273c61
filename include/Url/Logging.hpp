#ifndef URL_LOGGING_HPP
#define URL_LOGGING_HPP

/**
 * @file Logging.hpp
 *
 * This module declares the Url::GetLogger function.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <spdlog/spdlog.h>

namespace Url {

    /**
     * This is the name under which the library logger is registered
     * with spdlog.
     */
    extern const char* const LOGGER_NAME;

    /**
     * This function returns the logger used by the library,
     * creating and registering it the first time it's called.
     *
     * The logger writes to the standard error stream.  Its level
     * is "warn" unless overridden by the SPDLOG_LEVEL environment
     * variable (for example "SPDLOG_LEVEL=Url=debug").
     *
     * @return
     *     The logger used by the library is returned.
     */
    std::shared_ptr< spdlog::logger > GetLogger();

}

#endif /* URL_LOGGING_HPP */
