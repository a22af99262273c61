#ifndef URL_WARNINGS_HPP
#define URL_WARNINGS_HPP

/**
 * @file Warnings.hpp
 *
 * This module declares the Url::Warning structure and the
 * type of delegate used to receive warnings.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <string>

namespace Url {

    /**
     * This describes a condition which does not stop an operation,
     * but which the caller may want to know about.
     */
    struct Warning {
        /**
         * These are the kinds of warnings published by the library.
         */
        enum class Type {
            /**
             * Overlapping parameters were given to a multi-parameter
             * mutator.  The operation completed, with the more
             * specific parameters taking precedence.
             */
            Conflict,

            /**
             * In strict mode, a string given to the library was not
             * correctly percent-encoded.  The string was used anyway.
             */
            Encoding,
        };

        /**
         * This is the kind of warning.
         */
        Type type;

        /**
         * This is a human-readable description of the warning.
         */
        std::string message;
    };

    /**
     * This is the type of function which can be given to the library
     * to receive warnings.
     *
     * @param[in] warning
     *     This describes the condition being reported.
     */
    typedef std::function< void(const Warning& warning) > WarningDelegate;

}

#endif /* URL_WARNINGS_HPP */
