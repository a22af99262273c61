#ifndef URL_PUBLISH_WARNING_HPP
#define URL_PUBLISH_WARNING_HPP

/**
 * @file PublishWarning.hpp
 *
 * This module declares the Url::PublishWarning function.
 *
 * © 2018 by Richard Walters
 */

#include <string>
#include <Url/Warnings.hpp>

namespace Url {

    /**
     * This function delivers a warning to the given delegate or,
     * if no delegate is set, writes it to the library logger.
     *
     * @param[in] warningDelegate
     *     This is the function to call with the warning, if any.
     *
     * @param[in] type
     *     This is the kind of warning to publish.
     *
     * @param[in] message
     *     This describes the condition being reported.
     */
    void PublishWarning(
        const WarningDelegate& warningDelegate,
        Warning::Type type,
        const std::string& message
    );

}

#endif /* URL_PUBLISH_WARNING_HPP */
