/**
 * @file PublishWarning.cpp
 *
 * This module contains the implementation of the Url::PublishWarning
 * function.
 *
 * © 2018 by Richard Walters
 */

#include "PublishWarning.hpp"

#include <Url/Logging.hpp>

namespace Url {

    void PublishWarning(
        const WarningDelegate& warningDelegate,
        Warning::Type type,
        const std::string& message
    ) {
        if (warningDelegate == nullptr) {
            GetLogger()->warn(
                "{}: {}",
                (type == Warning::Type::Conflict) ? "conflict" : "encoding",
                message
            );
        } else {
            Warning warning;
            warning.type = type;
            warning.message = message;
            warningDelegate(warning);
        }
    }

}
