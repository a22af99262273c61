#ifndef URL_ERRORS_HPP
#define URL_ERRORS_HPP

/**
 * @file Errors.hpp
 *
 * This module declares the exception types thrown by the Url library.
 *
 * © 2018 by Richard Walters
 */

#include <stdexcept>
#include <string>

namespace Url {

    /**
     * This is the base class of all errors thrown by the library
     * when a URL component cannot be changed as requested.
     * Whenever one of these is thrown, the object on which the
     * operation was attempted is left as it was before the operation.
     */
    class UrlError
        : public std::invalid_argument
    {
    public:
        explicit UrlError(const std::string& message)
            : std::invalid_argument(message)
        {
        }
    };

    /**
     * This is thrown when a port is not a decimal number
     * in the range 1-65535.
     */
    class InvalidPortError
        : public UrlError
    {
    public:
        explicit InvalidPortError(const std::string& port)
            : UrlError("Invalid port '" + port + "'.")
        {
        }
    };

    /**
     * This is thrown when a network location (or a host) has
     * a malformed IPv6 literal, such as unbalanced brackets or
     * garbage after the closing bracket.
     */
    class InvalidAuthorityError
        : public UrlError
    {
    public:
        explicit InvalidAuthorityError(const std::string& netloc)
            : UrlError("Invalid netloc '" + netloc + "'.")
        {
        }
    };

    /**
     * This is thrown when a host contains characters which
     * are never allowed in a host, or has an empty label.
     */
    class InvalidHostError
        : public UrlError
    {
    public:
        explicit InvalidHostError(const std::string& host)
            : UrlError(
                "Invalid host '" + host + "'. Host strings must have at least"
                " one non-period character, can't contain any of"
                " '!@#$%^&'\"*()+=:;/', and can't have adjacent periods."
            )
        {
        }
    };

    /**
     * This is thrown when an attempt is made to change whether or not
     * a path is absolute, while its owner forces it to be absolute.
     */
    class ImmutableStateError
        : public UrlError
    {
    public:
        ImmutableStateError()
            : UrlError(
                "Path absoluteness is read-only for URLs with a netloc"
                " (a username, password, host, and/or port). A URL path"
                " must start with a '/' to separate itself from a netloc."
            )
        {
        }
    };

}

#endif /* URL_ERRORS_HPP */
