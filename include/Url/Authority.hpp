#ifndef URL_AUTHORITY_HPP
#define URL_AUTHORITY_HPP

/**
 * @file Authority.hpp
 *
 * This module declares the Url::Authority class.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <stdint.h>
#include <string>

namespace Url {

    /**
     * This class represents the authority (or "netloc") of a URL:
     * the optional user name, password, host, and port, as in
     * "user:password@www.example.com:8080".
     *
     * The user name and password are held decoded.  The host is held
     * in lower case.  Methods which change the authority either succeed
     * or throw a Url::UrlError, leaving the authority unchanged.
     */
    class Authority {
        // Lifecycle management
    public:
        ~Authority() noexcept;
        Authority(const Authority& other);
        Authority(Authority&&) noexcept;
        Authority& operator=(const Authority& other);
        Authority& operator=(Authority&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  It makes an authority
         * with no parts.
         */
        Authority();

        /**
         * This constructs the authority by loading the given string.
         *
         * @param[in] netloc
         *     This is the encoded authority, without the leading "//".
         *
         * @throw InvalidAuthorityError
         *     This is thrown if the host is a malformed IP literal.
         *
         * @throw InvalidHostError
         *     This is thrown if the host is not valid.
         *
         * @throw InvalidPortError
         *     This is thrown if the port is not valid.
         */
        explicit Authority(const std::string& netloc);

        /**
         * This is the equality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other authority to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two authorities are
         *     equal is returned.
         */
        bool operator==(const Authority& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other authority to which to compare this one.
         *
         * @return
         *     An indication of whether or not the two authorities are
         *     not equal is returned.
         */
        bool operator!=(const Authority& other) const;

        /**
         * This method replaces all parts of the authority with the
         * ones in the given string.  The host is always present after
         * this, though it may be empty.  An empty user name, password,
         * or port is taken to be absent.
         *
         * @param[in] netloc
         *     This is the encoded authority, without the leading "//".
         *
         * @return
         *     The authority is returned.
         *
         * @throw InvalidAuthorityError
         *     This is thrown if the host is a malformed IP literal.
         *
         * @throw InvalidHostError
         *     This is thrown if the host is not valid.
         *
         * @throw InvalidPortError
         *     This is thrown if the port is not valid.
         */
        Authority& Load(const std::string& netloc);

        bool HasUsername() const;
        std::string GetUsername() const;
        void SetUsername(const std::string& username);
        void ClearUsername();

        bool HasPassword() const;
        std::string GetPassword() const;
        void SetPassword(const std::string& password);
        void ClearPassword();

        /**
         * This method returns an indication of whether or not
         * the authority has a host, which may be empty.
         *
         * @return
         *     An indication of whether or not the authority
         *     has a host is returned.
         */
        bool HasHost() const;

        /**
         * This method returns the host of the authority, in lower case.
         * An IP literal host keeps its square brackets.  An
         * internationalized host is returned in its Unicode form,
         * in UTF-8, even though it's rendered in its ASCII ("xn--")
         * form.
         *
         * @return
         *     The host is returned.  It's empty if there is no host.
         */
        std::string GetHost() const;

        /**
         * This method sets the host of the authority.
         *
         * @param[in] host
         *     This is the host to set, in either its Unicode (UTF-8)
         *     or its ASCII form.  It is put in lower case.
         *
         * @throw InvalidAuthorityError
         *     This is thrown if the host is a malformed IP literal.
         *
         * @throw InvalidHostError
         *     This is thrown if the host is not valid.
         */
        void SetHost(const std::string& host);

        /**
         * This method removes the host of the authority.
         */
        void ClearHost();

        /**
         * This method returns an indication of whether or not
         * the authority has a port.
         *
         * @return
         *     An indication of whether or not the authority
         *     has a port is returned.
         */
        bool HasPort() const;

        /**
         * This method returns the port of the authority.
         *
         * @return
         *     The port is returned.  It's zero if there is no port.
         */
        uint16_t GetPort() const;

        /**
         * This method sets the port of the authority.
         *
         * @param[in] port
         *     This is the port to set.
         *
         * @throw InvalidPortError
         *     This is thrown if the port isn't in the range 1-65535.
         */
        void SetPort(int port);

        /**
         * This method sets the port of the authority.
         *
         * @param[in] port
         *     This is the port to set, in decimal.
         *
         * @throw InvalidPortError
         *     This is thrown if the string isn't a decimal number
         *     in the range 1-65535.
         */
        void SetPort(const std::string& port);

        /**
         * This method removes the port of the authority.
         */
        void ClearPort();

        /**
         * This method returns an indication of whether or not the
         * authority has none of a user name, a password, a non-empty
         * host, or a port.
         *
         * @return
         *     An indication of whether or not the authority
         *     is empty is returned.
         */
        bool IsEmpty() const;

        /**
         * This method removes all parts of the authority.
         */
        void Clear();

        /**
         * This method sets whether or not the characters of each
         * label of a host are checked more strictly.
         *
         * @param[in] strict
         *     This indicates whether or not to check hosts strictly.
         */
        void SetStrict(bool strict);

        /**
         * This method renders the authority as a string,
         * without the leading "//".
         *
         * @param[in] scheme
         *     This is the scheme of the URL.  The port is left out
         *     if it's the default port of the scheme.
         *
         * @return
         *     The encoded authority is returned.
         */
        std::string GenerateString(const std::string& scheme = "") const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* URL_AUTHORITY_HPP */
