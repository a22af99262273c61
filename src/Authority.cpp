/**
 * @file Authority.cpp
 *
 * This module contains the implementation of the Url::Authority class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSets.hpp"
#include "Idna.hpp"
#include "PercentEncoding.hpp"

#include <Url/Authority.hpp>
#include <Url/Codec.hpp>
#include <Url/Errors.hpp>
#include <stdlib.h>
#include <utility>

namespace {

    /**
     * This function splits the given host and port string into
     * the host and the port, checking the structure of IP literal
     * hosts along the way.
     *
     * @param[in] netloc
     *     This is the whole authority being parsed, for error messages.
     *
     * @param[in] hostPort
     *     This is the host, optionally followed by ':' and the port.
     *
     * @param[out] host
     *     This is where to store the host, still encoded.
     *
     * @param[out] port
     *     This is where to store the port.
     *
     * @throw Url::InvalidAuthorityError
     *     This is thrown if the host is a malformed IP literal.
     */
    void SplitHostAndPort(
        const std::string& netloc,
        const std::string& hostPort,
        std::string& host,
        std::string& port
    ) {
        /**
         * These are the various states for the state machine implemented
         * below to correctly split up and validate the substring
         * containing the host and potentially a port number as well.
         */
        enum class HostParsingState {
            FIRST_CHARACTER,
            NOT_IP_LITERAL,
            IP_LITERAL,
            IPV6_ADDRESS,
            IPV_FUTURE_NUMBER,
            IPV_FUTURE_BODY,
            GARBAGE_CHECK,
            PORT,
        };

        HostParsingState hostParsingState = HostParsingState::FIRST_CHARACTER;
        host.clear();
        port.clear();
        for (const auto c: hostPort) {
            switch(hostParsingState) {
                case HostParsingState::FIRST_CHARACTER: {
                    if (c == '[') {
                        host.push_back(c);
                        hostParsingState = HostParsingState::IP_LITERAL;
                        break;
                    } else {
                        hostParsingState = HostParsingState::NOT_IP_LITERAL;
                    }
                }

                case HostParsingState::NOT_IP_LITERAL: {
                    if (c == ':') {
                        hostParsingState = HostParsingState::PORT;
                    } else if (
                        (c == '[')
                        || (c == ']')
                    ) {
                        throw Url::InvalidAuthorityError(netloc);
                    } else {
                        host.push_back(c);
                    }
                } break;

                case HostParsingState::IP_LITERAL: {
                    if (
                        (c == 'v')
                        || (c == 'V')
                    ) {
                        host.push_back(c);
                        hostParsingState = HostParsingState::IPV_FUTURE_NUMBER;
                        break;
                    } else {
                        hostParsingState = HostParsingState::IPV6_ADDRESS;
                    }
                }

                case HostParsingState::IPV6_ADDRESS: {
                    if (c == '[') {
                        throw Url::InvalidAuthorityError(netloc);
                    }
                    host.push_back(c);
                    if (c == ']') {
                        hostParsingState = HostParsingState::GARBAGE_CHECK;
                    }
                } break;

                case HostParsingState::IPV_FUTURE_NUMBER: {
                    if (c == '.') {
                        hostParsingState = HostParsingState::IPV_FUTURE_BODY;
                    } else if (!Url::CharacterSets::HexDigit().Contains(c)) {
                        throw Url::InvalidAuthorityError(netloc);
                    }
                    host.push_back(c);
                } break;

                case HostParsingState::IPV_FUTURE_BODY: {
                    host.push_back(c);
                    if (c == ']') {
                        hostParsingState = HostParsingState::GARBAGE_CHECK;
                    } else if (!Url::CharacterSets::IpvFutureLastPart().Contains(c)) {
                        throw Url::InvalidAuthorityError(netloc);
                    }
                } break;

                case HostParsingState::GARBAGE_CHECK: {
                    // illegal to have anything else, unless it's a colon,
                    // in which case it's a port delimiter
                    if (c == ':') {
                        hostParsingState = HostParsingState::PORT;
                    } else {
                        throw Url::InvalidAuthorityError(netloc);
                    }
                } break;

                case HostParsingState::PORT: {
                    if (
                        (c == '[')
                        || (c == ']')
                    ) {
                        throw Url::InvalidAuthorityError(netloc);
                    }
                    port.push_back(c);
                } break;
            }
        }
        switch (hostParsingState) {
            case HostParsingState::IP_LITERAL:
            case HostParsingState::IPV6_ADDRESS:
            case HostParsingState::IPV_FUTURE_NUMBER:
            case HostParsingState::IPV_FUTURE_BODY: {
                throw Url::InvalidAuthorityError(netloc);
            }

            default: break;
        }
    }

    /**
     * This function checks the given host, which must not
     * have a port, and puts it in the forms in which it's held.
     * Internationalized host names are held in their Unicode form,
     * and rendered in their ASCII ("xn--") form.
     *
     * @param[in] host
     *     This is the host, still encoded unless it's an IP literal.
     *
     * @param[in] strict
     *     This indicates whether or not to check the characters
     *     of each host label more strictly.
     *
     * @param[out] normalizedHost
     *     This is where to store the decoded host in lower case.
     *
     * @param[out] encodedHost
     *     This is where to store the host as it appears in a URL.
     *
     * @throw Url::InvalidHostError
     *     This is thrown if the host is not valid.
     */
    void NormalizeHost(
        const std::string& host,
        bool strict,
        std::string& normalizedHost,
        std::string& encodedHost
    ) {
        if (
            !host.empty()
            && (host[0] == '[')
        ) {
            normalizedHost = Url::NormalizeCaseInsensitiveString(host);
            encodedHost = normalizedHost;
            return;
        }
        const auto decodedHost = Url::PercentDecode(host);
        if (!Url::IsValidHost(decodedHost, strict)) {
            throw Url::InvalidHostError(decodedHost);
        }
        normalizedHost = Url::NormalizeCaseInsensitiveString(decodedHost);
        if (Url::IsInternationalHostName(normalizedHost)) {
            std::string unicodeHost;
            if (
                !Url::EncodeHostName(normalizedHost, strict, encodedHost)
                || !Url::DecodeHostName(encodedHost, strict, unicodeHost)
            ) {
                throw Url::InvalidHostError(decodedHost);
            }
            normalizedHost = unicodeHost;
        } else {
            encodedHost = normalizedHost;
        }
    }

    /**
     * This function checks the given port and converts it to a number.
     *
     * @param[in] port
     *     This is the port, in decimal.
     *
     * @return
     *     The port number is returned.
     *
     * @throw Url::InvalidPortError
     *     This is thrown if the port is not valid.
     */
    uint16_t ParsePort(const std::string& port) {
        if (!Url::IsValidPort(port)) {
            throw Url::InvalidPortError(port);
        }
        return (uint16_t)strtoul(port.c_str(), NULL, 10);
    }

}

namespace Url {

    /**
     * This contains the private properties of an Authority instance.
     */
    struct Authority::Impl {
        /**
         * This indicates whether or not the authority has a user name.
         */
        bool hasUsername = false;

        /**
         * This is the decoded user name, if any.
         */
        std::string username;

        /**
         * This indicates whether or not the authority has a password.
         */
        bool hasPassword = false;

        /**
         * This is the decoded password, if any.
         */
        std::string password;

        /**
         * This indicates whether or not the authority has a host,
         * which may be empty.
         */
        bool hasHost = false;

        /**
         * This is the host, in lower case.
         */
        std::string host;

        /**
         * This is the host as it appears in a URL, which differs
         * from the host only if the host is internationalized.
         */
        std::string encodedHost;

        /**
         * This indicates whether or not the authority has a port.
         */
        bool hasPort = false;

        /**
         * This is the port, if any.
         */
        uint16_t port = 0;

        /**
         * This indicates whether or not the characters of each
         * host label are checked more strictly.
         */
        bool strict = false;
    };

    Authority::~Authority() noexcept = default;
    Authority::Authority(const Authority& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    Authority::Authority(Authority&&) noexcept = default;
    Authority& Authority::operator=(const Authority& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    Authority& Authority::operator=(Authority&&) noexcept = default;

    Authority::Authority()
        : impl_(new Impl)
    {
    }

    Authority::Authority(const std::string& netloc)
        : impl_(new Impl)
    {
        (void)Load(netloc);
    }

    bool Authority::operator==(const Authority& other) const {
        return (
            (impl_->hasUsername == other.impl_->hasUsername)
            && (impl_->username == other.impl_->username)
            && (impl_->hasPassword == other.impl_->hasPassword)
            && (impl_->password == other.impl_->password)
            && (impl_->hasHost == other.impl_->hasHost)
            && (impl_->host == other.impl_->host)
            && (impl_->hasPort == other.impl_->hasPort)
            && (impl_->port == other.impl_->port)
        );
    }

    bool Authority::operator!=(const Authority& other) const {
        return !(*this == other);
    }

    Authority& Authority::Load(const std::string& netloc) {
        std::unique_ptr< Impl > newImpl(new Impl);
        newImpl->strict = impl_->strict;

        // Check if there is a UserInfo, and if so, extract it.
        const auto userInfoDelimiter = netloc.rfind('@');
        std::string hostPort;
        if (userInfoDelimiter == std::string::npos) {
            hostPort = netloc;
        } else {
            const auto userInfo = netloc.substr(0, userInfoDelimiter);
            const auto passwordDelimiter = userInfo.find(':');
            if (passwordDelimiter == std::string::npos) {
                newImpl->username = PercentDecode(userInfo);
            } else {
                newImpl->username = PercentDecode(userInfo.substr(0, passwordDelimiter));
                newImpl->password = PercentDecode(userInfo.substr(passwordDelimiter + 1));
            }
            newImpl->hasUsername = !newImpl->username.empty();
            newImpl->hasPassword = !newImpl->password.empty();
            hostPort = netloc.substr(userInfoDelimiter + 1);
        }

        // The port is checked before the host, so that a bad port
        // is reported even when the host is bad too.
        std::string host, port;
        SplitHostAndPort(netloc, hostPort, host, port);
        if (!port.empty()) {
            newImpl->port = ParsePort(port);
            newImpl->hasPort = true;
        }
        NormalizeHost(host, newImpl->strict, newImpl->host, newImpl->encodedHost);
        newImpl->hasHost = true;

        impl_ = std::move(newImpl);
        return *this;
    }

    bool Authority::HasUsername() const {
        return impl_->hasUsername;
    }

    std::string Authority::GetUsername() const {
        return impl_->username;
    }

    void Authority::SetUsername(const std::string& username) {
        impl_->username = username;
        impl_->hasUsername = true;
    }

    void Authority::ClearUsername() {
        impl_->username.clear();
        impl_->hasUsername = false;
    }

    bool Authority::HasPassword() const {
        return impl_->hasPassword;
    }

    std::string Authority::GetPassword() const {
        return impl_->password;
    }

    void Authority::SetPassword(const std::string& password) {
        impl_->password = password;
        impl_->hasPassword = true;
    }

    void Authority::ClearPassword() {
        impl_->password.clear();
        impl_->hasPassword = false;
    }

    bool Authority::HasHost() const {
        return impl_->hasHost;
    }

    std::string Authority::GetHost() const {
        return impl_->host;
    }

    void Authority::SetHost(const std::string& host) {
        std::string hostOnly, port;
        SplitHostAndPort(host, host, hostOnly, port);
        if (hostOnly != host) {
            throw InvalidHostError(host);
        }
        std::string normalizedHost, encodedHost;
        NormalizeHost(hostOnly, impl_->strict, normalizedHost, encodedHost);
        impl_->host = normalizedHost;
        impl_->encodedHost = encodedHost;
        impl_->hasHost = true;
    }

    void Authority::ClearHost() {
        impl_->host.clear();
        impl_->encodedHost.clear();
        impl_->hasHost = false;
    }

    bool Authority::HasPort() const {
        return impl_->hasPort;
    }

    uint16_t Authority::GetPort() const {
        return impl_->port;
    }

    void Authority::SetPort(int port) {
        if (
            (port < 1)
            || (port > 65535)
        ) {
            throw InvalidPortError(std::to_string(port));
        }
        impl_->port = (uint16_t)port;
        impl_->hasPort = true;
    }

    void Authority::SetPort(const std::string& port) {
        impl_->port = ParsePort(port);
        impl_->hasPort = true;
    }

    void Authority::ClearPort() {
        impl_->port = 0;
        impl_->hasPort = false;
    }

    bool Authority::IsEmpty() const {
        return (
            !impl_->hasUsername
            && !impl_->hasPassword
            && impl_->host.empty()
            && !impl_->hasPort
        );
    }

    void Authority::Clear() {
        const auto strict = impl_->strict;
        *impl_ = Impl();
        impl_->strict = strict;
    }

    void Authority::SetStrict(bool strict) {
        impl_->strict = strict;
    }

    std::string Authority::GenerateString(const std::string& scheme) const {
        std::string netloc;
        if (impl_->hasUsername) {
            netloc += EncodeElement(impl_->username, CharacterSets::Unreserved());
        }
        if (impl_->hasPassword) {
            netloc += ':';
            netloc += EncodeElement(impl_->password, CharacterSets::Unreserved());
        }
        if (
            impl_->hasUsername
            || impl_->hasPassword
        ) {
            netloc += '@';
        }
        netloc += impl_->encodedHost;
        uint16_t defaultPort = 0;
        if (
            impl_->hasPort
            && (
                !GetDefaultPort(scheme, defaultPort)
                || (impl_->port != defaultPort)
            )
        ) {
            netloc += ':';
            netloc += std::to_string(impl_->port);
        }
        return netloc;
    }

}
