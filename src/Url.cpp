/**
 * @file Url.cpp
 *
 * This module contains the implementation of the Url::Url class.
 *
 * © 2018 by Richard Walters
 */

#include "PublishWarning.hpp"

#include <Url/Codec.hpp>
#include <Url/Errors.hpp>
#include <Url/Logging.hpp>
#include <Url/Url.hpp>
#include <stddef.h>
#include <string>
#include <utility>

namespace {

    /**
     * This is the prefix put in front of a path that would otherwise
     * begin with "//" in a URL that has no authority (see section 5.3
     * of RFC 3986).
     */
    const std::string EMPTY_FIRST_SEGMENT_PREFIX = "/.";

    /**
     * This function returns an indication of whether or not the given
     * path string, in a URL without an authority, needs a prefix
     * to keep it from being read back as an authority.  This is the
     * case for any path string which starts with "//" after zero or
     * more "/." prefixes, so that adding or removing one prefix
     * always gives back the original path string.
     *
     * @param[in] path
     *     This is the path string to check.
     *
     * @return
     *     An indication of whether or not the path needs
     *     the prefix is returned.
     */
    bool NeedsEmptyFirstSegmentPrefix(const std::string& path) {
        size_t position = 0;
        while (path.compare(position, EMPTY_FIRST_SEGMENT_PREFIX.length(), EMPTY_FIRST_SEGMENT_PREFIX) == 0) {
            position += EMPTY_FIRST_SEGMENT_PREFIX.length();
        }
        return (path.compare(position, 2, "//") == 0);
    }

    /**
     * This function returns an indication of whether or not the given
     * path string, from a URL without an authority, carries the
     * prefix which was added to keep it from being read back
     * as an authority.
     *
     * @param[in] path
     *     This is the path string to check.
     *
     * @return
     *     An indication of whether or not the path has
     *     the prefix is returned.
     */
    bool HasEmptyFirstSegmentPrefix(const std::string& path) {
        return (
            (path.compare(0, EMPTY_FIRST_SEGMENT_PREFIX.length(), EMPTY_FIRST_SEGMENT_PREFIX) == 0)
            && NeedsEmptyFirstSegmentPrefix(path.substr(EMPTY_FIRST_SEGMENT_PREFIX.length()))
        );
    }

    /**
     * This function percent-encodes any colons in the first segment
     * of the given relative path string, so that the segment isn't
     * read back as a scheme.
     *
     * @param[in] path
     *     This is the relative path string to fix.
     *
     * @return
     *     The fixed path string is returned.
     */
    std::string EncodeColonsInFirstSegment(const std::string& path) {
        const auto firstSegmentEnd = path.find('/');
        std::string fixed;
        for (size_t i = 0; i < path.length(); ++i) {
            if (
                (path[i] == ':')
                && (i < firstSegmentEnd)
            ) {
                fixed += "%3A";
            } else {
                fixed += path[i];
            }
        }
        return fixed;
    }

}

namespace Url {

    /**
     * This contains the private properties of a Url instance.
     */
    struct Url::Impl {
        // Properties

        /**
         * This indicates whether or not to warn about parts of the
         * URL that are not correctly percent-encoded, and to check
         * host names more strictly.
         */
        bool strict = false;

        /**
         * This is the function to call to deliver warnings.
         */
        WarningDelegate warningDelegate;

        /**
         * This indicates whether or not the URL has a scheme.
         */
        bool hasScheme = false;

        /**
         * This is the "scheme" element of the URL, in lower case.
         */
        std::string scheme;

        /**
         * This is the "authority" element of the URL.
         */
        Authority authority;

        /**
         * This is the "path" element of the URL.
         */
        Path path;

        /**
         * This is the "query" element of the URL.
         */
        Query query;

        /**
         * This is the "fragment" element of the URL.
         */
        Fragment fragment;

        // Methods

        /**
         * This method hands the strict mode setting and the
         * warning delegate of the URL down to its parts.
         */
        void Configure() {
            authority.SetStrict(strict);
            path.SetStrict(strict);
            path.SetWarningDelegate(warningDelegate);
            query.SetStrict(strict);
            query.SetWarningDelegate(warningDelegate);
            fragment.SetStrict(strict);
            fragment.SetWarningDelegate(warningDelegate);
        }

        /**
         * This method forces the path to be absolute whenever
         * the authority is not empty.
         */
        void SyncPathAbsoluteness() {
            path.SetAbsoluteness(
                authority.IsEmpty()
                ? Path::Absoluteness::Mutable
                : Path::Absoluteness::ForcedAbsolute
            );
        }

        /**
         * This method looks up the default port of the scheme.
         *
         * @param[out] port
         *     This is where to store the default port, if known.
         *
         * @return
         *     An indication of whether or not the scheme has a known
         *     default port is returned.
         */
        bool GetSchemeDefaultPort(uint16_t& port) const {
            return (
                hasScheme
                && GetDefaultPort(scheme, port)
            );
        }

        /**
         * This method returns a copy of the authority, without the
         * port if it's the default port of the scheme.
         *
         * @return
         *     The authority, ready for comparison, is returned.
         */
        Authority ComparableAuthority() const {
            auto comparable = authority;
            uint16_t defaultPort = 0;
            if (
                comparable.HasPort()
                && GetSchemeDefaultPort(defaultPort)
                && (comparable.GetPort() == defaultPort)
            ) {
                comparable.ClearPort();
            }
            return comparable;
        }

        /**
         * This method publishes a warning that the given overlapping
         * arguments were given together.
         *
         * @param[in] arguments
         *     This names the arguments which overlap.
         *
         * @param[in] method
         *     This is the name of the method to which
         *     the arguments were given.
         */
        void WarnAboutOverlap(
            const std::string& arguments,
            const std::string& method
        ) const {
            PublishWarning(
                warningDelegate,
                Warning::Type::Conflict,
                (
                    "Possible parameter overlap: " + arguments
                    + " provided to " + method + "()."
                )
            );
        }
    };

    Url::~Url() noexcept = default;
    Url::Url(const Url& other)
        : impl_(new Impl(*other.impl_))
    {
        impl_->SyncPathAbsoluteness();
    }
    Url::Url(Url&&) noexcept = default;
    Url& Url::operator=(const Url& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
            impl_->SyncPathAbsoluteness();
        }
        return *this;
    }
    Url& Url::operator=(Url&&) noexcept = default;

    Url::Url()
        : impl_(new Impl)
    {
    }

    Url::Url(
        const std::string& url,
        bool strict
    )
        : impl_(new Impl)
    {
        impl_->strict = strict;
        impl_->Configure();
        (void)Load(url);
    }

    bool Url::operator==(const Url& other) const {
        return (
            (impl_->hasScheme == other.impl_->hasScheme)
            && (impl_->scheme == other.impl_->scheme)
            && (impl_->ComparableAuthority() == other.impl_->ComparableAuthority())
            && (impl_->path == other.impl_->path)
            && (impl_->query == other.impl_->query)
            && (impl_->fragment == other.impl_->fragment)
        );
    }

    bool Url::operator!=(const Url& other) const {
        return !(*this == other);
    }

    Url& Url::Load(const std::string& url) {
        const auto parts = SplitUrl(url);
        GetLogger()->trace(
            "split '{}': scheme='{}' authority='{}' path='{}' query='{}' fragment='{}'",
            url,
            parts.scheme,
            parts.authority,
            parts.path,
            parts.query,
            parts.fragment
        );
        std::unique_ptr< Impl > newImpl(new Impl);
        newImpl->strict = impl_->strict;
        newImpl->warningDelegate = impl_->warningDelegate;
        newImpl->Configure();
        newImpl->hasScheme = parts.hasScheme;
        newImpl->scheme = NormalizeCaseInsensitiveString(parts.scheme);
        if (parts.hasAuthority) {
            (void)newImpl->authority.Load(parts.authority);
        }
        newImpl->SyncPathAbsoluteness();
        if (
            !parts.hasAuthority
            && HasEmptyFirstSegmentPrefix(parts.path)
        ) {
            (void)newImpl->path.Load(parts.path.substr(EMPTY_FIRST_SEGMENT_PREFIX.length()));
        } else {
            (void)newImpl->path.Load(parts.path);
        }
        (void)newImpl->query.Load(parts.query);
        (void)newImpl->fragment.Load(parts.fragment);
        impl_ = std::move(newImpl);
        return *this;
    }

    bool Url::ParseFromString(const std::string& urlString) {
        try {
            (void)Load(urlString);
        } catch (const UrlError& e) {
            GetLogger()->debug("unable to parse '{}': {}", urlString, e.what());
            return false;
        }
        return true;
    }

    bool Url::HasScheme() const {
        return impl_->hasScheme;
    }

    std::string Url::GetScheme() const {
        return impl_->scheme;
    }

    void Url::SetScheme(const std::string& scheme) {
        impl_->scheme = NormalizeCaseInsensitiveString(scheme);
        impl_->hasScheme = true;
    }

    void Url::ClearScheme() {
        impl_->scheme.clear();
        impl_->hasScheme = false;
    }

    bool Url::HasUsername() const {
        return impl_->authority.HasUsername();
    }

    std::string Url::GetUsername() const {
        return impl_->authority.GetUsername();
    }

    void Url::SetUsername(const std::string& username) {
        impl_->authority.SetUsername(username);
        impl_->SyncPathAbsoluteness();
    }

    void Url::ClearUsername() {
        impl_->authority.ClearUsername();
        impl_->SyncPathAbsoluteness();
    }

    bool Url::HasPassword() const {
        return impl_->authority.HasPassword();
    }

    std::string Url::GetPassword() const {
        return impl_->authority.GetPassword();
    }

    void Url::SetPassword(const std::string& password) {
        impl_->authority.SetPassword(password);
        impl_->SyncPathAbsoluteness();
    }

    void Url::ClearPassword() {
        impl_->authority.ClearPassword();
        impl_->SyncPathAbsoluteness();
    }

    bool Url::HasHost() const {
        return impl_->authority.HasHost();
    }

    std::string Url::GetHost() const {
        return impl_->authority.GetHost();
    }

    void Url::SetHost(const std::string& host) {
        impl_->authority.SetHost(host);
        impl_->SyncPathAbsoluteness();
    }

    void Url::ClearHost() {
        impl_->authority.ClearHost();
        impl_->SyncPathAbsoluteness();
    }

    bool Url::HasPort() const {
        uint16_t defaultPort = 0;
        return (
            impl_->authority.HasPort()
            || impl_->GetSchemeDefaultPort(defaultPort)
        );
    }

    uint16_t Url::GetPort() const {
        if (impl_->authority.HasPort()) {
            return impl_->authority.GetPort();
        }
        uint16_t defaultPort = 0;
        (void)impl_->GetSchemeDefaultPort(defaultPort);
        return defaultPort;
    }

    bool Url::HasExplicitPort() const {
        return impl_->ComparableAuthority().HasPort();
    }

    void Url::SetPort(int port) {
        impl_->authority.SetPort(port);
        impl_->SyncPathAbsoluteness();
    }

    void Url::SetPort(const std::string& port) {
        impl_->authority.SetPort(port);
        impl_->SyncPathAbsoluteness();
    }

    void Url::ClearPort() {
        impl_->authority.ClearPort();
        impl_->SyncPathAbsoluteness();
    }

    bool Url::HasNetloc() const {
        return (
            !impl_->authority.IsEmpty()
            || impl_->authority.HasHost()
        );
    }

    std::string Url::GetNetloc() const {
        return impl_->authority.GenerateString(impl_->scheme);
    }

    void Url::SetNetloc(const std::string& netloc) {
        auto authority = impl_->authority;
        (void)authority.Load(netloc);
        impl_->authority = std::move(authority);
        impl_->SyncPathAbsoluteness();
    }

    void Url::ClearNetloc() {
        impl_->authority.Clear();
        impl_->SyncPathAbsoluteness();
    }

    const Authority& Url::GetAuthority() const {
        return impl_->authority;
    }

    Path& Url::GetPath() {
        return impl_->path;
    }

    const Path& Url::GetPath() const {
        return impl_->path;
    }

    Query& Url::GetQuery() {
        return impl_->query;
    }

    const Query& Url::GetQuery() const {
        return impl_->query;
    }

    Fragment& Url::GetFragment() {
        return impl_->fragment;
    }

    const Fragment& Url::GetFragment() const {
        return impl_->fragment;
    }

    Url& Url::Add(const AddArguments& arguments) {
        if (
            arguments.args.IsPresent()
            && arguments.queryParams.IsPresent()
        ) {
            impl_->WarnAboutOverlap("<args> and <queryParams>", "Add");
        }
        if (arguments.path.IsPresent()) {
            (void)impl_->path.Add(arguments.path.Get());
        }
        if (arguments.args.IsPresent()) {
            (void)impl_->query.Add(arguments.args.Get());
        }
        if (arguments.queryParams.IsPresent()) {
            (void)impl_->query.Add(arguments.queryParams.Get());
        }
        Fragment::AddArguments fragmentArguments;
        fragmentArguments.path = arguments.fragmentPath;
        fragmentArguments.args = arguments.fragmentArgs;
        (void)impl_->fragment.Add(fragmentArguments);
        return *this;
    }

    Url& Url::Set(const SetArguments& arguments) {
        if (
            arguments.netloc.IsPresent()
            && (
                arguments.host.IsPresent()
                || arguments.port.IsPresent()
            )
        ) {
            impl_->WarnAboutOverlap("<netloc> and <host> and/or <port>", "Set");
        }
        if (
            (arguments.query.IsPresent() && arguments.args.IsPresent())
            || (arguments.query.IsPresent() && arguments.queryParams.IsPresent())
            || (arguments.args.IsPresent() && arguments.queryParams.IsPresent())
        ) {
            impl_->WarnAboutOverlap("<query>, <args>, and/or <queryParams>", "Set");
        }
        if (
            arguments.fragment.IsPresent()
            && (
                arguments.fragmentPath.IsPresent()
                || arguments.fragmentArgs.IsPresent()
                || arguments.fragmentSeparator.IsPresent()
            )
        ) {
            impl_->WarnAboutOverlap(
                "<fragment> and <fragmentPath>, <fragmentArgs>, and/or <fragmentSeparator>",
                "Set"
            );
        }

        // Work on a copy, so that nothing changes if any part
        // turns out not to be valid.
        std::unique_ptr< Impl > newImpl(new Impl(*impl_));
        if (arguments.netloc.IsPresent()) {
            (void)newImpl->authority.Load(arguments.netloc.Get());
        }
        if (arguments.port.IsPresent()) {
            newImpl->authority.SetPort(arguments.port.Get());
        }
        if (arguments.username.IsPresent()) {
            newImpl->authority.SetUsername(arguments.username.Get());
        }
        if (arguments.password.IsPresent()) {
            newImpl->authority.SetPassword(arguments.password.Get());
        }
        if (arguments.scheme.IsPresent()) {
            newImpl->scheme = NormalizeCaseInsensitiveString(arguments.scheme.Get());
            newImpl->hasScheme = true;
        }
        if (arguments.host.IsPresent()) {
            newImpl->authority.SetHost(arguments.host.Get());
        }
        newImpl->SyncPathAbsoluteness();
        if (arguments.path.IsPresent()) {
            (void)newImpl->path.Load(arguments.path.Get());
        }
        if (arguments.query.IsPresent()) {
            (void)newImpl->query.Load(arguments.query.Get());
        }
        if (arguments.args.IsPresent()) {
            (void)newImpl->query.Load(arguments.args.Get());
        }
        if (arguments.queryParams.IsPresent()) {
            (void)newImpl->query.Load(arguments.queryParams.Get());
        }
        if (arguments.fragment.IsPresent()) {
            (void)newImpl->fragment.Load(arguments.fragment.Get());
        }
        Fragment::SetArguments fragmentArguments;
        fragmentArguments.path = arguments.fragmentPath;
        fragmentArguments.args = arguments.fragmentArgs;
        fragmentArguments.separator = arguments.fragmentSeparator;
        (void)newImpl->fragment.Set(fragmentArguments);
        impl_ = std::move(newImpl);
        return *this;
    }

    Url& Url::Remove(const RemoveArguments& arguments) {
        if (arguments.port) {
            impl_->authority.ClearPort();
        }
        if (arguments.username) {
            impl_->authority.ClearUsername();
        }
        if (arguments.password) {
            impl_->authority.ClearPassword();
        }
        impl_->SyncPathAbsoluteness();
        if (arguments.entirePath) {
            (void)impl_->path.Clear();
        } else if (arguments.path.IsPresent()) {
            (void)impl_->path.Remove(arguments.path.Get());
        }
        if (arguments.query) {
            (void)impl_->query.Clear();
        } else {
            (void)impl_->query.RemoveKeys(arguments.args);
            (void)impl_->query.RemoveItems(arguments.argItems);
        }
        Fragment::RemoveArguments fragmentArguments;
        fragmentArguments.fragment = arguments.fragment;
        fragmentArguments.path = arguments.fragmentPath;
        fragmentArguments.args = arguments.fragmentArgs;
        (void)impl_->fragment.Remove(fragmentArguments);
        return *this;
    }

    Url& Url::Join(const std::string& reference) {
        return Load(JoinUrl(GenerateString(), reference));
    }

    Url& Url::Join(const Url& reference) {
        return Join(reference.GenerateString());
    }

    Url& Url::NormalizePath() {
        (void)impl_->path.Normalize();
        return *this;
    }

    void Url::SetStrict(bool strict) {
        impl_->strict = strict;
        impl_->Configure();
    }

    bool Url::IsStrict() const {
        return impl_->strict;
    }

    void Url::SetWarningDelegate(WarningDelegate warningDelegate) {
        impl_->warningDelegate = warningDelegate;
        impl_->Configure();
    }

    std::string Url::GenerateString(
        const std::string& delimiter,
        bool quotePlus,
        const std::string& dontQuote
    ) const {
        std::string buffer;
        if (impl_->hasScheme) {
            buffer += impl_->scheme;
            buffer += ':';
        }
        auto path = impl_->path.GenerateString();
        if (HasNetloc()) {
            buffer += "//";
            buffer += GetNetloc();
        } else if (NeedsEmptyFirstSegmentPrefix(path)) {
            buffer += EMPTY_FIRST_SEGMENT_PREFIX;
        } else if (
            !impl_->hasScheme
            && !impl_->path.IsAbsolute()
        ) {
            path = EncodeColonsInFirstSegment(path);
        }
        buffer += path;
        if (!impl_->query.IsEmpty()) {
            buffer += '?';
            buffer += impl_->query.Encode(delimiter, quotePlus, dontQuote);
        }
        const auto fragment = impl_->fragment.GenerateString();
        if (!fragment.empty()) {
            buffer += '#';
            buffer += fragment;
        }
        return buffer;
    }

}
