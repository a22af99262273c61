#ifndef URL_URL_HPP
#define URL_URL_HPP

/**
 * @file Url.hpp
 *
 * This module declares the Url::Url class.
 *
 * © 2018 by Richard Walters
 */

#include "Authority.hpp"
#include "Fragment.hpp"
#include "Parameter.hpp"
#include "Path.hpp"
#include "Query.hpp"
#include "Warnings.hpp"

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

namespace Url {

    /**
     * This class represents a Uniform Resource Locator (URL),
     * broken into its scheme, authority, path, query, and fragment,
     * each of which can be read and changed on its own.  The string
     * form of the URL is generated anew whenever it's asked for.
     *
     * Whenever the URL has a non-empty authority, its path is absolute.
     */
    class Url {
        // Types
    public:
        /**
         * These are the things which can be added to a URL.
         */
        struct AddArguments {
            /**
             * If present, this is added to the path.
             */
            Parameter< PathInput > path;

            /**
             * If present, these are added to the query.
             */
            Parameter< QueryInput > args;

            /**
             * If present, these are added to the query, after args.
             * Giving both this and args raises a conflict warning.
             */
            Parameter< QueryInput > queryParams;

            /**
             * If present, this is added to the path of the fragment.
             */
            Parameter< PathInput > fragmentPath;

            /**
             * If present, these are added to the query of the fragment.
             */
            Parameter< QueryInput > fragmentArgs;
        };

        /**
         * These are the things which can be set in a URL.
         *
         * Some of these overlap: netloc with host and port;
         * any two of query, args, and queryParams; and fragment with
         * fragmentPath, fragmentArgs, and fragmentSeparator.  Giving
         * overlapping arguments raises a conflict warning, and the
         * narrower (or later) argument wins.
         */
        struct SetArguments {
            Parameter< std::string > scheme;
            Parameter< std::string > username;
            Parameter< std::string > password;
            Parameter< std::string > netloc;
            Parameter< std::string > host;

            /**
             * If present, this is the port to set, in decimal.
             */
            Parameter< std::string > port;

            Parameter< PathInput > path;
            Parameter< QueryInput > query;
            Parameter< QueryInput > args;
            Parameter< QueryInput > queryParams;

            /**
             * If present, this is the encoded fragment to load,
             * without the leading '#'.
             */
            Parameter< std::string > fragment;

            Parameter< PathInput > fragmentPath;
            Parameter< QueryInput > fragmentArgs;
            Parameter< bool > fragmentSeparator;
        };

        /**
         * These are the things which can be removed from a URL.
         */
        struct RemoveArguments {
            bool port = false;
            bool username = false;
            bool password = false;

            /**
             * This indicates whether or not to clear the path.
             */
            bool entirePath = false;

            /**
             * If present, this is removed from the end of the path.
             */
            Parameter< PathInput > path;

            /**
             * These are query keys to remove.
             */
            std::vector< std::string > args;

            /**
             * These are query key:value items to remove.
             */
            std::vector< QueryParam > argItems;

            /**
             * This indicates whether or not to clear the query.
             */
            bool query = false;

            /**
             * This indicates whether or not to clear the fragment.
             */
            bool fragment = false;

            /**
             * If present, this is removed from the end
             * of the path of the fragment.
             */
            Parameter< PathInput > fragmentPath;

            /**
             * These are keys to remove from the query of the fragment.
             */
            std::vector< std::string > fragmentArgs;
        };

        // Lifecycle management
    public:
        ~Url() noexcept;
        Url(const Url& other);
        Url(Url&&) noexcept;
        Url& operator=(const Url& other);
        Url& operator=(Url&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  It makes an empty URL.
         */
        Url();

        /**
         * This constructs the URL by loading the given string.
         *
         * @param[in] url
         *     This is the string rendering of the URL to load.
         *
         * @param[in] strict
         *     This indicates whether or not to warn about parts of
         *     the URL that are not correctly percent-encoded, and
         *     to check host names more strictly.
         *
         * @throw UrlError
         *     This is thrown if the URL has an invalid port, host,
         *     or authority.
         */
        explicit Url(
            const std::string& url,
            bool strict = false
        );

        /**
         * This is the equality comparison operator for the class.
         * Ports are compared after filling in the default port
         * of the scheme.
         *
         * @param[in] other
         *     This is the other URL to which to compare this URL.
         *
         * @return
         *     An indication of whether or not the two URLs are
         *     equal is returned.
         */
        bool operator==(const Url& other) const;

        /**
         * This is the inequality comparison operator for the class.
         *
         * @param[in] other
         *     This is the other URL to which to compare this URL.
         *
         * @return
         *     An indication of whether or not the two URLs are
         *     not equal is returned.
         */
        bool operator!=(const Url& other) const;

        /**
         * This method replaces the whole URL with the one
         * in the given string.
         *
         * @param[in] url
         *     This is the string rendering of the URL to load.
         *
         * @return
         *     The URL is returned.
         *
         * @throw UrlError
         *     This is thrown if the URL has an invalid port, host,
         *     or authority.  The URL is unchanged in this case.
         */
        Url& Load(const std::string& url);

        /**
         * This method builds the URL from the elements
         * parsed from the given string rendering of a URL.
         *
         * @param[in] urlString
         *     This is the string rendering of the URL to parse.
         *
         * @return
         *     An indication of whether or not the URL was
         *     parsed successfully is returned.
         */
        bool ParseFromString(const std::string& urlString);

        bool HasScheme() const;

        /**
         * This method returns the "scheme" element of the URL,
         * in lower case.
         *
         * @return
         *     The "scheme" element of the URL is returned.
         *
         * @retval ""
         *     This is returned if there is no "scheme" element in the URL.
         */
        std::string GetScheme() const;

        void SetScheme(const std::string& scheme);
        void ClearScheme();

        bool HasUsername() const;
        std::string GetUsername() const;
        void SetUsername(const std::string& username);
        void ClearUsername();

        bool HasPassword() const;
        std::string GetPassword() const;
        void SetPassword(const std::string& password);
        void ClearPassword();

        bool HasHost() const;

        /**
         * This method returns the "host" element of the URL,
         * in lower case.  An internationalized host is returned
         * in its Unicode form.
         *
         * @return
         *     The "host" element of the URL is returned.
         *
         * @retval ""
         *     This is returned if there is no "host" element in the URL.
         */
        std::string GetHost() const;

        /**
         * This method sets the "host" element of the URL.
         *
         * @param[in] host
         *     This is the "host" element to set for the URL.
         *
         * @throw UrlError
         *     This is thrown if the host is not valid.
         */
        void SetHost(const std::string& host);

        void ClearHost();

        /**
         * This method returns an indication of whether or not the
         * URL has a port, either given explicitly or known as the
         * default port of the scheme.
         *
         * @return
         *     An indication of whether or not the
         *     URL has a port is returned.
         */
        bool HasPort() const;

        /**
         * This method returns the port of the URL, which is the
         * default port of the scheme unless another port was given.
         *
         * @return
         *     The port of the URL is returned.
         *
         * @retval 0
         *     This is returned if the URL has no port.
         */
        uint16_t GetPort() const;

        /**
         * This method returns an indication of whether or not the
         * URL has a port other than the default port of the scheme,
         * which is shown when the URL is rendered.
         *
         * @return
         *     An indication of whether or not the URL has
         *     an explicit port is returned.
         */
        bool HasExplicitPort() const;

        /**
         * This method sets the port of the URL.
         *
         * @param[in] port
         *     This is the port to set.
         *
         * @throw InvalidPortError
         *     This is thrown if the port isn't in the range 1-65535.
         */
        void SetPort(int port);

        /**
         * This method sets the port of the URL.
         *
         * @param[in] port
         *     This is the port to set, in decimal.
         *
         * @throw InvalidPortError
         *     This is thrown if the port is not valid.
         */
        void SetPort(const std::string& port);

        /**
         * This method removes any explicit port from the URL,
         * leaving the default port of the scheme, if any.
         */
        void ClearPort();

        /**
         * This method returns an indication of whether or not
         * the URL has an authority, which may be empty.
         *
         * @return
         *     An indication of whether or not the URL
         *     has an authority is returned.
         */
        bool HasNetloc() const;

        /**
         * This method returns the encoded authority of the URL,
         * such as "user:password@host:8080".
         *
         * @return
         *     The encoded authority of the URL is returned.
         */
        std::string GetNetloc() const;

        /**
         * This method replaces the authority of the URL.
         *
         * @param[in] netloc
         *     This is the encoded authority to set.
         *
         * @throw UrlError
         *     This is thrown if the authority has an invalid port,
         *     host, or IP literal.  The URL is unchanged in this case.
         */
        void SetNetloc(const std::string& netloc);

        void ClearNetloc();

        /**
         * This method gives read access to the authority of the URL.
         *
         * @return
         *     The authority of the URL is returned.
         */
        const Authority& GetAuthority() const;

        Path& GetPath();
        const Path& GetPath() const;
        Query& GetQuery();
        const Query& GetQuery() const;
        Fragment& GetFragment();
        const Fragment& GetFragment() const;

        /**
         * This method adds to the path, query, and fragment of the URL.
         *
         * @param[in] arguments
         *     These are the things to add.
         *
         * @return
         *     The URL is returned.
         */
        Url& Add(const AddArguments& arguments);

        /**
         * This method replaces parts of the URL.  Either all of the
         * given parts are set, or (if one of them is not valid) none.
         *
         * @param[in] arguments
         *     These are the things to set.
         *
         * @return
         *     The URL is returned.
         *
         * @throw UrlError
         *     This is thrown if one of the parts is not valid.
         *     The URL is unchanged in this case.
         */
        Url& Set(const SetArguments& arguments);

        /**
         * This method removes parts of the URL.
         *
         * @param[in] arguments
         *     These are the things to remove.
         *
         * @return
         *     The URL is returned.
         */
        Url& Remove(const RemoveArguments& arguments);

        /**
         * This method replaces the URL with the given reference,
         * resolved against the URL according to the
         * rules in RFC 3986 (https://tools.ietf.org/html/rfc3986).
         *
         * @param[in] reference
         *     This is the absolute or relative URL to resolve.
         *
         * @return
         *     The URL is returned.
         *
         * @throw UrlError
         *     This is thrown if the resolved URL is not valid.
         */
        Url& Join(const std::string& reference);

        /**
         * This method replaces the URL with the given reference,
         * resolved against the URL.
         *
         * @param[in] reference
         *     This is the absolute or relative URL to resolve.
         *
         * @return
         *     The URL is returned.
         */
        Url& Join(const Url& reference);

        /**
         * This method applies the "remove_dot_segments" routine talked about
         * in RFC 3986 (https://tools.ietf.org/html/rfc3986) to the path
         * segments of the URL, in order to normalize the path
         * (apply and remove "." and ".." segments).
         *
         * @return
         *     The URL is returned.
         */
        Url& NormalizePath();

        /**
         * This method sets whether or not to warn about parts of the
         * URL that are not correctly percent-encoded, and to check
         * host names more strictly.
         *
         * @param[in] strict
         *     This indicates whether or not to use strict mode.
         */
        void SetStrict(bool strict);

        bool IsStrict() const;

        /**
         * This method sets the function to call to deliver warnings,
         * for the URL and all of its parts.
         *
         * @param[in] warningDelegate
         *     This is the function to call to deliver warnings.
         *     If none is set, warnings are logged.
         */
        void SetWarningDelegate(WarningDelegate warningDelegate);

        /**
         * This method constructs and returns the string
         * rendering of the URL, according to the rules
         * in RFC 3986 (https://tools.ietf.org/html/rfc3986).
         *
         * @param[in] delimiter
         *     This is put between the items of the query.
         *
         * @param[in] quotePlus
         *     This indicates whether spaces in the query are
         *     rendered as '+' (if true) or as "%20" (if false).
         *
         * @param[in] dontQuote
         *     These are characters to leave unencoded in the query,
         *     where doing so doesn't change its meaning.
         *
         * @return
         *     The string rendering of the URL is returned.
         */
        std::string GenerateString(
            const std::string& delimiter = "&",
            bool quotePlus = true,
            const std::string& dontQuote = ""
        ) const;

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

#endif /* URL_URL_HPP */
