#ifndef URL_CODEC_HPP
#define URL_CODEC_HPP

/**
 * @file Codec.hpp
 *
 * This module declares the free functions used to split, join,
 * encode, decode, and validate the parts of a URL.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <vector>

namespace Url {

    /**
     * This holds the five syntactic parts of a URL string,
     * still percent-encoded.  The flags tell an empty part
     * apart from a missing one (for example "http:" has an
     * empty authority that is missing, while "http://" has
     * one that is present).
     */
    struct UrlParts {
        /**
         * This indicates whether or not the URL has a scheme.
         */
        bool hasScheme = false;

        /**
         * This is the scheme, without the trailing colon.
         */
        std::string scheme;

        /**
         * This indicates whether or not the URL has an authority
         * (introduced by "//").
         */
        bool hasAuthority = false;

        /**
         * This is the authority, without the leading "//".
         */
        std::string authority;

        /**
         * This is the path.
         */
        std::string path;

        /**
         * This indicates whether or not the URL has a query.
         */
        bool hasQuery = false;

        /**
         * This is the query, without the leading '?'.
         */
        std::string query;

        /**
         * This indicates whether or not the URL has a fragment.
         */
        bool hasFragment = false;

        /**
         * This is the fragment, without the leading '#'.
         */
        std::string fragment;
    };

    /**
     * This function splits the given URL string into its scheme,
     * authority, path, query, and fragment.  The same rules apply
     * to every scheme, registered or not.
     *
     * A scheme is recognized only if it is a letter followed by
     * letters, digits, '+', '-', or '.', and its colon comes before
     * any '/', '?', or '#'.  A URL that starts with a colon has
     * an empty scheme.
     *
     * @param[in] url
     *     This is the URL string to split.
     *
     * @return
     *     The parts of the URL are returned.
     */
    UrlParts SplitUrl(const std::string& url);

    /**
     * This function puts the given URL parts back together
     * into a URL string.
     *
     * @param[in] parts
     *     These are the parts of the URL.
     *
     * @return
     *     The URL string is returned.
     */
    std::string UnsplitUrl(const UrlParts& parts);

    /**
     * This function resolves the given reference against
     * the given base URL, following the algorithm of section 5.2
     * of RFC 3986 (https://tools.ietf.org/html/rfc3986), for any scheme.
     *
     * @param[in] base
     *     This is the URL against which to resolve the reference.
     *
     * @param[in] reference
     *     This is the absolute or relative URL to resolve.
     *
     * @return
     *     The resolved URL string is returned.
     */
    std::string JoinUrl(
        const std::string& base,
        const std::string& reference
    );

    /**
     * This function applies and removes the "." and ".." segments
     * of the given path.
     *
     * @param[in] path
     *     This is the path to clean up.
     *
     * @return
     *     The path without dot segments is returned.
     */
    std::string RemoveDotSegments(const std::string& path);

    /**
     * This function percent-encodes the given string.  Unreserved
     * characters (letters, digits, '-', '.', '_', '~') are never encoded.
     *
     * @param[in] s
     *     This is the string to encode.
     *
     * @param[in] safe
     *     These are the other characters to leave as they are.
     *
     * @return
     *     The encoded string is returned.
     */
    std::string PercentEncode(
        const std::string& s,
        const std::string& safe = ""
    );

    /**
     * This function decodes every percent-encoded character
     * in the given string.  A '%' which doesn't start a valid
     * encoding is kept as it is.
     *
     * @param[in] s
     *     This is the string to decode.
     *
     * @return
     *     The decoded string is returned.
     */
    std::string PercentDecode(const std::string& s);

    /**
     * This function is like PercentDecode, except that it
     * also turns every '+' into a space, as done for queries.
     *
     * @param[in] s
     *     This is the string to decode.
     *
     * @return
     *     The decoded string is returned.
     */
    std::string PercentDecodePlus(const std::string& s);

    /**
     * This function checks the given string against the
     * "scheme" syntax of RFC 3986.
     *
     * @param[in] scheme
     *     This is the string to check.
     *
     * @return
     *     An indication of whether or not the string is
     *     a valid scheme is returned.
     */
    bool IsValidScheme(const std::string& scheme);

    /**
     * This function checks the given string as a host name.
     * A host may not contain any of the characters
     * !@#$%^&'"*()+=:;/ and may not have adjacent periods,
     * though one trailing period is allowed.  In strict mode
     * every label must also consist of letters, digits, hyphens,
     * or non-ASCII characters.
     *
     * @param[in] host
     *     This is the string to check.
     *
     * @param[in] strict
     *     This indicates whether or not to check the characters
     *     of each label.
     *
     * @return
     *     An indication of whether or not the string is
     *     a valid host is returned.
     */
    bool IsValidHost(
        const std::string& host,
        bool strict = false
    );

    /**
     * This function checks that the given string is a decimal
     * port number in the range 1-65535.
     *
     * @param[in] port
     *     This is the string to check.
     *
     * @return
     *     An indication of whether or not the string is
     *     a valid port is returned.
     */
    bool IsValidPort(const std::string& port);

    /**
     * This function checks that the given string is
     * a correctly percent-encoded path segment.
     *
     * @param[in] segment
     *     This is the string to check.
     *
     * @return
     *     An indication of whether or not the string is
     *     correctly encoded is returned.
     */
    bool IsValidEncodedPathSegment(const std::string& segment);

    /**
     * This function checks that the given string is
     * a correctly percent-encoded query key.
     *
     * @param[in] key
     *     This is the string to check.
     *
     * @return
     *     An indication of whether or not the string is
     *     correctly encoded is returned.
     */
    bool IsValidEncodedQueryKey(const std::string& key);

    /**
     * This function checks that the given string is
     * a correctly percent-encoded query value.
     *
     * @param[in] value
     *     This is the string to check.
     *
     * @return
     *     An indication of whether or not the string is
     *     correctly encoded is returned.
     */
    bool IsValidEncodedQueryValue(const std::string& value);

    /**
     * This function looks up the port used by default
     * for the given scheme.
     *
     * @param[in] scheme
     *     This is the scheme, in lower case.
     *
     * @param[out] port
     *     This is where to store the default port, if known.
     *
     * @return
     *     An indication of whether or not the scheme has a known
     *     default port is returned.
     */
    bool GetDefaultPort(
        const std::string& scheme,
        uint16_t& port
    );

    /**
     * This function returns a lower-case copy of the given string,
     * for comparing elements such as schemes and hosts which
     * ignore case.
     *
     * @param[in] inString
     *     This is the string to normalize.
     *
     * @return
     *     The normalized string is returned.
     */
    std::string NormalizeCaseInsensitiveString(const std::string& inString);

    /**
     * This function splits the given path string on '/'
     * without decoding anything.
     *
     * @param[in] path
     *     This is the path to split.
     *
     * @return
     *     The segments of the path are returned.  A path that
     *     starts with '/' has an empty first segment.
     */
    std::vector< std::string > SplitPath(const std::string& path);

    /**
     * This function puts the given path segments together with '/'
     * between them, without encoding anything.
     *
     * @param[in] segments
     *     These are the segments to join.
     *
     * @return
     *     The path string is returned.
     */
    std::string JoinPath(const std::vector< std::string >& segments);

    /**
     * This function joins two lists of path segments, keeping the
     * slashes the caller most likely intended at the border.
     *
     * Examples:
     * - ["a"] + ["b"] == ["a", "b"]
     * - ["a", ""] + ["b"] == ["a", "b"]
     * - ["a"] + ["", "b"] == ["a", "b"]
     * - ["a", ""] + ["", "b"] == ["a", "", "b"]
     *
     * @param[in] segments
     *     These are the segments to which to add.
     *
     * @param[in] newSegments
     *     These are the segments to add.  An empty list
     *     or [""] adds nothing.
     *
     * @return
     *     The joined segments are returned.
     */
    std::vector< std::string > JoinPathSegments(
        const std::vector< std::string >& segments,
        const std::vector< std::string >& newSegments
    );

    /**
     * This function removes the given segments from the end
     * of the given path segments, if they match exactly there.
     *
     * Examples:
     * - "/a/b/c" - "b/c" == "/a/"
     *   (["", "a", "b", "c"] - ["b", "c"] == ["", "a", ""])
     * - "/a/b/c" - "/b/c" == "/a"
     *   (["", "a", "b", "c"] - ["", "b", "c"] == ["", "a"])
     *
     * @param[in] segments
     *     These are the segments from which to remove.
     *
     * @param[in] remove
     *     These are the segments to remove.  [""] stands for
     *     a trailing slash.
     *
     * @return
     *     The remaining segments are returned.  If the segments
     *     to remove don't match the end of the path, the path
     *     segments are returned unchanged.
     */
    std::vector< std::string > RemovePathSegments(
        std::vector< std::string > segments,
        std::vector< std::string > remove
    );

}

#endif /* URL_CODEC_HPP */
