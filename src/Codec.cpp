/**
 * @file Codec.cpp
 *
 * This module contains the implementation of the free functions
 * used to split, join, encode, decode, and validate the parts of a URL.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSets.hpp"
#include "PercentEncoding.hpp"

#include <algorithm>
#include <ctype.h>
#include <functional>
#include <map>
#include <memory>
#include <Url/Codec.hpp>

namespace {

    /**
     * This function parses the given string as an unsigned 16-bit
     * integer, detecting invalid characters, overflow, etc.
     *
     * @param[in] numberString
     *     This is the string containing the number to parse.
     *
     * @param[out] number
     *     This is where to store the number parsed.
     *
     * @return
     *     An indication of whether or not the number was parsed
     *     successfully is returned.
     */
    bool ParseUint16(
        const std::string& numberString,
        uint16_t& number
    ) {
        uint32_t numberIn32Bits = 0;
        for (auto c: numberString) {
            if (!Url::CharacterSets::Digit().Contains(c)) {
                return false;
            }
            numberIn32Bits *= 10;
            numberIn32Bits += (uint16_t)(c - '0');
            if (
                (numberIn32Bits & ~((1 << 16) - 1)) != 0
            ) {
                return false;
            }
        }
        number = (uint16_t)numberIn32Bits;
        return true;
    }

    /**
     * This function takes a given "stillPassing" strategy
     * and invokes it on the sequence of characters in the given
     * string, to check if the string passes or not.
     *
     * @param[in] candidate
     *     This is the string to test.
     *
     * @param[in] stillPassing
     *     This is the strategy to invoke in order to test the string.
     *
     * @return
     *     An indication of whether or not the given candidate string
     *     passes the test is returned.
     */
    bool FailsMatch(
        const std::string& candidate,
        std::function< bool(char, bool) > stillPassing
    ) {
        for (const auto c: candidate) {
            if (!stillPassing(c, false)) {
                return true;
            }
        }
        return !stillPassing(' ', true);
    }

    /**
     * This function returns a strategy function that
     * may be used with the FailsMatch function to test a scheme
     * to make sure it is legal according to the standard.
     *
     * @return
     *      A strategy function that may be used with the
     *      FailsMatch function to test a scheme to make sure
     *      it is legal according to the standard is returned.
     */
    std::function< bool(char, bool) > LegalSchemeCheckStrategy() {
        auto isFirstCharacter = std::make_shared< bool >(true);
        return [isFirstCharacter](char c, bool end){
            if (end) {
                return !*isFirstCharacter;
            } else {
                bool check;
                if (*isFirstCharacter) {
                    check = Url::CharacterSets::Alpha().Contains(c);
                } else {
                    check = Url::CharacterSets::SchemeNotFirst().Contains(c);
                }
                *isFirstCharacter = false;
                return check;
            }
        };
    }

    /**
     * This function implements the "merge" routine of RFC 3986
     * (https://tools.ietf.org/html/rfc3986), which puts the path
     * of a relative reference onto the directory of a base path.
     *
     * @param[in] base
     *     These are the parts of the base URL.
     *
     * @param[in] referencePath
     *     This is the relative path of the reference.
     *
     * @return
     *     The merged path is returned.
     */
    std::string MergePaths(
        const Url::UrlParts& base,
        const std::string& referencePath
    ) {
        if (
            base.hasAuthority
            && base.path.empty()
        ) {
            return "/" + referencePath;
        }
        const auto lastDelimiter = base.path.rfind('/');
        if (lastDelimiter == std::string::npos) {
            return referencePath;
        }
        return base.path.substr(0, lastDelimiter + 1) + referencePath;
    }

    /**
     * This is the default port of each scheme which has one.
     */
    const std::map< std::string, uint16_t >& DefaultPorts() {
        static const std::map< std::string, uint16_t > defaultPorts{
            {"dns", 53},
            {"ftp", 21},
            {"git", 9418},
            {"gopher", 70},
            {"http", 80},
            {"https", 443},
            {"imap", 143},
            {"ldap", 389},
            {"sftp", 22},
            {"smtp", 25},
            {"ssh", 22},
            {"telnet", 23},
            {"ws", 80},
            {"wss", 443},
        };
        return defaultPorts;
    }

}

namespace Url {

    UrlParts SplitUrl(const std::string& url) {
        UrlParts parts;
        std::string rest = url;

        // Limit our search so we don't scan into the authority
        // or path elements, because these may have the colon
        // character as well, which we might misinterpret
        // as the scheme delimiter.
        const auto schemeEnd = rest.find_first_of(":/?#");
        if (
            (schemeEnd != std::string::npos)
            && (rest[schemeEnd] == ':')
        ) {
            const auto scheme = rest.substr(0, schemeEnd);
            if (
                scheme.empty()
                || IsValidScheme(scheme)
            ) {
                parts.hasScheme = true;
                parts.scheme = scheme;
                rest = rest.substr(schemeEnd + 1);
            }
        }

        // Split authority from path.
        if (rest.substr(0, 2) == "//") {
            rest = rest.substr(2);
            auto authorityEnd = rest.find_first_of("/?#");
            if (authorityEnd == std::string::npos) {
                authorityEnd = rest.length();
            }
            parts.hasAuthority = true;
            parts.authority = rest.substr(0, authorityEnd);
            rest = rest.substr(authorityEnd);
        }

        // Break off the fragment, then the query.
        const auto fragmentDelimiter = rest.find('#');
        if (fragmentDelimiter != std::string::npos) {
            parts.hasFragment = true;
            parts.fragment = rest.substr(fragmentDelimiter + 1);
            rest = rest.substr(0, fragmentDelimiter);
        }
        const auto queryDelimiter = rest.find('?');
        if (queryDelimiter != std::string::npos) {
            parts.hasQuery = true;
            parts.query = rest.substr(queryDelimiter + 1);
            rest = rest.substr(0, queryDelimiter);
        }
        parts.path = rest;
        return parts;
    }

    std::string UnsplitUrl(const UrlParts& parts) {
        std::string url;
        if (parts.hasScheme) {
            url += parts.scheme + ":";
        }
        if (parts.hasAuthority) {
            url += "//" + parts.authority;
        }
        url += parts.path;
        if (parts.hasQuery) {
            url += "?" + parts.query;
        }
        if (parts.hasFragment) {
            url += "#" + parts.fragment;
        }
        return url;
    }

    std::string JoinUrl(
        const std::string& base,
        const std::string& reference
    ) {
        // Resolve the reference by following the algorithm
        // from section 5.2.2 in
        // RFC 3986 (https://tools.ietf.org/html/rfc3986).
        const auto baseParts = SplitUrl(base);
        const auto referenceParts = SplitUrl(reference);
        UrlParts target;
        if (referenceParts.hasScheme) {
            target = referenceParts;
            target.path = RemoveDotSegments(referenceParts.path);
        } else {
            if (referenceParts.hasAuthority) {
                target = referenceParts;
                target.path = RemoveDotSegments(referenceParts.path);
            } else {
                if (referenceParts.path.empty()) {
                    target.path = baseParts.path;
                    if (referenceParts.hasQuery) {
                        target.hasQuery = true;
                        target.query = referenceParts.query;
                    } else {
                        target.hasQuery = baseParts.hasQuery;
                        target.query = baseParts.query;
                    }
                } else {
                    // RFC describes this as:
                    // "if (R.path starts-with "/") then"
                    if (referenceParts.path[0] == '/') {
                        target.path = RemoveDotSegments(referenceParts.path);
                    } else {
                        // RFC describes this as:
                        // "T.path = merge(Base.path, R.path);"
                        target.path = RemoveDotSegments(
                            MergePaths(baseParts, referenceParts.path)
                        );
                    }
                    target.hasQuery = referenceParts.hasQuery;
                    target.query = referenceParts.query;
                }
                target.hasAuthority = baseParts.hasAuthority;
                target.authority = baseParts.authority;
            }
            target.hasScheme = baseParts.hasScheme;
            target.scheme = baseParts.scheme;
        }
        target.hasFragment = referenceParts.hasFragment;
        target.fragment = referenceParts.fragment;
        return UnsplitUrl(target);
    }

    std::string RemoveDotSegments(const std::string& path) {
        if (path.empty()) {
            return path;
        }
        const auto oldPath = SplitPath(path);
        std::vector< std::string > newPath;
        bool isAbsolute = oldPath[0].empty();
        bool atDirectoryLevel = false;
        for (const auto& segment: oldPath) {
            if (segment == ".") {
                atDirectoryLevel = true;
            } else if (segment == "..") {
                if (!newPath.empty()) {
                    if (
                        !isAbsolute
                        || (newPath.size() > 1)
                    ) {
                        newPath.pop_back();
                    }
                }
                atDirectoryLevel = true;
            } else {
                if (
                    !atDirectoryLevel
                    || !segment.empty()
                ) {
                    newPath.push_back(segment);
                }
                atDirectoryLevel = segment.empty();
            }
        }
        if (
            atDirectoryLevel
            && (
                !newPath.empty()
                && !newPath.back().empty()
            )
        ) {
            newPath.push_back("");
        }
        if (
            (newPath.size() == 1)
            && newPath[0].empty()
        ) {
            return "/";
        }
        return JoinPath(newPath);
    }

    std::string PercentEncode(
        const std::string& s,
        const std::string& safe
    ) {
        return EncodeElement(
            s,
            CharacterSet{
                CharacterSets::Unreserved(),
                CharacterSet(safe)
            }
        );
    }

    std::string PercentDecode(const std::string& s) {
        return DecodeElement(s);
    }

    std::string PercentDecodePlus(const std::string& s) {
        return DecodeElement(s, true);
    }

    bool IsValidScheme(const std::string& scheme) {
        return !FailsMatch(scheme, LegalSchemeCheckStrategy());
    }

    bool IsValidHost(
        const std::string& host,
        bool strict
    ) {
        std::vector< std::string > labels;
        size_t labelStart = 0;
        for (;;) {
            const auto labelEnd = host.find('.', labelStart);
            if (labelEnd == std::string::npos) {
                labels.push_back(host.substr(labelStart));
                break;
            }
            labels.push_back(host.substr(labelStart, labelEnd - labelStart));
            labelStart = labelEnd + 1;
        }

        // A trailing period marks a fully qualified domain name.
        if (labels.back().empty()) {
            labels.pop_back();
        }
        for (const auto& label: labels) {
            if (label.empty()) {
                return false;
            }
            for (const auto c: label) {
                if (CharacterSets::InvalidHost().Contains(c)) {
                    return false;
                }
            }
            if (
                strict
                && !CharacterSets::StrictHostLabel().ContainsAll(label)
            ) {
                return false;
            }
        }
        return true;
    }

    bool IsValidPort(const std::string& port) {
        uint16_t number = 0;
        return (
            !port.empty()
            && ParseUint16(port, number)
            && (number != 0)
        );
    }

    bool IsValidEncodedPathSegment(const std::string& segment) {
        return IsEncodedElement(segment, CharacterSets::ValidPathSegment());
    }

    bool IsValidEncodedQueryKey(const std::string& key) {
        return IsEncodedElement(key, CharacterSets::ValidQueryKey());
    }

    bool IsValidEncodedQueryValue(const std::string& value) {
        return IsEncodedElement(value, CharacterSets::ValidQueryValue());
    }

    bool GetDefaultPort(
        const std::string& scheme,
        uint16_t& port
    ) {
        const auto& defaultPorts = DefaultPorts();
        const auto defaultPort = defaultPorts.find(scheme);
        if (defaultPort == defaultPorts.end()) {
            return false;
        }
        port = defaultPort->second;
        return true;
    }

    std::string NormalizeCaseInsensitiveString(const std::string& inString) {
        std::string outString;
        for (char c: inString) {
            outString.push_back((char)tolower((unsigned char)c));
        }
        return outString;
    }

    std::vector< std::string > SplitPath(const std::string& path) {
        std::vector< std::string > segments;
        size_t segmentStart = 0;
        for (;;) {
            const auto pathDelimiter = path.find('/', segmentStart);
            if (pathDelimiter == std::string::npos) {
                segments.push_back(path.substr(segmentStart));
                break;
            }
            segments.push_back(
                path.substr(segmentStart, pathDelimiter - segmentStart)
            );
            segmentStart = pathDelimiter + 1;
        }
        return segments;
    }

    std::string JoinPath(const std::vector< std::string >& segments) {
        std::string path;
        bool first = true;
        for (const auto& segment: segments) {
            if (!first) {
                path += '/';
            }
            path += segment;
            first = false;
        }
        return path;
    }

    std::vector< std::string > JoinPathSegments(
        const std::vector< std::string >& segments,
        const std::vector< std::string >& newSegments
    ) {
        auto finals = segments;
        if (
            (finals.size() == 1)
            && finals[0].empty()
        ) {
            finals.clear();
        }
        if (
            newSegments.empty()
            || (
                (newSegments.size() == 1)
                && newSegments[0].empty()
            )
        ) {
            return finals;
        }
        if (finals.empty()) {
            return newSegments;
        }
        auto additions = newSegments;
        if (
            finals.back().empty()
            && (
                !additions[0].empty()
                || (additions.size() > 1)
            )
        ) {
            // ["a", ""] + ["b"] == ["a", "b"]
            // ["a", ""] + ["", "b"] == ["a", "", "b"]
            finals.pop_back();
        } else if (
            !finals.back().empty()
            && additions[0].empty()
            && (additions.size() > 1)
        ) {
            // ["a"] + ["", "b"] == ["a", "b"]
            (void)additions.erase(additions.begin());
        }
        finals.insert(finals.end(), additions.begin(), additions.end());
        return finals;
    }

    std::vector< std::string > RemovePathSegments(
        std::vector< std::string > segments,
        std::vector< std::string > remove
    ) {
        // [""] means a '/', which is properly represented by ["", ""].
        if (
            (segments.size() == 1)
            && segments[0].empty()
        ) {
            segments.push_back("");
        }
        if (
            (remove.size() == 1)
            && remove[0].empty()
        ) {
            remove.push_back("");
        }
        if (remove == segments) {
            return {};
        }
        if (
            remove.empty()
            || (remove.size() > segments.size())
        ) {
            return segments;
        }
        auto toRemove = remove;
        if (
            (remove.size() > 1)
            && remove[0].empty()
        ) {
            (void)toRemove.erase(toRemove.begin());
        }
        if (
            toRemove.empty()
            || !std::equal(
                toRemove.begin(),
                toRemove.end(),
                segments.end() - toRemove.size()
            )
        ) {
            return segments;
        }
        segments.resize(segments.size() - toRemove.size());
        if (
            !remove[0].empty()
            && !segments.empty()
        ) {
            segments.push_back("");
        }
        return segments;
    }

}
