#ifndef URL_CHARACTER_SETS_HPP
#define URL_CHARACTER_SETS_HPP

/**
 * @file CharacterSets.hpp
 *
 * This module declares the functions which return the character sets
 * shared by the components of the Url library.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"

namespace Url {

    namespace CharacterSets {

        /**
         * This returns the set containing just the alphabetic
         * characters from the ASCII character set.
         */
        const CharacterSet& Alpha();

        /**
         * This returns the set containing just numbers.
         */
        const CharacterSet& Digit();

        /**
         * This returns the set corresponding to the "unreserved" syntax
         * specified in RFC 3986 (https://tools.ietf.org/html/rfc3986).
         * These characters are never percent-encoded.
         */
        const CharacterSet& Unreserved();

        /**
         * This returns the set corresponding to the "sub-delims" syntax
         * specified in RFC 3986 (https://tools.ietf.org/html/rfc3986).
         */
        const CharacterSet& SubDelims();

        /**
         * This returns the set corresponding to the second part
         * of the "scheme" syntax
         * specified in RFC 3986 (https://tools.ietf.org/html/rfc3986).
         */
        const CharacterSet& SchemeNotFirst();

        /**
         * This returns the set corresponding to the "pchar" syntax
         * specified in RFC 3986 (https://tools.ietf.org/html/rfc3986),
         * leaving out "pct-encoded".  These are the characters left
         * as-is when a path segment is encoded.
         */
        const CharacterSet& PcharNotPctEncoded();

        /**
         * This returns the set corresponding to the "query" syntax
         * and the "fragment" syntax
         * specified in RFC 3986 (https://tools.ietf.org/html/rfc3986),
         * leaving out "pct-encoded".
         */
        const CharacterSet& QueryOrFragmentNotPctEncoded();

        /**
         * This returns the set of characters left as-is when
         * a query key is encoded.
         */
        const CharacterSet& QueryKeySafe();

        /**
         * This returns the set of characters left as-is when
         * a query value is encoded.
         */
        const CharacterSet& QueryValueSafe();

        /**
         * This returns the set of characters that may appear, without
         * percent-encoding, in a path segment received from a caller
         * in strict mode.  Non-ASCII bytes are accepted.
         */
        const CharacterSet& ValidPathSegment();

        /**
         * This returns the set of characters that may appear, without
         * percent-encoding, in a query key received from a caller
         * in strict mode.  Non-ASCII bytes are accepted.
         */
        const CharacterSet& ValidQueryKey();

        /**
         * This returns the set of characters that may appear, without
         * percent-encoding, in a query value received from a caller
         * in strict mode.  Non-ASCII bytes are accepted.
         */
        const CharacterSet& ValidQueryValue();

        /**
         * This returns the set of characters which may never appear
         * in a host name.
         */
        const CharacterSet& InvalidHost();

        /**
         * This returns the set of characters allowed in a host name
         * label in strict mode.  Non-ASCII bytes are accepted so that
         * internationalized names pass.
         */
        const CharacterSet& StrictHostLabel();

        /**
         * This returns the set corresponding to the last part of
         * the "IPvFuture" syntax
         * specified in RFC 3986 (https://tools.ietf.org/html/rfc3986).
         */
        const CharacterSet& IpvFutureLastPart();

        /**
         * This returns the set of characters allowed in
         * a hexadecimal digit.
         */
        const CharacterSet& HexDigit();

    }

}

#endif /* URL_CHARACTER_SETS_HPP */
