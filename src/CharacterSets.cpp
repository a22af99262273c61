/**
 * @file CharacterSets.cpp
 *
 * This module contains the implementation of the functions which
 * return the character sets shared by the components of the Url library.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSets.hpp"

namespace {

    /**
     * This is the set of bytes which can only appear in
     * UTF-8 encodings of non-ASCII characters.
     */
    const Url::CharacterSet& NonAscii() {
        static const Url::CharacterSet nonAscii((char)0x80, (char)0xFF);
        return nonAscii;
    }

}

namespace Url {

    namespace CharacterSets {

        const CharacterSet& Alpha() {
            static const CharacterSet alpha{
                CharacterSet('a', 'z'),
                CharacterSet('A', 'Z')
            };
            return alpha;
        }

        const CharacterSet& Digit() {
            static const CharacterSet digit('0', '9');
            return digit;
        }

        const CharacterSet& Unreserved() {
            static const CharacterSet unreserved{
                Alpha(),
                Digit(),
                '-', '.', '_', '~'
            };
            return unreserved;
        }

        const CharacterSet& SubDelims() {
            static const CharacterSet subDelims{
                '!', '$', '&', '\'', '(', ')',
                '*', '+', ',', ';', '='
            };
            return subDelims;
        }

        const CharacterSet& SchemeNotFirst() {
            static const CharacterSet schemeNotFirst{
                Alpha(),
                Digit(),
                '+', '-', '.',
            };
            return schemeNotFirst;
        }

        const CharacterSet& PcharNotPctEncoded() {
            static const CharacterSet pcharNotPctEncoded{
                Unreserved(),
                SubDelims(),
                ':', '@'
            };
            return pcharNotPctEncoded;
        }

        const CharacterSet& QueryOrFragmentNotPctEncoded() {
            static const CharacterSet queryOrFragmentNotPctEncoded{
                PcharNotPctEncoded(),
                '/', '?'
            };
            return queryOrFragmentNotPctEncoded;
        }

        const CharacterSet& QueryKeySafe() {
            // '&', '=' and '+' have meaning inside a query,
            // so they are always encoded in keys.
            static const CharacterSet queryKeySafe{
                Unreserved(),
                CharacterSet("/?:@!$'()*,;")
            };
            return queryKeySafe;
        }

        const CharacterSet& QueryValueSafe() {
            static const CharacterSet queryValueSafe{
                QueryKeySafe(),
                '='
            };
            return queryValueSafe;
        }

        const CharacterSet& ValidPathSegment() {
            static const CharacterSet validPathSegment{
                PcharNotPctEncoded(),
                NonAscii()
            };
            return validPathSegment;
        }

        const CharacterSet& ValidQueryKey() {
            static const CharacterSet validQueryKey{
                Unreserved(),
                CharacterSet(":@!$&'()*+,;/?"),
                NonAscii()
            };
            return validQueryKey;
        }

        const CharacterSet& ValidQueryValue() {
            static const CharacterSet validQueryValue{
                ValidQueryKey(),
                '='
            };
            return validQueryValue;
        }

        const CharacterSet& InvalidHost() {
            static const CharacterSet invalidHost("!@#$%^&'\"*()+=:;/");
            return invalidHost;
        }

        const CharacterSet& StrictHostLabel() {
            static const CharacterSet strictHostLabel{
                Alpha(),
                Digit(),
                '-',
                NonAscii()
            };
            return strictHostLabel;
        }

        const CharacterSet& IpvFutureLastPart() {
            static const CharacterSet ipvFutureLastPart{
                Unreserved(),
                SubDelims(),
                ':'
            };
            return ipvFutureLastPart;
        }

        const CharacterSet& HexDigit() {
            static const CharacterSet hexDigit{
                CharacterSet('0', '9'),
                CharacterSet('A', 'F'),
                CharacterSet('a', 'f')
            };
            return hexDigit;
        }

    }

}
