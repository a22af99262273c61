/**
 * @file Idna.cpp
 *
 * This module contains the implementation of the functions which
 * convert internationalized host names between their Unicode
 * and ASCII forms.
 *
 * © 2018 by Richard Walters
 */

#include "Idna.hpp"

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <unicode/uidna.h>
#include <unicode/utypes.h>
#include <vector>

namespace {

    /**
     * This is the prefix of a host name label which is in
     * the ASCII-compatible form of an internationalized label.
     */
    const std::string ACE_PREFIX = "xn--";

    /**
     * This is the type of smart pointer used to hold an ICU
     * IDNA converter.
     */
    typedef std::unique_ptr< UIDNA, void(*)(UIDNA*) > IdnaConverter;

    /**
     * These are the directions in which a host name can be converted.
     */
    enum class Direction {
        ToAscii,
        ToUnicode,
    };

    /**
     * This function returns the IDNA processing errors which
     * are not treated as errors.  Hyphen placement is never checked.
     * Outside of strict mode, empty labels and the DNS length limits
     * are not checked either.
     *
     * @param[in] strict
     *     This indicates whether or not strict checking is requested.
     *
     * @return
     *     The bit mask of ignored errors is returned.
     */
    uint32_t IgnoredErrors(bool strict) {
        uint32_t ignored = (
            UIDNA_ERROR_HYPHEN_3_4
            | UIDNA_ERROR_LEADING_HYPHEN
            | UIDNA_ERROR_TRAILING_HYPHEN
        );
        if (!strict) {
            ignored |= (
                UIDNA_ERROR_EMPTY_LABEL
                | UIDNA_ERROR_LABEL_TOO_LONG
                | UIDNA_ERROR_DOMAIN_NAME_TOO_LONG
            );
        }
        return ignored;
    }

    /**
     * This function converts the given host name in the given direction.
     *
     * @param[in] host
     *     This is the host name to convert.
     *
     * @param[in] strict
     *     This indicates whether or not strict checking is requested.
     *
     * @param[in] direction
     *     This is the direction in which to convert the host name.
     *
     * @param[out] output
     *     This is where to store the converted host name.
     *
     * @return
     *     An indication of whether or not the host name
     *     could be converted is returned.
     */
    bool Convert(
        const std::string& host,
        bool strict,
        Direction direction,
        std::string& output
    ) {
        uint32_t options = (
            UIDNA_CHECK_BIDI
            | UIDNA_CHECK_CONTEXTJ
            | UIDNA_NONTRANSITIONAL_TO_ASCII
            | UIDNA_NONTRANSITIONAL_TO_UNICODE
        );
        if (strict) {
            options |= UIDNA_USE_STD3_RULES;
        }
        UErrorCode status = U_ZERO_ERROR;
        IdnaConverter converter(uidna_openUTS46(options, &status), uidna_close);
        if (U_FAILURE(status)) {
            return false;
        }
        std::vector< char > buffer(host.length() * 2 + 64);
        for (;;) {
            status = U_ZERO_ERROR;
            UIDNAInfo info = UIDNA_INFO_INITIALIZER;
            int32_t length;
            if (direction == Direction::ToAscii) {
                length = uidna_nameToASCII_UTF8(
                    converter.get(),
                    host.data(),
                    (int32_t)host.length(),
                    buffer.data(),
                    (int32_t)buffer.size(),
                    &info,
                    &status
                );
            } else {
                length = uidna_nameToUnicodeUTF8(
                    converter.get(),
                    host.data(),
                    (int32_t)host.length(),
                    buffer.data(),
                    (int32_t)buffer.size(),
                    &info,
                    &status
                );
            }
            if (status == U_BUFFER_OVERFLOW_ERROR) {
                buffer.resize((size_t)length);
                continue;
            }
            if (
                U_FAILURE(status)
                || ((info.errors & ~IgnoredErrors(strict)) != 0)
            ) {
                return false;
            }
            output.assign(buffer.data(), (size_t)length);
            return true;
        }
    }

}

namespace Url {

    bool IsInternationalHostName(const std::string& host) {
        for (const auto c: host) {
            if ((unsigned char)c >= 0x80) {
                return true;
            }
        }
        size_t labelStart = 0;
        for (;;) {
            if (host.compare(labelStart, ACE_PREFIX.length(), ACE_PREFIX) == 0) {
                return true;
            }
            const auto labelDelimiter = host.find('.', labelStart);
            if (labelDelimiter == std::string::npos) {
                return false;
            }
            labelStart = labelDelimiter + 1;
        }
    }

    bool EncodeHostName(
        const std::string& host,
        bool strict,
        std::string& encoded
    ) {
        return Convert(host, strict, Direction::ToAscii, encoded);
    }

    bool DecodeHostName(
        const std::string& host,
        bool strict,
        std::string& decoded
    ) {
        return Convert(host, strict, Direction::ToUnicode, decoded);
    }

}
