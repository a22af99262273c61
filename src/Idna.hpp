#ifndef URL_IDNA_HPP
#define URL_IDNA_HPP

/**
 * @file Idna.hpp
 *
 * This module declares the functions which convert internationalized
 * host names between their Unicode and ASCII ("xn--") forms.
 *
 * © 2018 by Richard Walters
 */

#include <string>

namespace Url {

    /**
     * This function determines whether or not the given host name
     * needs to go through IDNA processing, because it has characters
     * outside of ASCII, or a label in the ASCII-compatible
     * "xn--" form.
     *
     * @param[in] host
     *     This is the host name to check, in lower case.
     *
     * @return
     *     An indication of whether or not the host name is
     *     internationalized is returned.
     */
    bool IsInternationalHostName(const std::string& host);

    /**
     * This function converts the given host name to its ASCII form,
     * following UTS #46 (https://unicode.org/reports/tr46/).
     *
     * @param[in] host
     *     This is the host name to convert, in UTF-8.
     *
     * @param[in] strict
     *     This indicates whether or not to apply the STD3 rules
     *     and the DNS length limits.
     *
     * @param[out] encoded
     *     This is where to store the ASCII form of the host name.
     *
     * @return
     *     An indication of whether or not the host name
     *     could be converted is returned.
     */
    bool EncodeHostName(
        const std::string& host,
        bool strict,
        std::string& encoded
    );

    /**
     * This function converts the given host name to its Unicode form,
     * following UTS #46 (https://unicode.org/reports/tr46/).
     *
     * @param[in] host
     *     This is the host name to convert.
     *
     * @param[in] strict
     *     This indicates whether or not to apply the STD3 rules
     *     and the DNS length limits.
     *
     * @param[out] decoded
     *     This is where to store the Unicode form of the host name,
     *     in UTF-8.
     *
     * @return
     *     An indication of whether or not the host name
     *     could be converted is returned.
     */
    bool DecodeHostName(
        const std::string& host,
        bool strict,
        std::string& decoded
    );

}

#endif /* URL_IDNA_HPP */
