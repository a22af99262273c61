#ifndef URL_PERCENT_ENCODING_HPP
#define URL_PERCENT_ENCODING_HPP

/**
 * @file PercentEncoding.hpp
 *
 * This module declares the Url::PercentEncodedCharacterDecoder class
 * and the functions which percent-encode and percent-decode
 * the elements of a URL.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"

#include <memory>
#include <stddef.h>
#include <string>

namespace Url {

    /**
     * This class can take in a percent-encoded character,
     * decode it, and also detect if there are any problems in the encoding.
     */
    class PercentEncodedCharacterDecoder {
        // Lifecycle management
    public:
        ~PercentEncodedCharacterDecoder() noexcept;
        PercentEncodedCharacterDecoder(const PercentEncodedCharacterDecoder&) = delete;
        PercentEncodedCharacterDecoder(PercentEncodedCharacterDecoder&&) noexcept;
        PercentEncodedCharacterDecoder& operator=(const PercentEncodedCharacterDecoder&) = delete;
        PercentEncodedCharacterDecoder& operator=(PercentEncodedCharacterDecoder&&) noexcept;

        // Methods
    public:
        /**
         * This is the default constructor.
         */
        PercentEncodedCharacterDecoder();

        /**
         * This method inputs the next encoded character.
         *
         * @param[in] c
         *     This is the next encoded character to give to the decoder.
         *
         * @return
         *     An indication of whether or not the encoded character
         *     was accepted is returned.
         */
        bool NextEncodedCharacter(char c);

        /**
         * This method checks to see if the decoder is done
         * and has decoded the encoded character.
         *
         * @return
         *     An indication of whether or not the decoder is done
         *     and has decoded the encoded character is returned.
         */
        bool Done() const;

        /**
         * This method returns the decoded character, once
         * the decoder is done.
         *
         * @return
         *     The decoded character is returned.
         */
        char GetDecodedCharacter() const;

        /**
         * This method returns the characters accepted by the decoder
         * since it was constructed, so that a caller can put them back
         * into its output if the sequence turns out to be malformed.
         *
         * @return
         *     The characters accepted by the decoder are returned.
         */
        std::string GetAcceptedCharacters() const;

        // Properties
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

    /**
     * This function percent-encodes every character of the given
     * element which is not in the given set of safe characters.
     * Hexadecimal digits are written in upper-case.
     *
     * @param[in] element
     *     This is the element to encode.
     *
     * @param[in] safeCharacters
     *     This is the set of characters which are not encoded.
     *
     * @return
     *     The encoded element is returned.
     */
    std::string EncodeElement(
        const std::string& element,
        const CharacterSet& safeCharacters
    );

    /**
     * This function decodes every percent-encoded character in the given
     * element.  Malformed sequences (a '%' not followed by two hexadecimal
     * digits) are copied to the output unchanged.
     *
     * @param[in] element
     *     This is the element to decode.
     *
     * @param[in] plusIsSpace
     *     This indicates whether or not a '+' in the element stands
     *     for a space, as it does in queries.
     *
     * @return
     *     The decoded element is returned.
     */
    std::string DecodeElement(
        const std::string& element,
        bool plusIsSpace = false
    );

    /**
     * This function checks that the given element consists only of
     * characters in the given set and well-formed percent-encoded
     * characters.
     *
     * @param[in] element
     *     This is the element to check.
     *
     * @param[in] allowedCharacters
     *     This is the set of characters that do not need to
     *     be percent-encoded.
     *
     * @return
     *     An indication of whether or not the element
     *     is correctly encoded is returned.
     */
    bool IsEncodedElement(
        const std::string& element,
        const CharacterSet& allowedCharacters
    );

}

#endif /* URL_PERCENT_ENCODING_HPP */
