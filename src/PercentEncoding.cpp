/**
 * @file PercentEncoding.cpp
 *
 * This module contains the implementation of the
 * Url::PercentEncodedCharacterDecoder class and the functions which
 * percent-encode and percent-decode the elements of a URL.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSets.hpp"
#include "PercentEncoding.hpp"

namespace {

    /**
     * These are the digits used to write a percent-encoded character.
     */
    const char* const UPPER_HEX_DIGITS = "0123456789ABCDEF";

}

namespace Url {

    struct PercentEncodedCharacterDecoder::Impl {
        // Properties

        /**
         * This is the decoded character.
         */
        int decodedCharacter = 0;

        /**
         * This is the number of digits that we still need to shift in
         * to decode the character.
         */
        size_t digitsLeft = 2;

        /**
         * These are the hex digits accepted so far.
         */
        std::string acceptedCharacters;

        // Methods

        /**
         * This method shifts in the given hex digit as part of
         * building the decoded character.
         *
         * @param[in] c
         *     This is the hex digit to shift into the decoded character.
         *
         * @return
         *     An indication of whether or not the given hex digit
         *     was valid is returned.
         */
        bool ShiftInHexDigit(char c) {
            if (!CharacterSets::HexDigit().Contains(c)) {
                return false;
            }
            decodedCharacter <<= 4;
            if (CharacterSets::Digit().Contains(c)) {
                decodedCharacter += (int)(c - '0');
            } else if ((c >= 'A') && (c <= 'F')) {
                decodedCharacter += (int)(c - 'A') + 10;
            } else {
                decodedCharacter += (int)(c - 'a') + 10;
            }
            acceptedCharacters.push_back(c);
            return true;
        }
    };

    PercentEncodedCharacterDecoder::~PercentEncodedCharacterDecoder() noexcept = default;
    PercentEncodedCharacterDecoder::PercentEncodedCharacterDecoder(PercentEncodedCharacterDecoder&&) noexcept = default;
    PercentEncodedCharacterDecoder& PercentEncodedCharacterDecoder::operator=(PercentEncodedCharacterDecoder&&) noexcept = default;

    PercentEncodedCharacterDecoder::PercentEncodedCharacterDecoder()
        : impl_(new Impl)
    {
    }

    bool PercentEncodedCharacterDecoder::NextEncodedCharacter(char c) {
        if (
            (impl_->digitsLeft == 0)
            || !impl_->ShiftInHexDigit(c)
        ) {
            return false;
        }
        --impl_->digitsLeft;
        return true;
    }

    bool PercentEncodedCharacterDecoder::Done() const {
        return (impl_->digitsLeft == 0);
    }

    char PercentEncodedCharacterDecoder::GetDecodedCharacter() const {
        return (char)impl_->decodedCharacter;
    }

    std::string PercentEncodedCharacterDecoder::GetAcceptedCharacters() const {
        return impl_->acceptedCharacters;
    }

    std::string EncodeElement(
        const std::string& element,
        const CharacterSet& safeCharacters
    ) {
        std::string encodedElement;
        for (auto c: element) {
            if (safeCharacters.Contains(c)) {
                encodedElement.push_back(c);
            } else {
                const auto byte = (unsigned char)c;
                encodedElement.push_back('%');
                encodedElement.push_back(UPPER_HEX_DIGITS[byte >> 4]);
                encodedElement.push_back(UPPER_HEX_DIGITS[byte & 0x0F]);
            }
        }
        return encodedElement;
    }

    std::string DecodeElement(
        const std::string& element,
        bool plusIsSpace
    ) {
        std::string decodedElement;
        bool decodingPec = false;
        PercentEncodedCharacterDecoder pecDecoder;
        for (const auto c: element) {
            if (decodingPec) {
                if (pecDecoder.NextEncodedCharacter(c)) {
                    if (pecDecoder.Done()) {
                        decodingPec = false;
                        decodedElement.push_back(pecDecoder.GetDecodedCharacter());
                    }
                    continue;
                }
                decodingPec = false;
                decodedElement.push_back('%');
                decodedElement += pecDecoder.GetAcceptedCharacters();
            }
            if (c == '%') {
                decodingPec = true;
                pecDecoder = PercentEncodedCharacterDecoder();
            } else if (plusIsSpace && (c == '+')) {
                decodedElement.push_back(' ');
            } else {
                decodedElement.push_back(c);
            }
        }
        if (decodingPec) {
            decodedElement.push_back('%');
            decodedElement += pecDecoder.GetAcceptedCharacters();
        }
        return decodedElement;
    }

    bool IsEncodedElement(
        const std::string& element,
        const CharacterSet& allowedCharacters
    ) {
        bool decodingPec = false;
        PercentEncodedCharacterDecoder pecDecoder;
        for (const auto c: element) {
            if (decodingPec) {
                if (!pecDecoder.NextEncodedCharacter(c)) {
                    return false;
                }
                if (pecDecoder.Done()) {
                    decodingPec = false;
                }
            } else if (c == '%') {
                decodingPec = true;
                pecDecoder = PercentEncodedCharacterDecoder();
            } else if (!allowedCharacters.Contains(c)) {
                return false;
            }
        }
        return !decodingPec;
    }

}
