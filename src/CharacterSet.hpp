#ifndef URL_CHARACTER_SET_HPP
#define URL_CHARACTER_SET_HPP

/**
 * @file CharacterSet.hpp
 *
 * This module declares the Url::CharacterSet class.
 *
 * © 2018 by Richard Walters
 */

#include <initializer_list>
#include <memory>
#include <string>

namespace Url {

    /**
     * This represents a set of characters which can be queried
     * to find out if a character is in the set or not.
     * All 256 byte values may be members, so that sets can
     * classify UTF-8 code units as well as ASCII characters.
     */
    class CharacterSet {
        // Lifecycle management
    public:
        ~CharacterSet() noexcept;
        CharacterSet(const CharacterSet&);
        CharacterSet(CharacterSet&&) noexcept;
        CharacterSet& operator=(const CharacterSet&);
        CharacterSet& operator=(CharacterSet&&) noexcept;

        // Methods
    public:
        /**
         * This is the default constructor.
         */
        CharacterSet();

        /**
         * This constructs a character set that contains
         * just the given character.
         *
         * @param[in] c
         *     This is the only character to put in the set.
         */
        CharacterSet(char c);

        /**
         * This constructs a character set that contains all the
         * characters between the given "first" and "last"
         * characters, inclusive.
         *
         * @param[in] first
         *     This is the first of the range of characters
         *     to put in the set.
         *
         * @param[in] last
         *     This is the last of the range of characters
         *     to put in the set.
         */
        CharacterSet(char first, char last);

        /**
         * This constructs a character set that contains every
         * character appearing in the given string.
         *
         * @param[in] characters
         *     These are the characters to put in the set.
         */
        explicit CharacterSet(const std::string& characters);

        /**
         * This constructs a character set that contains all the
         * characters in all the other given character sets.
         *
         * @param[in] characterSets
         *     These are the character sets to include.
         */
        CharacterSet(
            std::initializer_list< const CharacterSet > characterSets
        );

        /**
         * This method checks to see if the given character
         * is in the character set.
         *
         * @param[in] c
         *     This is the character to check.
         *
         * @return
         *     An indication of whether or not the given character
         *     is in the character set is returned.
         */
        bool Contains(char c) const;

        /**
         * This method checks to see if every character of the given
         * string is in the character set.
         *
         * @param[in] s
         *     This is the string to check.
         *
         * @return
         *     An indication of whether or not every character of the
         *     given string is in the character set is returned.
         */
        bool ContainsAll(const std::string& s) const;

        /**
         * This method returns a set containing the characters of
         * this set which are also in the other given set.
         *
         * @param[in] other
         *     This is the set with which to intersect this set.
         *
         * @return
         *     The intersection of the two sets is returned.
         */
        CharacterSet Intersect(const CharacterSet& other) const;

        // Private Properties
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

#endif /* URL_CHARACTER_SET_HPP */
