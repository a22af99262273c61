/**
 * @file CharacterSet.cpp
 *
 * This module contains the implementation of the
 * Url::CharacterSet class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"

#include <bitset>
#include <utility>

namespace {

    /**
     * This function maps the given character to its position
     * in a set membership table.
     *
     * @param[in] c
     *     This is the character to map.
     *
     * @return
     *     The position of the character in the table is returned.
     */
    size_t IndexOf(char c) {
        return (size_t)(unsigned char)c;
    }

}

namespace Url {

    /**
     * This contains the private properties of the CharacterSet class.
     */
    struct CharacterSet::Impl {
        /**
         * This has one bit per byte value, set if the
         * corresponding character is in the set.
         */
        std::bitset< 256 > charactersInSet;
    };

    CharacterSet::~CharacterSet() noexcept = default;
    CharacterSet::CharacterSet(const CharacterSet& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    CharacterSet::CharacterSet(CharacterSet&& other) noexcept = default;
    CharacterSet& CharacterSet::operator=(const CharacterSet& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    CharacterSet& CharacterSet::operator=(CharacterSet&& other) noexcept = default;

    CharacterSet::CharacterSet()
        : impl_(new Impl)
    {
    }

    CharacterSet::CharacterSet(char c)
        : impl_(new Impl)
    {
        (void)impl_->charactersInSet.set(IndexOf(c));
    }

    CharacterSet::CharacterSet(char first, char last)
        : impl_(new Impl)
    {
        auto firstIndex = IndexOf(first);
        auto lastIndex = IndexOf(last);
        if (firstIndex > lastIndex) {
            std::swap(firstIndex, lastIndex);
        }
        for (auto index = firstIndex; index <= lastIndex; ++index) {
            (void)impl_->charactersInSet.set(index);
        }
    }

    CharacterSet::CharacterSet(const std::string& characters)
        : impl_(new Impl)
    {
        for (auto c: characters) {
            (void)impl_->charactersInSet.set(IndexOf(c));
        }
    }

    CharacterSet::CharacterSet(
        std::initializer_list< const CharacterSet > characterSets
    )
        : impl_(new Impl)
    {
        for (
            auto characterSet = characterSets.begin();
            characterSet != characterSets.end();
            ++characterSet
        ) {
            impl_->charactersInSet |= characterSet->impl_->charactersInSet;
        }
    }

    bool CharacterSet::Contains(char c) const {
        return impl_->charactersInSet.test(IndexOf(c));
    }

    bool CharacterSet::ContainsAll(const std::string& s) const {
        for (auto c: s) {
            if (!Contains(c)) {
                return false;
            }
        }
        return true;
    }

    CharacterSet CharacterSet::Intersect(const CharacterSet& other) const {
        CharacterSet intersection;
        intersection.impl_->charactersInSet = (
            impl_->charactersInSet
            & other.impl_->charactersInSet
        );
        return intersection;
    }

}
