/**
 * @file PercentEncodingTests.cpp
 *
 * This module contains the unit tests of the Url::PercentEncodedCharacterDecoder
 * class and the element encoding functions built on it.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <src/CharacterSets.hpp>
#include <src/PercentEncoding.hpp>
#include <stddef.h>
#include <vector>

TEST(PercentEncodingTests, GoodSequences) {
    Url::PercentEncodedCharacterDecoder pec;
    struct TestVector {
        char sequence[2];
        char expectedOutput;
    };
    const std::vector< TestVector > testVectors{
        {{'4', '1'}, 'A'},
        {{'5', 'A'}, 'Z'},
        {{'6', 'e'}, 'n'},
        {{'e', '1'}, (char)0xe1},
        {{'C', 'A'}, (char)0xca},
    };
    size_t index = 0;
    for (auto testVector: testVectors) {
        pec = Url::PercentEncodedCharacterDecoder();
        ASSERT_FALSE(pec.Done());
        ASSERT_TRUE(pec.NextEncodedCharacter(testVector.sequence[0]));
        ASSERT_FALSE(pec.Done());
        ASSERT_TRUE(pec.NextEncodedCharacter(testVector.sequence[1]));
        ASSERT_TRUE(pec.Done());
        ASSERT_EQ(testVector.expectedOutput, pec.GetDecodedCharacter()) << index;
        ++index;
    }
}

TEST(PercentEncodingTests, BadSequences) {
    Url::PercentEncodedCharacterDecoder pec;
    std::vector< char > testVectors{
        'G', 'g', '.', 'z', '-', ' ', 'V',
    };
    for (auto testVector: testVectors) {
        pec = Url::PercentEncodedCharacterDecoder();
        ASSERT_FALSE(pec.Done());
        ASSERT_FALSE(pec.NextEncodedCharacter(testVector));
    }
}

TEST(PercentEncodingTests, NoMoreDigitsAcceptedOnceDone) {
    Url::PercentEncodedCharacterDecoder pec;
    ASSERT_TRUE(pec.NextEncodedCharacter('2'));
    ASSERT_TRUE(pec.NextEncodedCharacter('0'));
    ASSERT_TRUE(pec.Done());
    ASSERT_FALSE(pec.NextEncodedCharacter('0'));
    ASSERT_EQ(' ', pec.GetDecodedCharacter());
    ASSERT_EQ("20", pec.GetAcceptedCharacters());
}

TEST(PercentEncodingTests, EncodeElement) {
    struct TestVector {
        std::string element;
        std::string expectedEncoding;
    };
    const std::vector< TestVector > testVectors{
        {"", ""},
        {"abc-._~", "abc-._~"},
        {"a b", "a%20b"},
        {"100%", "100%25"},
        {"a/b?c#d", "a%2Fb%3Fc%23d"},
        {"\xc3\xa9", "%C3%A9"},
    };
    size_t index = 0;
    for (const auto& testVector: testVectors) {
        EXPECT_EQ(
            testVector.expectedEncoding,
            Url::EncodeElement(
                testVector.element,
                Url::CharacterSets::Unreserved()
            )
        ) << index;
        ++index;
    }
    EXPECT_EQ(
        "a:b@c",
        Url::EncodeElement("a:b@c", Url::CharacterSets::PcharNotPctEncoded())
    );
}

TEST(PercentEncodingTests, DecodeElement) {
    struct TestVector {
        std::string element;
        bool plusIsSpace;
        std::string expectedDecoding;
    };
    const std::vector< TestVector > testVectors{
        {"", false, ""},
        {"a%20b", false, "a b"},
        {"%41%5a%6e", false, "AZn"},
        {"a+b", false, "a+b"},
        {"a+b", true, "a b"},
        {"%2B", true, "+"},
        {"100%", false, "100%"},
        {"%zz", false, "%zz"},
        {"%4", false, "%4"},
        {"%4g", false, "%4g"},
        {"%%41", false, "%A"},
        {"%C3%A9", false, "\xc3\xa9"},
    };
    size_t index = 0;
    for (const auto& testVector: testVectors) {
        EXPECT_EQ(
            testVector.expectedDecoding,
            Url::DecodeElement(testVector.element, testVector.plusIsSpace)
        ) << index;
        ++index;
    }
}

TEST(PercentEncodingTests, IsEncodedElement) {
    struct TestVector {
        std::string element;
        bool expectedValid;
    };
    const std::vector< TestVector > testVectors{
        {"", true},
        {"abc", true},
        {"a%20b", true},
        {"a b", false},
        {"a%2", false},
        {"a%zz", false},
        {"%", false},
    };
    size_t index = 0;
    for (const auto& testVector: testVectors) {
        EXPECT_EQ(
            testVector.expectedValid,
            Url::IsEncodedElement(
                testVector.element,
                Url::CharacterSets::Unreserved()
            )
        ) << index;
        ++index;
    }
}
