#ifndef DOCSHIELD_TEST_UNIT_TEST_TEXT_UTILS_HPP
#define DOCSHIELD_TEST_UNIT_TEST_TEXT_UTILS_HPP

#include <gtest/gtest.h>
#include <string>
#include "util/hashing.hpp"
#include "util/text_utils.hpp"

/**
 * @file test_text_utils.hpp
 * @brief ASCII case folding, trimming, UTF-8 encoding and SHA-256 helpers.
 */

namespace docshield {
namespace test {

TEST(TextUtilsTest, FoldsOnlyAscii)
{
    using namespace util::text;
    EXPECT_EQ(toLower("IgNoRe Previous"), "ignore previous");
    EXPECT_EQ(toUpper("ffffff"), "FFFFFF");
    // bytes of a multi-byte sequence are left alone
    EXPECT_EQ(toLower("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");
}

TEST(TextUtilsTest, TrimAndBlank)
{
    using namespace util::text;
    EXPECT_EQ(trimmed("  \t key = value \r\n"), "key = value");
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \n\t "));
    EXPECT_FALSE(isBlank("  x "));
}

TEST(TextUtilsTest, CaseInsensitiveSearch)
{
    using namespace util::text;
    const std::string hay = "Please IGNORE PREVIOUS INSTRUCTIONS now";
    EXPECT_EQ(findIgnoreCase(hay, "ignore previous instructions"), 7u);
    EXPECT_TRUE(containsIgnoreCase(hay, "instructions NOW"));
    EXPECT_FALSE(containsIgnoreCase(hay, "system prompt"));
    EXPECT_FALSE(containsIgnoreCase(hay, ""));
    EXPECT_TRUE(matchesAtIgnoreCase(hay, 7, "Ignore"));
    EXPECT_FALSE(matchesAtIgnoreCase(hay, hay.size() - 2, "now!"));
    EXPECT_TRUE(equalsIgnoreCase("JailBreak", "jailbreak"));
    EXPECT_FALSE(equalsIgnoreCase("jailbreak", "jailbreaks"));
}

TEST(TextUtilsTest, AppendUtf8)
{
    std::string out;
    util::text::appendUtf8(out, 'A');
    util::text::appendUtf8(out, 0xE9);
    util::text::appendUtf8(out, 0x20AC);
    util::text::appendUtf8(out, 0x1F600);
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(HashingTest, Sha256KnownVector)
{
    EXPECT_EQ(util::hashing::sha256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    std::vector<uint8_t> empty;
    EXPECT_EQ(util::hashing::sha256(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashingTest, IncrementalMatchesOneShot)
{
    util::hashing::Sha256 digest;
    digest.update("a", 1).update("bc", 2);
    EXPECT_EQ(digest.hexDigest(), util::hashing::sha256(std::string("abc")));
}

} // namespace test
} // namespace docshield

#endif // DOCSHIELD_TEST_UNIT_TEST_TEXT_UTILS_HPP
