#include <gtest/gtest.h>

#include <set>
#include <string>

#include "breachlab/utils/hash_utils.hpp"

namespace breachlab {
namespace {

using utils::HashUtils;

TEST(HashUtilsTest, HmacSha256MatchesRfc4231Vector)
{
    // RFC 4231, test case 2
    EXPECT_EQ(HashUtils::ComputeHmacSHA256("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HashUtilsTest, Sha256MatchesKnownDigest)
{
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, ConstantTimeEqualsComparesContentAndLength)
{
    EXPECT_TRUE(HashUtils::ConstantTimeEquals("flag{0123}", "flag{0123}"));
    EXPECT_FALSE(HashUtils::ConstantTimeEquals("flag{0123}", "flag{0124}"));
    EXPECT_FALSE(HashUtils::ConstantTimeEquals("flag{0123}", "flag{012}"));
    EXPECT_FALSE(HashUtils::ConstantTimeEquals("flag{0123}", ""));
    EXPECT_TRUE(HashUtils::ConstantTimeEquals("", ""));
}

TEST(HashUtilsTest, RandomHexHasRequestedLengthAndVaries)
{
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        auto token = HashUtils::RandomHex(8);
        ASSERT_EQ(token.size(), 16u);
        EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(token);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(HashUtilsTest, RandomBytesOfZeroLengthIsEmpty)
{
    EXPECT_TRUE(HashUtils::RandomBytes(0).empty());
}

}  // namespace
}  // namespace breachlab
