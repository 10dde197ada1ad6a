/**
 * @file test_sha256.cpp
 * @brief SHA-256 helpers used by the validation cache key
 */

#include "secbox/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace secbox::common;

TEST(Sha256, KnownVectors)
{
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, MultiBlockInput)
{
    // 56 bytes forces the length into a second padding block
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, PrefixedForm)
{
    const auto hash = sha256_prefixed("print('hi')");
    ASSERT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.size(), 7U + 64U);
    EXPECT_EQ(hash.substr(7), sha256("print('hi')"));
}

TEST(Sha256, CaseSensitiveCode)
{
    EXPECT_NE(sha256("eval(x)"), sha256("Eval(x)"));
}
