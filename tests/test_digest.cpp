/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "hashbreaker/digest.hpp"
#include "hashbreaker/types.hpp"

namespace hashbreaker::tests {

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(hexDigest(hashmode::MD5, "hello").value(), "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(hexDigest(hashmode::SHA1, "hello").value(), "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d");
    EXPECT_EQ(hexDigest(hashmode::SHA256, "hello").value(),
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(DigestTest, ReusableContext) {
    Digester md5(hashmode::MD5);
    ASSERT_TRUE(md5.valid());
    EXPECT_EQ(md5.hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5.hex("hello"), "5d41402abc4b2a76b9719d911017c592");
}

TEST(DigestTest, UnsupportedModes) {
    EXPECT_FALSE(supportsCpuDigest(hashmode::BCRYPT));
    EXPECT_FALSE(supportsCpuDigest(hashmode::NTLM));
    EXPECT_TRUE(supportsCpuDigest(hashmode::SHA512));
    EXPECT_FALSE(hexDigest(hashmode::BCRYPT, "hello").has_value());
    Digester bcrypt(hashmode::BCRYPT);
    EXPECT_FALSE(bcrypt.valid());
}

}
