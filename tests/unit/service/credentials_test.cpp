#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

#include "gcb/foundation/error_code.hpp"
#include "gcb/service/credentials.hpp"

using namespace gcb::service;
using gcb::foundation::ErrorCode;

// ---------------------------------------------------------------------------
// Token comparison
// ---------------------------------------------------------------------------

TEST(CredentialsTest, TokensEqualComparesWholeValue) {
    EXPECT_TRUE(tokensEqual("s3cret", "s3cret"));
    EXPECT_TRUE(tokensEqual("", ""));
    EXPECT_FALSE(tokensEqual("s3cret", "s3creT"));
    EXPECT_FALSE(tokensEqual("s3cret", "s3cre"));
    EXPECT_FALSE(tokensEqual("", "s3cret"));
}

TEST(CredentialsTest, FingerprintIsStableShortHex) {
    auto fp = tokenFingerprint("s3cret");
    ASSERT_EQ(fp.size(), 8u);
    EXPECT_TRUE(std::all_of(fp.begin(), fp.end(), [](unsigned char c) {
        return std::isxdigit(c) && !std::isupper(c);
    }));
    EXPECT_EQ(fp, tokenFingerprint("s3cret"));
    EXPECT_NE(fp, tokenFingerprint("other"));
    EXPECT_EQ(fp.find("s3cret"), std::string::npos);
}

TEST(CredentialsTest, FingerprintOfEmptyTokenIsSha256Prefix) {
    // SHA-256("") = e3b0c442...
    EXPECT_EQ(tokenFingerprint(""), "e3b0c442");
}

// ---------------------------------------------------------------------------
// Code generation
// ---------------------------------------------------------------------------

TEST(CredentialsTest, NumericCodeHasRequestedDigits) {
    for (std::size_t digits : {1u, 6u, 12u, 18u}) {
        auto code = generateNumericCode(digits);
        ASSERT_TRUE(code.hasValue()) << digits;
        EXPECT_EQ(code.value().size(), digits);
        EXPECT_TRUE(std::all_of(code.value().begin(), code.value().end(),
                                [](unsigned char c) { return std::isdigit(c) != 0; }));
    }
}

TEST(CredentialsTest, NumericCodesVary) {
    std::set<std::string> codes;
    for (int i = 0; i < 50; ++i) {
        codes.insert(generateNumericCode(6).value());
    }
    EXPECT_GT(codes.size(), 40u);
}

TEST(CredentialsTest, NumericCodeLengthOutOfRange) {
    for (std::size_t digits : {0u, 19u}) {
        auto code = generateNumericCode(digits);
        ASSERT_TRUE(code.hasError()) << digits;
        EXPECT_EQ(code.error().code(), ErrorCode::InvalidArgument);
    }
}
