#include <gtest/gtest.h>
#include <string>
#include "utils/HostKeyFingerprint.hpp"

TEST(HostKeyFingerprintTest, MatchesOpenSshFormat) {
    const std::string key = "abc";
    std::string fingerprint = HostKeyFingerprint::sha256(reinterpret_cast<const unsigned char*>(key.data()),
                                                         key.size());
    EXPECT_EQ(fingerprint, "SHA256:ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0");
}

TEST(HostKeyFingerprintTest, ComparisonIgnoresPadding) {
    const std::string actual = "SHA256:ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0";
    EXPECT_TRUE(HostKeyFingerprint::matches(actual, actual));
    EXPECT_TRUE(HostKeyFingerprint::matches(actual + "=", actual));
    EXPECT_FALSE(HostKeyFingerprint::matches("SHA256:AAAA", actual));
    EXPECT_FALSE(HostKeyFingerprint::matches("", actual));
}
