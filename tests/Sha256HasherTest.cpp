#include <gtest/gtest.h>

#include <stdexcept>

#include "utils/Sha256Hasher.hpp"
#include "utils/byte_tools.hpp"

TEST(Sha256HasherTest, IncrementalMatchesOneShot) {
    Sha256Hasher hasher;
    hasher.Update("a");
    hasher.Update("");
    hasher.Update("bc");
    EXPECT_EQ(hasher.Finalize(), utils::CalculateSHA256("abc"));
    EXPECT_TRUE(hasher.IsFinalized());
}

TEST(Sha256HasherTest, EmbeddedZeroBytesAreHashed) {
    const std::string data("a\0b", 3);
    Sha256Hasher hasher;
    hasher.Update(data);
    EXPECT_EQ(hasher.Finalize(), utils::CalculateSHA256(data));
}

TEST(Sha256HasherTest, UnusableAfterFinalize) {
    Sha256Hasher hasher;
    EXPECT_EQ(hasher.Finalize().size(), 32u);
    EXPECT_THROW(hasher.Update("x"), std::runtime_error);
    EXPECT_THROW(hasher.Finalize(), std::runtime_error);
}
