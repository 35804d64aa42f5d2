#include <gtest/gtest.h>
#include "utilities/errors.hpp"
#include "utilities/metrics.h"

using namespace dits;

TEST(ErrorsTest, CodesAndNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::Io), "IoError");
    EXPECT_STREQ(errorCodeName(ErrorCode::Integrity), "IntegrityError");
    EXPECT_STREQ(errorCodeName(ErrorCode::NotFound), "NotFound");
    EXPECT_STREQ(errorCodeName(ErrorCode::Config), "ConfigError");
    EXPECT_STREQ(errorCodeName(ErrorCode::Cancelled), "Cancelled");

    EXPECT_EQ(IoError("x").code(), ErrorCode::Io);
    EXPECT_EQ(IntegrityError("x").code(), ErrorCode::Integrity);
    EXPECT_EQ(NotFoundError("x").code(), ErrorCode::NotFound);
    EXPECT_EQ(ConfigError("x").code(), ErrorCode::Config);
    EXPECT_EQ(CancelledError("x").code(), ErrorCode::Cancelled);
}

TEST(ErrorsTest, IoErrorCarriesPath) {
    IoError withPath("read failed", "/tmp/file.bin");
    EXPECT_EQ(withPath.path(), "/tmp/file.bin");
    EXPECT_STREQ(withPath.what(), "/tmp/file.bin: read failed");

    IoError withoutPath("read failed");
    EXPECT_TRUE(withoutPath.path().empty());
    EXPECT_STREQ(withoutPath.what(), "read failed");
}

TEST(ErrorsTest, IntegrityErrorCarriesLocation) {
    IntegrityError e("hash mismatch", "abcd", 3, 4096);
    EXPECT_EQ(e.chunkHash(), "abcd");
    ASSERT_TRUE(e.chunkIndex().has_value());
    EXPECT_EQ(*e.chunkIndex(), 3u);
    ASSERT_TRUE(e.byteOffset().has_value());
    EXPECT_EQ(*e.byteOffset(), 4096u);
    EXPECT_STREQ(e.what(),
                 "hash mismatch (chunk abcd, index 3, offset 4096)");

    IntegrityError bare("malformed");
    EXPECT_FALSE(bare.chunkIndex().has_value());
    EXPECT_STREQ(bare.what(), "malformed");
}

TEST(ErrorsTest, ThrowHelpersThrowMatchingType) {
    EXPECT_THROW(throwIoError("boom", "p"), IoError);
    EXPECT_THROW(throwNotFound("deadbeef"), NotFoundError);
    EXPECT_THROW(throwConfigError("bad"), ConfigError);

    const double before = MetricsRegistry::instance().counterValue(
        "dits_integrity_errors_total");
    try {
        throwIntegrityError("mismatch", "ff", 1, 2);
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError &e) {
        EXPECT_EQ(e.chunkHash(), "ff");
        EXPECT_EQ(*e.chunkIndex(), 1u);
    }
    EXPECT_EQ(MetricsRegistry::instance().counterValue(
                  "dits_integrity_errors_total"),
              before + 1);
}

TEST(ErrorsTest, AllCatchableAsDitsError) {
    try {
        throwNotFound("cafe");
    } catch (const DitsError &e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
        EXPECT_STREQ(e.what(), "Object not found: cafe");
    }
}
