// ============================================================================
// WIRE HELPER UNIT TESTS
// ============================================================================
// CRC-32, big-endian readers and the header type table
// ============================================================================

#include <gtest/gtest.h>
#include <eventwire/core/wire/byte_order.hpp>
#include <eventwire/core/wire/constants.hpp>
#include <eventwire/core/wire/crc32.hpp>
#include <eventwire/core/errors/decode_error.hpp>
#include <string>

using namespace EventWire;

// ============================================================================
// CRC-32
// ============================================================================

TEST(Crc32, StandardCheckValue) {
    std::string input = "123456789";
    EXPECT_EQ(computeCrc32(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
              0xCBF43926u);
}

TEST(Crc32, EmptyInputIsZero) {
    EXPECT_EQ(computeCrc32(nullptr, 0), 0u);
}

TEST(Crc32, MinimumFramePrelude) {
    // total_length = 16, headers_length = 0
    std::vector<uint8_t> prelude = {0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(computeCrc32(prelude), 0x05C248EBu);
}

// ============================================================================
// BYTE ORDER
// ============================================================================

TEST(ByteOrder, ReadsBigEndian) {
    const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(readUint8(data), 0x01);
    EXPECT_EQ(readUint16BE(data), 0x0102);
    EXPECT_EQ(readUint32BE(data), 0x01020304u);
    EXPECT_EQ(readUint64BE(data), 0x0102030405060708ull);
}

TEST(ByteOrder, ReadsFullUnsignedRange) {
    const uint8_t data[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(readUint32BE(data), 0xFFFFFFFFu);
    EXPECT_EQ(readUint64BE(data), 0xFFFFFFFFFFFFFFFFull);
}

// ============================================================================
// HEADER TYPE TABLE
// ============================================================================

TEST(HeaderTypeTable, KnownTags) {
    for (uint8_t tag = 0; tag <= 9; ++tag) {
        EXPECT_TRUE(isKnownHeaderType(tag)) << "tag " << static_cast<int>(tag);
    }
    EXPECT_FALSE(isKnownHeaderType(10));
    EXPECT_FALSE(isKnownHeaderType(255));
}

TEST(HeaderTypeTable, Names) {
    EXPECT_STREQ(headerTypeName(HeaderType::BOOL_TRUE), "bool_true");
    EXPECT_STREQ(headerTypeName(HeaderType::LONG), "long");
    EXPECT_STREQ(headerTypeName(HeaderType::UUID), "uuid");
}

TEST(FrameLayout, MinimumFrameLength) {
    EXPECT_EQ(kMinFrameLength, 16u);
    EXPECT_EQ(kHeadersOffset, 12u);
}

// ============================================================================
// ERROR CODES
// ============================================================================

TEST(DecodeErrorCodes, StableNames) {
    EXPECT_STREQ(decodeErrorCodeName(DecodeErrorCode::TooShort), "TooShort");
    EXPECT_STREQ(decodeErrorCodeName(DecodeErrorCode::PreludeChecksumError), "PreludeChecksumError");
    EXPECT_STREQ(decodeErrorCodeName(DecodeErrorCode::MalformedPayload), "MalformedPayload");
}

TEST(DecodeErrorCodes, FactoriesCarryDetails) {
    auto mismatch = DecodeError::lengthMismatch(32, 20);
    EXPECT_EQ(mismatch.code(), DecodeErrorCode::LengthMismatch);
    EXPECT_EQ(mismatch.declaredLength(), 32u);
    EXPECT_EQ(mismatch.actualLength(), 20u);
    EXPECT_STREQ(mismatch.what(), "Expected 32 bytes in the frame but got 20");

    auto unknown = DecodeError::unknownHeaderType(42, 14);
    EXPECT_EQ(unknown.headerType(), 42);
    EXPECT_STREQ(unknown.what(), "Unknown header value type: 42 (at offset 14)");
}
