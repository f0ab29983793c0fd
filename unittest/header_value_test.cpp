// ============================================================================
// HEADER VALUE & MESSAGE MODEL UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <eventwire/core/message/header_value.hpp>
#include <eventwire/core/message/parsed_message.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace EventWire;

// ============================================================================
// UUID
// ============================================================================

TEST(Uuid, FormatsCanonicalHyphenatedHex) {
    const uint8_t raw[16] = {0x3b, 0xfd, 0xac, 0x5c, 0xfe, 0x6c, 0x40, 0x29,
                             0x83, 0xbf, 0xc1, 0xde, 0x78, 0x19, 0xf5, 0x31};
    EXPECT_EQ(Uuid::fromBytes(raw).text, "3bfdac5c-fe6c-4029-83bf-c1de7819f531");
}

TEST(Uuid, ConvertsBackToRawBytes) {
    Uuid uuid{"3bfdac5c-fe6c-4029-83bf-c1de7819f531"};
    auto raw = uuid.toBytes();
    EXPECT_EQ(raw[0], 0x3b);
    EXPECT_EQ(raw[7], 0x29);
    EXPECT_EQ(raw[15], 0x31);
    EXPECT_EQ(Uuid::fromBytes(raw.data()), uuid);
}

TEST(Uuid, RejectsMalformedText) {
    EXPECT_THROW(Uuid{"not-a-uuid"}.toBytes(), std::invalid_argument);
    EXPECT_THROW(Uuid{"3bfdac5c-fe6c-4029-83bf-c1de7819f5"}.toBytes(), std::invalid_argument);
}

// ============================================================================
// TIMESTAMP
// ============================================================================

TEST(Timestamp, ConvertsToTimePoint) {
    Timestamp ts{1500000000123ull};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.toTimePoint().time_since_epoch());
    EXPECT_EQ(ms.count(), 1500000000123ll);
}

TEST(Timestamp, KeepsMillisecondsPastYear2262) {
    // Beyond the nanosecond range of system_clock::duration
    for (uint64_t millis : {9300000000000ull, 20000000000000ull, 9223372036854775807ull}) {
        Timestamp ts{millis};
        EXPECT_EQ(ts.toTimePoint().time_since_epoch().count(), static_cast<int64_t>(millis))
            << "millis " << millis;
    }
}

TEST(Timestamp, RejectsCountsAboveSignedRange) {
    EXPECT_THROW(Timestamp{9223372036854775808ull}.toTimePoint(), std::out_of_range);
    EXPECT_THROW(Timestamp{UINT64_MAX}.toTimePoint(), std::out_of_range);
}

// ============================================================================
// RENDERING
// ============================================================================

TEST(HeaderValueToString, RendersEachAlternative) {
    EXPECT_EQ(headerValueToString(HeaderValue(true)), "true");
    EXPECT_EQ(headerValueToString(HeaderValue(false)), "false");
    EXPECT_EQ(headerValueToString(HeaderValue(uint8_t{200})), "200");
    EXPECT_EQ(headerValueToString(HeaderValue(uint16_t{65535})), "65535");
    EXPECT_EQ(headerValueToString(HeaderValue(uint32_t{4000000000u})), "4000000000");
    EXPECT_EQ(headerValueToString(HeaderValue(uint64_t{18446744073709551615ull})),
              "18446744073709551615");
    EXPECT_EQ(headerValueToString(HeaderValue(Bytes{0xDE, 0xAD, 0xBE, 0xEF})), "deadbeef");
    EXPECT_EQ(headerValueToString(HeaderValue(std::string("event"))), "event");
    EXPECT_EQ(headerValueToString(HeaderValue(Timestamp{0})), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(headerValueToString(HeaderValue(Timestamp{1500000000123ull})),
              "2017-07-14T02:40:00.123Z");
}

TEST(HeaderValueToString, LargeTimestampNeverRendersAsEpoch) {
    std::string rendered = headerValueToString(HeaderValue(Timestamp{UINT64_MAX}));
    EXPECT_EQ(rendered.find("1970-01-01"), std::string::npos);
    bool calendar = !rendered.empty() && rendered.back() == 'Z';
    EXPECT_TRUE(calendar || rendered == "18446744073709551615ms") << rendered;
}

TEST(HeaderTypeOf, MapsAlternativesToWireTags) {
    EXPECT_EQ(headerTypeOf(HeaderValue(true)), HeaderType::BOOL_TRUE);
    EXPECT_EQ(headerTypeOf(HeaderValue(false)), HeaderType::BOOL_FALSE);
    EXPECT_EQ(headerTypeOf(HeaderValue(uint16_t{1})), HeaderType::SHORT);
    EXPECT_EQ(headerTypeOf(HeaderValue(Timestamp{1})), HeaderType::TIMESTAMP);
    EXPECT_EQ(headerTypeOf(HeaderValue(Uuid{"x"})), HeaderType::UUID);
}

// ============================================================================
// CONTENT TYPE MATCHING
// ============================================================================

TEST(JsonContentType, MatchesJsonSubtypes) {
    EXPECT_TRUE(isJsonContentType("application/json"));
    EXPECT_TRUE(isJsonContentType("application/x-amz-json-1.1"));
    EXPECT_TRUE(isJsonContentType("application/vnd.api+json; charset=utf-8"));
}

TEST(JsonContentType, RejectsOtherTypes) {
    EXPECT_FALSE(isJsonContentType("text/plain"));
    EXPECT_FALSE(isJsonContentType("text/json"));
    EXPECT_FALSE(isJsonContentType("application/octet-stream"));
    EXPECT_FALSE(isJsonContentType("application/JSON"));   // case-sensitive
    EXPECT_FALSE(isJsonContentType("Application/json"));
    EXPECT_FALSE(isJsonContentType(" application/json"));  // whole-value match
    EXPECT_FALSE(isJsonContentType(""));
}

// ============================================================================
// PARSED MESSAGE
// ============================================================================

TEST(ParsedMessage, HeaderLookup) {
    ParsedMessage msg;
    msg.headers[":event-type"] = std::string("Records");
    msg.headers["count"] = uint32_t{7};

    ASSERT_NE(msg.findHeader("count"), nullptr);
    EXPECT_EQ(std::get<uint32_t>(*msg.findHeader("count")), 7u);
    EXPECT_EQ(msg.findHeader("missing"), nullptr);

    ASSERT_NE(msg.findStringHeader(":event-type"), nullptr);
    EXPECT_EQ(*msg.findStringHeader(":event-type"), "Records");
    EXPECT_EQ(msg.findStringHeader("count"), nullptr);
}

TEST(ParsedMessage, PayloadShapes) {
    ParsedMessage text;
    text.payload = std::string("hello");
    EXPECT_FALSE(text.isStructured());
    EXPECT_EQ(text.payloadText(), "hello");
    EXPECT_THROW(text.payloadJson(), std::bad_variant_access);

    ParsedMessage structured;
    structured.payload = Payload(std::in_place_type<nlohmann::json>, nlohmann::json{{"a", 1}});
    EXPECT_TRUE(structured.isStructured());
    EXPECT_EQ(structured.payloadJson()["a"], 1);
}
