#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <tuple>
#include <vector>
#include "structwire/packet/record.hpp"

using namespace structwire::packet;

namespace {

struct Header {
    uint16_t version = 0;
    uint8_t ttl = 0;
    uint32_t checksum = 0;

    auto fields() const { return std::make_tuple(be("version", version), field("ttl", ttl), le("checksum", checksum)); }
    auto fields() { return std::make_tuple(be("version", version), field("ttl", ttl), le("checksum", checksum)); }

    bool operator==(const Header&) const = default;
};

struct Integers {
    uint8_t u8_0 = 0;
    int8_t i8_0 = 0;
    uint16_t u16_0 = 0;
    int16_t i16_0 = 0;
    uint16_t u16_1 = 0;
    int16_t i16_1 = 0;
    uint32_t u32_0 = 0;
    int32_t i32_0 = 0;
    uint32_t u32_1 = 0;
    int32_t i32_1 = 0;
    uint64_t u64_0 = 0;
    int64_t i64_0 = 0;
    uint64_t u64_1 = 0;
    int64_t i64_1 = 0;

    template<typename Self>
    static auto describe(Self& s) {
        return std::make_tuple(field(s.u8_0), field(s.i8_0), be(s.u16_0), be(s.i16_0), le(s.u16_1), le(s.i16_1),
                               be(s.u32_0), be(s.i32_0), le(s.u32_1), le(s.i32_1),
                               be(s.u64_0), be(s.i64_0), le(s.u64_1), le(s.i64_1));
    }
    auto fields() const { return describe(*this); }
    auto fields() { return describe(*this); }

    bool operator==(const Integers&) const = default;
};

struct Empty {
    auto fields() const { return std::tuple<>(); }
    auto fields() { return std::tuple<>(); }

    bool operator==(const Empty&) const = default;
};

} // namespace

class RecordTest : public ::testing::Test {
protected:
    Header header() const {
        Header h;
        h.version = 1;
        h.ttl = 42;
        h.checksum = 47;
        return h;
    }

    const std::array<uint8_t, 7> header_bytes{0x00, 0x01, 0x2A, 0x2F, 0x00, 0x00, 0x00};
};

TEST_F(RecordTest, StaticLayout) {
    static_assert(Record<Header>);
    static_assert(byte_len_v<Header> == 7);
    static_assert(byte_len<Header>() == 7);
    static_assert(field_count_v<Header> == 3);
    static_assert(field_offsets_v<Header> == std::array<std::size_t, 3>{0, 2, 3});
    static_assert(std::tuple_size_v<byte_array<Header>> == 7);
}

TEST_F(RecordTest, EncodeLiteral) {
    std::array<uint8_t, 7> out{};
    encode(header(), out);
    EXPECT_EQ(out, header_bytes);
    EXPECT_EQ(encode_to_array(header()), header_bytes);
    EXPECT_EQ(encode_to_vector(header()), std::vector<uint8_t>(header_bytes.begin(), header_bytes.end()));
}

TEST_F(RecordTest, DecodeLiteral) {
    EXPECT_EQ(decode<Header>(header_bytes), header());
}

TEST_F(RecordTest, LargerBufferOnlyTouchesPrefix) {
    std::vector<uint8_t> out(12, 0xEE);
    encode(header(), out);
    EXPECT_TRUE(std::equal(header_bytes.begin(), header_bytes.end(), out.begin()));
    for (std::size_t i = 7; i < out.size(); ++i) {
        EXPECT_EQ(out[i], 0xEE);
    }
    EXPECT_EQ(decode<Header>(out), header());
}

TEST_F(RecordTest, ShortBufferThrowsAndLeavesOutputUntouched) {
    std::vector<uint8_t> out(6, 0xEE);
    try {
        encode(header(), out);
        FAIL() << "expected BufferSizeError";
    } catch (const BufferSizeError& e) {
        EXPECT_EQ(e.required(), 7u);
        EXPECT_EQ(e.actual(), 6u);
    }
    EXPECT_EQ(out, std::vector<uint8_t>(6, 0xEE));

    EXPECT_THROW(decode<Header>(std::span<const uint8_t>(header_bytes).first(6)), BufferSizeError);
    EXPECT_THROW(decode<Header>(std::span<const uint8_t>()), PacketError);
}

TEST_F(RecordTest, TryEncodeAndDecode) {
    std::array<uint8_t, 7> out{};
    auto written = try_encode(header(), out);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 7u);
    EXPECT_EQ(out, header_bytes);

    auto decoded = try_decode<Header>(out);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), header());
}

TEST_F(RecordTest, TryVariantsReportShortBuffer) {
    std::array<uint8_t, 3> small{0xEE, 0xEE, 0xEE};
    auto written = try_encode(header(), small);
    EXPECT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), structwire::StructwireErrc::buffer_too_small);
    EXPECT_EQ(small, (std::array<uint8_t, 3>{0xEE, 0xEE, 0xEE}));

    auto decoded = try_decode<Header>(small);
    EXPECT_FALSE(decoded);
    EXPECT_EQ(decoded.error().category().name(), std::string("structwire"));
}

TEST_F(RecordTest, MixedIntegersRoundTrip) {
    static_assert(byte_len_v<Integers> == 58);
    static_assert(field_count_v<Integers> == 14);
    static_assert(field_offsets_v<Integers>[13] == 50);

    Integers v{42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 52, 53, 54, 55};
    auto bytes = encode_to_array(v);
    EXPECT_EQ(bytes[0], 42);
    EXPECT_EQ(bytes[1], 43);
    // be u16 44
    EXPECT_EQ(bytes[2], 0);
    EXPECT_EQ(bytes[3], 44);
    // le u16 46
    EXPECT_EQ(bytes[6], 46);
    EXPECT_EQ(bytes[7], 0);
    // le i64 55 in the last eight bytes
    EXPECT_EQ(bytes[50], 55);
    EXPECT_EQ(bytes[57], 0);
    EXPECT_EQ(decode<Integers>(bytes), v);
}

TEST_F(RecordTest, MixedIntegersExtremes) {
    Integers v;
    v.i8_0 = -128;
    v.i16_0 = -32768;
    v.u16_1 = 0xFFFF;
    v.i32_1 = -1;
    v.u64_0 = 0xFFFFFFFFFFFFFFFFULL;
    v.i64_1 = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(decode<Integers>(encode_to_array(v)), v);
}

TEST_F(RecordTest, ZeroFieldRecord) {
    static_assert(Record<Empty>);
    static_assert(byte_len_v<Empty> == 0);
    static_assert(field_count_v<Empty> == 0);

    std::vector<uint8_t> out;
    encode(Empty{}, out);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(decode<Empty>(out), Empty{});
    EXPECT_TRUE(encode_to_vector(Empty{}).empty());
    EXPECT_TRUE(try_decode<Empty>(std::span<const uint8_t>()).has_value());
}
