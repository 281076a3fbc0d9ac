#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include "structwire/packet/primitive.hpp"

using namespace structwire::packet;

template<typename T>
class PrimitiveRoundTripTest : public ::testing::Test {
protected:
    static constexpr std::size_t N = primitive_byte_len<T>;

    void check(T value) {
        std::array<uint8_t, N> be_bytes{};
        std::array<uint8_t, N> le_bytes{};
        encode_big_endian(value, std::span<uint8_t, N>(be_bytes));
        encode_little_endian(value, std::span<uint8_t, N>(le_bytes));
        EXPECT_EQ(decode_big_endian<T>(std::span<const uint8_t, N>(be_bytes)), value);
        EXPECT_EQ(decode_little_endian<T>(std::span<const uint8_t, N>(le_bytes)), value);

        // The two orders are mirror images
        for (std::size_t i = 0; i < N; ++i) {
            EXPECT_EQ(be_bytes[i], le_bytes[N - 1 - i]);
        }
    }
};

using IntegerTypes = ::testing::Types<uint8_t, int8_t, uint16_t, int16_t, uint32_t, int32_t, uint64_t, int64_t>;
TYPED_TEST_SUITE(PrimitiveRoundTripTest, IntegerTypes);

TYPED_TEST(PrimitiveRoundTripTest, MinMaxAndSmallValues) {
    this->check(std::numeric_limits<TypeParam>::min());
    this->check(std::numeric_limits<TypeParam>::max());
    this->check(TypeParam{0});
    this->check(TypeParam{1});
    this->check(TypeParam{42});
    if constexpr (std::is_signed_v<TypeParam>) {
        this->check(TypeParam{-1});
    }
}

// 42 written little-endian then big-endian
template<typename T>
std::array<uint8_t, 2 * sizeof(T)> le_then_be(T value) {
    std::array<uint8_t, 2 * sizeof(T)> out{};
    encode_little_endian(value, std::span<uint8_t, sizeof(T)>(out.data(), sizeof(T)));
    encode_big_endian(value, std::span<uint8_t, sizeof(T)>(out.data() + sizeof(T), sizeof(T)));
    return out;
}

TEST(ByteOrderTest, SixteenBit) {
    EXPECT_EQ(le_then_be<uint16_t>(42), (std::array<uint8_t, 4>{42, 0, 0, 42}));
    EXPECT_EQ(le_then_be<int16_t>(42), (std::array<uint8_t, 4>{42, 0, 0, 42}));
}

TEST(ByteOrderTest, ThirtyTwoBit) {
    const std::array<uint8_t, 8> expected{42, 0, 0, 0, 0, 0, 0, 42};
    EXPECT_EQ(le_then_be<uint32_t>(42), expected);
    EXPECT_EQ(le_then_be<int32_t>(42), expected);
}

TEST(ByteOrderTest, SixtyFourBit) {
    const std::array<uint8_t, 16> expected{42, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 42};
    EXPECT_EQ(le_then_be<uint64_t>(42), expected);
    EXPECT_EQ(le_then_be<int64_t>(42), expected);
}

TEST(ByteOrderTest, NegativeValuesUseTwosComplement) {
    std::array<uint8_t, 2> out{};
    encode_big_endian(int16_t{-2}, std::span<uint8_t, 2>(out));
    EXPECT_EQ(out, (std::array<uint8_t, 2>{0xFF, 0xFE}));
    encode_little_endian(int16_t{-2}, std::span<uint8_t, 2>(out));
    EXPECT_EQ(out, (std::array<uint8_t, 2>{0xFE, 0xFF}));
}

enum class Color : uint16_t { Red = 1, Blue = 0x0203 };

TEST(PrimitiveTest, EnumUsesUnderlyingType) {
    static_assert(primitive_byte_len<Color> == 2);
    std::array<uint8_t, 2> out{};
    encode_ordered<ByteOrder::Big>(Color::Blue, std::span<uint8_t, 2>(out));
    EXPECT_EQ(out, (std::array<uint8_t, 2>{0x02, 0x03}));
    EXPECT_EQ((decode_ordered<ByteOrder::Little, Color>(std::span<const uint8_t, 2>(out))), static_cast<Color>(0x0302));
}

TEST(PrimitiveTest, SingleByteTypes) {
    static_assert(primitive_byte_len<bool> == 1);
    static_assert(primitive_byte_len<std::byte> == 1);
    static_assert(SingleBytePrimitive<int8_t>);
    static_assert(MultiBytePrimitive<uint16_t>);
    static_assert(!WirePrimitive<float>);

    std::array<uint8_t, 1> out{};
    encode_byte(true, std::span<uint8_t, 1>(out));
    EXPECT_EQ(out[0], 1);
    encode_byte(std::byte{0xA5}, std::span<uint8_t, 1>(out));
    EXPECT_EQ(out[0], 0xA5);
    EXPECT_EQ(decode_byte<std::byte>(std::span<const uint8_t, 1>(out)), std::byte{0xA5});
    EXPECT_TRUE(decode_byte<bool>(std::span<const uint8_t, 1>(out)));
    out[0] = 0;
    EXPECT_FALSE(decode_byte<bool>(std::span<const uint8_t, 1>(out)));
}

TEST(PrimitiveTest, ByteOrderNames) {
    EXPECT_EQ(to_string(ByteOrder::Big), "be");
    EXPECT_EQ(to_string(ByteOrder::Little), "le");
    EXPECT_EQ(to_string(ByteOrder::None), "-");
}
