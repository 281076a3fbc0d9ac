#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

#include "structwire/packet/bit_utils.hpp"

namespace structwire::packet {

/**
 * @brief Byte order of a record field
 *
 * None is only valid for single-byte fields and nested records.
 */
enum class ByteOrder : uint8_t {
    None = 0,
    Big = 1,
    Little = 2
};

constexpr std::string_view to_string(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::Big: return "be";
        case ByteOrder::Little: return "le";
        default: return "-";
    }
}

template<typename T>
concept WireInteger = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
    (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

template<typename T>
concept WireEnum = std::is_enum_v<T> && WireInteger<std::underlying_type_t<T>>;

// Types that always occupy exactly one byte regardless of sizeof
template<typename T>
concept WireByte = std::is_same_v<T, bool> || std::is_same_v<T, std::byte>;

template<typename T>
concept WirePrimitive = WireInteger<T> || WireEnum<T> || WireByte<T>;

template<WirePrimitive T>
inline constexpr std::size_t primitive_byte_len = WireByte<T> ? std::size_t{1} : sizeof(T);

template<typename T>
concept SingleBytePrimitive = WirePrimitive<T> && primitive_byte_len<T> == 1;

template<typename T>
concept MultiBytePrimitive = WirePrimitive<T> && (primitive_byte_len<T> > 1);

namespace detail {

template<std::size_t N> struct carrier;
template<> struct carrier<1> { using type = uint8_t; };
template<> struct carrier<2> { using type = uint16_t; };
template<> struct carrier<4> { using type = uint32_t; };
template<> struct carrier<8> { using type = uint64_t; };

template<WirePrimitive T>
using carrier_t = typename carrier<primitive_byte_len<T>>::type;

// Signed values travel as the unsigned bit pattern of equal width.
template<WirePrimitive T>
constexpr carrier_t<T> to_bits(T value) noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? uint8_t{1} : uint8_t{0};
    } else if constexpr (std::is_same_v<T, std::byte>) {
        return std::to_integer<uint8_t>(value);
    } else if constexpr (std::is_enum_v<T>) {
        return static_cast<carrier_t<T>>(static_cast<std::underlying_type_t<T>>(value));
    } else {
        return static_cast<carrier_t<T>>(value);
    }
}

template<WirePrimitive T>
constexpr T from_bits(carrier_t<T> bits) noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return bits != 0;
    } else if constexpr (std::is_same_v<T, std::byte>) {
        return std::byte{bits};
    } else if constexpr (std::is_enum_v<T>) {
        return static_cast<T>(static_cast<std::underlying_type_t<T>>(bits));
    } else {
        return static_cast<T>(bits);
    }
}

} // namespace detail

/**
 * @brief Write a single-byte value
 */
template<SingleBytePrimitive T>
void encode_byte(T value, std::span<uint8_t, 1> out) noexcept {
    out[0] = detail::to_bits(value);
}

/**
 * @brief Read a single-byte value
 */
template<SingleBytePrimitive T>
T decode_byte(std::span<const uint8_t, 1> in) noexcept {
    return detail::from_bits<T>(in[0]);
}

/**
 * @brief Write value with the most significant byte first
 * @param value Value to write
 * @param out Destination window of exactly primitive_byte_len<T> bytes
 */
template<WirePrimitive T>
void encode_big_endian(T value, std::span<uint8_t, primitive_byte_len<T>> out) noexcept {
    const auto bits = detail::to_bits(value);
    if constexpr (primitive_byte_len<T> == 1) {
        out[0] = bits;
    } else if constexpr (primitive_byte_len<T> == 2) {
        write_be16(out.data(), bits);
    } else if constexpr (primitive_byte_len<T> == 4) {
        write_be32(out.data(), bits);
    } else {
        write_be64(out.data(), bits);
    }
}

/**
 * @brief Write value with the least significant byte first
 * @param value Value to write
 * @param out Destination window of exactly primitive_byte_len<T> bytes
 */
template<WirePrimitive T>
void encode_little_endian(T value, std::span<uint8_t, primitive_byte_len<T>> out) noexcept {
    const auto bits = detail::to_bits(value);
    if constexpr (primitive_byte_len<T> == 1) {
        out[0] = bits;
    } else if constexpr (primitive_byte_len<T> == 2) {
        write_le16(out.data(), bits);
    } else if constexpr (primitive_byte_len<T> == 4) {
        write_le32(out.data(), bits);
    } else {
        write_le64(out.data(), bits);
    }
}

/**
 * @brief Read a value stored most significant byte first
 * @param in Source window of exactly primitive_byte_len<T> bytes
 * @return Decoded value
 */
template<WirePrimitive T>
T decode_big_endian(std::span<const uint8_t, primitive_byte_len<T>> in) noexcept {
    if constexpr (primitive_byte_len<T> == 1) {
        return detail::from_bits<T>(in[0]);
    } else if constexpr (primitive_byte_len<T> == 2) {
        return detail::from_bits<T>(read_be16(in.data()));
    } else if constexpr (primitive_byte_len<T> == 4) {
        return detail::from_bits<T>(read_be32(in.data()));
    } else {
        return detail::from_bits<T>(read_be64(in.data()));
    }
}

/**
 * @brief Read a value stored least significant byte first
 * @param in Source window of exactly primitive_byte_len<T> bytes
 * @return Decoded value
 */
template<WirePrimitive T>
T decode_little_endian(std::span<const uint8_t, primitive_byte_len<T>> in) noexcept {
    if constexpr (primitive_byte_len<T> == 1) {
        return detail::from_bits<T>(in[0]);
    } else if constexpr (primitive_byte_len<T> == 2) {
        return detail::from_bits<T>(read_le16(in.data()));
    } else if constexpr (primitive_byte_len<T> == 4) {
        return detail::from_bits<T>(read_le32(in.data()));
    } else {
        return detail::from_bits<T>(read_le64(in.data()));
    }
}

/**
 * @brief Dispatch to the codec selected by Order
 *
 * ByteOrder::None is only accepted for single-byte types.
 */
template<ByteOrder Order, WirePrimitive T>
void encode_ordered(T value, std::span<uint8_t, primitive_byte_len<T>> out) noexcept {
    if constexpr (Order == ByteOrder::Big) {
        encode_big_endian(value, out);
    } else if constexpr (Order == ByteOrder::Little) {
        encode_little_endian(value, out);
    } else {
        static_assert(primitive_byte_len<T> == 1, "multi-byte value needs a byte order");
        encode_byte(value, out);
    }
}

template<ByteOrder Order, WirePrimitive T>
T decode_ordered(std::span<const uint8_t, primitive_byte_len<T>> in) noexcept {
    if constexpr (Order == ByteOrder::Big) {
        return decode_big_endian<T>(in);
    } else if constexpr (Order == ByteOrder::Little) {
        return decode_little_endian<T>(in);
    } else {
        static_assert(primitive_byte_len<T> == 1, "multi-byte value needs a byte order");
        return decode_byte<T>(in);
    }
}

} // namespace structwire::packet
