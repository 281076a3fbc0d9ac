#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <tuple>
#include <utility>
#include <vector>

#include "structwire/error.hpp"
#include "structwire/expected.hpp"
#include "structwire/packet/exceptions.hpp"
#include "structwire/packet/field.hpp"
#include "structwire/packet/primitive.hpp"

namespace structwire::packet {

// =============================================================================
// Static layout
// =============================================================================

template<Record R>
using field_tuple_t = std::remove_cvref_t<decltype(std::declval<const R&>().fields())>;

/// Serialized size of R in bytes (sum of its field sizes, no padding)
template<Record R>
inline constexpr std::size_t byte_len_v = wire_size<R>::value;

template<Record R>
constexpr std::size_t byte_len() noexcept {
    return byte_len_v<R>;
}

template<Record R>
inline constexpr std::size_t field_count_v = std::tuple_size_v<field_tuple_t<R>>;

namespace detail {

template<typename Tuple, std::size_t... I>
constexpr std::array<std::size_t, sizeof...(I)> field_offsets(std::index_sequence<I...>) noexcept {
    std::array<std::size_t, sizeof...(I)> offsets{};
    [[maybe_unused]] std::size_t offset = 0;
    ((offsets[I] = offset, offset += std::tuple_element_t<I, Tuple>::byte_len), ...);
    return offsets;
}

} // namespace detail

/// Byte offset of every field, in declaration order
template<Record R>
inline constexpr std::array<std::size_t, field_count_v<R>> field_offsets_v =
    detail::field_offsets<field_tuple_t<R>>(std::make_index_sequence<field_count_v<R>>{});

template<Record R>
using byte_array = std::array<std::uint8_t, byte_len_v<R>>;

// =============================================================================
// Field walking
// =============================================================================

namespace detail {

template<Record R>
void encode_record(const R& value, std::uint8_t* out) noexcept;

template<Record R>
void decode_record(R& value, const std::uint8_t* in) noexcept;

template<typename F>
void encode_field(const F& f, std::uint8_t* out) noexcept {
    if constexpr (F::is_record) {
        encode_record(f.value(), out);
    } else {
        encode_ordered<F::byte_order>(f.value(), std::span<std::uint8_t, F::byte_len>(out, F::byte_len));
    }
}

template<typename F>
void decode_field(const F& f, const std::uint8_t* in) noexcept {
    using value_type = typename F::value_type;
    if constexpr (F::is_record) {
        decode_record(f.value(), in);
    } else {
        f.value() = decode_ordered<F::byte_order, value_type>(
            std::span<const std::uint8_t, F::byte_len>(in, F::byte_len));
    }
}

template<Record R, std::size_t... I>
void encode_fields(const R& value, [[maybe_unused]] std::uint8_t* out, std::index_sequence<I...>) noexcept {
    [[maybe_unused]] const auto fields = value.fields();
    (encode_field(std::get<I>(fields), out + field_offsets_v<R>[I]), ...);
}

template<Record R, std::size_t... I>
void decode_fields(R& value, [[maybe_unused]] const std::uint8_t* in, std::index_sequence<I...>) noexcept {
    [[maybe_unused]] const auto fields = value.fields();
    (decode_field(std::get<I>(fields), in + field_offsets_v<R>[I]), ...);
}

template<Record R>
void encode_record(const R& value, std::uint8_t* out) noexcept {
    encode_fields(value, out, std::make_index_sequence<field_count_v<R>>{});
}

template<Record R>
void decode_record(R& value, const std::uint8_t* in) noexcept {
    decode_fields(value, in, std::make_index_sequence<field_count_v<R>>{});
}

} // namespace detail

// =============================================================================
// Encode / decode
// =============================================================================

/**
 * @brief Serialize a record into the first byte_len<R>() bytes of out
 * @param value Record to serialize
 * @param out Destination buffer (at least byte_len<R>() bytes)
 * @throws BufferSizeError if out is too small; nothing is written in that case
 */
template<Record R>
void encode(const R& value, std::span<std::uint8_t> out) {
    if (out.size() < byte_len_v<R>) {
        throw_buffer_size_error("encode", byte_len_v<R>, out.size());
    }
    detail::encode_record(value, out.data());
}

/**
 * @brief Deserialize a record from the first byte_len<R>() bytes of in
 * @param in Source buffer (at least byte_len<R>() bytes)
 * @return Decoded record
 * @throws BufferSizeError if in is too small
 */
template<Record R>
R decode(std::span<const std::uint8_t> in) {
    if (in.size() < byte_len_v<R>) {
        throw_buffer_size_error("decode", byte_len_v<R>, in.size());
    }
    R value{};
    detail::decode_record(value, in.data());
    return value;
}

template<Record R>
byte_array<R> encode_to_array(const R& value) noexcept {
    byte_array<R> out{};
    detail::encode_record(value, out.data());
    return out;
}

template<Record R>
std::vector<std::uint8_t> encode_to_vector(const R& value) {
    std::vector<std::uint8_t> out(byte_len_v<R>);
    detail::encode_record(value, out.data());
    return out;
}

/**
 * @brief Non-throwing encode
 * @return Number of bytes written, or StructwireErrc::buffer_too_small
 */
template<Record R>
structwire::Result<std::size_t> try_encode(const R& value, std::span<std::uint8_t> out) noexcept {
    if (out.size() < byte_len_v<R>) {
        return make_error_code(StructwireErrc::buffer_too_small);
    }
    detail::encode_record(value, out.data());
    return std::size_t{byte_len_v<R>};
}

/**
 * @brief Non-throwing decode
 * @return Decoded record, or StructwireErrc::buffer_too_small
 */
template<Record R>
structwire::Result<R> try_decode(std::span<const std::uint8_t> in) noexcept {
    if (in.size() < byte_len_v<R>) {
        return make_error_code(StructwireErrc::buffer_too_small);
    }
    R value{};
    detail::decode_record(value, in.data());
    return value;
}

} // namespace structwire::packet
