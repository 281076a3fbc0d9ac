#pragma once

#include <cstddef>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "structwire/packet/primitive.hpp"

namespace structwire::packet {

// =============================================================================
// Field descriptors
// =============================================================================
//
// A record exposes its wire layout through a pair of fields() members that
// return a tuple of field descriptors in declaration order:
//
//   struct Header {
//       uint16_t version;
//       uint8_t ttl;
//       uint32_t checksum;
//
//       auto fields() const {
//           return std::make_tuple(be("version", version),
//                                  field("ttl", ttl),
//                                  le("checksum", checksum));
//       }
//       auto fields() {
//           return std::make_tuple(be("version", version),
//                                  field("ttl", ttl),
//                                  le("checksum", checksum));
//       }
//   };
//
// be()/le() are required for multi-byte primitives and rejected for
// single-byte primitives and nested records; field() is the reverse.
// Violations fail to compile.
//
// =============================================================================

template<typename T, ByteOrder Order>
class field_ref;

template<typename T>
struct is_field_ref : std::false_type {};

template<typename T, ByteOrder Order>
struct is_field_ref<field_ref<T, Order>> : std::true_type {};

template<typename T>
struct is_field_tuple : std::false_type {};

template<typename... Fs>
struct is_field_tuple<std::tuple<Fs...>> : std::conjunction<is_field_ref<Fs>...> {};

template<typename T>
concept FieldTuple = is_field_tuple<std::remove_cvref_t<T>>::value;

template<typename T>
concept Record = std::is_class_v<T> && requires(const T& c, T& m) {
    { c.fields() } -> FieldTuple;
    { m.fields() } -> FieldTuple;
};

// Field types that must be declared with field()
template<typename T>
concept UnorderedField = SingleBytePrimitive<T> || Record<T>;

// Field types that must be declared with be() or le()
template<typename T>
concept OrderedField = MultiBytePrimitive<T>;

template<typename T, ByteOrder Order>
inline constexpr bool valid_field_v =
    Order == ByteOrder::None ? UnorderedField<T> : OrderedField<T>;

/**
 * @brief Serialized size of a primitive or record type
 */
template<typename T>
struct wire_size;

template<WirePrimitive T>
struct wire_size<T> : std::integral_constant<std::size_t, primitive_byte_len<T>> {};

template<typename Tuple>
struct tuple_wire_size;

template<typename... Fs>
struct tuple_wire_size<std::tuple<Fs...>>
    : std::integral_constant<std::size_t, (std::size_t{0} + ... + Fs::byte_len)> {};

template<typename A, typename B>
struct same_field_layout : std::false_type {};

template<typename... As, typename... Bs>
    requires(sizeof...(As) == sizeof...(Bs))
struct same_field_layout<std::tuple<As...>, std::tuple<Bs...>>
    : std::bool_constant<((std::is_same_v<typename As::value_type, typename Bs::value_type> &&
                           As::byte_order == Bs::byte_order && As::byte_len == Bs::byte_len) && ...)> {};

/// True when fields() const and fields() declare the same fields in the same order
template<Record R>
inline constexpr bool fields_agree_v =
    same_field_layout<std::remove_cvref_t<decltype(std::declval<const R&>().fields())>,
                      std::remove_cvref_t<decltype(std::declval<R&>().fields())>>::value;

template<Record R>
struct wire_size<R>
    : tuple_wire_size<std::remove_cvref_t<decltype(std::declval<const R&>().fields())>> {
    static_assert(fields_agree_v<R>,
                  "fields() const and fields() must declare the same fields with the same byte order");
};

/**
 * @brief Reference to one record member plus its static wire metadata
 * @tparam T Member type (const-qualified when taken from fields() const)
 * @tparam Order Declared byte order
 */
template<typename T, ByteOrder Order>
class field_ref {
public:
    using value_type = std::remove_const_t<T>;

    static_assert(WirePrimitive<value_type> || Record<value_type>,
                  "field type has no wire representation");
    static_assert(Order != ByteOrder::None || !MultiBytePrimitive<value_type>,
                  "multi-byte field requires an explicit byte order: declare it with be() or le()");
    static_assert(Order == ByteOrder::None || !SingleBytePrimitive<value_type>,
                  "single-byte field must not declare a byte order: declare it with field()");
    static_assert(Order == ByteOrder::None || !Record<value_type>,
                  "nested record field must not declare a byte order: declare it with field()");

    static constexpr ByteOrder byte_order = Order;
    static constexpr std::size_t byte_len = wire_size<value_type>::value;
    static constexpr bool is_record = Record<value_type>;

    constexpr field_ref(const char* name, T& value) noexcept
        : name_(name), value_(&value) {}

    constexpr const char* name() const noexcept { return name_; }
    constexpr T& value() const noexcept { return *value_; }

private:
    const char* name_;
    T* value_;
};

/**
 * @brief Display key of a field: its name, or its position when nameless
 */
inline std::string field_key(const char* name, std::size_t index) {
    return (name != nullptr && *name != '\0') ? std::string(name) : std::to_string(index);
}

// -----------------------------------------------------------------------------
// Declaration helpers
// -----------------------------------------------------------------------------

/**
 * @brief Declare a single-byte or nested record field
 */
template<typename T>
    requires UnorderedField<std::remove_const_t<T>>
constexpr auto field(const char* name, T& value) noexcept {
    return field_ref<T, ByteOrder::None>(name, value);
}

template<typename T>
    requires UnorderedField<std::remove_const_t<T>>
constexpr auto field(T& value) noexcept {
    return field_ref<T, ByteOrder::None>("", value);
}

/**
 * @brief Declare a big-endian multi-byte field
 */
template<typename T>
    requires OrderedField<std::remove_const_t<T>>
constexpr auto be(const char* name, T& value) noexcept {
    return field_ref<T, ByteOrder::Big>(name, value);
}

template<typename T>
    requires OrderedField<std::remove_const_t<T>>
constexpr auto be(T& value) noexcept {
    return field_ref<T, ByteOrder::Big>("", value);
}

/**
 * @brief Declare a little-endian multi-byte field
 */
template<typename T>
    requires OrderedField<std::remove_const_t<T>>
constexpr auto le(const char* name, T& value) noexcept {
    return field_ref<T, ByteOrder::Little>(name, value);
}

template<typename T>
    requires OrderedField<std::remove_const_t<T>>
constexpr auto le(T& value) noexcept {
    return field_ref<T, ByteOrder::Little>("", value);
}

} // namespace structwire::packet
