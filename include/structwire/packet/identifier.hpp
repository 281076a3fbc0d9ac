#pragma once

#include <type_traits>
#include <utility>

namespace structwire::packet {

/**
 * @brief Record types carrying a message identifier
 *
 * A record opts in with a static constant:
 *
 *   struct Ping {
 *       static constexpr uint8_t identifier = 0x01;
 *       ...
 *   };
 *
 * The identifier only tags the type. It is not written by encode(); a
 * protocol that puts it on the wire declares an ordinary field for it.
 */
template<typename T>
concept HasIdentifier = requires {
    T::identifier;
    requires std::is_integral_v<std::remove_cv_t<decltype(T::identifier)>> ||
             std::is_enum_v<std::remove_cv_t<decltype(T::identifier)>>;
};

template<HasIdentifier R>
using identifier_type_t = std::remove_cv_t<decltype(R::identifier)>;

template<HasIdentifier R>
inline constexpr identifier_type_t<R> identifier_v = R::identifier;

namespace detail {

// std::cmp_equal rejects bool and character types; compare those as unsigned
template<typename T>
constexpr auto comparable_integer(T v) noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return static_cast<unsigned int>(v);
    } else if constexpr (std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                         std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                         std::is_same_v<T, char32_t>) {
        return static_cast<std::make_unsigned_t<T>>(v);
    } else {
        return v;
    }
}

} // namespace detail

/**
 * @brief Check a candidate value against R's identifier
 *
 * bool and character identifiers compare by their unsigned value, so
 * char identifier 'A' matches 65.
 */
template<HasIdentifier R, typename V>
    requires std::is_integral_v<V> || std::is_enum_v<V>
constexpr bool matches_identifier(V value) noexcept {
    using id_type = identifier_type_t<R>;
    if constexpr (std::is_enum_v<V>) {
        if constexpr (std::is_same_v<V, id_type>) {
            return value == identifier_v<R>;
        } else {
            return false;
        }
    } else if constexpr (std::is_enum_v<id_type>) {
        return std::cmp_equal(detail::comparable_integer(value),
                              detail::comparable_integer(static_cast<std::underlying_type_t<id_type>>(identifier_v<R>)));
    } else {
        return std::cmp_equal(detail::comparable_integer(value), detail::comparable_integer(identifier_v<R>));
    }
}

} // namespace structwire::packet
