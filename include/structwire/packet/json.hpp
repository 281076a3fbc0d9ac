#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "structwire/packet/exceptions.hpp"
#include "structwire/packet/field.hpp"
#include "structwire/packet/record.hpp"

namespace structwire::packet {

// JSON view of a record: one member per field, keyed by field name (or by
// position for nameless fields). Nested records become nested objects;
// enumerations and std::byte appear as their integer value.

namespace detail {

template<WirePrimitive T>
nlohmann::json primitive_to_json(T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value;
    } else if constexpr (std::is_same_v<T, std::byte>) {
        return std::to_integer<uint64_t>(value);
    } else if constexpr (std::is_enum_v<T>) {
        return primitive_to_json(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (std::is_signed_v<T>) {
        return static_cast<int64_t>(value);
    } else {
        return static_cast<uint64_t>(value);
    }
}

template<WireInteger T>
T integer_from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_number_integer()) {
        throw InvalidFieldError(path, "expected an integer");
    }
    if (j.is_number_unsigned()) {
        const auto v = j.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw InvalidFieldError(path, "value " + std::to_string(v) + " out of range");
        }
        return static_cast<T>(v);
    }
    const auto v = j.get<int64_t>();
    if constexpr (std::is_signed_v<T>) {
        if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
            v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
            throw InvalidFieldError(path, v);
        }
    } else {
        if (v < 0 || static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw InvalidFieldError(path, v);
        }
    }
    return static_cast<T>(v);
}

template<WirePrimitive T>
T primitive_from_json(const nlohmann::json& j, const std::string& path) {
    if constexpr (std::is_same_v<T, bool>) {
        if (!j.is_boolean()) {
            throw InvalidFieldError(path, "expected a boolean");
        }
        return j.get<bool>();
    } else if constexpr (std::is_same_v<T, std::byte>) {
        return std::byte{integer_from_json<uint8_t>(j, path)};
    } else if constexpr (std::is_enum_v<T>) {
        return static_cast<T>(integer_from_json<std::underlying_type_t<T>>(j, path));
    } else {
        return integer_from_json<T>(j, path);
    }
}

template<Record R>
nlohmann::json to_json_object(const R& value);

template<Record R>
void from_json_object(R& value, const nlohmann::json& j, const std::string& path);

template<Record R, std::size_t... I>
nlohmann::json to_json_fields(const R& value, std::index_sequence<I...>) {
    auto j = nlohmann::json::object();
    [[maybe_unused]] const auto fields = value.fields();
    auto put = [&j](const auto& f, std::size_t index) {
        using F = std::remove_cvref_t<decltype(f)>;
        if constexpr (F::is_record) {
            j[field_key(f.name(), index)] = to_json_object(f.value());
        } else {
            j[field_key(f.name(), index)] = primitive_to_json(f.value());
        }
    };
    (put(std::get<I>(fields), I), ...);
    return j;
}

template<Record R, std::size_t... I>
void from_json_fields(R& value, const nlohmann::json& j, const std::string& path, std::index_sequence<I...>) {
    [[maybe_unused]] const auto fields = value.fields();
    auto get = [&j, &path](const auto& f, std::size_t index) {
        using F = std::remove_cvref_t<decltype(f)>;
        const std::string key = field_key(f.name(), index);
        const std::string field_path = path.empty() ? key : path + "." + key;
        auto it = j.find(key);
        if (it == j.end()) {
            throw InvalidFieldError(field_path, "missing");
        }
        if constexpr (F::is_record) {
            from_json_object(f.value(), *it, field_path);
        } else {
            f.value() = primitive_from_json<typename F::value_type>(*it, field_path);
        }
    };
    (get(std::get<I>(fields), I), ...);
}

template<Record R>
nlohmann::json to_json_object(const R& value) {
    return to_json_fields(value, std::make_index_sequence<field_count_v<R>>{});
}

template<Record R>
void from_json_object(R& value, const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        throw InvalidFieldError(path.empty() ? std::string("<root>") : path, "expected an object");
    }
    from_json_fields(value, j, path, std::make_index_sequence<field_count_v<R>>{});
}

} // namespace detail

/**
 * @brief Convert a record to a JSON object
 */
template<Record R>
nlohmann::json record_to_json(const R& value) {
    return detail::to_json_object(value);
}

/**
 * @brief Build a record from a JSON object
 * @param j JSON object with one member per field
 * @return Record
 * @throws InvalidFieldError if a field is missing, has the wrong type, or is out of range
 */
template<Record R>
R record_from_json(const nlohmann::json& j) {
    R value{};
    detail::from_json_object(value, j, "");
    return value;
}

} // namespace structwire::packet
