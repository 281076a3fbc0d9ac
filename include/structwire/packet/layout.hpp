#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "structwire/packet/exceptions.hpp"
#include "structwire/packet/field.hpp"
#include "structwire/packet/record.hpp"

namespace structwire::packet {

/**
 * @brief Field definition
 */
struct FieldDefinition {
    enum class FieldType {
        UInt,
        Int,
        Bool,
        Byte,
        Enum,
        Record
    };

    std::string name;
    std::size_t byte_offset = 0;   // from the start of the outermost record
    std::size_t byte_length = 0;
    ByteOrder byte_order = ByteOrder::None;
    FieldType type = FieldType::UInt;
    std::vector<FieldDefinition> children;

    bool is_record() const noexcept { return type == FieldType::Record; }
};

std::string_view to_string(FieldDefinition::FieldType type) noexcept;

/**
 * @brief Runtime description of a record's wire layout
 */
class RecordLayout {
public:
    RecordLayout() = default;
    explicit RecordLayout(std::string name) : name_(std::move(name)) {}

    /**
     * @brief Append a field definition
     * @param field Field definition
     */
    void add_field(const FieldDefinition& field);

    /**
     * @brief Look up a field definition
     * @param field_name Field name; "outer.inner" reaches nested record fields
     * @return Field definition (nullptr if not found)
     */
    const FieldDefinition* get_field_definition(const std::string& field_name) const;

    /**
     * @brief Read the raw value of a primitive field from an encoded buffer
     * @param field_name Field name (dotted path allowed)
     * @param data Encoded record
     * @return Field bits zero-extended to 64 bits
     * @throws InvalidFieldError if the field is unknown or is a nested record
     * @throws BufferSizeError if data is shorter than the record
     */
    uint64_t get_field_value(const std::string& field_name, std::span<const uint8_t> data) const;

    /**
     * @brief Packet size in bytes
     */
    std::size_t get_packet_size() const { return packet_size_; }

    const std::vector<FieldDefinition>& fields() const { return fields_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Human readable table, one line per field
     */
    std::string to_string() const;

    nlohmann::json to_json() const;

private:
    std::string name_;
    std::vector<FieldDefinition> fields_;
    std::size_t packet_size_ = 0;
};

namespace detail {

template<typename T>
constexpr FieldDefinition::FieldType field_type_of() noexcept {
    if constexpr (Record<T>) {
        return FieldDefinition::FieldType::Record;
    } else if constexpr (std::is_same_v<T, bool>) {
        return FieldDefinition::FieldType::Bool;
    } else if constexpr (std::is_same_v<T, std::byte>) {
        return FieldDefinition::FieldType::Byte;
    } else if constexpr (std::is_enum_v<T>) {
        return FieldDefinition::FieldType::Enum;
    } else if constexpr (std::is_signed_v<T>) {
        return FieldDefinition::FieldType::Int;
    } else {
        return FieldDefinition::FieldType::UInt;
    }
}

template<Record R>
std::vector<FieldDefinition> describe_fields(const R& value, std::size_t base);

template<typename F>
FieldDefinition describe_field(const F& f, std::size_t index, std::size_t offset) {
    using value_type = typename F::value_type;
    FieldDefinition def;
    def.name = field_key(f.name(), index);
    def.byte_offset = offset;
    def.byte_length = F::byte_len;
    def.byte_order = F::byte_order;
    def.type = field_type_of<value_type>();
    if constexpr (F::is_record) {
        def.children = describe_fields(f.value(), offset);
    }
    return def;
}

template<Record R, std::size_t... I>
std::vector<FieldDefinition> describe_fields(const R& value, std::size_t base, std::index_sequence<I...>) {
    [[maybe_unused]] const auto fields = value.fields();
    return {describe_field(std::get<I>(fields), I, base + field_offsets_v<R>[I])...};
}

template<Record R>
std::vector<FieldDefinition> describe_fields(const R& value, std::size_t base) {
    return describe_fields(value, base, std::make_index_sequence<field_count_v<R>>{});
}

} // namespace detail

/**
 * @brief Build the layout of record type R
 * @param name Layout name shown by to_string()/to_json()
 *
 * Offsets and sizes agree with field_offsets_v<R> and byte_len_v<R>.
 */
template<Record R>
RecordLayout describe_layout(std::string name = {}) {
    const R blank{};
    RecordLayout layout(std::move(name));
    for (const auto& def : detail::describe_fields(blank, 0)) {
        layout.add_field(def);
    }
    return layout;
}

} // namespace structwire::packet
