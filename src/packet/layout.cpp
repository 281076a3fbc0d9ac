#include "structwire/packet/layout.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace structwire::packet {

namespace {

const FieldDefinition* find_in(const std::vector<FieldDefinition>& fields, std::string_view path) {
    auto dot = path.find('.');
    auto head = path.substr(0, dot);
    auto it = std::find_if(fields.begin(), fields.end(),
                           [head](const FieldDefinition& f) { return f.name == head; });
    if (it == fields.end()) {
        return nullptr;
    }
    if (dot == std::string_view::npos) {
        return &*it;
    }
    return find_in(it->children, path.substr(dot + 1));
}

void append_rows(std::ostringstream& os, const std::vector<FieldDefinition>& fields, const std::string& prefix) {
    for (const auto& f : fields) {
        const std::string full_name = prefix.empty() ? f.name : prefix + "." + f.name;
        os << std::setw(8) << f.byte_offset
           << std::setw(8) << f.byte_length << "  "
           << std::left << std::setw(7) << packet::to_string(f.byte_order)
           << std::setw(8) << packet::to_string(f.type)
           << full_name << std::right << '\n';
        append_rows(os, f.children, full_name);
    }
}

nlohmann::json field_to_json(const FieldDefinition& f) {
    nlohmann::json j = {
        {"name", f.name},
        {"offset", f.byte_offset},
        {"length", f.byte_length},
        {"order", std::string(packet::to_string(f.byte_order))},
        {"type", std::string(packet::to_string(f.type))},
    };
    if (f.is_record()) {
        auto children = nlohmann::json::array();
        for (const auto& c : f.children) {
            children.push_back(field_to_json(c));
        }
        j["fields"] = std::move(children);
    }
    return j;
}

} // namespace

std::string_view to_string(FieldDefinition::FieldType type) noexcept {
    switch (type) {
        case FieldDefinition::FieldType::UInt: return "uint";
        case FieldDefinition::FieldType::Int: return "int";
        case FieldDefinition::FieldType::Bool: return "bool";
        case FieldDefinition::FieldType::Byte: return "byte";
        case FieldDefinition::FieldType::Enum: return "enum";
        case FieldDefinition::FieldType::Record: return "record";
    }
    return "unknown";
}

void RecordLayout::add_field(const FieldDefinition& field) {
    fields_.push_back(field);

    // Update packet size
    packet_size_ = std::max(packet_size_, field.byte_offset + field.byte_length);
}

const FieldDefinition* RecordLayout::get_field_definition(const std::string& field_name) const {
    return find_in(fields_, field_name);
}

uint64_t RecordLayout::get_field_value(const std::string& field_name, std::span<const uint8_t> data) const {
    const FieldDefinition* field = get_field_definition(field_name);
    if (field == nullptr) {
        throw InvalidFieldError(field_name, "Field not found");
    }
    if (field->is_record()) {
        throw InvalidFieldError(field_name, "Nested record has no scalar value");
    }
    if (data.size() < packet_size_) {
        throw_buffer_size_error("get_field_value", packet_size_, data.size());
    }

    const auto bytes = data.subspan(field->byte_offset, field->byte_length);
    uint64_t value = 0;
    if (field->byte_order == ByteOrder::Big) {
        for (uint8_t b : bytes) {
            value = (value << 8) | b;
        }
    } else {
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            value = (value << 8) | *it;
        }
    }
    return value;
}

std::string RecordLayout::to_string() const {
    std::ostringstream os;
    os << (name_.empty() ? "record" : name_) << ": " << packet_size_ << " bytes, "
       << fields_.size() << " fields\n";
    os << "  offset  length  order  type    name\n";
    append_rows(os, fields_, "");
    return os.str();
}

nlohmann::json RecordLayout::to_json() const {
    auto fields = nlohmann::json::array();
    for (const auto& f : fields_) {
        fields.push_back(field_to_json(f));
    }
    return {
        {"name", name_},
        {"size", packet_size_},
        {"fields", std::move(fields)},
    };
}

} // namespace structwire::packet
