#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace structwire::packet {

/**
 * @brief Base class of all packet errors
 */
class PacketError : public std::runtime_error {
public:
    explicit PacketError(const std::string& message)
        : std::runtime_error("PacketError: " + message) {}
};

/**
 * @brief Buffer shorter than the record's fixed byte length
 */
class BufferSizeError : public PacketError {
public:
    BufferSizeError(std::string_view operation, std::size_t required, std::size_t actual)
        : PacketError(std::string(operation) + " needs " + std::to_string(required) +
                      " bytes, buffer has " + std::to_string(actual)),
          required_(required), actual_(actual) {}

    std::size_t required() const noexcept { return required_; }
    std::size_t actual() const noexcept { return actual_; }

private:
    std::size_t required_;
    std::size_t actual_;
};

/**
 * @brief Field value error
 */
class InvalidFieldError : public PacketError {
public:
    explicit InvalidFieldError(const std::string& field_name, const std::string& reason)
        : PacketError("Invalid field '" + field_name + "': " + reason) {}

    explicit InvalidFieldError(const std::string& field_name, int64_t value)
        : PacketError("Invalid field '" + field_name + "' value: " + std::to_string(value)) {}
};

/**
 * @brief Log the contract violation and throw BufferSizeError
 */
[[noreturn]] void throw_buffer_size_error(std::string_view operation,
                                          std::size_t required,
                                          std::size_t actual);

} // namespace structwire::packet
