#pragma once

#include <cstdint>

namespace structwire::packet {

/**
 * @brief Read 16-bit value in big-endian format
 * @param data Data pointer (at least 2 bytes)
 * @return 16-bit value
 */
uint16_t read_be16(const uint8_t* data) noexcept;

/**
 * @brief Read 32-bit value in big-endian format
 * @param data Data pointer (at least 4 bytes)
 * @return 32-bit value
 */
uint32_t read_be32(const uint8_t* data) noexcept;

/**
 * @brief Read 64-bit value in big-endian format
 * @param data Data pointer (at least 8 bytes)
 * @return 64-bit value
 */
uint64_t read_be64(const uint8_t* data) noexcept;

/**
 * @brief Read 16-bit value in little-endian format
 * @param data Data pointer (at least 2 bytes)
 * @return 16-bit value
 */
uint16_t read_le16(const uint8_t* data) noexcept;

/**
 * @brief Read 32-bit value in little-endian format
 * @param data Data pointer (at least 4 bytes)
 * @return 32-bit value
 */
uint32_t read_le32(const uint8_t* data) noexcept;

/**
 * @brief Read 64-bit value in little-endian format
 * @param data Data pointer (at least 8 bytes)
 * @return 64-bit value
 */
uint64_t read_le64(const uint8_t* data) noexcept;

/**
 * @brief Write 16-bit value in big-endian format
 * @param data Data pointer (at least 2 bytes)
 * @param value Value to write
 */
void write_be16(uint8_t* data, uint16_t value) noexcept;

/**
 * @brief Write 32-bit value in big-endian format
 * @param data Data pointer (at least 4 bytes)
 * @param value Value to write
 */
void write_be32(uint8_t* data, uint32_t value) noexcept;

/**
 * @brief Write 64-bit value in big-endian format
 * @param data Data pointer (at least 8 bytes)
 * @param value Value to write
 */
void write_be64(uint8_t* data, uint64_t value) noexcept;

/**
 * @brief Write 16-bit value in little-endian format
 * @param data Data pointer (at least 2 bytes)
 * @param value Value to write
 */
void write_le16(uint8_t* data, uint16_t value) noexcept;

/**
 * @brief Write 32-bit value in little-endian format
 * @param data Data pointer (at least 4 bytes)
 * @param value Value to write
 */
void write_le32(uint8_t* data, uint32_t value) noexcept;

/**
 * @brief Write 64-bit value in little-endian format
 * @param data Data pointer (at least 8 bytes)
 * @param value Value to write
 */
void write_le64(uint8_t* data, uint64_t value) noexcept;

} // namespace structwire::packet
