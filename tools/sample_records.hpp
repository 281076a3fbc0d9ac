#pragma once

#include <cstddef>
#include <cstdint>
#include <tuple>

#include "structwire/packet/field.hpp"

namespace structwire::samples {

using packet::be;
using packet::field;
using packet::le;

// 7 bytes: be u16, u8, le u32
struct Packet {
  uint16_t version = 0;
  uint8_t ttl = 0;
  uint32_t checksum = 0;

  auto fields() const { return std::make_tuple(be("version", version), field("ttl", ttl), le("checksum", checksum)); }
  auto fields() { return std::make_tuple(be("version", version), field("ttl", ttl), le("checksum", checksum)); }

  bool operator==(const Packet&) const = default;
};

// Every integer width in both byte orders, 58 bytes
struct Integers {
  static constexpr uint8_t identifier = 42;

  uint8_t u8_0 = 0;
  int8_t i8_0 = 0;
  uint16_t u16_0 = 0;
  int16_t i16_0 = 0;
  uint16_t u16_1 = 0;
  int16_t i16_1 = 0;
  uint32_t u32_0 = 0;
  int32_t i32_0 = 0;
  uint32_t u32_1 = 0;
  int32_t i32_1 = 0;
  uint64_t u64_0 = 0;
  int64_t i64_0 = 0;
  uint64_t u64_1 = 0;
  int64_t i64_1 = 0;

  template<typename Self>
  static auto describe(Self& s) {
    return std::make_tuple(
        field("u8_0", s.u8_0), field("i8_0", s.i8_0),
        be("u16_0", s.u16_0), be("i16_0", s.i16_0),
        le("u16_1", s.u16_1), le("i16_1", s.i16_1),
        be("u32_0", s.u32_0), be("i32_0", s.i32_0),
        le("u32_1", s.u32_1), le("i32_1", s.i32_1),
        be("u64_0", s.u64_0), be("i64_0", s.i64_0),
        le("u64_1", s.u64_1), le("i64_1", s.i64_1));
  }
  auto fields() const { return describe(*this); }
  auto fields() { return describe(*this); }

  bool operator==(const Integers&) const = default;
};

enum class FrameStatus : uint16_t {
  Idle = 0,
  Busy = 1,
  Fault = 0x8001
};

// Nested record: the kind byte carries the identifier
struct Frame {
  static constexpr uint8_t identifier = 7;

  uint8_t kind = identifier;
  Packet header;
  uint32_t sequence = 0;
  std::byte flags{0};
  bool urgent = false;
  FrameStatus status = FrameStatus::Idle;

  template<typename Self>
  static auto describe(Self& s) {
    return std::make_tuple(field("kind", s.kind), field("header", s.header), le("sequence", s.sequence),
                           field("flags", s.flags), field("urgent", s.urgent), be("status", s.status));
  }
  auto fields() const { return describe(*this); }
  auto fields() { return describe(*this); }

  bool operator==(const Frame&) const = default;
};

} // namespace structwire::samples
