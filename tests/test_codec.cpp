#include <cassert>
#include <cstdint>
#include <span>
#include <vector>

#include "structwire/packet/json.hpp"
#include "structwire/packet/layout.hpp"
#include "structwire/packet/record.hpp"
#include "sample_records.hpp"

using namespace structwire;
using namespace structwire::packet;

int main() {
  samples::Frame f{};
  f.header.version = 1;
  f.header.ttl = 42;
  f.header.checksum = 47;
  f.sequence = 0x01020304;
  f.flags = std::byte{0x0F};
  f.urgent = true;
  f.status = samples::FrameStatus::Busy;

  std::vector<uint8_t> buf(byte_len_v<samples::Frame>);
  auto enc = try_encode(f, buf);
  assert(enc.has_value());
  assert(enc.value() == 16);

  auto bytes = encode_to_vector(f);
  assert(bytes.size() == byte_len<samples::Frame>());
  assert(bytes[0] == 7);
  // header: be u16, u8, le u32
  assert(bytes[1] == 0x00 && bytes[2] == 0x01 && bytes[3] == 0x2A && bytes[4] == 0x2F);
  // sequence is little-endian
  assert(bytes[8] == 0x04 && bytes[11] == 0x01);
  assert(bytes[12] == 0x0F);
  assert(bytes[13] == 1);
  assert(bytes[14] == 0x00 && bytes[15] == 0x01);

  auto dec = try_decode<samples::Frame>(bytes);
  assert(dec.has_value());
  assert(dec.value() == f);

  // truncated input
  auto bad = try_decode<samples::Frame>(std::span<const uint8_t>(bytes).first(15));
  assert(!bad);
  assert(bad.error() == StructwireErrc::buffer_too_small);

  // layout and JSON agree with the codec
  auto layout = describe_layout<samples::Frame>("frame");
  assert(layout.get_packet_size() == bytes.size());
  assert(layout.get_field_value("header.ttl", bytes) == 42);
  assert(record_from_json<samples::Frame>(record_to_json(f)) == f);
  return 0;
}
