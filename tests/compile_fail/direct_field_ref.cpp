// Bypassing the declaration helpers still hits the field_ref checks.
#include <cstdint>
#include "structwire/packet/field.hpp"

using namespace structwire::packet;

int main() {
    uint64_t value = 0;
    field_ref<uint64_t, ByteOrder::None> f("value", value);
    return static_cast<int>(f.byte_len);
}
