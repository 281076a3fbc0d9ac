// A single-byte field declared with a byte order must not compile.
#include <cstdint>
#include <tuple>
#include "structwire/packet/record.hpp"

using namespace structwire::packet;

struct Bad {
    uint8_t value = 0;

    auto fields() const { return std::make_tuple(be("value", value)); }
    auto fields() { return std::make_tuple(be("value", value)); }
};

int main() {
    return static_cast<int>(byte_len_v<Bad>);
}
