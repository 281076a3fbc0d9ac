#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <tuple>
#include "structwire/packet/field.hpp"
#include "structwire/packet/record.hpp"

using namespace structwire::packet;

namespace {

struct Inner {
    uint8_t a = 0;

    auto fields() const { return std::make_tuple(field("a", a)); }
    auto fields() { return std::make_tuple(field("a", a)); }
};

// fields() const and fields() disagree on the second field
struct Skewed {
    uint8_t a = 0;
    uint64_t b = 0;

    auto fields() const { return std::make_tuple(field("a", a)); }
    auto fields() { return std::make_tuple(field("a", a), be("b", b)); }
};

struct SwappedOrder {
    uint16_t v = 0;

    auto fields() const { return std::make_tuple(be("v", v)); }
    auto fields() { return std::make_tuple(le("v", v)); }
};

enum class Small : uint8_t { A };
enum class Wide : uint32_t { A };

// Whether a declaration helper accepts a member of type T
template<typename T>
concept CanDeclareUnordered = requires(T& v) { field("x", v); };

template<typename T>
concept CanDeclareBigEndian = requires(T& v) { be("x", v); };

template<typename T>
concept CanDeclareLittleEndian = requires(T& v) { le("x", v); };

} // namespace

TEST(FieldValidationTest, MultiBytePrimitivesNeedAnOrder) {
    static_assert(!CanDeclareUnordered<uint16_t>);
    static_assert(!CanDeclareUnordered<int32_t>);
    static_assert(!CanDeclareUnordered<uint64_t>);
    static_assert(!CanDeclareUnordered<Wide>);
    static_assert(CanDeclareBigEndian<uint16_t>);
    static_assert(CanDeclareLittleEndian<int64_t>);
    static_assert(CanDeclareBigEndian<const uint32_t>);
    static_assert(CanDeclareLittleEndian<Wide>);
    SUCCEED();
}

TEST(FieldValidationTest, SingleBytePrimitivesRejectAnOrder) {
    static_assert(CanDeclareUnordered<uint8_t>);
    static_assert(CanDeclareUnordered<int8_t>);
    static_assert(CanDeclareUnordered<bool>);
    static_assert(CanDeclareUnordered<std::byte>);
    static_assert(CanDeclareUnordered<Small>);
    static_assert(!CanDeclareBigEndian<uint8_t>);
    static_assert(!CanDeclareLittleEndian<int8_t>);
    static_assert(!CanDeclareBigEndian<bool>);
    static_assert(!CanDeclareLittleEndian<Small>);
    SUCCEED();
}

TEST(FieldValidationTest, NestedRecordsRejectAnOrder) {
    static_assert(Record<Inner>);
    static_assert(CanDeclareUnordered<Inner>);
    static_assert(CanDeclareUnordered<const Inner>);
    static_assert(!CanDeclareBigEndian<Inner>);
    static_assert(!CanDeclareLittleEndian<Inner>);
    SUCCEED();
}

TEST(FieldValidationTest, TypesWithoutWireFormAreRejected) {
    struct NotARecord { int x; };
    static_assert(!Record<NotARecord>);
    static_assert(!CanDeclareUnordered<NotARecord>);
    static_assert(!CanDeclareBigEndian<float>);
    static_assert(!CanDeclareUnordered<double>);
    static_assert(!CanDeclareLittleEndian<int*>);
    SUCCEED();
}

TEST(FieldValidationTest, FieldListsMustAgree) {
    static_assert(fields_agree_v<Inner>);
    static_assert(Record<Skewed>);
    static_assert(!fields_agree_v<Skewed>);
    static_assert(!fields_agree_v<SwappedOrder>);
    static_assert(same_field_layout<std::tuple<>, std::tuple<>>::value);
    SUCCEED();
}

TEST(FieldValidationTest, ValidFieldPredicate) {
    static_assert(valid_field_v<uint8_t, ByteOrder::None>);
    static_assert(!valid_field_v<uint8_t, ByteOrder::Big>);
    static_assert(valid_field_v<uint16_t, ByteOrder::Little>);
    static_assert(!valid_field_v<uint16_t, ByteOrder::None>);
    static_assert(valid_field_v<Inner, ByteOrder::None>);
    static_assert(!valid_field_v<Inner, ByteOrder::Little>);
    SUCCEED();
}

TEST(FieldValidationTest, FieldRefCarriesStaticMetadata) {
    uint32_t value = 7;
    auto f = le("value", value);
    using F = decltype(f);
    static_assert(F::byte_order == ByteOrder::Little);
    static_assert(F::byte_len == 4);
    static_assert(!F::is_record);

    Inner inner;
    auto g = field(inner);
    static_assert(decltype(g)::is_record);
    static_assert(decltype(g)::byte_len == 1);

    EXPECT_STREQ(f.name(), "value");
    EXPECT_STREQ(g.name(), "");
    f.value() = 9;
    EXPECT_EQ(value, 9u);
    EXPECT_EQ(field_key(g.name(), 3), "3");
    EXPECT_EQ(field_key(f.name(), 3), "value");
}
