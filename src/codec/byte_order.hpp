#pragma once
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <type_traits>
#include <variant>

namespace binio {

enum class Endian {
    Little,
    Big
};

enum class Kind {
    U8,
    I8,
    U16,
    I16,
    U32,
    I32,
    U64,
    I64,
    F32,
    F64
};

// Alternative index matches the Kind ordinal
using Value = std::variant<uint8_t, int8_t, uint16_t, int16_t, uint32_t, int32_t,
                           uint64_t, int64_t, float, double>;

// Encoded width in bytes, 0 for an unknown kind
size_t kind_width(Kind kind);
const char* kind_name(Kind kind);

inline Kind kind_of(const Value& value) {
    return static_cast<Kind>(value.index());
}

namespace detail {

template<size_t N> struct UIntOfSize;
template<> struct UIntOfSize<1> { using type = uint8_t; };
template<> struct UIntOfSize<2> { using type = uint16_t; };
template<> struct UIntOfSize<4> { using type = uint32_t; };
template<> struct UIntOfSize<8> { using type = uint64_t; };

// Byte i of the encoding, counted from the start of the buffer
template<typename Bits>
uint8_t byte_at(Bits bits, size_t i, Endian endian) {
    size_t shift = endian == Endian::Little ? i : sizeof(Bits) - 1 - i;
    return static_cast<uint8_t>(bits >> (shift * 8));
}

template<typename Bits>
Bits place_byte(uint8_t byte, size_t i, Endian endian) {
    size_t shift = endian == Endian::Little ? i : sizeof(Bits) - 1 - i;
    return static_cast<Bits>(static_cast<Bits>(byte) << (shift * 8));
}

} // namespace detail

// Encodes value at dst in the given byte order. T is any integer or IEEE-754
// float type; signed and float values are stored by bit pattern.
template<typename T>
void store(uint8_t* dst, T value, Endian endian) {
    static_assert(std::is_arithmetic<T>::value, "store requires an arithmetic type");
    using Bits = typename detail::UIntOfSize<sizeof(T)>::type;
    Bits bits;
    std::memcpy(&bits, &value, sizeof(T));
    for (size_t i = 0; i < sizeof(T); ++i) {
        dst[i] = detail::byte_at(bits, i, endian);
    }
}

template<typename T>
T load(const uint8_t* src, Endian endian) {
    static_assert(std::is_arithmetic<T>::value, "load requires an arithmetic type");
    using Bits = typename detail::UIntOfSize<sizeof(T)>::type;
    Bits bits = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        bits |= detail::place_byte<Bits>(src[i], i, endian);
    }
    T value;
    std::memcpy(&value, &bits, sizeof(T));
    return value;
}

} // namespace binio
