#include "binary_reader.hpp"
#include <algorithm>
#include "utf8.hpp"
#include "util/error.hpp"

namespace binio {

BinaryReader::BinaryReader(const uint8_t* data, size_t length)
    : data_(data)
    , length_(length)
    , cursor_(0) {
}

BinaryReader::BinaryReader(const std::vector<uint8_t>& data)
    : BinaryReader(data.data(), data.size()) {
}

void BinaryReader::require(size_t width, const char* op) const {
    if (cursor_ > length_ || width > length_ - cursor_) {
        throw OutOfBoundsError(op, cursor_, width, length_);
    }
}

template<typename T>
T BinaryReader::read_value(Endian endian, const char* op) {
    require(sizeof(T), op);
    T value = load<T>(data_ + cursor_, endian);
    cursor_ += sizeof(T);
    return value;
}

uint8_t BinaryReader::read_uint8() {
    return read_value<uint8_t>(Endian::Little, "read_uint8");
}

int8_t BinaryReader::read_int8() {
    return read_value<int8_t>(Endian::Little, "read_int8");
}

uint16_t BinaryReader::read_uint16_le() {
    return read_value<uint16_t>(Endian::Little, "read_uint16_le");
}

uint16_t BinaryReader::read_uint16_be() {
    return read_value<uint16_t>(Endian::Big, "read_uint16_be");
}

int16_t BinaryReader::read_int16_le() {
    return read_value<int16_t>(Endian::Little, "read_int16_le");
}

int16_t BinaryReader::read_int16_be() {
    return read_value<int16_t>(Endian::Big, "read_int16_be");
}

uint32_t BinaryReader::read_uint32_le() {
    return read_value<uint32_t>(Endian::Little, "read_uint32_le");
}

uint32_t BinaryReader::read_uint32_be() {
    return read_value<uint32_t>(Endian::Big, "read_uint32_be");
}

int32_t BinaryReader::read_int32_le() {
    return read_value<int32_t>(Endian::Little, "read_int32_le");
}

int32_t BinaryReader::read_int32_be() {
    return read_value<int32_t>(Endian::Big, "read_int32_be");
}

uint64_t BinaryReader::read_uint64_le() {
    return read_value<uint64_t>(Endian::Little, "read_uint64_le");
}

uint64_t BinaryReader::read_uint64_be() {
    return read_value<uint64_t>(Endian::Big, "read_uint64_be");
}

int64_t BinaryReader::read_int64_le() {
    return read_value<int64_t>(Endian::Little, "read_int64_le");
}

int64_t BinaryReader::read_int64_be() {
    return read_value<int64_t>(Endian::Big, "read_int64_be");
}

float BinaryReader::read_float32_le() {
    return read_value<float>(Endian::Little, "read_float32_le");
}

float BinaryReader::read_float32_be() {
    return read_value<float>(Endian::Big, "read_float32_be");
}

double BinaryReader::read_float64_le() {
    return read_value<double>(Endian::Little, "read_float64_le");
}

double BinaryReader::read_float64_be() {
    return read_value<double>(Endian::Big, "read_float64_be");
}

Value BinaryReader::read(Kind kind, Endian endian) {
    bool le = endian == Endian::Little;
    switch (kind) {
        case Kind::U8:  return read_uint8();
        case Kind::I8:  return read_int8();
        case Kind::U16: return le ? read_uint16_le() : read_uint16_be();
        case Kind::I16: return le ? read_int16_le() : read_int16_be();
        case Kind::U32: return le ? read_uint32_le() : read_uint32_be();
        case Kind::I32: return le ? read_int32_le() : read_int32_be();
        case Kind::U64: return le ? read_uint64_le() : read_uint64_be();
        case Kind::I64: return le ? read_int64_le() : read_int64_be();
        case Kind::F32: return le ? read_float32_le() : read_float32_be();
        case Kind::F64: return le ? read_float64_le() : read_float64_be();
    }
    throw UnknownKindError(static_cast<int>(kind));
}

std::string BinaryReader::read_string() {
    require(0, "read_string");
    const uint8_t* begin = data_ + cursor_;
    const uint8_t* end = data_ + length_;
    const uint8_t* terminator = std::find(begin, end, uint8_t{0});
    if (terminator == end) {
        throw OutOfBoundsError("read_string", length_, 1, length_);
    }

    std::string result = decode_utf8(begin, static_cast<size_t>(terminator - begin));
    cursor_ += static_cast<size_t>(terminator - begin) + 1;
    return result;
}

std::vector<uint8_t> BinaryReader::read_bytes(size_t length) {
    require(length, "read_bytes");
    std::vector<uint8_t> result(data_ + cursor_, data_ + cursor_ + length);
    cursor_ += length;
    return result;
}

std::string BinaryReader::read_chars(size_t length) {
    require(length, "read_chars");
    std::string result = decode_utf8(data_ + cursor_, length);
    cursor_ += length;
    return result;
}

std::vector<uint8_t> BinaryReader::read_to_end() {
    require(0, "read_to_end");
    std::vector<uint8_t> result(data_ + cursor_, data_ + length_);
    cursor_ = length_;
    return result;
}

} // namespace binio
