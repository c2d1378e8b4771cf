#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "byte_order.hpp"

namespace binio {

// Sequential decoder over a caller-owned buffer. The buffer is neither
// copied nor modified and must outlive the reader. Every read consumes its
// exact width at cursor() and advances past it; a read that would run past
// the end throws OutOfBoundsError and leaves the cursor where it was.
//
// Not thread-safe: share an instance only under external synchronization.
class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t length);
    explicit BinaryReader(const std::vector<uint8_t>& data);
    // The reader does not own its source; a temporary would dangle
    BinaryReader(std::vector<uint8_t>&&) = delete;

    size_t cursor() const { return cursor_; }
    size_t length() const { return length_; }
    bool has_more_data() const { return cursor_ < length_; }

    // No bounds check here; the next read validates the offset.
    void seek(size_t offset) { cursor_ = offset; }

    uint8_t read_uint8();
    int8_t read_int8();

    uint16_t read_uint16_le();
    uint16_t read_uint16_be();
    int16_t read_int16_le();
    int16_t read_int16_be();

    uint32_t read_uint32_le();
    uint32_t read_uint32_be();
    int32_t read_int32_le();
    int32_t read_int32_be();

    uint64_t read_uint64_le();
    uint64_t read_uint64_be();
    int64_t read_int64_le();
    int64_t read_int64_be();

    float read_float32_le();
    float read_float32_be();
    double read_float64_le();
    double read_float64_be();

    // Big-endian, unlike read(kind) which defaults to little-endian
    float read_float32() { return read_float32_be(); }
    double read_float64() { return read_float64_be(); }

    // Tag-dispatched read. The returned Value holds the alternative for kind.
    Value read(Kind kind, Endian endian = Endian::Little);

    // Zero-terminated UTF-8 string; the terminator is consumed, not returned.
    std::string read_string();

    std::vector<uint8_t> read_bytes(size_t length);

    // length bytes decoded as UTF-8, no terminator expected
    std::string read_chars(size_t length);

    std::vector<uint8_t> read_to_end();

private:
    template<typename T>
    T read_value(Endian endian, const char* op);

    void require(size_t width, const char* op) const;

    const uint8_t* data_;
    size_t length_;
    size_t cursor_;
};

} // namespace binio
