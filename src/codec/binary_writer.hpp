#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "byte_order.hpp"
#include "config/codec_config.hpp"

namespace binio {

// Sequential encoder into an owned, zero-filled, growable buffer.
//
// Writes land at cursor() and advance it; length() is the high-water mark
// of everything written and is what get_buffer() exports. The cursor may be
// seeked past length() to leave zero-filled gaps. Storage grows on demand
// (see WriterConfig) so a write never fails for lack of capacity.
//
// Not thread-safe: share an instance only under external synchronization.
class BinaryWriter {
public:
    explicit BinaryWriter(size_t initial_capacity = WriterConfig{}.initial_capacity);
    explicit BinaryWriter(const WriterConfig& config);

    size_t cursor() const { return cursor_; }
    size_t length() const { return max_cursor_; }
    size_t capacity() const { return buffer_.size(); }

    // Capacity is extended to cover offset; length() is unchanged.
    void seek(size_t offset);

    void write_uint8(uint8_t value);
    void write_int8(int8_t value);

    void write_uint16_le(uint16_t value);
    void write_uint16_be(uint16_t value);
    void write_int16_le(int16_t value);
    void write_int16_be(int16_t value);

    void write_uint32_le(uint32_t value);
    void write_uint32_be(uint32_t value);
    void write_int32_le(int32_t value);
    void write_int32_be(int32_t value);

    void write_uint64_le(uint64_t value);
    void write_uint64_be(uint64_t value);
    void write_int64_le(int64_t value);
    void write_int64_be(int64_t value);

    void write_float32_le(float value);
    void write_float32_be(float value);
    void write_float64_le(double value);
    void write_float64_be(double value);

    // Big-endian, unlike write(value, kind) which defaults to little-endian
    void write_float32(float value) { write_float32_be(value); }
    void write_float64(double value) { write_float64_be(value); }

    // Converts the held number to kind, then encodes it.
    void write(const Value& value, Kind kind, Endian endian = Endian::Little);

    // UTF-8 bytes of value followed by a single zero byte
    void write_string(const std::string& value);

    void write_bytes(const uint8_t* data, size_t length);
    void write_bytes(const std::vector<uint8_t>& data);

    // UTF-8 bytes of value, no terminator
    void write_chars(const std::string& value);

    // Copy of the first length() bytes
    std::vector<uint8_t> get_buffer() const;

    // Grows capacity to exactly size when smaller. Returns the capacity.
    size_t ensure_size(size_t size);

private:
    template<typename T>
    void write_value(T value, Endian endian);

    void pre_write(size_t size);
    // Grows capacity so that [offset, offset + size) is addressable
    void reserve(size_t offset, size_t size);
    void post_write(size_t size);
    void extend_buffer(size_t capacity);

    WriterConfig config_;
    std::vector<uint8_t> buffer_;
    size_t cursor_{0};
    size_t max_cursor_{0};
};

} // namespace binio
