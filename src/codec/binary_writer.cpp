#include "binary_writer.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include "utf8.hpp"
#include "util/error.hpp"
#include "util/logger.hpp"

namespace binio {

namespace {

WriterConfig config_with_capacity(size_t initial_capacity) {
    WriterConfig config;
    config.initial_capacity = initial_capacity;
    return config;
}

// Integer targets take the truncated value modulo 2^width, with NaN and
// infinity mapped to 0. Doubles beyond the float range become infinity.
template<typename T, typename From>
T convert_number(From held) {
    if constexpr (std::is_floating_point<From>::value && std::is_integral<T>::value) {
        if (!std::isfinite(held)) {
            return 0;
        }
        const double two_pow_64 = 18446744073709551616.0;
        double truncated = std::trunc(static_cast<double>(held));
        uint64_t magnitude = static_cast<uint64_t>(std::fmod(std::fabs(truncated), two_pow_64));
        uint64_t wrapped = truncated < 0 ? uint64_t{0} - magnitude : magnitude;
        return static_cast<T>(wrapped);
    } else if constexpr (std::is_same<T, float>::value && std::is_same<From, double>::value) {
        if (std::fabs(held) > std::numeric_limits<float>::max()) {
            float infinity = std::numeric_limits<float>::infinity();
            return held > 0 ? infinity : -infinity;
        }
        return static_cast<float>(held);
    } else {
        return static_cast<T>(held);
    }
}

template<typename T>
T convert(const Value& value) {
    return std::visit([](auto held) { return convert_number<T>(held); }, value);
}

} // namespace

BinaryWriter::BinaryWriter(size_t initial_capacity)
    : BinaryWriter(config_with_capacity(initial_capacity)) {
}

BinaryWriter::BinaryWriter(const WriterConfig& config)
    : config_(config)
    , buffer_(config.initial_capacity, 0) {
}

void BinaryWriter::seek(size_t offset) {
    reserve(offset, 0);
    cursor_ = offset;
}

template<typename T>
void BinaryWriter::write_value(T value, Endian endian) {
    pre_write(sizeof(T));
    store<T>(buffer_.data() + cursor_, value, endian);
    post_write(sizeof(T));
}

void BinaryWriter::write_uint8(uint8_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_int8(int8_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_uint16_le(uint16_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_uint16_be(uint16_t value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_int16_le(int16_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_int16_be(int16_t value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_uint32_le(uint32_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_uint32_be(uint32_t value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_int32_le(int32_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_int32_be(int32_t value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_uint64_le(uint64_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_uint64_be(uint64_t value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_int64_le(int64_t value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_int64_be(int64_t value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_float32_le(float value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_float32_be(float value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write_float64_le(double value) {
    write_value(value, Endian::Little);
}

void BinaryWriter::write_float64_be(double value) {
    write_value(value, Endian::Big);
}

void BinaryWriter::write(const Value& value, Kind kind, Endian endian) {
    switch (kind) {
        case Kind::U8:  write_value(convert<uint8_t>(value), endian); return;
        case Kind::I8:  write_value(convert<int8_t>(value), endian); return;
        case Kind::U16: write_value(convert<uint16_t>(value), endian); return;
        case Kind::I16: write_value(convert<int16_t>(value), endian); return;
        case Kind::U32: write_value(convert<uint32_t>(value), endian); return;
        case Kind::I32: write_value(convert<int32_t>(value), endian); return;
        case Kind::U64: write_value(convert<uint64_t>(value), endian); return;
        case Kind::I64: write_value(convert<int64_t>(value), endian); return;
        case Kind::F32: write_value(convert<float>(value), endian); return;
        case Kind::F64: write_value(convert<double>(value), endian); return;
    }
    throw UnknownKindError(static_cast<int>(kind));
}

void BinaryWriter::write_string(const std::string& value) {
    pre_write(value.size() + 1);
    std::memcpy(buffer_.data() + cursor_, utf8_bytes(value), value.size());
    buffer_[cursor_ + value.size()] = 0;
    post_write(value.size() + 1);
}

void BinaryWriter::write_bytes(const uint8_t* data, size_t length) {
    pre_write(length);
    if (length > 0) {
        std::memcpy(buffer_.data() + cursor_, data, length);
    }
    post_write(length);
}

void BinaryWriter::write_bytes(const std::vector<uint8_t>& data) {
    write_bytes(data.data(), data.size());
}

void BinaryWriter::write_chars(const std::string& value) {
    write_bytes(utf8_bytes(value), value.size());
}

std::vector<uint8_t> BinaryWriter::get_buffer() const {
    return std::vector<uint8_t>(buffer_.begin(), buffer_.begin() + max_cursor_);
}

size_t BinaryWriter::ensure_size(size_t size) {
    if (buffer_.size() < size) {
        extend_buffer(size);
    }
    return buffer_.size();
}

void BinaryWriter::pre_write(size_t size) {
    reserve(cursor_, size);
}

void BinaryWriter::reserve(size_t offset, size_t size) {
    if (size > std::numeric_limits<size_t>::max() - offset) {
        throw std::length_error("BinaryWriter: write of " + std::to_string(size) +
                                " byte(s) at offset " + std::to_string(offset) +
                                " overflows size_t");
    }

    size_t required = offset + size;
    size_t current = buffer_.size();
    if (required <= current) {
        return;
    }

    size_t new_capacity;
    if (current >= config_.linear_growth_threshold) {
        new_capacity = current + config_.linear_growth_step;
    } else {
        new_capacity = current * 2;
    }
    if (new_capacity < required) {
        new_capacity = required;
    }

    extend_buffer(new_capacity);
}

void BinaryWriter::post_write(size_t size) {
    cursor_ += size;
    max_cursor_ = std::max(max_cursor_, cursor_);
}

void BinaryWriter::extend_buffer(size_t capacity) {
    if (Logger::instance().is_enabled(LogLevel::DEBUG)) {
        BINIO_LOG_DEBUG("Growing writer buffer from {} to {} bytes", buffer_.size(), capacity);
    }
    // resize() value-initializes the new tail, so it stays zero-filled
    buffer_.resize(capacity);
}

} // namespace binio
