#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace binio {

// Thrown when a read needs bytes past the end of the source buffer.
class OutOfBoundsError : public std::out_of_range {
public:
    OutOfBoundsError(const std::string& op, size_t offset, size_t width, size_t length)
        : std::out_of_range(op + ": " + std::to_string(width) + " byte(s) at offset " +
                            std::to_string(offset) + " exceed buffer length " +
                            std::to_string(length))
        , offset_(offset)
        , width_(width)
        , length_(length) {
    }

    size_t offset() const { return offset_; }
    size_t width() const { return width_; }
    size_t length() const { return length_; }

private:
    size_t offset_;
    size_t width_;
    size_t length_;
};

// Thrown by the tag-dispatched read/write for a Kind outside the enumeration.
class UnknownKindError : public std::invalid_argument {
public:
    explicit UnknownKindError(int kind)
        : std::invalid_argument("Unknown kind: " + std::to_string(kind))
        , kind_(kind) {
    }

    int kind() const { return kind_; }

private:
    int kind_;
};

} // namespace binio
