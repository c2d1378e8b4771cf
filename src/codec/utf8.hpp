#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace binio {

// Decodes UTF-8 bytes into a well-formed UTF-8 string. A leading byte order
// mark is dropped and every malformed subsequence becomes U+FFFD, the same
// output a WHATWG TextDecoder("utf-8") produces.
std::string decode_utf8(const uint8_t* data, size_t length);

inline std::string decode_utf8(const std::vector<uint8_t>& bytes) {
    return decode_utf8(bytes.data(), bytes.size());
}

// Raw bytes of text, written as-is (text is expected to be UTF-8 already)
inline const uint8_t* utf8_bytes(const std::string& text) {
    return reinterpret_cast<const uint8_t*>(text.data());
}

} // namespace binio
