#include "utf8.hpp"

namespace binio {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

void append_code_point(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

std::string decode_utf8(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(length);

    size_t pos = 0;
    if (length >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        pos = 3;
    }

    uint32_t code_point = 0;
    int bytes_needed = 0;
    int bytes_seen = 0;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;

    while (pos < length) {
        uint8_t byte = data[pos];

        if (bytes_needed == 0) {
            ++pos;
            if (byte <= 0x7F) {
                out.push_back(static_cast<char>(byte));
            } else if (byte >= 0xC2 && byte <= 0xDF) {
                bytes_needed = 1;
                code_point = byte & 0x1F;
            } else if (byte >= 0xE0 && byte <= 0xEF) {
                if (byte == 0xE0) lower = 0xA0;
                if (byte == 0xED) upper = 0x9F;
                bytes_needed = 2;
                code_point = byte & 0x0F;
            } else if (byte >= 0xF0 && byte <= 0xF4) {
                if (byte == 0xF0) lower = 0x90;
                if (byte == 0xF4) upper = 0x8F;
                bytes_needed = 3;
                code_point = byte & 0x07;
            } else {
                out += kReplacement;
            }
            continue;
        }

        if (byte < lower || byte > upper) {
            // Drop the partial sequence and re-examine this byte as a lead
            code_point = 0;
            bytes_needed = 0;
            bytes_seen = 0;
            lower = 0x80;
            upper = 0xBF;
            out += kReplacement;
            continue;
        }

        ++pos;
        lower = 0x80;
        upper = 0xBF;
        code_point = (code_point << 6) | (byte & 0x3F);
        if (++bytes_seen == bytes_needed) {
            append_code_point(out, code_point);
            code_point = 0;
            bytes_needed = 0;
            bytes_seen = 0;
        }
    }

    if (bytes_needed != 0) {
        out += kReplacement;
    }
    return out;
}

} // namespace binio
