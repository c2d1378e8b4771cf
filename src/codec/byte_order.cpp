#include "byte_order.hpp"

namespace binio {

size_t kind_width(Kind kind) {
    switch (kind) {
        case Kind::U8:
        case Kind::I8:  return 1;
        case Kind::U16:
        case Kind::I16: return 2;
        case Kind::U32:
        case Kind::I32:
        case Kind::F32: return 4;
        case Kind::U64:
        case Kind::I64:
        case Kind::F64: return 8;
    }
    return 0;
}

const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::U8:  return "u8";
        case Kind::I8:  return "i8";
        case Kind::U16: return "u16";
        case Kind::I16: return "i16";
        case Kind::U32: return "u32";
        case Kind::I32: return "i32";
        case Kind::U64: return "u64";
        case Kind::I64: return "i64";
        case Kind::F32: return "f32";
        case Kind::F64: return "f64";
    }
    return "unknown";
}

} // namespace binio
