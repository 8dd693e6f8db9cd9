#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace hyperslab {

enum class ByteOrder : uint8_t {
    LittleEndian = 0,
    BigEndian = 1
};

// I/O failures: open/stat/mmap errors, reads beyond the end of a file.
class HyperslabError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Caller contract violation on a region request (lengths, bounds, steps).
class InvalidRegion : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A position, stride, skip or length does not fit its integer range.
class ArithmeticOverflow : public std::overflow_error {
public:
    using std::overflow_error::overflow_error;
};

inline ByteOrder native_byte_order() {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return ByteOrder::BigEndian;
#else
    return ByteOrder::LittleEndian;
#endif
}

// Endian read helpers

inline uint16_t read_u16_le(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, sizeof(v));
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    v = __builtin_bswap16(v);
#endif
    return v;
}

inline uint16_t read_u16_be(const uint8_t* p) {
    return static_cast<uint16_t>(
        (static_cast<uint16_t>(p[0]) << 8) | static_cast<uint16_t>(p[1]));
}

inline uint32_t read_u32_le(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    v = __builtin_bswap32(v);
#endif
    return v;
}

inline uint32_t read_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline uint64_t read_u64_le(const uint8_t* p) {
    uint64_t v;
    std::memcpy(&v, p, sizeof(v));
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    v = __builtin_bswap64(v);
#endif
    return v;
}

inline uint64_t read_u64_be(const uint8_t* p) {
    return (static_cast<uint64_t>(p[0]) << 56) |
           (static_cast<uint64_t>(p[1]) << 48) |
           (static_cast<uint64_t>(p[2]) << 40) |
           (static_cast<uint64_t>(p[3]) << 32) |
           (static_cast<uint64_t>(p[4]) << 24) |
           (static_cast<uint64_t>(p[5]) << 16) |
           (static_cast<uint64_t>(p[6]) << 8) |
           static_cast<uint64_t>(p[7]);
}

inline uint16_t read_u16(const uint8_t* p, ByteOrder bo) {
    return bo == ByteOrder::LittleEndian ? read_u16_le(p) : read_u16_be(p);
}

inline uint32_t read_u32(const uint8_t* p, ByteOrder bo) {
    return bo == ByteOrder::LittleEndian ? read_u32_le(p) : read_u32_be(p);
}

inline uint64_t read_u64(const uint8_t* p, ByteOrder bo) {
    return bo == ByteOrder::LittleEndian ? read_u64_le(p) : read_u64_be(p);
}

// Swap `count` elements of `elem_size` bytes in place to native order.
// elem_size must be 1, 2, 4 or 8.
inline void to_native_order(uint8_t* p, size_t count, size_t elem_size,
                            ByteOrder bo) {
    if (elem_size == 1 || bo == native_byte_order()) {
        return;
    }
    for (size_t i = 0; i < count; ++i, p += elem_size) {
        switch (elem_size) {
            case 2: {
                uint16_t v = read_u16(p, bo);
                std::memcpy(p, &v, sizeof(v));
                break;
            }
            case 4: {
                uint32_t v = read_u32(p, bo);
                std::memcpy(p, &v, sizeof(v));
                break;
            }
            case 8: {
                uint64_t v = read_u64(p, bo);
                std::memcpy(p, &v, sizeof(v));
                break;
            }
            default:
                throw std::invalid_argument(
                    "unsupported element size " + std::to_string(elem_size));
        }
    }
}

}  // namespace hyperslab
