#ifndef BAE_SDK_ENDIAN_HH
#define BAE_SDK_ENDIAN_HH

#include <bae/sdk/types.hh>
#include <bae/sdk/bae_sdk_config.h>
#include <cstring>

namespace bae {

// Platform endianness detection using CMake-generated config
#if BAE_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

// Byte swapping functions
inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

// Conditional byte swapping based on platform
inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint16_t swap16be(uint16_t x) {
    return is_big_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

inline uint32_t swap32be(uint32_t x) {
    return is_big_endian ? x : swap32(x);
}

// Unaligned loads and stores, ptr may point anywhere inside a byte buffer
inline uint16_t load16(const uint8* ptr) {
    uint16_t v;
    std::memcpy(&v, ptr, sizeof(v));
    return v;
}

inline uint32_t load32(const uint8* ptr) {
    uint32_t v;
    std::memcpy(&v, ptr, sizeof(v));
    return v;
}

inline void store16(uint8* ptr, uint16_t v) {
    std::memcpy(ptr, &v, sizeof(v));
}

inline void store32(uint8* ptr, uint32_t v) {
    std::memcpy(ptr, &v, sizeof(v));
}

// Read macros for little-endian data
#define BAE_READ_16LE(ptr) bae::swap16le(bae::load16(ptr))
#define BAE_READ_32LE(ptr) bae::swap32le(bae::load32(ptr))

// Write macros for little-endian data
#define BAE_WRITE_16LE(ptr, val) bae::store16((ptr), bae::swap16le(val))
#define BAE_WRITE_32LE(ptr, val) bae::store32((ptr), bae::swap32le(val))

} // namespace bae

#endif // BAE_SDK_ENDIAN_HH
