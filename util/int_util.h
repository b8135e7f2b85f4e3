#ifndef SNUFFLE_UTIL_INT_UTIL_H_INCLUDED
#define SNUFFLE_UTIL_INT_UTIL_H_INCLUDED

#include <cstdint>

namespace snuffle { namespace util {

// n must be in [1, 31]
constexpr uint32_t rol(uint32_t x, uint32_t n) {
    return (x<<n) | (x>>(32-n));
}

inline uint32_t get_le_uint32(const uint8_t* b) {
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1])<<8) | (static_cast<uint32_t>(b[2])<<16) | (static_cast<uint32_t>(b[3])<<24);
}

inline void put_le_uint32(uint8_t* b, uint32_t n) {
    b[0] = static_cast<uint8_t>(n);
    b[1] = static_cast<uint8_t>(n>>8);
    b[2] = static_cast<uint8_t>(n>>16);
    b[3] = static_cast<uint8_t>(n>>24);
}

inline uint64_t get_le_uint64(const uint8_t* b) {
    return static_cast<uint64_t>(get_le_uint32(b)) | (static_cast<uint64_t>(get_le_uint32(b+4))<<32);
}

inline void put_le_uint64(uint8_t* b, uint64_t n) {
    put_le_uint32(b, static_cast<uint32_t>(n));
    put_le_uint32(b+4, static_cast<uint32_t>(n>>32));
}

} } // namespace snuffle::util

#endif
