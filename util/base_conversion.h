#ifndef SNUFFLE_UTIL_BASE_CONVERSION_H_INCLUDED
#define SNUFFLE_UTIL_BASE_CONVERSION_H_INCLUDED

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace snuffle { namespace util {

// Lower case hex, two characters per byte
std::string base16_encode(const void* buffer, size_t len);
std::string base16_encode(const std::vector<uint8_t>& v);

// Accepts upper and lower case digits. Throws std::runtime_error on
// odd length or non-hex characters.
std::vector<uint8_t> base16_decode(const char* buffer, size_t len);
std::vector<uint8_t> base16_decode(const std::string& s);

} } // namespace snuffle::util

#endif
