#include "base_conversion.h"
#include <cassert>
#include <stdexcept>

namespace {

constexpr char hexchars[] = "0123456789abcdef";

uint8_t hexdigit(char c)
{
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    throw std::runtime_error(std::string("Invalid hexdigit '") + c + "'");
}

} // unnamed namespace

namespace snuffle { namespace util {

std::string base16_encode(const void* buffer, size_t len)
{
    const uint8_t* bytes = static_cast<const uint8_t*>(buffer);
    std::string result(len * 2, '\0');
    for (size_t i = 0; i < len; ++i) {
        result[2*i]   = hexchars[bytes[i] >> 4];
        result[2*i+1] = hexchars[bytes[i] & 0xf];
    }
    return result;
}

std::string base16_encode(const std::vector<uint8_t>& v)
{
    return base16_encode(v.data(), v.size());
}

std::vector<uint8_t> base16_decode(const char* buffer, size_t len)
{
    if (len % 2) {
        throw std::runtime_error("Invalid length " + std::to_string(len) + " of base16 encoded string '" + std::string(buffer, len) + "'");
    }
    std::vector<uint8_t> v(len/2);
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] = static_cast<uint8_t>((hexdigit(buffer[2*i]) << 4) | hexdigit(buffer[2*i+1]));
    }
    assert(v.size() * 2 == len);
    return v;
}

std::vector<uint8_t> base16_decode(const std::string& s)
{
    return base16_decode(s.data(), s.length());
}

} } // namespace snuffle::util
