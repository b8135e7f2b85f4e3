#include "salsa20.h"
#include <algorithm>
#include <functional>
#include <string.h>
#include <salsa/salsa.h>
#include <util/test.h>

namespace {

using namespace snuffle;

unsigned effective_rounds(unsigned rounds)
{
    if (rounds == 0) {
        return salsa::default_rounds;
    }
    salsa::check_rounds(rounds);
    return rounds;
}

// Returns the constant set to use with the (now 32-byte) expanded key
const uint8_t* expand_key(uint8_t* expanded, const uint8_t* key, size_t key_len)
{
    SNUFFLE_CHECK(key_len == salsa20::key_length_bytes || key_len == salsa20::short_key_length_bytes,
            "Invalid key length " << key_len << ". Must be 32 or 16 bytes.");
    if (key_len == salsa20::short_key_length_bytes) {
        memcpy(expanded, key, salsa20::short_key_length_bytes);
        memcpy(expanded + salsa20::short_key_length_bytes, key, salsa20::short_key_length_bytes);
        return salsa::sigma16;
    }
    memcpy(expanded, key, salsa20::key_length_bytes);
    return salsa::sigma32;
}

// Identical buffers are fine (in-place operation), partial overlap is not
bool overlaps_inexactly(const uint8_t* out, const uint8_t* in, size_t len)
{
    if (len == 0 || out == in) {
        return false;
    }
    std::less<const uint8_t*> before;
    return before(in, out + len) && before(out, in + len);
}

} // unnamed namespace

namespace snuffle { namespace salsa20 {

void xor_key_stream(uint8_t* out, size_t out_len, const uint8_t* in, size_t in_len, const uint8_t* nonce, size_t nonce_len, const uint8_t* key, size_t key_len)
{
    xor_key_stream_with_rounds(out, out_len, in, in_len, nonce, nonce_len, key, key_len, salsa::default_rounds);
}

void xor_key_stream_with_rounds(uint8_t* out, size_t out_len, const uint8_t* in, size_t in_len, const uint8_t* nonce, size_t nonce_len, const uint8_t* key, size_t key_len, unsigned rounds, uint64_t initial_counter)
{
    rounds = effective_rounds(rounds);

    uint8_t working_key[salsa::key_length_bytes];
    const uint8_t* sigma = expand_key(working_key, key, key_len);

    SNUFFLE_CHECK(nonce_len == nonce_length_bytes || nonce_len == xnonce_length_bytes,
            "Invalid nonce length " << nonce_len << ". Must be 8 or 24 bytes.");

    const size_t len = std::min(out_len, in_len);
    SNUFFLE_CHECK(!overlaps_inexactly(out, in, len), "Input and output buffers overlap");

    const uint8_t* sub_nonce = nonce;
    if (nonce_len == xnonce_length_bytes) {
        uint8_t sub_key[salsa::key_length_bytes];
        salsa::hsalsa20(sub_key, nonce, working_key, sigma, rounds);
        memcpy(working_key, sub_key, sizeof(working_key));
        sub_nonce = nonce + salsa::hsalsa_input_length_bytes;
        // The derived key is always a full 256-bit key
        sigma = salsa::sigma32;
    }

    salsa::xor_key_stream(out, in, len, sub_nonce, initial_counter, working_key, sigma, rounds);
}

std::vector<uint8_t> salsa20(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce, const std::vector<uint8_t>& data, unsigned rounds, uint64_t initial_counter)
{
    auto res = data;
    salsa20_inplace(key, nonce, res, rounds, initial_counter);
    return res;
}

void salsa20_inplace(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce, std::vector<uint8_t>& data, unsigned rounds, uint64_t initial_counter)
{
    xor_key_stream_with_rounds(data.data(), data.size(), data.data(), data.size(), nonce.data(), nonce.size(), key.data(), key.size(), rounds, initial_counter);
}

} } // namespace snuffle::salsa20
