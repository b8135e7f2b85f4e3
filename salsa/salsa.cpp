#include "salsa.h"
#include <algorithm>
#include <util/int_util.h>
#include <util/test.h>

using snuffle::util::rol;
using snuffle::util::get_le_uint32;
using snuffle::util::put_le_uint32;

namespace {

using snuffle::salsa::state;

// The 4x4 state is laid out as
//
//   sigma0  key0    key1    key2
//   key3    sigma1  in0     in1
//   in2     in3     sigma2  key4
//   key5    key6    key7    sigma3
//
// where in0..in3 is either nonce+counter or the HSalsa20 input.
void initial_state(state& s, const uint8_t* key, const uint8_t* in, const uint8_t* sigma)
{
    s[ 0] = get_le_uint32(&sigma[0*4]);
    s[ 5] = get_le_uint32(&sigma[1*4]);
    s[10] = get_le_uint32(&sigma[2*4]);
    s[15] = get_le_uint32(&sigma[3*4]);

    s[ 1] = get_le_uint32(&key[0*4]);
    s[ 2] = get_le_uint32(&key[1*4]);
    s[ 3] = get_le_uint32(&key[2*4]);
    s[ 4] = get_le_uint32(&key[3*4]);
    s[11] = get_le_uint32(&key[4*4]);
    s[12] = get_le_uint32(&key[5*4]);
    s[13] = get_le_uint32(&key[6*4]);
    s[14] = get_le_uint32(&key[7*4]);

    s[ 6] = get_le_uint32(&in[0*4]);
    s[ 7] = get_le_uint32(&in[1*4]);
    s[ 8] = get_le_uint32(&in[2*4]);
    s[ 9] = get_le_uint32(&in[3*4]);
}

void permute(state& s, unsigned rounds)
{
    for (unsigned i = 0; i < rounds; i += 2) {
        snuffle::salsa::double_round(s);
    }
}

void serialize(uint8_t* out, const state& s)
{
    for (auto x : s) {
        put_le_uint32(out, x);
        out += 4;
    }
}

} // unnamed namespace

namespace snuffle { namespace salsa {

void check_rounds(unsigned rounds)
{
    SNUFFLE_CHECK(rounds == 8 || rounds == 12 || rounds == 20, "Invalid number of rounds " << rounds << ". Must be 8, 12 or 20.");
}

void quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d)
{
    b ^= rol(a + d, 7);
    c ^= rol(b + a, 9);
    d ^= rol(c + b, 13);
    a ^= rol(d + c, 18);
}

void column_round(state& s)
{
    quarter_round(s[ 0], s[ 4], s[ 8], s[12]);
    quarter_round(s[ 5], s[ 9], s[13], s[ 1]);
    quarter_round(s[10], s[14], s[ 2], s[ 6]);
    quarter_round(s[15], s[ 3], s[ 7], s[11]);
}

void row_round(state& s)
{
    quarter_round(s[ 0], s[ 1], s[ 2], s[ 3]);
    quarter_round(s[ 5], s[ 6], s[ 7], s[ 4]);
    quarter_round(s[10], s[11], s[ 8], s[ 9]);
    quarter_round(s[15], s[12], s[13], s[14]);
}

void double_round(state& s)
{
    column_round(s);
    row_round(s);
}

void core(state& s, unsigned rounds)
{
    check_rounds(rounds);
    const state initial = s;
    permute(s, rounds);
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] += initial[i];
    }
}

void hash(uint8_t* out, const uint8_t* in, unsigned rounds)
{
    state s;
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = get_le_uint32(&in[i*4]);
    }
    core(s, rounds);
    serialize(out, s);
}

void hsalsa20(uint8_t* out, const uint8_t* in, const uint8_t* key, const uint8_t* sigma, unsigned rounds)
{
    check_rounds(rounds);
    state s;
    initial_state(s, key, in, sigma);
    permute(s, rounds);
    put_le_uint32(&out[0*4], s[ 0]);
    put_le_uint32(&out[1*4], s[ 5]);
    put_le_uint32(&out[2*4], s[10]);
    put_le_uint32(&out[3*4], s[15]);
    put_le_uint32(&out[4*4], s[ 6]);
    put_le_uint32(&out[5*4], s[ 7]);
    put_le_uint32(&out[6*4], s[ 8]);
    put_le_uint32(&out[7*4], s[ 9]);
}

void key_stream_block(uint8_t* out, const uint8_t* nonce, uint64_t block_counter, const uint8_t* key, const uint8_t* sigma, unsigned rounds)
{
    uint8_t in[hsalsa_input_length_bytes];
    for (size_t i = 0; i < nonce_length_bytes; ++i) {
        in[i] = nonce[i];
    }
    util::put_le_uint64(&in[nonce_length_bytes], block_counter);

    state s;
    initial_state(s, key, in, sigma);
    core(s, rounds);
    serialize(out, s);
}

void xor_key_stream(uint8_t* out, const uint8_t* in, size_t len, const uint8_t* nonce, uint64_t block_counter, const uint8_t* key, const uint8_t* sigma, unsigned rounds)
{
    check_rounds(rounds);

    uint8_t key_stream[block_length_bytes];
    for (size_t i = 0; i < len; i += block_length_bytes) {
        const size_t this_block = std::min(len - i, block_length_bytes);
        key_stream_block(key_stream, nonce, block_counter++, key, sigma, rounds);
        for (size_t j = 0; j < this_block; ++j) {
            out[i+j] = in[i+j] ^ key_stream[j];
        }
    }
}

} } // namespace snuffle::salsa
