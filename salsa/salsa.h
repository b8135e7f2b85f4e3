#ifndef SNUFFLE_SALSA_SALSA_H_INCLUDED
#define SNUFFLE_SALSA_SALSA_H_INCLUDED

#include <stdint.h>
#include <stddef.h>
#include <array>

// The Salsa20 core, HSalsa20 and the raw keystream generator.
// Salsa20 specification: https://cr.yp.to/snuffle/spec.pdf
// XSalsa20/HSalsa20:     https://cr.yp.to/snuffle/xsalsa-20081128.pdf
//
// Nothing in here branches on key, nonce or data.
namespace snuffle { namespace salsa {

constexpr size_t key_length_bytes          = 256 / 8;
constexpr size_t nonce_length_bytes        = 64 / 8;
constexpr size_t hsalsa_input_length_bytes = 128 / 8;
constexpr size_t block_length_bytes        = 64;
constexpr size_t sigma_length_bytes        = 16;

constexpr unsigned default_rounds = 20;

// "expand 32-byte k" and "expand 16-byte k"
constexpr uint8_t sigma32[sigma_length_bytes] = { 'e','x','p','a','n','d',' ','3','2','-','b','y','t','e',' ','k' };
constexpr uint8_t sigma16[sigma_length_bytes] = { 'e','x','p','a','n','d',' ','1','6','-','b','y','t','e',' ','k' };

using state = std::array<uint32_t, 16>;

// Throws configuration_error unless rounds is 8, 12 or 20
void check_rounds(unsigned rounds);

void quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d);
void column_round(state& s);
void row_round(state& s);
void double_round(state& s);

// Applies rounds/2 double rounds to s and adds the original input
// (the feed-forward).
void core(state& s, unsigned rounds);

// The Salsa20 hash function: 64 bytes in, 64 bytes out. Salsa20/8 is the
// mixing function used by scrypt. out and in may be the same buffer.
void hash(uint8_t* out, const uint8_t* in, unsigned rounds = default_rounds);

// Derives a 32-byte subkey from key and the 16-byte input. No feed-forward,
// words 0, 5, 10, 15, 6, 7, 8 and 9 of the permuted state form the result.
void hsalsa20(uint8_t* out, const uint8_t* in, const uint8_t* key, const uint8_t* sigma, unsigned rounds = default_rounds);

// Produces the 64-byte keystream block number block_counter for (key, nonce).
void key_stream_block(uint8_t* out, const uint8_t* nonce, uint64_t block_counter, const uint8_t* key, const uint8_t* sigma, unsigned rounds);

// XORs len bytes of in with the keystream starting at block block_counter and
// stores the result in out. out and in may point to the same buffer, other
// overlap is not allowed. key is always 32 bytes here, nonce 8 bytes.
void xor_key_stream(uint8_t* out, const uint8_t* in, size_t len, const uint8_t* nonce, uint64_t block_counter, const uint8_t* key, const uint8_t* sigma, unsigned rounds = default_rounds);

} } // namespace snuffle::salsa

#endif
