#ifndef SNUFFLE_SALSA20_SALSA20_H_INCLUDED
#define SNUFFLE_SALSA20_SALSA20_H_INCLUDED

#include <stdint.h>
#include <stddef.h>
#include <vector>

// Salsa20 and XSalsa20 stream encryption.
//
// Salsa20 is message oriented: keystream blocks are not preserved between
// calls, every call starts at block initial_counter (normally 0). Both sides
// of a channel must therefore segment their data identically. Encrypting two
// messages with the same (key, nonce) pair leaks their XOR; the caller is
// responsible for nonce uniqueness. No authentication is provided.
//
// Passing a 24-byte nonce selects XSalsa20.
namespace snuffle { namespace salsa20 {

constexpr size_t key_length_bytes       = 256 / 8;
constexpr size_t short_key_length_bytes = 128 / 8;
constexpr size_t nonce_length_bytes     = 64 / 8;
constexpr size_t xnonce_length_bytes    = 192 / 8;

// XORs in with the Salsa20/20 keystream and stores the result in out.
//
// Only min(out_len, in_len) bytes are processed, surplus input is ignored.
// out and in may be the same buffer, but must not otherwise overlap.
// The key must be 32 (or 16) bytes, the nonce 8 or 24 bytes.
//
// Invalid arguments throw snuffle::configuration_error before anything
// is written to out.
void xor_key_stream(uint8_t* out, size_t out_len, const uint8_t* in, size_t in_len, const uint8_t* nonce, size_t nonce_len, const uint8_t* key, size_t key_len);

// As xor_key_stream, but with a selectable number of rounds (8, 12 or 20,
// 0 means 20) and starting keystream block. A 16-byte key is expanded to
// 32 bytes by repetition and uses the "expand 16-byte k" constant.
void xor_key_stream_with_rounds(uint8_t* out, size_t out_len, const uint8_t* in, size_t in_len, const uint8_t* nonce, size_t nonce_len, const uint8_t* key, size_t key_len, unsigned rounds, uint64_t initial_counter = 0);

std::vector<uint8_t> salsa20(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce, const std::vector<uint8_t>& data, unsigned rounds = 0, uint64_t initial_counter = 0);

// In-place variant
void salsa20_inplace(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce, std::vector<uint8_t>& data, unsigned rounds = 0, uint64_t initial_counter = 0);

} } // namespace snuffle::salsa20

#endif
