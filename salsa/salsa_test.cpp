#include <algorithm>
#include <iostream>
#include <iomanip>
#include <vector>

#include <salsa/salsa.h>
#include <util/base_conversion.h>
#include <util/test.h>

using namespace snuffle;

std::ostream& operator<<(std::ostream& os, const std::vector<uint8_t>& v)
{
    return os << util::base16_encode(v);
}

std::ostream& operator<<(std::ostream& os, const salsa::state& s)
{
    const auto old_flags = os.flags();
    for (size_t i = 0; i < s.size(); ++i) {
        os << (i ? " " : "") << "0x" << std::hex << std::setw(8) << std::setfill('0') << s[i];
    }
    os.flags(old_flags);
    return os;
}

void quarter_round_test()
{
    // Examples from section 3 of the Salsa20 specification
    static const struct {
        uint32_t in[4];
        uint32_t out[4];
    } test_cases[] = {
        { { 0x00000000, 0x00000000, 0x00000000, 0x00000000 }, { 0x00000000, 0x00000000, 0x00000000, 0x00000000 } },
        { { 0x00000001, 0x00000000, 0x00000000, 0x00000000 }, { 0x08008145, 0x00000080, 0x00010200, 0x20500000 } },
        { { 0x00000000, 0x00000001, 0x00000000, 0x00000000 }, { 0x88000100, 0x00000001, 0x00000200, 0x00402000 } },
        { { 0x00000000, 0x00000000, 0x00000001, 0x00000000 }, { 0x80040000, 0x00000000, 0x00000001, 0x00002000 } },
        { { 0x00000000, 0x00000000, 0x00000000, 0x00000001 }, { 0x00048044, 0x00000080, 0x00010000, 0x20100001 } },
        { { 0xe7e8c006, 0xc4f9417d, 0x6479b4b2, 0x68c67137 }, { 0xe876d72b, 0x9361dfd5, 0xf1460244, 0x948541a3 } },
        { { 0xd3917c5b, 0x55f1c407, 0x52a58a7a, 0x8f887a3b }, { 0x3e2f308c, 0xd90a8f36, 0x6ab2a923, 0x2883524c } },
    };
    for (const auto& t : test_cases) {
        uint32_t a = t.in[0], b = t.in[1], c = t.in[2], d = t.in[3];
        salsa::quarter_round(a, b, c, d);
        SNUFFLE_ASSERT_EQUAL(t.out[0], a);
        SNUFFLE_ASSERT_EQUAL(t.out[1], b);
        SNUFFLE_ASSERT_EQUAL(t.out[2], c);
        SNUFFLE_ASSERT_EQUAL(t.out[3], d);
    }
}

void round_test()
{
    const salsa::state ones = {{
        0x00000001, 0x00000000, 0x00000000, 0x00000000,
        0x00000001, 0x00000000, 0x00000000, 0x00000000,
        0x00000001, 0x00000000, 0x00000000, 0x00000000,
        0x00000001, 0x00000000, 0x00000000, 0x00000000,
    }};

    salsa::state s = ones;
    salsa::row_round(s);
    const salsa::state row_expected = {{
        0x08008145, 0x00000080, 0x00010200, 0x20500000,
        0x20100001, 0x00048044, 0x00000080, 0x00010000,
        0x00000001, 0x00002000, 0x80040000, 0x00000000,
        0x00000001, 0x00000200, 0x00402000, 0x88000100,
    }};
    SNUFFLE_ASSERT_EQUAL(row_expected, s);

    s = ones;
    salsa::column_round(s);
    const salsa::state column_expected = {{
        0x10090288, 0x00000000, 0x00000000, 0x00000000,
        0x00000101, 0x00000000, 0x00000000, 0x00000000,
        0x00020401, 0x00000000, 0x00000000, 0x00000000,
        0x40a04001, 0x00000000, 0x00000000, 0x00000000,
    }};
    SNUFFLE_ASSERT_EQUAL(column_expected, s);

    s = salsa::state{{ 1 }};
    salsa::double_round(s);
    const salsa::state double_expected = {{
        0x8186a22d, 0x0040a284, 0x82479210, 0x06929051,
        0x08000090, 0x02402200, 0x00004000, 0x00800000,
        0x00010200, 0x20400000, 0x08008104, 0x00000000,
        0x20500000, 0xa0000040, 0x0008180a, 0x612a8020,
    }};
    SNUFFLE_ASSERT_EQUAL(double_expected, s);
}

void hash_test()
{
    std::vector<uint8_t> out(salsa::block_length_bytes, 0xff);

    // All zero input is a fixed point
    const std::vector<uint8_t> zero(salsa::block_length_bytes);
    salsa::hash(out.data(), zero.data());
    SNUFFLE_ASSERT_EQUAL(zero, out);

    // Section 8 of the Salsa20 specification
    const std::vector<uint8_t> in = {
        211,159, 13,115, 76, 55, 82,183,  3,117,222, 37,191,187,234,136,
         49,237,179, 48,  1,106,178,219,175,199,166, 48, 86, 16,179,207,
         31,240, 32, 63, 15, 83, 93,161,116,147, 48,113,238, 55,204, 36,
         79,201,235, 79,  3, 81,156, 47,203, 26,244,243, 88,118,104, 54,
    };
    const std::vector<uint8_t> expected = {
        109, 42,178,168,156,240,248,238,168,196,190,203, 26,110,170,154,
         29, 29,150, 26,150, 30,235,249,190,163,251, 48, 69,144, 51, 57,
        118, 40,152,157,180, 57, 27, 94,107, 42,236, 35, 27,111,114,114,
        219,236,232,135,111,155,110, 18, 24,232, 95,158,179, 19, 48,202,
    };
    salsa::hash(out.data(), in.data(), 20);
    SNUFFLE_ASSERT_EQUAL(expected, out);

    // In place
    auto buf = in;
    salsa::hash(buf.data(), buf.data(), 20);
    SNUFFLE_ASSERT_EQUAL(expected, buf);

    // RFC 7914 section 8: Salsa20/8 core
    const auto in8 = util::base16_decode(
            "7e879a214f3ec9867ca940e641718f26baee555b8c61c1b50df846116dcd3b1d"
            "ee24f319df9b3d8514121e4b5ac5aa3276021d2909c74829edebc68db8b8c25e");
    const auto expected8 = util::base16_decode(
            "a41f859c6608cc993b81cacb020cef05044b2181a2fd337dfd7b1c6396682f29"
            "b4393168e3c9e6bcfe6bc5b7a06d96bae424cc102c91745c24ad673dc7618f81");
    salsa::hash(out.data(), in8.data(), 8);
    SNUFFLE_ASSERT_EQUAL(expected8, out);

    SNUFFLE_ASSERT_THROWS(salsa::hash(out.data(), in8.data(), 10), configuration_error);
}

void hsalsa20_test()
{
    // NaCl crypto_box test: HSalsa20(shared secret, 0) = "firstkey"
    const auto key = util::base16_decode("4a5d9d5ba4ce2de1728e3bf480350f25e07e21c947d19e3376f09b3c1e161742");
    const std::vector<uint8_t> zero(salsa::hsalsa_input_length_bytes);
    std::vector<uint8_t> out(salsa::key_length_bytes);
    salsa::hsalsa20(out.data(), zero.data(), key.data(), salsa::sigma32);
    SNUFFLE_ASSERT_EQUAL(util::base16_decode("1b27556473e985d462cd51197a9a46c76009549eac6474f206c4ee0844f68389"), out);

    // With the 16-byte key constants
    const std::string short_key = "this is 16b key!this is 16b key!";
    const std::string input = "24-byte nonce fo";
    salsa::hsalsa20(out.data(), reinterpret_cast<const uint8_t*>(input.data()), reinterpret_cast<const uint8_t*>(short_key.data()), salsa::sigma16, 20);
    SNUFFLE_ASSERT_EQUAL(util::base16_decode("a53ce789fe659cf25bc934fb3004cef03f8d77c0824cdb28865891cf3891ae66"), out);

    for (unsigned rounds : { 0, 1, 7, 13, 21 }) {
        SNUFFLE_ASSERT_THROWS(salsa::hsalsa20(out.data(), zero.data(), key.data(), salsa::sigma32, rounds), configuration_error);
    }
}

void key_stream_test()
{
    const std::vector<uint8_t> zero_key(salsa::key_length_bytes);
    const std::vector<uint8_t> zero_nonce(salsa::nonce_length_bytes);
    std::vector<uint8_t> block(salsa::block_length_bytes);

    static const struct {
        unsigned    rounds;
        const char* first_block;
    } zero_key_cases[] = {
        { 20, "9a97f65b9b4c721b960a672145fca8d4e32e67f9111ea979ce9c4826806aeee63de9c0da2bd7f91ebcb2639bf989c6251b29bf38d39a9bdce7c55f4b2ac12a39" },
        { 12, "bd78a2f8118a563c761db4f2fbe055da97f90988d27594d9c5dfd13a3efeaa3f68f0d2564850adf5017433968e4b3405ac49a39532124fcd6f47e415c7028a83" },
        {  8, "9f591da5f99c235445ea91866ead681b977c4ffa036d770fbca79d41fb014178cf8ecf3164e5e77d7495dc0195081edb2f45c8a1b17d2bec8df3ef9fb7618075" },
    };
    for (const auto& t : zero_key_cases) {
        salsa::key_stream_block(block.data(), zero_nonce.data(), 0, zero_key.data(), salsa::sigma32, t.rounds);
        SNUFFLE_ASSERT_EQUAL_MESSAGE(util::base16_decode(t.first_block), block, "rounds = " << t.rounds);
    }

    // Block 3 for a non-trivial key and nonce
    std::vector<uint8_t> key(salsa::key_length_bytes), nonce(salsa::nonce_length_bytes);
    for (size_t i = 0; i < key.size(); ++i) key[i] = static_cast<uint8_t>(i);
    for (size_t i = 0; i < nonce.size(); ++i) nonce[i] = static_cast<uint8_t>(100 + i);
    salsa::key_stream_block(block.data(), nonce.data(), 3, key.data(), salsa::sigma32, 20);
    SNUFFLE_ASSERT_EQUAL(util::base16_decode("ad29a211f33f31d74974d4cddb7109540f8ca73eb909bb90aba85a9308cb125dd20b71ebb4102a9296d4f8cad4d92dbe4b9f65f6ee8d7b68fdde353f9d2dc9c9"), block);

    // xor_key_stream over several blocks, starting at a nonzero counter,
    // must agree with the individual blocks
    const size_t len = 3 * salsa::block_length_bytes + 5;
    std::vector<uint8_t> data(len, 0);
    salsa::xor_key_stream(data.data(), data.data(), data.size(), nonce.data(), 3, key.data(), salsa::sigma32);
    for (uint64_t n = 0; n < 4; ++n) {
        salsa::key_stream_block(block.data(), nonce.data(), 3 + n, key.data(), salsa::sigma32, 20);
        const size_t offset = static_cast<size_t>(n) * salsa::block_length_bytes;
        const size_t count  = std::min(salsa::block_length_bytes, len - offset);
        SNUFFLE_ASSERT_EQUAL(std::vector<uint8_t>(block.begin(), block.begin() + count), std::vector<uint8_t>(data.begin() + offset, data.begin() + offset + count));
    }

    // The high word of the counter is used
    std::vector<uint8_t> low(salsa::block_length_bytes), high(salsa::block_length_bytes);
    salsa::key_stream_block(low.data(), nonce.data(), 1, key.data(), salsa::sigma32, 20);
    salsa::key_stream_block(high.data(), nonce.data(), (uint64_t(1) << 32) | 1, key.data(), salsa::sigma32, 20);
    SNUFFLE_ASSERT_NOT_EQUAL(low, high);

    // Nothing is written for an empty input
    std::vector<uint8_t> untouched(4, 0x5a);
    salsa::xor_key_stream(untouched.data(), untouched.data(), 0, nonce.data(), 0, key.data(), salsa::sigma32);
    SNUFFLE_ASSERT_EQUAL(std::vector<uint8_t>(4, 0x5a), untouched);

    SNUFFLE_ASSERT_THROWS(salsa::xor_key_stream(data.data(), data.data(), data.size(), nonce.data(), 0, key.data(), salsa::sigma32, 16), configuration_error);
}

int main()
{
    try {
        quarter_round_test();
        round_test();
        hash_test();
        hsalsa20_test();
        key_stream_test();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
