#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <cstdlib>
#include <salsa/salsa.h>

using namespace snuffle;

constexpr size_t buffer_size = 1 << 20;
constexpr int    test_times  = 64;

template<typename Clock>
uint64_t clock_ns()
{
    const auto now_ticks = Clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now_ticks).count();
}

template<typename F>
double time_it(const F& f)
{
    auto ns = clock_ns<std::chrono::high_resolution_clock>;
    const auto start_time = ns();
    f();
    const auto end_time = ns();
    return (end_time - start_time) / 1e9;
}

int main(int argc, char* argv[])
{
    const int times = argc > 1 ? std::atoi(argv[1]) : test_times;
    if (times <= 0) {
        std::cerr << "Usage: " << argv[0] << " [iterations]" << std::endl;
        return 1;
    }

    std::vector<uint8_t> key(salsa::key_length_bytes);
    std::vector<uint8_t> nonce(salsa::nonce_length_bytes);
    for (size_t i = 0; i < key.size(); ++i) key[i] = static_cast<uint8_t>(i);
    std::vector<uint8_t> buffer(buffer_size);

    for (unsigned rounds : { 8, 12, 20 }) {
        uint64_t counter = 0;
        const double t = time_it([&] {
            for (int i = 0; i < times; ++i) {
                salsa::xor_key_stream(buffer.data(), buffer.data(), buffer.size(), nonce.data(), counter, key.data(), salsa::sigma32, rounds);
                counter += buffer_size / salsa::block_length_bytes;
            }
        });
        const double mb = static_cast<double>(buffer_size) * times / (1024 * 1024);
        std::cout << "Salsa20/" << std::setw(2) << rounds << ": " << std::fixed << std::setprecision(1) << mb / t << " MB/s" << std::endl;
    }
    unsigned checksum = 0;
    for (auto b : buffer) checksum += b;
    std::cout << "Checksum " << checksum << std::endl;
}
