#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdlib>

#include <salsa20/salsa20.h>
#include <util/base_conversion.h>
#include <util/ostream_adapter.h>
#include <util/test.h>

using namespace snuffle;

namespace {

void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [-v] [-r rounds] [-c counter] <hex key> <hex nonce> <input> <output>\n";
    std::cerr << "\n";
    std::cerr << "Encrypts or decrypts <input> with Salsa20 and writes the result to <output>.\n";
    std::cerr << "The key is 32 or 16 bytes, the nonce 8 bytes (Salsa20) or 24 bytes (XSalsa20).\n";
    std::cerr << "rounds is 8, 12 or 20 (default), counter is the first 64-byte block number.\n";
    std::cerr << "Use - for standard input/output.\n";
}

std::vector<uint8_t> read_all(std::istream& in)
{
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<uint8_t> read_file(const std::string& filename)
{
    if (filename == "-") {
        return read_all(std::cin);
    }
    std::ifstream in(filename, std::ifstream::binary);
    if (!in || !in.is_open()) {
        throw std::runtime_error("Could not open " + filename);
    }
    auto data = read_all(in);
    if (in.bad()) {
        throw std::runtime_error("Error reading " + filename);
    }
    return data;
}

void write_file(const std::string& filename, const std::vector<uint8_t>& data)
{
    auto write = [&](std::ostream& out) {
        out.write(reinterpret_cast<const char*>(data.data()), data.size());
        out.flush();
        if (!out) {
            throw std::runtime_error("Error writing " + filename);
        }
    };
    if (filename == "-") {
        write(std::cout);
        return;
    }
    std::ofstream out(filename, std::ofstream::binary);
    if (!out || !out.is_open()) {
        throw std::runtime_error("Could not open " + filename + " for writing");
    }
    write(out);
}

unsigned long long parse_number(const std::string& s, const char* what)
{
    size_t pos = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(s, &pos, 0);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (s.empty() || pos != s.size() || s[0] == '-') {
        throw std::runtime_error(std::string("Invalid ") + what + " '" + s + "'");
    }
    return n;
}

} // unnamed namespace

int main(int argc, char* argv[])
{
    bool     verbose = false;
    unsigned rounds  = 0;
    uint64_t counter = 0;
    std::vector<std::string> args;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-v") {
                verbose = true;
            } else if ((arg == "-r" || arg == "-c") && i + 1 < argc) {
                const auto n = parse_number(argv[++i], arg == "-r" ? "round count" : "counter");
                if (arg == "-r") {
                    rounds = static_cast<unsigned>(n);
                    if (rounds != n) {
                        throw std::runtime_error("Invalid round count " + std::to_string(n));
                    }
                } else {
                    counter = n;
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                usage(argv[0]);
                return 2;
            } else {
                args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        usage(argv[0]);
        return 2;
    }

    if (args.size() != 4) {
        usage(argv[0]);
        return 2;
    }

    util::ostream_adapter logger{[verbose](const std::string& line) {
        if (verbose) std::cerr << "salsa20: " << line << std::endl;
    }};

    try {
        const auto key   = util::base16_decode(args[0]);
        const auto nonce = util::base16_decode(args[1]);
        logger << (nonce.size() == salsa20::xnonce_length_bytes ? "XSalsa20" : "Salsa20")
            << "/" << (rounds ? rounds : 20) << " with a " << key.size() * 8 << "-bit key, starting at block " << counter << std::endl;

        auto data = read_file(args[2]);
        logger << "Read " << data.size() << " bytes from " << args[2] << std::endl;

        salsa20::salsa20_inplace(key, nonce, data, rounds, counter);

        write_file(args[3], data);
        logger << "Wrote " << data.size() << " bytes to " << args[3] << std::endl;
    } catch (const configuration_error& e) {
        std::cerr << "Invalid parameters: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
