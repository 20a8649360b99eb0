#include <crock/random.hpp>
#include <crock/log.hpp>
#include <fstream>
#include <random>

namespace crock {

void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }

    log::debug("/dev/urandom unavailable, using std::random_device");
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

} // namespace crock
