#include "random_token.hpp"

#include <cstdint>
#include <random>

namespace cog_converter {

std::string random_token() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char digits[] = "0123456789abcdef";

    std::uint64_t value = rng();
    std::string token(16, '0');
    for (int i = 15; i >= 0; --i) {
        token[i] = digits[value & 0xF];
        value >>= 4;
    }
    return token;
}

}  // namespace cog_converter
