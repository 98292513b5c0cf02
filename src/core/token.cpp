#include "core/token.h"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace lingua
{

std::string RandomHexToken(size_t bytes)
{
    static std::mutex mu;
    static std::mt19937_64 rng{std::random_device{}()};

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    std::lock_guard<std::mutex> lock(mu);
    for (size_t i = 0; i < bytes; ++i)
        oss << std::setw(2) << (unsigned)(rng() & 0xFFu);
    return oss.str();
}

} // namespace lingua
