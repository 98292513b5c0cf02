#pragma once

#include <cstddef>
#include <string>

namespace lingua
{

// Random lowercase hex string of `bytes * 2` characters. Thread-safe.
std::string RandomHexToken(size_t bytes = 16);

} // namespace lingua
