#pragma once

#include <filesystem>
#include <string>

namespace lingua::file_util
{

// Writes `bytes` to `<p>.tmp` then renames over `p`. Creates parent directories.
bool WriteFileAtomic(const std::filesystem::path& p, const std::string& bytes, std::string& err);

// Reads a whole file. Fails when the file can't be opened or read.
bool ReadFileText(const std::filesystem::path& p, std::string& out, std::string& err);

} // namespace lingua::file_util
