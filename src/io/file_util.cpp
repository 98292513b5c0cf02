#include "io/file_util.h"

#include <fstream>
#include <iterator>

namespace lingua::file_util
{

bool WriteFileAtomic(const std::filesystem::path& p, const std::string& bytes, std::string& err)
{
    err.clear();
    try
    {
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }

    const std::filesystem::path tmp = p.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            err = "Failed to open temp file for writing: " + tmp.string();
            return false;
        }
        if (!bytes.empty())
            out.write(bytes.data(), (std::streamsize)bytes.size());
        out.close();
        if (!out)
        {
            err = "Failed to finalize temp file write: " + tmp.string();
            std::error_code rm_ec;
            std::filesystem::remove(tmp, rm_ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec)
    {
        err = ec.message();
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        return false;
    }
    return true;
}

bool ReadFileText(const std::filesystem::path& p, std::string& out, std::string& err)
{
    err.clear();
    out.clear();
    std::ifstream in(p, std::ios::binary);
    if (!in)
    {
        err = "Failed to open file for reading: " + p.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        err = "Failed to read file contents: " + p.string();
        out.clear();
        return false;
    }
    return true;
}

} // namespace lingua::file_util
