#include "io/state_slot.h"

#include "core/paths.h"
#include "io/file_util.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace lingua
{
namespace
{
static bool ReadJsonObject(const std::string& path, json& out, std::string& err)
{
    err.clear();
    out = json::object();

    std::error_code ec;
    if (!fs::exists(path, ec))
        return true; // absent file == empty object

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open " + path + " for reading.";
        return false;
    }
    try
    {
        in >> out;
    }
    catch (const std::exception& e)
    {
        err = e.what();
        out = json::object();
        return false;
    }
    if (!out.is_object())
    {
        err = "State file is not a JSON object.";
        out = json::object();
        return false;
    }
    return true;
}
} // namespace

std::optional<std::string> MemorySlot::Get() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return value_;
}

bool MemorySlot::Set(const std::string& value, std::string& err)
{
    err.clear();
    std::lock_guard<std::mutex> lock(mu_);
    value_ = value;
    return true;
}

JsonFileSlot::JsonFileSlot(std::string path, std::string key)
    : path_(std::move(path))
    , key_(std::move(key))
{
}

std::optional<std::string> JsonFileSlot::Get() const
{
    std::lock_guard<std::mutex> lock(mu_);
    json j;
    std::string err;
    if (!ReadJsonObject(path_, j, err))
    {
        std::fprintf(stderr, "[state] %s: %s\n", path_.c_str(), err.c_str());
        return std::nullopt;
    }
    auto it = j.find(key_);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

bool JsonFileSlot::Set(const std::string& value, std::string& err)
{
    std::lock_guard<std::mutex> lock(mu_);
    json j;
    std::string rerr;
    if (!ReadJsonObject(path_, j, rerr))
    {
        // A corrupt state file is replaced rather than blocking the write.
        std::fprintf(stderr, "[state] replacing unreadable %s: %s\n", path_.c_str(), rerr.c_str());
        j = json::object();
    }
    j[key_] = value;
    return file_util::WriteFileAtomic(fs::path(path_), j.dump(2) + "\n", err);
}

std::string GetStateFilePath()
{
    return LinguaConfigPath("state.json");
}

} // namespace lingua
