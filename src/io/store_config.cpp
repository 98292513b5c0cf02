#include "io/store_config.h"

#include "core/paths.h"
#include "io/file_util.h"
#include "io/state_slot.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace lingua
{
namespace
{
constexpr int kSchemaVersion = 1;

static json ToJson(const StoreConfig& cfg)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    j["table_name"] = cfg.table_name;
    j["supported_languages"] = cfg.supported_languages;
    if (!cfg.locale.empty())
        j["locale"] = cfg.locale;
    if (!cfg.bundles_dir.empty())
        j["bundles_dir"] = cfg.bundles_dir;
    if (!cfg.state_path.empty())
        j["state_path"] = cfg.state_path;
    if (!cfg.app_resources_dir.empty())
        j["app_resources_dir"] = cfg.app_resources_dir;
    j["workers"] = cfg.workers;
    j["disabled"] = cfg.disabled;

    json ts;
    ts["endpoint"] = cfg.translation_service.endpoint;
    if (!cfg.translation_service.api_key.empty())
        ts["api_key"] = cfg.translation_service.api_key;
    ts["timeout_seconds"] = cfg.translation_service.timeout_seconds;
    j["translation_service"] = std::move(ts);
    return j;
}

static void FromJson(const json& j, StoreConfig& out)
{
    // Defaults are already in out; only override what we recognize.
    if (j.contains("table_name") && j["table_name"].is_string())
        out.table_name = j["table_name"].get<std::string>();
    if (j.contains("supported_languages") && j["supported_languages"].is_array())
    {
        out.supported_languages.clear();
        for (const auto& v : j["supported_languages"])
        {
            if (v.is_string())
                out.supported_languages.push_back(v.get<std::string>());
        }
    }
    if (j.contains("locale") && j["locale"].is_string()) out.locale = j["locale"].get<std::string>();
    if (j.contains("bundles_dir") && j["bundles_dir"].is_string()) out.bundles_dir = j["bundles_dir"].get<std::string>();
    if (j.contains("state_path") && j["state_path"].is_string()) out.state_path = j["state_path"].get<std::string>();
    if (j.contains("app_resources_dir") && j["app_resources_dir"].is_string())
        out.app_resources_dir = j["app_resources_dir"].get<std::string>();
    if (j.contains("workers") && j["workers"].is_number_integer())
        out.workers = std::max(1, j["workers"].get<int>());
    if (j.contains("disabled") && j["disabled"].is_boolean()) out.disabled = j["disabled"].get<bool>();

    if (j.contains("translation_service") && j["translation_service"].is_object())
    {
        const json& ts = j["translation_service"];
        if (ts.contains("endpoint") && ts["endpoint"].is_string())
            out.translation_service.endpoint = ts["endpoint"].get<std::string>();
        if (ts.contains("api_key") && ts["api_key"].is_string())
            out.translation_service.api_key = ts["api_key"].get<std::string>();
        if (ts.contains("timeout_seconds") && ts["timeout_seconds"].is_number_integer())
            out.translation_service.timeout_seconds = std::max(1, ts["timeout_seconds"].get<int>());
    }
}
} // namespace

std::string GetConfigFilePath()
{
    return LinguaConfigPath("lingua.json");
}

bool LoadStoreConfig(const std::string& path, StoreConfig& out, std::string& err)
{
    err.clear();

    std::error_code ec;
    if (!fs::exists(path, ec))
        return true; // first run; hardcoded defaults

    std::ifstream f(path);
    if (!f)
    {
        err = std::string("Failed to open config file for reading: ") + path;
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse config (") + path + "): " + e.what();
        return false;
    }
    if (!j.is_object())
    {
        err = std::string("Config is not a JSON object: ") + path;
        return false;
    }

    if (j.contains("schema_version") && j["schema_version"].is_number_integer() &&
        j["schema_version"].get<int>() > kSchemaVersion)
    {
        err = "Config schema_version " + std::to_string(j["schema_version"].get<int>()) + " is newer than supported";
        return false;
    }

    FromJson(j, out);
    return true;
}

bool SaveStoreConfig(const std::string& path, const StoreConfig& cfg, std::string& err)
{
    return file_util::WriteFileAtomic(fs::path(path), ToJson(cfg).dump(2) + "\n", err);
}

StoreConfig ResolveDefaults(StoreConfig cfg)
{
    if (cfg.bundles_dir.empty())
        cfg.bundles_dir = LinguaDataPath("bundles");
    if (cfg.state_path.empty())
        cfg.state_path = GetStateFilePath();
    if (cfg.table_name.empty())
        cfg.table_name = "Localizable";
    return cfg;
}

} // namespace lingua
