#pragma once

#include <string>
#include <vector>

namespace lingua
{

struct TranslationServiceConfig
{
    // LibreTranslate-compatible base URL (e.g. "https://libretranslate.example/").
    // Empty means no service is configured.
    std::string endpoint;
    std::string api_key;
    int         timeout_seconds = 30;
};

// Persistent configuration, stored as lingua.json.
struct StoreConfig
{
    std::string              table_name = "Localizable";
    std::vector<std::string> supported_languages;
    std::string              locale;            // e.g. "sv-SE"; empty = ICU default locale
    std::string              bundles_dir;       // empty = <data_dir>/bundles
    std::string              state_path;        // empty = <config_dir>/state.json
    std::string              app_resources_dir; // ICU .res directory; empty = none
    int                      workers = 1;
    bool                     disabled = false;

    TranslationServiceConfig translation_service;
};

// <config_dir>/lingua.json
std::string GetConfigFilePath();

// Missing file: leaves `out` at defaults and succeeds.
// Unreadable or malformed file: fails with `err` set.
bool LoadStoreConfig(const std::string& path, StoreConfig& out, std::string& err);
bool SaveStoreConfig(const std::string& path, const StoreConfig& cfg, std::string& err);

// Fills empty paths with their defaults.
StoreConfig ResolveDefaults(StoreConfig cfg);

} // namespace lingua
