#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetLinguaConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/lingua";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/lingua";

    // Last resort: current directory
    return ".";
}

std::string GetLinguaDataDir()
{
    const std::string xdg = EnvOrEmpty("XDG_DATA_HOME");
    if (!xdg.empty())
        return xdg + "/lingua";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.local/share/lingua";

    return ".";
}

std::string LinguaConfigPath(const std::string& relative)
{
    if (relative.empty())
        return GetLinguaConfigDir();
    return (fs::path(GetLinguaConfigDir()) / relative).string();
}

std::string LinguaDataPath(const std::string& relative)
{
    if (relative.empty())
        return GetLinguaDataDir();
    return (fs::path(GetLinguaDataDir()) / relative).string();
}
