#pragma once

#include <string>

// Returns an absolute directory path intended for lingua config/state.
// On Linux prefers $XDG_CONFIG_HOME/lingua, then $HOME/.config/lingua.
std::string GetLinguaConfigDir();

// Returns the base data directory used by lingua (bundle directories live here).
//
// Prefers $XDG_DATA_HOME/lingua, then $HOME/.local/share/lingua.
std::string GetLinguaDataDir();

// Joins the config dir and a relative path within it.
// Example: LinguaConfigPath("state.json") -> "<config_dir>/state.json"
std::string LinguaConfigPath(const std::string& relative);

// Joins the data dir and a relative path within it.
// Example: LinguaDataPath("bundles") -> "<data_dir>/bundles"
std::string LinguaDataPath(const std::string& relative);
