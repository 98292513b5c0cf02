#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace lingua
{

// A single persisted string value (e.g. the name of the current bundle directory).
// Read once at startup, written whenever the current bundle changes.
class PersistentSlot
{
public:
    virtual ~PersistentSlot() = default;

    // Empty when nothing was stored yet (or the backing store is unreadable).
    virtual std::optional<std::string> Get() const = 0;

    virtual bool Set(const std::string& value, std::string& err) = 0;
};

// In-memory slot. Survives only as long as the object does.
class MemorySlot final : public PersistentSlot
{
public:
    MemorySlot() = default;
    explicit MemorySlot(std::string initial) : value_(std::move(initial)) {}

    std::optional<std::string> Get() const override;
    bool Set(const std::string& value, std::string& err) override;

private:
    mutable std::mutex         mu_;
    std::optional<std::string> value_;
};

// Stores the value under `key` inside a JSON object file. Other keys in the
// file are preserved. Writes go through a temp file + rename.
class JsonFileSlot final : public PersistentSlot
{
public:
    JsonFileSlot(std::string path, std::string key);

    std::optional<std::string> Get() const override;
    bool Set(const std::string& value, std::string& err) override;

    const std::string& Path() const { return path_; }

private:
    std::string        path_;
    std::string        key_;
    mutable std::mutex mu_;
};

// Default state file: <config_dir>/state.json
std::string GetStateFilePath();

// Key used for the current bundle name inside the state file.
inline constexpr const char* kCurrentBundleKey = "current_bundle";

} // namespace lingua
