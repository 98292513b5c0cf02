#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lingua
{

// Strings compiled into the application (the first link of the lookup chain).
//
// Lookup returns `default_value` when the application has no entry for the key,
// mirroring resource APIs that take a "value if missing" argument.
class AppResources
{
public:
    virtual ~AppResources() = default;

    virtual std::string Lookup(std::string_view key,
                               std::string_view language,
                               const std::string& default_value) const = 0;
};

// In-memory resources, keyed by language code.
class MapAppResources final : public AppResources
{
public:
    void Set(const std::string& language, const std::string& key, std::string value);

    std::string Lookup(std::string_view key,
                       std::string_view language,
                       const std::string& default_value) const override;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> db_;
};

// ICU resource bundles: `<bundle_dir>/<language>.res` (e.g. built with genrb).
//
// Keys are looked up at the top-level table first; keys containing '.' are then
// also tried as a path of nested tables ("menu.file.quit").
class IcuAppResources final : public AppResources
{
public:
    explicit IcuAppResources(std::string bundle_dir);
    ~IcuAppResources() override;

    IcuAppResources(const IcuAppResources&) = delete;
    IcuAppResources& operator=(const IcuAppResources&) = delete;

    std::string Lookup(std::string_view key,
                       std::string_view language,
                       const std::string& default_value) const override;

    const std::string& BundleDir() const { return bundle_dir_; }

private:
    struct Bundles;

    std::string              bundle_dir_;
    std::unique_ptr<Bundles> bundles_;
};

} // namespace lingua
