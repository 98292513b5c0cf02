#pragma once

#include "core/app_resources.h"
#include "core/translation_table.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lingua
{

class BundleStore;

// Resolves display strings: app resources, then the current stored bundle,
// then the caller's fallback, then the key itself.
//
// "Missing" is detected by probing with a sentinel default that real content
// can't contain (a random token generated per resolver).
class LookupResolver
{
public:
    explicit LookupResolver(const BundleStore& bundles, std::shared_ptr<const AppResources> app = nullptr);

    void SetAppResources(std::shared_ptr<const AppResources> app);

    std::string Resolve(std::string_view key,
                        std::string_view language,
                        const std::optional<std::string>& fallback = std::nullopt) const;

    // False if any language would fall through to the key-echo case.
    bool IsTranslated(std::string_view text, const std::vector<LanguageKey>& languages) const;

    const std::string& Sentinel() const { return sentinel_; }

private:
    // Both return the sentinel when there is no entry.
    std::string ProbeApp(std::string_view key, std::string_view language) const;
    std::string ProbeStored(std::string_view key, std::string_view language) const;

    const TranslationTable::Entries* CachedEntries(const std::string& language,
                                                   std::shared_ptr<const TranslationTable::Entries>& hold) const;

    const BundleStore& bundles_;
    std::string        sentinel_;

    mutable std::mutex                  app_mu_;
    std::shared_ptr<const AppResources> app_;

    // Parsed language files of the current bundle; dropped whenever the bundle is swapped.
    mutable std::mutex    cache_mu_;
    mutable std::uint64_t cache_generation_ = 0;
    mutable std::unordered_map<std::string, std::shared_ptr<const TranslationTable::Entries>> cache_;
};

} // namespace lingua
