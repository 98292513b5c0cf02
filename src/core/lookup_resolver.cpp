#include "core/lookup_resolver.h"

#include "core/language.h"
#include "core/token.h"
#include "io/bundle_store.h"

#include <initializer_list>

namespace lingua
{

LookupResolver::LookupResolver(const BundleStore& bundles, std::shared_ptr<const AppResources> app)
    : bundles_(bundles)
    , sentinel_("\x1f## no translation " + RandomHexToken(16) + " ##\x1f")
    , app_(std::move(app))
{
}

void LookupResolver::SetAppResources(std::shared_ptr<const AppResources> app)
{
    std::lock_guard<std::mutex> lock(app_mu_);
    app_ = std::move(app);
}

std::string LookupResolver::ProbeApp(std::string_view key, std::string_view language) const
{
    std::shared_ptr<const AppResources> app;
    {
        std::lock_guard<std::mutex> lock(app_mu_);
        app = app_;
    }
    if (!app)
        return sentinel_;
    return app->Lookup(key, language, sentinel_);
}

const TranslationTable::Entries* LookupResolver::CachedEntries(const std::string& language,
                                                               std::shared_ptr<const TranslationTable::Entries>& hold) const
{
    const std::uint64_t gen = bundles_.Generation();
    {
        std::lock_guard<std::mutex> lock(cache_mu_);
        if (gen != cache_generation_)
        {
            cache_.clear();
            cache_generation_ = gen;
        }
        auto it = cache_.find(language);
        if (it != cache_.end())
        {
            hold = it->second;
            return hold.get();
        }
    }

    std::uint64_t read_gen = 0;
    hold = std::make_shared<const TranslationTable::Entries>(bundles_.LoadLanguage(language, &read_gen));

    std::lock_guard<std::mutex> lock(cache_mu_);
    if (read_gen == cache_generation_)
        cache_[language] = hold;
    return hold.get();
}

std::string LookupResolver::ProbeStored(std::string_view key, std::string_view language) const
{
    const std::string k(key);
    const std::string exact(language);
    const std::string code = LanguageCodeOf(language);

    for (const std::string* lang : {&exact, &code})
    {
        if (lang->empty() || (lang == &code && code == exact))
            continue;
        std::shared_ptr<const TranslationTable::Entries> hold;
        const TranslationTable::Entries* entries = CachedEntries(*lang, hold);
        auto it = entries->find(k);
        if (it != entries->end())
            return it->second;
    }
    return sentinel_;
}

std::string LookupResolver::Resolve(std::string_view key,
                                    std::string_view language,
                                    const std::optional<std::string>& fallback) const
{
    std::string s = ProbeApp(key, language);
    if (s != sentinel_)
        return s;

    s = ProbeStored(key, language);
    if (s != sentinel_)
        return s;

    return fallback ? *fallback : std::string(key);
}

bool LookupResolver::IsTranslated(std::string_view text, const std::vector<LanguageKey>& languages) const
{
    for (const auto& lang : languages)
    {
        if (Resolve(text, lang, sentinel_) == sentinel_)
            return false;
    }
    return true;
}

} // namespace lingua
