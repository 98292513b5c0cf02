#include "core/translation_table.h"

#include <algorithm>

namespace lingua
{

void TranslationTable::Merge(const TranslationTable& other)
{
    for (const auto& [lang, vals] : other.db_)
    {
        Entries& dst = db_[lang];
        for (const auto& [k, v] : vals)
            dst[k] = v;
    }
}

void TranslationTable::Remove(const std::vector<TranslationKey>& keys)
{
    if (keys.empty())
        return;
    for (auto& [lang, vals] : db_)
    {
        (void)lang;
        for (const auto& k : keys)
            vals.erase(k);
    }
}

std::optional<TranslatedValue> TranslationTable::Get(std::string_view language, std::string_view key) const
{
    auto lit = db_.find(std::string(language));
    if (lit == db_.end())
        return std::nullopt;
    auto kit = lit->second.find(std::string(key));
    if (kit == lit->second.end())
        return std::nullopt;
    return kit->second;
}

void TranslationTable::Set(const LanguageKey& language, const TranslationKey& key, TranslatedValue value)
{
    db_[language][key] = std::move(value);
}

const TranslationTable::Entries& TranslationTable::EntriesFor(std::string_view language) const
{
    static const Entries empty;
    auto it = db_.find(std::string(language));
    return it == db_.end() ? empty : it->second;
}

bool TranslationTable::HasLanguage(std::string_view language) const
{
    return db_.find(std::string(language)) != db_.end();
}

std::vector<LanguageKey> TranslationTable::Languages() const
{
    std::vector<LanguageKey> out;
    out.reserve(db_.size());
    for (const auto& [lang, vals] : db_)
    {
        if (!vals.empty())
            out.push_back(lang);
    }
    std::sort(out.begin(), out.end());
    return out;
}

TranslationTable TranslationTable::Scoped(const std::vector<LanguageKey>& languages) const
{
    TranslationTable out;
    for (const auto& lang : languages)
    {
        auto it = db_.find(lang);
        if (it != db_.end())
            out.db_[lang] = it->second;
    }
    return out;
}

size_t TranslationTable::Size() const
{
    size_t n = 0;
    for (const auto& [lang, vals] : db_)
    {
        (void)lang;
        n += vals.size();
    }
    return n;
}

bool TranslationTable::operator==(const TranslationTable& o) const
{
    auto covered = [](const Map& a, const Map& b)
    {
        for (const auto& [lang, vals] : a)
        {
            if (vals.empty())
                continue;
            auto it = b.find(lang);
            if (it == b.end() || it->second != vals)
                return false;
        }
        return true;
    };
    return covered(db_, o.db_) && covered(o.db_, db_);
}

} // namespace lingua
