#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lingua
{

using LanguageKey = std::string;
using TranslationKey = std::string;
using TranslatedValue = std::string;

// In-memory {language -> {key -> value}} table.
//
// Tables are short-lived: read from disk for one request, merged, written back
// and dropped. They are plain values and are not synchronized.
class TranslationTable
{
public:
    using Entries = std::unordered_map<TranslationKey, TranslatedValue>;
    using Map = std::unordered_map<LanguageKey, Entries>;

    TranslationTable() = default;
    explicit TranslationTable(Map db) : db_(std::move(db)) {}

    // Overwrites every (language, key) of `other` into this table. Last writer wins.
    void Merge(const TranslationTable& other);

    // Deletes every entry whose key is in `keys`, in every language.
    void Remove(const std::vector<TranslationKey>& keys);

    std::optional<TranslatedValue> Get(std::string_view language, std::string_view key) const;
    void Set(const LanguageKey& language, const TranslationKey& key, TranslatedValue value);

    // Entries for one language (empty map when the language is absent).
    const Entries& EntriesFor(std::string_view language) const;
    bool HasLanguage(std::string_view language) const;

    // Languages with at least one entry, sorted.
    std::vector<LanguageKey> Languages() const;

    // Copy restricted to the given languages.
    TranslationTable Scoped(const std::vector<LanguageKey>& languages) const;

    // Total number of entries across all languages.
    size_t Size() const;
    bool   Empty() const { return Size() == 0; }

    const Map& Data() const { return db_; }
    Map&       Data() { return db_; }

    // Empty language maps compare equal to absent ones.
    bool operator==(const TranslationTable& o) const;
    bool operator!=(const TranslationTable& o) const { return !(*this == o); }

private:
    Map db_;
};

} // namespace lingua
