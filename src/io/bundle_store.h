#pragma once

#include "core/error.h"
#include "core/translation_table.h"
#include "io/state_slot.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lingua
{

// Durable on-disk storage for a TranslationTable.
//
// Layout of one bundle directory (a snapshot):
//   <bundles_dir>/<hex>.bundle/
//       en.lang/Localizable.table
//       sv.lang/Localizable.table
//
// Exactly one bundle is current. Writes never modify it: they build a new
// bundle, swap the current pointer, persist the new name in the slot and only
// then delete the previous bundle.
class BundleStore
{
public:
    // Writes one table file. Replaceable so tests can inject failures.
    using FileWriter = std::function<bool(const std::filesystem::path& path, const std::string& bytes, std::string& err)>;

    // Called for non-fatal failures (stale bundle deletion, slot persistence).
    using WarningHook = std::function<void(const Error&)>;

    BundleStore(std::filesystem::path bundles_dir,
                std::string table_name,
                std::vector<LanguageKey> languages,
                PersistentSlot& slot);

    BundleStore(const BundleStore&) = delete;
    BundleStore& operator=(const BundleStore&) = delete;

    // Bundles younger than this survive the prune in Open: another process
    // sharing the bundles dir may still be writing them.
    static constexpr std::chrono::seconds kStaleBundleAge{600};

    // Restores the bundle named in the slot, or creates a fresh one.
    // Also removes stale bundles (e.g. left over from interrupted writes)
    // older than kStaleBundleAge.
    bool Open(Error& err);

    // Ensures root/, root/<lang>.lang/ and an (empty) <table>.table file per language.
    static bool CreateDirectoryLayout(const std::filesystem::path& root,
                                      const std::string& table_name,
                                      const std::vector<LanguageKey>& languages,
                                      Error& err);

    // Reads `languages` from an arbitrary bundle root. Missing or unreadable
    // files yield no entries for that language.
    static TranslationTable Load(const std::filesystem::path& root,
                                 const std::string& table_name,
                                 const std::vector<LanguageKey>& languages);

    static std::filesystem::path TableFilePath(const std::filesystem::path& root,
                                               const std::string& table_name,
                                               const LanguageKey& language);

    // Reads from the current bundle.
    TranslationTable Load(const std::vector<LanguageKey>& languages) const;

    // Reads one language from the current bundle. `generation` receives the
    // swap counter of the bundle that was read.
    TranslationTable::Entries LoadLanguage(const LanguageKey& language, std::uint64_t* generation = nullptr) const;

    // Supported languages plus any language directory found in the current bundle.
    std::vector<LanguageKey> KnownLanguages() const;

    // Writes `table` into a new bundle and makes it current. On failure the
    // previous bundle stays current; the partial one is left for PruneStaleRoots.
    bool WriteAtomic(const TranslationTable& table, Error& err);

    // Replaces the current bundle with a fresh empty one.
    bool Clean(Error& err);

    // Removes a bundle directory tree. Failure is reported to the warning hook too.
    bool Delete(const std::filesystem::path& root, Error& err);

    // Deletes every *.bundle directory except the current one whose last
    // modification is at least `min_age` ago. Returns the count removed.
    // With a zero age this is only safe while no write is in flight.
    size_t PruneStaleRoots(std::chrono::seconds min_age = std::chrono::seconds(0));

    std::filesystem::path CurrentRoot() const;
    std::uint64_t         Generation() const;

    const std::filesystem::path&     BundlesDir() const { return bundles_dir_; }
    const std::string&               TableName() const { return table_name_; }
    const std::vector<LanguageKey>&  Languages() const { return languages_; }

    void SetFileWriter(FileWriter writer);
    void SetWarningHook(WarningHook hook);

private:
    bool CreateFreshRoot(std::filesystem::path& out, Error& err);
    void Commit(const std::filesystem::path& new_root);
    void Warn(const Error& e) const;

    std::filesystem::path    bundles_dir_;
    std::string              table_name_;
    std::vector<LanguageKey> languages_;
    PersistentSlot&          slot_;

    FileWriter  writer_;
    WarningHook warning_hook_;

    // Serializes commits so the slot always names the root that is current
    // and only the replaced root gets deleted.
    std::mutex commit_mu_;

    // Guards current_ and generation_. Readers hold it shared for the whole
    // read so a swapped-out bundle is never deleted under them.
    mutable std::shared_mutex mu_;
    std::filesystem::path     current_;
    std::uint64_t             generation_ = 0;
};

} // namespace lingua
