#pragma once

#include "core/app_resources.h"
#include "core/error.h"
#include "core/lookup_resolver.h"
#include "core/store_events.h"
#include "core/task_queue.h"
#include "core/translation_coordinator.h"
#include "core/translation_service.h"
#include "core/translation_table.h"
#include "io/bundle_store.h"
#include "io/state_slot.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lingua
{

struct StoreOptions
{
    std::string              table_name = "Localizable";
    std::vector<LanguageKey> supported_languages;
    std::string              locale; // empty = ICU default locale
    std::filesystem::path    bundles_dir;
    size_t                   workers = 1;
};

// Localization string store: persisted per-language tables, machine
// translation sync and lookups with a fallback chain.
//
// Threading: every public method may be called from the owner thread without
// blocking on disk or network. Completions (callbacks, signals, watchers) are
// queued and run when the owner calls PollCompletions()/WaitForCompletions().
class Store
{
public:
    using Done = std::function<void(const TranslateOutcome&)>;
    using Watcher = std::function<void(const std::string&)>;
    using WatchId = std::uint64_t;

    Store(StoreOptions options,
          PersistentSlot& slot,
          std::shared_ptr<TranslationService> service = nullptr,
          std::shared_ptr<const AppResources> app_resources = nullptr);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Restores (or creates) the current bundle. Call once before anything else.
    bool Open(Error& err);

    void SetDisabled(bool disabled);
    bool Disabled() const;

    void SetTranslationService(std::shared_ptr<TranslationService> service);
    void SetAppResources(std::shared_ptr<const AppResources> app_resources);

    // Changing the locale re-runs watchers.
    void        SetLocale(std::string locale);
    std::string Locale() const;
    std::string LanguageCode() const;

    const std::vector<LanguageKey>& SupportedLanguages() const { return options_.supported_languages; }

    // Translates `texts` from `from` into `to` (all supported languages but
    // `from` when empty), merges the result into the stored tables and commits.
    std::shared_ptr<const TranslateOperation> Translate(std::vector<std::string> texts,
                                                        LanguageKey from,
                                                        std::vector<LanguageKey> to = {},
                                                        TranslationCoordinator::Callback done = {});

    // Replaces the stored tables with `table` (atomic bundle swap).
    void Write(TranslationTable table, Done done = {});

    // Removes `keys` from every stored language.
    void Remove(std::vector<TranslationKey> keys, Done done = {});

    // Wipes the stored tables (fresh empty bundle).
    void Clean(Done done = {});

    // Blocking read of the current bundle.
    TranslationTable Translations(const std::vector<LanguageKey>& languages) const;

    // Current locale.
    std::string String(std::string_view key) const;
    std::string String(std::string_view key,
                       std::string_view language,
                       const std::optional<std::string>& fallback = std::nullopt) const;

    bool IsTranslated(std::string_view text, const std::vector<LanguageKey>& languages) const;

    // Calls `fn` now with the resolved value for the current locale, then again
    // after every committed write, clean or locale change.
    WatchId Watch(std::string key, Watcher fn);
    bool    Unwatch(WatchId id);

    Signal<>&             OnChanged() { return events_.changed; }
    Signal<const Error&>& OnFailed() { return events_.failed; }
    Signal<>&             OnCleaned() { return events_.cleaned; }

    size_t PollCompletions();
    size_t WaitForCompletions(std::chrono::milliseconds timeout);

    BundleStore&          Bundles() { return *bundles_; }
    const LookupResolver& Resolver() const { return *resolver_; }
    size_t                InFlight() const;

private:
    struct WatchEntry
    {
        WatchId     id = 0;
        std::string key;
        Watcher     fn;
    };

    // Runs `work` on a worker; reports through `done` and the signals.
    void RunMutation(std::function<bool(Error&)> work, Done done, bool is_clean);
    void FailNow(Error err, Done done);
    void NotifyWatchers();

    StoreOptions options_;

    StoreEvents     events_;
    CompletionQueue completions_;

    std::unique_ptr<BundleStore>            bundles_;
    std::unique_ptr<LookupResolver>         resolver_;
    std::unique_ptr<WorkerPool>             workers_;
    std::unique_ptr<TranslationCoordinator> coordinator_;

    mutable std::mutex locale_mu_;
    std::string        locale_;

    std::mutex              watch_mu_;
    std::vector<WatchEntry> watchers_;
    WatchId                 next_watch_id_ = 0;

    std::atomic<size_t> mutations_in_flight_{0};
};

} // namespace lingua

// Convenience macro for UI code: resolves `key` for the store's current locale.
#define LINGUA_TR(store, key_literal) (store).String((key_literal))
