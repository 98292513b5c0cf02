#include "core/store.h"

#include "core/language.h"

#include <algorithm>
#include <cstdio>

namespace lingua
{

Store::Store(StoreOptions options,
             PersistentSlot& slot,
             std::shared_ptr<TranslationService> service,
             std::shared_ptr<const AppResources> app_resources)
    : options_(std::move(options))
    , locale_(options_.locale)
{
    bundles_ = std::make_unique<BundleStore>(options_.bundles_dir,
                                             options_.table_name,
                                             options_.supported_languages,
                                             slot);
    resolver_ = std::make_unique<LookupResolver>(*bundles_, std::move(app_resources));
    workers_ = std::make_unique<WorkerPool>(options_.workers);
    coordinator_ = std::make_unique<TranslationCoordinator>(*bundles_, *workers_, completions_, events_);
    coordinator_->SetService(std::move(service));

    // Non-fatal bundle problems (cleanup, slot persistence) surface as failure events.
    StoreEvents* events = &events_;
    CompletionQueue* completions = &completions_;
    bundles_->SetWarningHook([events, completions](const Error& e)
    {
        completions->Push([events, e]() { events->failed.Emit(e); });
    });

    events_.changed.Connect([this]() { NotifyWatchers(); });
    events_.cleaned.Connect([this]() { NotifyWatchers(); });
}

Store::~Store()
{
    // Queued disk work finishes before anything it references goes away.
    workers_->Shutdown();
    coordinator_.reset();
    bundles_->SetWarningHook({});
}

bool Store::Open(Error& err)
{
    return bundles_->Open(err);
}

void Store::SetDisabled(bool disabled)
{
    coordinator_->SetDisabled(disabled);
}

bool Store::Disabled() const
{
    return coordinator_->Disabled();
}

void Store::SetTranslationService(std::shared_ptr<TranslationService> service)
{
    coordinator_->SetService(std::move(service));
}

void Store::SetAppResources(std::shared_ptr<const AppResources> app_resources)
{
    resolver_->SetAppResources(std::move(app_resources));
}

void Store::SetLocale(std::string locale)
{
    {
        std::lock_guard<std::mutex> lock(locale_mu_);
        if (locale_ == locale)
            return;
        locale_ = std::move(locale);
    }
    completions_.Push([this]() { NotifyWatchers(); });
}

std::string Store::Locale() const
{
    std::lock_guard<std::mutex> lock(locale_mu_);
    return locale_;
}

std::string Store::LanguageCode() const
{
    return LanguageCodeOf(Locale());
}

std::shared_ptr<const TranslateOperation> Store::Translate(std::vector<std::string> texts,
                                                           LanguageKey from,
                                                           std::vector<LanguageKey> to,
                                                           TranslationCoordinator::Callback done)
{
    return coordinator_->Translate(std::move(texts), std::move(from), std::move(to), std::move(done));
}

void Store::FailNow(Error err, Done done)
{
    std::fprintf(stderr, "[store] %s\n", Describe(err).c_str());
    StoreEvents* events = &events_;
    completions_.Push([events, err = std::move(err), done = std::move(done)]()
    {
        events->failed.Emit(err);
        if (done)
            done(TranslateOutcome{false, err});
    });
}

void Store::RunMutation(std::function<bool(Error&)> work, Done done, bool is_clean)
{
    if (Disabled())
    {
        FailNow(Error::Make(ErrorKind::Disabled, "translation store is disabled"), std::move(done));
        return;
    }

    ++mutations_in_flight_;
    StoreEvents* events = &events_;
    CompletionQueue* completions = &completions_;
    auto shared_done = std::make_shared<Done>(std::move(done));
    const bool posted = workers_->Post([this, events, completions, work = std::move(work), shared_done, is_clean]()
    {
        Error err;
        const bool ok = work(err);
        if (!ok)
            std::fprintf(stderr, "[store] %s\n", Describe(err).c_str());
        --mutations_in_flight_;
        completions->Push([events, ok, err, shared_done, is_clean]()
        {
            if (ok)
            {
                if (is_clean)
                    events->cleaned.Emit();
                else
                    events->changed.Emit();
            }
            else
            {
                events->failed.Emit(err);
            }
            if (*shared_done)
                (*shared_done)(TranslateOutcome{ok, ok ? Error{} : err});
        });
    });
    if (!posted)
    {
        --mutations_in_flight_;
        FailNow(Error::Make(ErrorKind::IOFailure, "worker pool is shut down"), std::move(*shared_done));
    }
}

void Store::Write(TranslationTable table, Done done)
{
    auto t = std::make_shared<TranslationTable>(std::move(table));
    BundleStore* bundles = bundles_.get();
    RunMutation([bundles, t](Error& err) { return bundles->WriteAtomic(*t, err); }, std::move(done), false);
}

void Store::Remove(std::vector<TranslationKey> keys, Done done)
{
    BundleStore* bundles = bundles_.get();
    RunMutation([bundles, keys = std::move(keys)](Error& err)
    {
        TranslationTable t = bundles->Load(bundles->KnownLanguages());
        t.Remove(keys);
        return bundles->WriteAtomic(t, err);
    }, std::move(done), false);
}

void Store::Clean(Done done)
{
    BundleStore* bundles = bundles_.get();
    RunMutation([bundles](Error& err) { return bundles->Clean(err); }, std::move(done), true);
}

TranslationTable Store::Translations(const std::vector<LanguageKey>& languages) const
{
    return bundles_->Load(languages);
}

std::string Store::String(std::string_view key) const
{
    return resolver_->Resolve(key, LanguageCode());
}

std::string Store::String(std::string_view key,
                          std::string_view language,
                          const std::optional<std::string>& fallback) const
{
    return resolver_->Resolve(key, language, fallback);
}

bool Store::IsTranslated(std::string_view text, const std::vector<LanguageKey>& languages) const
{
    return resolver_->IsTranslated(text, languages);
}

Store::WatchId Store::Watch(std::string key, Watcher fn)
{
    if (!fn)
        return 0;
    const std::string value = String(key);
    WatchId id = 0;
    {
        std::lock_guard<std::mutex> lock(watch_mu_);
        id = ++next_watch_id_;
        watchers_.push_back(WatchEntry{id, std::move(key), fn});
    }
    fn(value);
    return id;
}

bool Store::Unwatch(WatchId id)
{
    std::lock_guard<std::mutex> lock(watch_mu_);
    auto it = std::find_if(watchers_.begin(), watchers_.end(), [&](const WatchEntry& w) { return w.id == id; });
    if (it == watchers_.end())
        return false;
    watchers_.erase(it);
    return true;
}

void Store::NotifyWatchers()
{
    std::vector<WatchEntry> snapshot;
    {
        std::lock_guard<std::mutex> lock(watch_mu_);
        snapshot = watchers_;
    }
    for (const auto& w : snapshot)
        w.fn(String(w.key));
}

size_t Store::PollCompletions()
{
    return completions_.Drain();
}

size_t Store::WaitForCompletions(std::chrono::milliseconds timeout)
{
    return completions_.WaitAndDrain(timeout);
}

size_t Store::InFlight() const
{
    return coordinator_->InFlight() + mutations_in_flight_.load();
}

} // namespace lingua
