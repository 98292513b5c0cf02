#include "core/translation_coordinator.h"

#include "io/bundle_store.h"

#include <algorithm>
#include <cstdio>

namespace lingua
{
namespace
{
static void AppendUnique(std::vector<LanguageKey>& v, const LanguageKey& lang)
{
    if (std::find(v.begin(), v.end(), lang) == v.end())
        v.push_back(lang);
}
} // namespace

const char* ToString(TranslateState s)
{
    switch (s)
    {
        case TranslateState::Idle: return "Idle";
        case TranslateState::Reading: return "Reading";
        case TranslateState::Translating: return "Translating";
        case TranslateState::Merging: return "Merging";
        case TranslateState::Writing: return "Writing";
        case TranslateState::Completed: return "Completed";
        case TranslateState::Failed: return "Failed";
    }
    return "Unknown";
}

TranslationCoordinator::TranslationCoordinator(BundleStore& bundles,
                                               WorkerPool& workers,
                                               CompletionQueue& completions,
                                               StoreEvents& events)
    : bundles_(bundles)
    , workers_(workers)
    , completions_(completions)
    , events_(events)
    , alive_(std::make_shared<Liveness>())
{
    alive_->self = this;
}

TranslationCoordinator::~TranslationCoordinator()
{
    {
        std::lock_guard<std::mutex> lock(alive_->mu);
        alive_->self = nullptr;
    }

    // Let disk work that was already queued run to completion.
    std::unique_lock<std::mutex> lock(jobs_mu_);
    jobs_cv_.wait(lock, [&]() { return jobs_pending_ == 0; });
}

void TranslationCoordinator::SetService(std::shared_ptr<TranslationService> service)
{
    std::lock_guard<std::mutex> lock(service_mu_);
    service_ = std::move(service);
}

std::shared_ptr<TranslationService> TranslationCoordinator::Service() const
{
    std::lock_guard<std::mutex> lock(service_mu_);
    return service_;
}

bool TranslationCoordinator::PostJob(Task job)
{
    {
        std::lock_guard<std::mutex> lock(jobs_mu_);
        ++jobs_pending_;
    }
    const bool posted = workers_.Post([this, job = std::move(job)]()
    {
        struct Release
        {
            TranslationCoordinator* self;
            ~Release()
            {
                std::lock_guard<std::mutex> lock(self->jobs_mu_);
                --self->jobs_pending_;
                self->jobs_cv_.notify_all();
            }
        } release{this};
        job();
    });
    if (!posted)
    {
        std::lock_guard<std::mutex> lock(jobs_mu_);
        --jobs_pending_;
        jobs_cv_.notify_all();
    }
    return posted;
}

std::shared_ptr<const TranslateOperation> TranslationCoordinator::Translate(std::vector<std::string> texts,
                                                                            LanguageKey from,
                                                                            std::vector<LanguageKey> to,
                                                                            Callback done)
{
    auto op = std::make_shared<TranslateOperation>();
    op->id_ = ++next_id_;
    op->texts_ = std::move(texts);
    op->from_ = std::move(from);
    op->done_ = std::move(done);
    ++in_flight_;

    if (disabled_.load())
    {
        Finish(op, TranslateOutcome{false, Error::Make(ErrorKind::Disabled, "translation store is disabled")});
        return op;
    }

    if (to.empty())
    {
        for (const auto& lang : bundles_.Languages())
        {
            if (lang != op->from_)
                to.push_back(lang);
        }
    }
    op->to_ = std::move(to);
    op->all_ = op->to_;
    AppendUnique(op->all_, op->from_);

    if (!PostJob([this, op]() { Read(op); }))
        Finish(op, TranslateOutcome{false, Error::Make(ErrorKind::IOFailure, "worker pool is shut down")});
    return op;
}

void TranslationCoordinator::Read(const OpPtr& op)
{
    op->state_ = TranslateState::Reading;
    TranslationTable snapshot = bundles_.Load(op->all_);

    std::shared_ptr<TranslationService> service = Service();
    if (!service)
    {
        Finish(op, TranslateOutcome{false, Error::Make(ErrorKind::NoTranslationService, "no translation service configured")});
        return;
    }

    TranslationRequest req;
    req.texts = op->texts_;
    req.from = op->from_;
    req.to = op->to_;
    req.seed = std::move(snapshot);

    op->state_ = TranslateState::Translating;
    std::weak_ptr<Liveness> weak = alive_;
    service->Translate(std::move(req), [weak, op](TranslationResult result)
    {
        std::shared_ptr<Liveness> live = weak.lock();
        if (!live)
        {
            std::fprintf(stderr, "[translate] #%llu: result arrived after shutdown; dropped\n", (unsigned long long)op->Id());
            return;
        }
        std::lock_guard<std::mutex> lock(live->mu);
        if (!live->self)
        {
            std::fprintf(stderr, "[translate] #%llu: result arrived after shutdown; dropped\n", (unsigned long long)op->Id());
            return;
        }
        live->self->OnServiceResult(op, std::move(result));
    });
}

void TranslationCoordinator::OnServiceResult(const OpPtr& op, TranslationResult result)
{
    if (op->service_answered_.exchange(true))
    {
        std::fprintf(stderr, "[translate] #%llu: service completed more than once; ignoring\n", (unsigned long long)op->Id());
        return;
    }

    if (!result.ok)
    {
        Finish(op, TranslateOutcome{false, std::move(result.error)});
        return;
    }

    op->state_ = TranslateState::Merging;
    auto translated = std::make_shared<TranslationTable>(std::move(result.table));
    if (!PostJob([this, op, translated]() { MergeAndWrite(op, *translated); }))
        Finish(op, TranslateOutcome{false, Error::Make(ErrorKind::IOFailure, "worker pool is shut down")});
}

void TranslationCoordinator::MergeAndWrite(const OpPtr& op, const TranslationTable& translated)
{
    // Re-read: the bundle may have changed while the service was working.
    std::vector<LanguageKey> langs = bundles_.KnownLanguages();
    for (const auto& lang : op->all_)
        AppendUnique(langs, lang);
    TranslationTable current = bundles_.Load(langs);
    current.Merge(translated);

    op->state_ = TranslateState::Writing;
    Error err;
    if (!bundles_.WriteAtomic(current, err))
    {
        Finish(op, TranslateOutcome{false, std::move(err)});
        return;
    }
    Finish(op, TranslateOutcome{true, Error{}});
}

void TranslationCoordinator::Finish(const OpPtr& op, TranslateOutcome outcome)
{
    if (op->finished_.exchange(true))
        return;

    op->state_ = outcome.ok ? TranslateState::Completed : TranslateState::Failed;
    if (!outcome.ok)
        std::fprintf(stderr, "[translate] #%llu failed: %s\n", (unsigned long long)op->Id(), Describe(outcome.error).c_str());
    --in_flight_;

    StoreEvents* events = &events_;
    completions_.Push([events, op, outcome = std::move(outcome)]()
    {
        if (outcome.ok)
            events->changed.Emit();
        else
            events->failed.Emit(outcome.error);
        if (op->done_)
            op->done_(*op, outcome);
    });
}

} // namespace lingua
