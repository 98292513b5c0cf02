#pragma once

#include "core/error.h"
#include "core/store_events.h"
#include "core/task_queue.h"
#include "core/translation_service.h"
#include "core/translation_table.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lingua
{

class BundleStore;

enum class TranslateState
{
    Idle,
    Reading,
    Translating,
    Merging,
    Writing,
    Completed,
    Failed,
};

const char* ToString(TranslateState s);

struct TranslateOutcome
{
    bool  ok = false;
    Error error; // valid when !ok
};

// Handle for one translate request. Owns the inputs it was started with.
class TranslateOperation
{
public:
    std::uint64_t  Id() const { return id_; }
    TranslateState State() const { return state_.load(); }
    bool           Finished() const { return finished_.load(); }

    const std::vector<std::string>& Texts() const { return texts_; }
    const LanguageKey&              From() const { return from_; }
    const std::vector<LanguageKey>& To() const { return to_; }
    const std::vector<LanguageKey>& AllLanguages() const { return all_; }

private:
    friend class TranslationCoordinator;

    std::uint64_t               id_ = 0;
    std::atomic<TranslateState> state_{TranslateState::Idle};
    std::atomic<bool>           service_answered_{false};
    std::atomic<bool>           finished_{false};

    std::vector<std::string> texts_;
    LanguageKey              from_;
    std::vector<LanguageKey> to_;
    std::vector<LanguageKey> all_;

    std::function<void(const TranslateOperation&, const TranslateOutcome&)> done_;
};

// Drives translate requests through Reading -> Translating -> Merging ->
// Writing -> Completed/Failed.
//
// Disk work runs on the worker pool; the service runs wherever it likes. The
// per-request callback plus exactly one `changed` or `failed` event are
// delivered through the completion queue.
//
// Requests are independent: there is no cross-request locking, so two
// overlapping requests are last-write-wins at the bundle store.
class TranslationCoordinator
{
public:
    using Callback = std::function<void(const TranslateOperation&, const TranslateOutcome&)>;

    TranslationCoordinator(BundleStore& bundles,
                           WorkerPool& workers,
                           CompletionQueue& completions,
                           StoreEvents& events);
    ~TranslationCoordinator();

    TranslationCoordinator(const TranslationCoordinator&) = delete;
    TranslationCoordinator& operator=(const TranslationCoordinator&) = delete;

    void SetService(std::shared_ptr<TranslationService> service);
    std::shared_ptr<TranslationService> Service() const;

    void SetDisabled(bool disabled) { disabled_.store(disabled); }
    bool Disabled() const { return disabled_.load(); }

    // `to` empty means every supported language except `from`.
    std::shared_ptr<const TranslateOperation> Translate(std::vector<std::string> texts,
                                                        LanguageKey from,
                                                        std::vector<LanguageKey> to = {},
                                                        Callback done = {});

    // Requests started and not yet finished.
    size_t InFlight() const { return in_flight_.load(); }

private:
    // Lets service completions find the coordinator without keeping it alive.
    struct Liveness
    {
        std::mutex              mu;
        TranslationCoordinator* self = nullptr;
    };

    using OpPtr = std::shared_ptr<TranslateOperation>;

    bool PostJob(Task job);
    void Read(const OpPtr& op);
    void OnServiceResult(const OpPtr& op, TranslationResult result);
    void MergeAndWrite(const OpPtr& op, const TranslationTable& translated);
    void Finish(const OpPtr& op, TranslateOutcome outcome);

    BundleStore&     bundles_;
    WorkerPool&      workers_;
    CompletionQueue& completions_;
    StoreEvents&     events_;

    mutable std::mutex                  service_mu_;
    std::shared_ptr<TranslationService> service_;

    std::atomic<bool>          disabled_{false};
    std::atomic<std::uint64_t> next_id_{0};
    std::atomic<size_t>        in_flight_{0};

    // Worker jobs that capture `this`; the destructor waits for them.
    std::mutex              jobs_mu_;
    std::condition_variable jobs_cv_;
    size_t                  jobs_pending_ = 0;

    std::shared_ptr<Liveness> alive_;
};

} // namespace lingua
