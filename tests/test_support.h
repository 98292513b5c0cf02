#pragma once

#include "core/store.h"
#include "core/token.h"
#include "core/translation_service.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace testutils
{

// Unique directory under the system temp dir, removed on destruction.
class TempDir
{
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("lingua_test_" + lingua::RandomHexToken(8)))
    {
        std::filesystem::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Dictionary-backed translation service.
//
// Modes:
// - Immediate: completes inside Translate()
// - Threaded:  completes from a separate thread
// - Deferred:  completions are parked until Release() is called
class FakeTranslationService final : public lingua::TranslationService
{
public:
    enum class Mode
    {
        Immediate,
        Threaded,
        Deferred,
    };

    explicit FakeTranslationService(Mode mode = Mode::Immediate) : mode_(mode) {}

    ~FakeTranslationService() override
    {
        for (auto& t : threads_)
        {
            if (t.joinable())
                t.join();
        }
    }

    void Add(const std::string& key, const std::string& value) { dict_[key] = value; }

    // Every request fails with this error.
    void FailWith(lingua::Error e) { fail_ = std::move(e); }

    // Completes each request this many times (>1 exercises duplicate delivery).
    void SetCompletions(int n) { completions_ = n; }

    void Translate(lingua::TranslationRequest request, Completion done) override
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            ++calls_;
            last_request_ = request;
        }

        lingua::TranslationResult r;
        if (fail_)
        {
            r.error = *fail_;
        }
        else
        {
            r.ok = true;
            r.table = request.seed;
            for (const auto& key : request.texts)
            {
                for (const auto& lang : request.to)
                {
                    auto it = dict_.find(key);
                    r.table.Set(lang, key, it != dict_.end() ? it->second : "unknown key " + key);
                }
            }
        }

        auto fire = [done, r, n = completions_]()
        {
            for (int i = 0; i < n; ++i)
                done(r);
        };

        switch (mode_)
        {
            case Mode::Immediate:
                fire();
                break;
            case Mode::Threaded:
            {
                std::lock_guard<std::mutex> lock(mu_);
                threads_.emplace_back(fire);
                break;
            }
            case Mode::Deferred:
            {
                std::lock_guard<std::mutex> lock(mu_);
                parked_.push_back(fire);
                break;
            }
        }
    }

    // Fires every parked completion. Returns how many fired.
    size_t Release()
    {
        std::vector<std::function<void()>> fire;
        {
            std::lock_guard<std::mutex> lock(mu_);
            fire.swap(parked_);
        }
        for (auto& f : fire)
            f();
        return fire.size();
    }

    size_t Parked() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return parked_.size();
    }

    int Calls() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_;
    }

    lingua::TranslationRequest LastRequest() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return last_request_;
    }

private:
    Mode                                mode_;
    std::map<std::string, std::string>  dict_;
    std::optional<lingua::Error>        fail_;
    int                                 completions_ = 1;

    mutable std::mutex                  mu_;
    int                                 calls_ = 0;
    lingua::TranslationRequest          last_request_;
    std::vector<std::thread>            threads_;
    std::vector<std::function<void()>>  parked_;
};

// Polls `pump` until `pred` holds or the timeout expires.
inline bool WaitUntil(const std::function<bool()>& pred,
                      const std::function<void()>& pump,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        pump();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace testutils
