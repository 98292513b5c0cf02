#include "core/app_resources.h"

#include "core/language.h"

#include <unicode/unistr.h>
#include <unicode/ures.h>

#include <vector>

namespace lingua
{
namespace
{
static bool SplitDotted(std::string_view key, std::vector<std::string_view>& out)
{
    out.clear();
    if (key.empty())
        return false;

    size_t b = 0;
    for (;;)
    {
        const size_t p = key.find('.', b);
        const size_t e = (p == std::string_view::npos) ? key.size() : p;
        if (e == b)
            return false; // empty segment
        out.push_back(key.substr(b, e - b));
        if (p == std::string_view::npos)
            break;
        b = p + 1;
        if (b >= key.size())
            return false;
    }
    return !out.empty();
}

struct BundleHandle
{
    UResourceBundle* b = nullptr;
    BundleHandle() = default;
    explicit BundleHandle(UResourceBundle* bb) : b(bb) {}
    BundleHandle(const BundleHandle&) = delete;
    BundleHandle& operator=(const BundleHandle&) = delete;
    BundleHandle(BundleHandle&& o) noexcept : b(o.b) { o.b = nullptr; }
    BundleHandle& operator=(BundleHandle&& o) noexcept
    {
        if (this != &o)
        {
            if (b) ures_close(b);
            b = o.b;
            o.b = nullptr;
        }
        return *this;
    }
    ~BundleHandle()
    {
        if (b)
            ures_close(b);
    }
};

static bool ReadString(const UResourceBundle* res, std::string& out)
{
    if (ures_getType(res) != URES_STRING)
        return false;
    int32_t len = 0;
    UErrorCode status = U_ZERO_ERROR;
    const UChar* us = ures_getString(res, &len, &status);
    if (U_FAILURE(status) || !us)
        return false;
    out.clear();
    icu::UnicodeString(us, len).toUTF8String(out);
    return true;
}

// Top-level key as-is. ICU keys are invariant-character strings; anything else
// simply misses.
static bool LookupFlat(UResourceBundle* root, const std::string& key, std::string& out)
{
    UErrorCode status = U_ZERO_ERROR;
    BundleHandle child(ures_getByKey(root, key.c_str(), nullptr, &status));
    if (U_FAILURE(status) || !child.b)
        return false;
    return ReadString(child.b, out);
}

// Walk nested tables using ures_getByKey.
static bool LookupDotted(UResourceBundle* root, std::string_view key, std::string& out)
{
    std::vector<std::string_view> segs;
    if (!SplitDotted(key, segs) || segs.size() < 2)
        return false;

    BundleHandle cur(nullptr);
    UResourceBundle* cur_raw = root;
    for (const auto& sv : segs)
    {
        const std::string seg(sv);
        UErrorCode s = U_ZERO_ERROR;
        UResourceBundle* next = ures_getByKey(cur_raw, seg.c_str(), nullptr, &s);
        if (U_FAILURE(s) || !next)
        {
            if (next)
                ures_close(next);
            return false;
        }
        cur = BundleHandle(next);
        cur_raw = cur.b;
    }
    return ReadString(cur_raw, out);
}
} // namespace

void MapAppResources::Set(const std::string& language, const std::string& key, std::string value)
{
    std::lock_guard<std::mutex> lock(mu_);
    db_[LanguageCodeOf(language)][key] = std::move(value);
}

std::string MapAppResources::Lookup(std::string_view key,
                                    std::string_view language,
                                    const std::string& default_value) const
{
    const std::string lang = LanguageCodeOf(language);
    std::lock_guard<std::mutex> lock(mu_);
    auto lit = db_.find(lang);
    if (lit == db_.end())
        return default_value;
    auto kit = lit->second.find(std::string(key));
    if (kit == lit->second.end())
        return default_value;
    return kit->second;
}

struct IcuAppResources::Bundles
{
    std::mutex mu;
    // language -> opened bundle (nullptr cached when the language has no .res file)
    std::unordered_map<std::string, UResourceBundle*> open;

    ~Bundles()
    {
        for (auto& [lang, b] : open)
        {
            (void)lang;
            if (b)
                ures_close(b);
        }
    }
};

IcuAppResources::IcuAppResources(std::string bundle_dir)
    : bundle_dir_(std::move(bundle_dir))
    , bundles_(std::make_unique<Bundles>())
{
    // ICU reads a path without a trailing separator as "<dir>/<prefix>_<locale>.res".
    if (!bundle_dir_.empty() && bundle_dir_.back() != '/')
        bundle_dir_.push_back('/');
}

IcuAppResources::~IcuAppResources() = default;

std::string IcuAppResources::Lookup(std::string_view key,
                                    std::string_view language,
                                    const std::string& default_value) const
{
    if (bundle_dir_.empty() || key.empty())
        return default_value;

    const std::string lang = LanguageCodeOf(language);

    std::lock_guard<std::mutex> lock(bundles_->mu);
    auto it = bundles_->open.find(lang);
    if (it == bundles_->open.end())
    {
        UErrorCode status = U_ZERO_ERROR;
        UResourceBundle* b = ures_openDirect(bundle_dir_.c_str(), lang.c_str(), &status);
        if (U_FAILURE(status))
        {
            if (b)
                ures_close(b);
            b = nullptr;
        }
        it = bundles_->open.emplace(lang, b).first;
    }
    if (!it->second)
        return default_value;

    std::string out;
    const std::string k(key);
    if (LookupFlat(it->second, k, out))
        return out;
    if (k.find('.') != std::string::npos && LookupDotted(it->second, key, out))
        return out;
    return default_value;
}

} // namespace lingua
