#include "io/bundle_store.h"

#include "core/token.h"
#include "io/file_util.h"
#include "io/strings_file.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace lingua
{
namespace
{
constexpr const char* kBundleExtension = ".bundle";
constexpr const char* kLanguageExtension = ".lang";

static void AppendUnique(std::vector<LanguageKey>& v, const LanguageKey& lang)
{
    if (std::find(v.begin(), v.end(), lang) == v.end())
        v.push_back(lang);
}
} // namespace

BundleStore::BundleStore(fs::path bundles_dir,
                         std::string table_name,
                         std::vector<LanguageKey> languages,
                         PersistentSlot& slot)
    : bundles_dir_(std::move(bundles_dir))
    , table_name_(std::move(table_name))
    , languages_(std::move(languages))
    , slot_(slot)
    , writer_(&file_util::WriteFileAtomic)
{
}

void BundleStore::SetFileWriter(FileWriter writer)
{
    writer_ = writer ? std::move(writer) : FileWriter(&file_util::WriteFileAtomic);
}

void BundleStore::SetWarningHook(WarningHook hook)
{
    warning_hook_ = std::move(hook);
}

void BundleStore::Warn(const Error& e) const
{
    std::fprintf(stderr, "[bundle] %s\n", Describe(e).c_str());
    if (warning_hook_)
        warning_hook_(e);
}

fs::path BundleStore::TableFilePath(const fs::path& root, const std::string& table_name, const LanguageKey& language)
{
    return root / (language + kLanguageExtension) / (table_name + "." + std::string(strings_file::kExtension));
}

bool BundleStore::CreateDirectoryLayout(const fs::path& root,
                                        const std::string& table_name,
                                        const std::vector<LanguageKey>& languages,
                                        Error& err)
{
    try
    {
        fs::create_directories(root);
        for (const auto& lang : languages)
        {
            const fs::path file = TableFilePath(root, table_name, lang);
            fs::create_directories(file.parent_path());
            if (fs::exists(file))
                continue;
            std::ofstream out(file, std::ios::binary);
            if (!out)
            {
                err = Error::Make(ErrorKind::IOFailure, "failed to create " + file.string());
                return false;
            }
        }
    }
    catch (const std::exception& e)
    {
        err = Error::Make(ErrorKind::IOFailure, e.what());
        return false;
    }
    return true;
}

TranslationTable BundleStore::Load(const fs::path& root,
                                   const std::string& table_name,
                                   const std::vector<LanguageKey>& languages)
{
    TranslationTable t;
    if (root.empty())
        return t;

    for (const auto& lang : languages)
    {
        const fs::path file = TableFilePath(root, table_name, lang);
        std::error_code ec;
        if (!fs::exists(file, ec))
            continue;

        TranslationTable::Entries entries;
        std::string rerr;
        if (!strings_file::ReadFile(file.string(), entries, rerr))
        {
            // One bad language never blocks the others.
            std::fprintf(stderr, "[bundle] skipping %s: %s\n", file.string().c_str(), rerr.c_str());
            continue;
        }
        if (!entries.empty())
            t.Data()[lang] = std::move(entries);
    }
    return t;
}

TranslationTable BundleStore::Load(const std::vector<LanguageKey>& languages) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return Load(current_, table_name_, languages);
}

TranslationTable::Entries BundleStore::LoadLanguage(const LanguageKey& language, std::uint64_t* generation) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (generation)
        *generation = generation_;
    TranslationTable t = Load(current_, table_name_, {language});
    auto it = t.Data().find(language);
    if (it == t.Data().end())
        return {};
    return std::move(it->second);
}

std::vector<LanguageKey> BundleStore::KnownLanguages() const
{
    std::vector<LanguageKey> out = languages_;

    std::shared_lock<std::shared_mutex> lock(mu_);
    if (current_.empty())
        return out;

    std::error_code ec;
    std::vector<LanguageKey> found;
    for (fs::directory_iterator it(current_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code dec;
        if (!it->is_directory(dec) || it->path().extension() != kLanguageExtension)
            continue;
        found.push_back(it->path().stem().string());
    }
    std::sort(found.begin(), found.end());
    for (const auto& lang : found)
        AppendUnique(out, lang);
    return out;
}

bool BundleStore::CreateFreshRoot(fs::path& out, Error& err)
{
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        const fs::path candidate = bundles_dir_ / (RandomHexToken(16) + kBundleExtension);
        std::error_code ec;
        if (fs::exists(candidate, ec))
            continue;
        if (!CreateDirectoryLayout(candidate, table_name_, languages_, err))
            return false;
        out = candidate;
        return true;
    }
    err = Error::Make(ErrorKind::IOFailure, "could not pick a unique bundle name in " + bundles_dir_.string());
    return false;
}

void BundleStore::Commit(const fs::path& new_root)
{
    std::lock_guard<std::mutex> commit(commit_mu_);

    fs::path old;
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        old = current_;
        current_ = new_root;
        ++generation_;
    }

    std::string serr;
    if (!slot_.Set(new_root.filename().string(), serr))
        Warn(Error::Make(ErrorKind::IOFailure, "failed to persist current bundle name: " + serr));

    if (!old.empty() && old != new_root)
    {
        Error derr;
        (void)Delete(old, derr); // reported through the warning hook
    }
}

bool BundleStore::Open(Error& err)
{
    try
    {
        fs::create_directories(bundles_dir_);
    }
    catch (const std::exception& e)
    {
        err = Error::Make(ErrorKind::IOFailure, e.what());
        return false;
    }

    fs::path root;
    if (const auto name = slot_.Get(); name && !name->empty())
    {
        const fs::path candidate = bundles_dir_ / *name;
        std::error_code ec;
        if (fs::is_directory(candidate, ec))
            root = candidate;
        else
            std::fprintf(stderr, "[bundle] stored bundle %s is gone; starting fresh\n", name->c_str());
    }

    if (!root.empty())
    {
        // Supported languages may have grown since the bundle was written.
        if (!CreateDirectoryLayout(root, table_name_, languages_, err))
            return false;
        std::lock_guard<std::mutex> commit(commit_mu_);
        std::unique_lock<std::shared_mutex> lock(mu_);
        current_ = root;
        ++generation_;
    }
    else
    {
        if (!CreateFreshRoot(root, err))
            return false;
        Commit(root);
    }

    PruneStaleRoots(kStaleBundleAge);
    return true;
}

bool BundleStore::WriteAtomic(const TranslationTable& table, Error& err)
{
    std::vector<LanguageKey> langs = languages_;
    for (const auto& lang : table.Languages())
        AppendUnique(langs, lang);

    fs::path root;
    if (!CreateFreshRoot(root, err))
        return false;

    for (const auto& lang : langs)
    {
        std::string bytes;
        std::string serr;
        if (!strings_file::Serialize(table.EntriesFor(lang), bytes, serr))
        {
            err = Error::Make(ErrorKind::SerializationFailure, lang + ": " + serr);
            std::fprintf(stderr, "[bundle] write aborted, %s\n", Describe(err).c_str());
            return false;
        }

        const fs::path file = TableFilePath(root, table_name_, lang);
        std::string werr;
        if (!writer_(file, bytes, werr))
        {
            err = Error::Make(ErrorKind::IOFailure, file.string() + ": " + werr);
            std::fprintf(stderr, "[bundle] write aborted, %s\n", Describe(err).c_str());
            return false;
        }
    }

    Commit(root);
    return true;
}

bool BundleStore::Clean(Error& err)
{
    fs::path root;
    if (!CreateFreshRoot(root, err))
        return false;
    Commit(root);
    return true;
}

bool BundleStore::Delete(const fs::path& root, Error& err)
{
    if (root == CurrentRoot())
    {
        err = Error::Make(ErrorKind::IOFailure, "refusing to delete the current bundle " + root.string());
        Warn(err);
        return false;
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec)
    {
        err = Error::Make(ErrorKind::IOFailure, "failed to delete " + root.string() + ": " + ec.message());
        Warn(err);
        return false;
    }
    return true;
}

size_t BundleStore::PruneStaleRoots(std::chrono::seconds min_age)
{
    const fs::path current = CurrentRoot();
    const auto cutoff = fs::file_time_type::clock::now() - min_age;

    std::vector<fs::path> stale;
    std::error_code ec;
    for (fs::directory_iterator it(bundles_dir_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code dec;
        if (!it->is_directory(dec) || it->path().extension() != kBundleExtension)
            continue;
        if (it->path() == current)
            continue;
        if (min_age.count() > 0)
        {
            std::error_code tec;
            const auto mtime = fs::last_write_time(it->path(), tec);
            if (tec || mtime > cutoff)
                continue;
        }
        stale.push_back(it->path());
    }

    size_t removed = 0;
    for (const auto& p : stale)
    {
        Error derr;
        if (Delete(p, derr))
            ++removed;
    }
    return removed;
}

fs::path BundleStore::CurrentRoot() const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return current_;
}

std::uint64_t BundleStore::Generation() const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return generation_;
}

} // namespace lingua
