#include "core/app_resources.h"
#include "core/store.h"
#include "io/http_translation_service.h"
#include "io/state_slot.h"
#include "io/store_config.h"
#include "io/strings_file.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{
volatile std::sig_atomic_t g_InterruptRequested = 0;

void HandleInterruptSignal(int signal)
{
    if (signal == SIGINT)
        g_InterruptRequested = 1;
}

void PrintUsage()
{
    std::fprintf(stderr,
                 "usage: lingua [--config <path>] <command> [args]\n"
                 "\n"
                 "commands:\n"
                 "  translate --from <lang> [--to a,b] <text>...   machine-translate and store\n"
                 "  get <key> [--lang <lang>] [--default <value>]  resolve a string\n"
                 "  check <text> [lang...]                         exit 0 if translated everywhere\n"
                 "  dump [lang...]                                 print stored tables\n"
                 "  set <lang> <key> <value>                       store one entry\n"
                 "  remove <key>...                                remove keys from every language\n"
                 "  clean                                          wipe the stored tables\n"
                 "  init <lang>... [--endpoint <url>] [--api-key <key>] [--force]\n"
                 "                                                 write a new config file\n");
}

std::vector<std::string> SplitComma(const std::string& s)
{
    std::vector<std::string> out;
    size_t b = 0;
    while (b <= s.size())
    {
        const size_t p = s.find(',', b);
        const size_t e = (p == std::string::npos) ? s.size() : p;
        if (e > b)
            out.push_back(s.substr(b, e - b));
        if (p == std::string::npos)
            break;
        b = p + 1;
    }
    return out;
}

// Pumps the completion queue until `finished` flips (or Ctrl+C).
bool WaitFor(lingua::Store& store, const bool& finished)
{
    while (!finished)
    {
        if (g_InterruptRequested)
        {
            std::fprintf(stderr, "lingua: interrupted\n");
            return false;
        }
        store.WaitForCompletions(std::chrono::milliseconds(100));
    }
    return true;
}

int RunMutation(lingua::Store& store, const std::function<void(lingua::Store::Done)>& start)
{
    bool finished = false;
    lingua::TranslateOutcome result;
    start([&](const lingua::TranslateOutcome& o)
    {
        result = o;
        finished = true;
    });
    if (!WaitFor(store, finished))
        return 1;
    if (!result.ok)
    {
        std::fprintf(stderr, "lingua: %s\n", lingua::Describe(result.error).c_str());
        return 1;
    }
    return 0;
}

int CmdTranslate(lingua::Store& store, const std::vector<std::string>& args)
{
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> texts;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "--from" && i + 1 < args.size())
            from = args[++i];
        else if (args[i] == "--to" && i + 1 < args.size())
            to = SplitComma(args[++i]);
        else
            texts.push_back(args[i]);
    }
    if (from.empty() || texts.empty())
    {
        PrintUsage();
        return 2;
    }

    bool finished = false;
    lingua::TranslateOutcome result;
    auto op = store.Translate(texts, from, to, [&](const lingua::TranslateOperation&, const lingua::TranslateOutcome& o)
    {
        result = o;
        finished = true;
    });
    if (!WaitFor(store, finished))
        return 1;
    if (!result.ok)
    {
        std::fprintf(stderr, "lingua: translate #%llu: %s\n",
                     (unsigned long long)op->Id(), lingua::Describe(result.error).c_str());
        return 1;
    }

    for (const auto& lang : op->To())
    {
        for (const auto& t : texts)
            std::printf("%s\t%s\t%s\n", lang.c_str(), t.c_str(), store.String(t, lang).c_str());
    }
    return 0;
}

int CmdGet(lingua::Store& store, const std::vector<std::string>& args)
{
    std::string key;
    std::string lang;
    std::optional<std::string> fallback;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "--lang" && i + 1 < args.size())
            lang = args[++i];
        else if (args[i] == "--default" && i + 1 < args.size())
            fallback = args[++i];
        else if (key.empty())
            key = args[i];
    }
    if (key.empty())
    {
        PrintUsage();
        return 2;
    }
    const std::string value = lang.empty()
        ? store.String(key, store.LanguageCode(), fallback)
        : store.String(key, lang, fallback);
    std::printf("%s\n", value.c_str());
    return 0;
}

int CmdCheck(lingua::Store& store, const std::vector<std::string>& args)
{
    if (args.empty())
    {
        PrintUsage();
        return 2;
    }
    std::vector<std::string> langs(args.begin() + 1, args.end());
    if (langs.empty())
        langs = store.SupportedLanguages();
    const bool ok = store.IsTranslated(args[0], langs);
    std::printf("%s\n", ok ? "translated" : "missing");
    return ok ? 0 : 1;
}

int CmdDump(lingua::Store& store, const std::vector<std::string>& args)
{
    std::vector<std::string> langs = args;
    if (langs.empty())
        langs = store.Bundles().KnownLanguages();

    const lingua::TranslationTable t = store.Translations(langs);
    for (const auto& lang : langs)
    {
        std::string text;
        std::string err;
        if (!lingua::strings_file::Serialize(t.EntriesFor(lang), text, err))
        {
            std::fprintf(stderr, "lingua: %s: %s\n", lang.c_str(), err.c_str());
            return 1;
        }
        std::printf("// %s\n%s", lang.c_str(), text.c_str());
    }
    return 0;
}

int CmdSet(lingua::Store& store, const std::vector<std::string>& args)
{
    if (args.size() != 3)
    {
        PrintUsage();
        return 2;
    }
    lingua::TranslationTable t = store.Translations(store.Bundles().KnownLanguages());
    t.Set(args[0], args[1], args[2]);
    return RunMutation(store, [&](lingua::Store::Done done) { store.Write(std::move(t), std::move(done)); });
}

int CmdRemove(lingua::Store& store, const std::vector<std::string>& args)
{
    if (args.empty())
    {
        PrintUsage();
        return 2;
    }
    return RunMutation(store, [&](lingua::Store::Done done) { store.Remove(args, std::move(done)); });
}

int CmdInit(const std::string& config_path, const std::vector<std::string>& args)
{
    lingua::StoreConfig cfg;
    bool force = false;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "--endpoint" && i + 1 < args.size())
            cfg.translation_service.endpoint = args[++i];
        else if (args[i] == "--api-key" && i + 1 < args.size())
            cfg.translation_service.api_key = args[++i];
        else if (args[i] == "--force")
            force = true;
        else if (std::find(cfg.supported_languages.begin(), cfg.supported_languages.end(), args[i]) ==
                 cfg.supported_languages.end())
            cfg.supported_languages.push_back(args[i]);
    }
    if (cfg.supported_languages.empty())
    {
        PrintUsage();
        return 2;
    }

    std::error_code ec;
    if (!force && std::filesystem::exists(config_path, ec))
    {
        std::fprintf(stderr, "[config] %s already exists (use --force to overwrite)\n", config_path.c_str());
        return 2;
    }

    std::string err;
    if (!lingua::SaveStoreConfig(config_path, cfg, err))
    {
        std::fprintf(stderr, "[config] failed to write %s: %s\n", config_path.c_str(), err.c_str());
        return 1;
    }
    std::printf("%s\n", config_path.c_str());
    return 0;
}

int CmdClean(lingua::Store& store)
{
    return RunMutation(store, [&](lingua::Store::Done done) { store.Clean(std::move(done)); });
}
} // namespace

int main(int argc, char** argv)
{
    std::signal(SIGINT, HandleInterruptSignal);

    std::string config_path = lingua::GetConfigFilePath();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
            config_path = argv[++i];
        else if (a == "-h" || a == "--help")
        {
            PrintUsage();
            return 0;
        }
        else
            args.push_back(a);
    }
    if (args.empty())
    {
        PrintUsage();
        return 2;
    }

    const std::string cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    if (cmd == "init")
        return CmdInit(config_path, rest);

    lingua::StoreConfig cfg;
    {
        std::string err;
        if (!lingua::LoadStoreConfig(config_path, cfg, err))
        {
            const lingua::Error e = lingua::Error::Make(lingua::ErrorKind::ConfigFailure, err);
            std::fprintf(stderr, "[config] %s\n", lingua::Describe(e).c_str());
            return 2;
        }
    }
    cfg = lingua::ResolveDefaults(std::move(cfg));
    if (cfg.supported_languages.empty())
    {
        std::fprintf(stderr, "[config] %s: supported_languages is empty (see `lingua init`)\n", config_path.c_str());
        return 2;
    }

    lingua::JsonFileSlot slot(cfg.state_path, lingua::kCurrentBundleKey);

    lingua::StoreOptions opts;
    opts.table_name = cfg.table_name;
    opts.supported_languages = cfg.supported_languages;
    opts.locale = cfg.locale;
    opts.bundles_dir = cfg.bundles_dir;
    opts.workers = (size_t)std::max(1, cfg.workers);

    std::shared_ptr<lingua::TranslationService> service;
    if (!cfg.translation_service.endpoint.empty())
        service = std::make_shared<lingua::HttpTranslationService>(cfg.translation_service);

    std::shared_ptr<const lingua::AppResources> app;
    if (!cfg.app_resources_dir.empty())
        app = std::make_shared<lingua::IcuAppResources>(cfg.app_resources_dir);

    lingua::Store store(opts, slot, service, app);
    store.SetDisabled(cfg.disabled);
    {
        lingua::Error err;
        if (!store.Open(err))
        {
            std::fprintf(stderr, "[bundle] %s\n", lingua::Describe(err).c_str());
            return 1;
        }
    }

    int rc = 2;
    if (cmd == "translate")
        rc = CmdTranslate(store, rest);
    else if (cmd == "get")
        rc = CmdGet(store, rest);
    else if (cmd == "check")
        rc = CmdCheck(store, rest);
    else if (cmd == "dump")
        rc = CmdDump(store, rest);
    else if (cmd == "set")
        rc = CmdSet(store, rest);
    else if (cmd == "remove")
        rc = CmdRemove(store, rest);
    else if (cmd == "clean")
        rc = CmdClean(store);
    else
        PrintUsage();

    // Deliver anything still queued (e.g. cleanup warnings) before exiting.
    store.PollCompletions();
    return rc;
}
