#include <catch2/catch.hpp>

#include "core/app_resources.h"
#include "core/lookup_resolver.h"
#include "io/bundle_store.h"
#include "io/state_slot.h"
#include "test_support.h"

// sv.res and en.res are compiled from tests/data/res by genrb at build time.
static const char* kResDir = LINGUA_TEST_RES_DIR;

TEST_CASE("Flat keys are read from the compiled bundle", "[icu]")
{
    lingua::IcuAppResources app(kResDir);
    REQUIRE(app.Lookup("hello", "sv", "?") == "hej");
    REQUIRE(app.Lookup("bye", "sv", "?") == "hej då");
    REQUIRE(app.Lookup("hello", "en", "?") == "hello");
}

TEST_CASE("Dotted keys walk nested tables", "[icu]")
{
    lingua::IcuAppResources app(kResDir);
    REQUIRE(app.Lookup("menu.file.quit", "sv", "?") == "Avsluta");
    REQUIRE(app.Lookup("menu.file.quit", "en", "?") == "Quit");
    REQUIRE(app.Lookup("menu.file", "sv", "?") == "?");
    REQUIRE(app.Lookup("menu..quit", "sv", "?") == "?");
    REQUIRE(app.Lookup("menu.file.save", "sv", "?") == "?");
}

TEST_CASE("Missing keys and languages return the default", "[icu]")
{
    lingua::IcuAppResources app(kResDir);
    REQUIRE(app.Lookup("bye", "en", "fallback") == "fallback");
    REQUIRE(app.Lookup("hello", "de", "fallback") == "fallback");
    // Cached miss for the language answers the same way.
    REQUIRE(app.Lookup("hello", "de", "again") == "again");
    REQUIRE(app.Lookup("", "sv", "empty") == "empty");
}

TEST_CASE("Region locales use their language bundle", "[icu]")
{
    lingua::IcuAppResources app(kResDir);
    REQUIRE(app.Lookup("hello", "sv-SE", "?") == "hej");
    REQUIRE(app.Lookup("hello", "sv_FI", "?") == "hej");
}

TEST_CASE("A directory with a trailing separator works the same", "[icu]")
{
    lingua::IcuAppResources app(std::string(kResDir) + "/");
    REQUIRE(app.Lookup("hello", "sv", "?") == "hej");
}

TEST_CASE("Nonexistent resource directories fall through", "[icu]")
{
    lingua::IcuAppResources app("/nonexistent/lingua/res");
    REQUIRE(app.Lookup("hello", "sv", "fallback") == "fallback");
}

TEST_CASE("Compiled resources lead the resolver chain", "[icu]")
{
    testutils::TempDir tmp;
    lingua::MemorySlot slot;
    lingua::BundleStore bundles(tmp.Path(), "Localizable", {"sv", "en"}, slot);
    lingua::Error err;
    REQUIRE(bundles.Open(err));

    lingua::TranslationTable t;
    t.Set("sv", "hello", "tjena");
    t.Set("sv", "thanks", "tack");
    REQUIRE(bundles.WriteAtomic(t, err));

    lingua::LookupResolver r(bundles, std::make_shared<lingua::IcuAppResources>(kResDir));
    REQUIRE(r.Resolve("hello", "sv") == "hej");
    REQUIRE(r.Resolve("thanks", "sv") == "tack");
    REQUIRE(r.Resolve("menu.file.quit", "sv") == "Avsluta");
    REQUIRE(r.Resolve("nope", "sv") == "nope");
}
