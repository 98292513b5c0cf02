#include <catch2/catch.hpp>

#include "io/state_slot.h"
#include "io/store_config.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <fstream>

using json = nlohmann::json;

namespace
{
json ReadJson(const std::filesystem::path& p)
{
    std::ifstream in(p);
    json j;
    in >> j;
    return j;
}
} // namespace

TEST_CASE("MemorySlot starts empty and remembers the last value", "[state]")
{
    lingua::MemorySlot slot;
    REQUIRE_FALSE(slot.Get().has_value());

    std::string err;
    REQUIRE(slot.Set("a.bundle", err));
    REQUIRE(slot.Set("b.bundle", err));
    REQUIRE(*slot.Get() == "b.bundle");
}

TEST_CASE("JsonFileSlot keeps unrelated keys", "[state]")
{
    testutils::TempDir tmp;
    const auto path = tmp.Path() / "state.json";
    {
        std::ofstream out(path);
        out << R"({"window": {"w": 800}, "current_bundle": "old.bundle"})";
    }

    lingua::JsonFileSlot slot(path.string(), lingua::kCurrentBundleKey);
    REQUIRE(*slot.Get() == "old.bundle");

    std::string err;
    REQUIRE(slot.Set("new.bundle", err));

    const json j = ReadJson(path);
    REQUIRE(j["current_bundle"] == "new.bundle");
    REQUIRE(j["window"]["w"] == 800);

    lingua::JsonFileSlot again(path.string(), lingua::kCurrentBundleKey);
    REQUIRE(*again.Get() == "new.bundle");
}

TEST_CASE("JsonFileSlot treats a missing or corrupt file as empty", "[state]")
{
    testutils::TempDir tmp;
    const auto path = tmp.Path() / "nested" / "state.json";

    lingua::JsonFileSlot slot(path.string(), "k");
    REQUIRE_FALSE(slot.Get().has_value());

    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    REQUIRE_FALSE(slot.Get().has_value());

    std::string err;
    REQUIRE(slot.Set("v", err));
    REQUIRE(*slot.Get() == "v");
}

TEST_CASE("Store config loads defaults when the file is absent", "[config]")
{
    testutils::TempDir tmp;
    lingua::StoreConfig cfg;
    std::string err;
    REQUIRE(lingua::LoadStoreConfig((tmp.Path() / "lingua.json").string(), cfg, err));
    REQUIRE(cfg.table_name == "Localizable");
    REQUIRE(cfg.workers == 1);
    REQUIRE_FALSE(cfg.disabled);
    REQUIRE(cfg.translation_service.endpoint.empty());
}

TEST_CASE("Store config survives a save and load", "[config]")
{
    testutils::TempDir tmp;
    const std::string path = (tmp.Path() / "lingua.json").string();

    lingua::StoreConfig cfg;
    cfg.table_name = "Main";
    cfg.supported_languages = {"sv", "en"};
    cfg.locale = "sv-SE";
    cfg.bundles_dir = "/tmp/b";
    cfg.workers = 3;
    cfg.disabled = true;
    cfg.translation_service.endpoint = "http://localhost:5000/";
    cfg.translation_service.timeout_seconds = 7;

    std::string err;
    REQUIRE(lingua::SaveStoreConfig(path, cfg, err));

    lingua::StoreConfig loaded;
    REQUIRE(lingua::LoadStoreConfig(path, loaded, err));
    REQUIRE(loaded.table_name == "Main");
    REQUIRE(loaded.supported_languages == std::vector<std::string>{"sv", "en"});
    REQUIRE(loaded.locale == "sv-SE");
    REQUIRE(loaded.bundles_dir == "/tmp/b");
    REQUIRE(loaded.workers == 3);
    REQUIRE(loaded.disabled);
    REQUIRE(loaded.translation_service.endpoint == "http://localhost:5000/");
    REQUIRE(loaded.translation_service.timeout_seconds == 7);
}

TEST_CASE("Store config rejects malformed and newer files", "[config]")
{
    testutils::TempDir tmp;
    const auto path = tmp.Path() / "lingua.json";
    std::string err;
    lingua::StoreConfig cfg;

    {
        std::ofstream out(path);
        out << "[1, 2";
    }
    REQUIRE_FALSE(lingua::LoadStoreConfig(path.string(), cfg, err));
    REQUIRE_FALSE(err.empty());

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"schema_version": 99, "table_name": "X"})";
    }
    REQUIRE_FALSE(lingua::LoadStoreConfig(path.string(), cfg, err));
    REQUIRE(cfg.table_name == "Localizable");
}

TEST_CASE("Unknown and mistyped config fields are ignored", "[config]")
{
    testutils::TempDir tmp;
    const auto path = tmp.Path() / "lingua.json";
    {
        std::ofstream out(path);
        out << R"({"workers": "four", "extra": true, "supported_languages": ["de", 5, "fr"]})";
    }
    lingua::StoreConfig cfg;
    std::string err;
    REQUIRE(lingua::LoadStoreConfig(path.string(), cfg, err));
    REQUIRE(cfg.workers == 1);
    REQUIRE(cfg.supported_languages == std::vector<std::string>{"de", "fr"});
}

TEST_CASE("A fresh config is written into a missing directory", "[config]")
{
    testutils::TempDir tmp;
    const std::string path = (tmp.Path() / "first" / "run" / "lingua.json").string();

    lingua::StoreConfig cfg;
    cfg.supported_languages = {"sv", "en"};
    cfg.translation_service.endpoint = "http://localhost:5000/";
    std::string err;
    REQUIRE(lingua::SaveStoreConfig(path, cfg, err));

    const json j = ReadJson(path);
    REQUIRE(j["schema_version"] == 1);
    REQUIRE_FALSE(j.contains("bundles_dir"));
    REQUIRE_FALSE(j["translation_service"].contains("api_key"));

    lingua::StoreConfig loaded;
    REQUIRE(lingua::LoadStoreConfig(path, loaded, err));
    REQUIRE(loaded.supported_languages == cfg.supported_languages);
    REQUIRE(loaded.table_name == "Localizable");
    REQUIRE(loaded.bundles_dir.empty());
    REQUIRE(lingua::ResolveDefaults(loaded).bundles_dir.size() > 0);
}
