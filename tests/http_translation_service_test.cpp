#include <catch2/catch.hpp>

#include "io/http_translation_service.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <future>

using json = nlohmann::json;
using lingua::ErrorKind;
using lingua::HttpTranslationService;
using lingua::TranslationRequest;
using lingua::TranslationResult;

namespace
{
lingua::TranslationServiceConfig Config()
{
    lingua::TranslationServiceConfig c;
    c.endpoint = "http://translate.local/";
    c.api_key = "secret";
    c.timeout_seconds = 5;
    return c;
}

TranslationResult TranslateSync(HttpTranslationService& svc, TranslationRequest req)
{
    std::promise<TranslationResult> p;
    auto f = p.get_future();
    svc.Translate(std::move(req), [&p](TranslationResult r) { p.set_value(std::move(r)); });
    REQUIRE(f.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    return f.get();
}
} // namespace

TEST_CASE("Request bodies carry texts, languages and the key", "[http]")
{
    const json j = json::parse(HttpTranslationService::BuildRequestBody({"hello", "bye"}, "en", "sv", "k"));
    REQUIRE(j["q"] == json::array({"hello", "bye"}));
    REQUIRE(j["source"] == "en");
    REQUIRE(j["target"] == "sv");
    REQUIRE(j["format"] == "text");
    REQUIRE(j["api_key"] == "k");

    const json no_key = json::parse(HttpTranslationService::BuildRequestBody({"x"}, "en", "sv", ""));
    REQUIRE_FALSE(no_key.contains("api_key"));
}

TEST_CASE("Responses are validated against the texts sent", "[http]")
{
    std::vector<std::string> out;
    std::string err;

    REQUIRE(HttpTranslationService::ParseResponse(R"({"translatedText": ["hej", "hej då"]})", 2, out, err));
    REQUIRE(out == std::vector<std::string>{"hej", "hej då"});

    REQUIRE(HttpTranslationService::ParseResponse(R"({"translatedText": "hej"})", 1, out, err));
    REQUIRE(out == std::vector<std::string>{"hej"});

    REQUIRE_FALSE(HttpTranslationService::ParseResponse(R"({"translatedText": ["a"]})", 2, out, err));
    REQUIRE_FALSE(HttpTranslationService::ParseResponse(R"({"error": "Invalid API key"})", 1, out, err));
    REQUIRE(err == "Invalid API key");
    REQUIRE_FALSE(HttpTranslationService::ParseResponse("<html>", 1, out, err));
    REQUIRE_FALSE(HttpTranslationService::ParseResponse(R"({"translatedText": [1]})", 1, out, err));
}

TEST_CASE("One call per target language fills the seed", "[http]")
{
    std::vector<std::string> urls;
    std::vector<json> bodies;
    std::string content_type;
    long timeout = 0;
    // Runs on the service thread; checked after completion.
    HttpTranslationService svc(Config(), [&](const std::string& url, const std::string& body,
                                             const std::map<std::string, std::string>& headers,
                                             const lingua::http::Options& opts)
    {
        urls.push_back(url);
        bodies.push_back(json::parse(body));
        content_type = headers.count("Content-Type") ? headers.at("Content-Type") : "";
        timeout = opts.timeout_seconds;

        lingua::http::Response r;
        r.status = 200;
        const std::string target = bodies.back()["target"].get<std::string>();
        r.body = json{{"translatedText", json::array({target + ":hello"})}}.dump();
        return r;
    });

    TranslationRequest req;
    req.texts = {"hello"};
    req.from = "en";
    req.to = {"sv", "fi"};
    req.seed.Set("sv", "old", "gammal");

    const TranslationResult res = TranslateSync(svc, req);
    REQUIRE(res.ok);
    REQUIRE(urls == std::vector<std::string>{"http://translate.local/translate", "http://translate.local/translate"});
    REQUIRE(bodies[0]["api_key"] == "secret");
    REQUIRE(content_type == "application/json");
    REQUIRE(timeout == 5);
    REQUIRE(*res.table.Get("sv", "hello") == "sv:hello");
    REQUIRE(*res.table.Get("fi", "hello") == "fi:hello");
    REQUIRE(*res.table.Get("sv", "old") == "gammal");
    REQUIRE_FALSE(res.table.Get("en", "hello").has_value());
}

TEST_CASE("HTTP errors fail the whole request", "[http]")
{
    int calls = 0;
    HttpTranslationService svc(Config(), [&](const std::string&, const std::string&,
                                             const std::map<std::string, std::string>&,
                                             const lingua::http::Options&)
    {
        ++calls;
        lingua::http::Response r;
        r.status = 403;
        r.err = "HTTP 403";
        r.body = R"({"error": "Invalid API key"})";
        return r;
    });

    TranslationRequest req;
    req.texts = {"hello"};
    req.from = "en";
    req.to = {"sv", "fi"};

    const TranslationResult res = TranslateSync(svc, req);
    REQUIRE_FALSE(res.ok);
    REQUIRE(calls == 1);
    REQUIRE(res.error.kind == ErrorKind::ServiceFailure);
    REQUIRE(res.error.message == "en->sv: HTTP 403 (Invalid API key)");
}

TEST_CASE("A missing endpoint is a service failure", "[http]")
{
    lingua::TranslationServiceConfig c;
    HttpTranslationService svc(c, [](const std::string&, const std::string&,
                                     const std::map<std::string, std::string>&,
                                     const lingua::http::Options&) { return lingua::http::Response{}; });
    TranslationRequest req;
    req.texts = {"hello"};
    req.from = "en";
    req.to = {"sv"};
    const TranslationResult res = TranslateSync(svc, req);
    REQUIRE_FALSE(res.ok);
    REQUIRE(res.error.kind == ErrorKind::ServiceFailure);
}

TEST_CASE("Urls are joined with a single slash", "[http]")
{
    REQUIRE(lingua::http::JoinUrl("http://a/", "/translate") == "http://a/translate");
    REQUIRE(lingua::http::JoinUrl("http://a", "translate") == "http://a/translate");
}
