#include "io/http_translation_service.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <memory>

using json = nlohmann::json;

namespace lingua
{

HttpTranslationService::HttpTranslationService(TranslationServiceConfig config, Transport transport)
    : config_(std::move(config))
    , transport_(transport ? std::move(transport) : Transport(&http::Post))
{
}

HttpTranslationService::~HttpTranslationService()
{
    worker_.Shutdown();
}

std::string HttpTranslationService::BuildRequestBody(const std::vector<std::string>& texts,
                                                     const std::string& source,
                                                     const std::string& target,
                                                     const std::string& api_key)
{
    json j;
    j["q"] = texts;
    j["source"] = source;
    j["target"] = target;
    j["format"] = "text";
    if (!api_key.empty())
        j["api_key"] = api_key;
    return j.dump();
}

bool HttpTranslationService::ParseResponse(const std::string& body,
                                           size_t expected,
                                           std::vector<std::string>& out,
                                           std::string& err)
{
    err.clear();
    out.clear();

    json j;
    try
    {
        j = json::parse(body);
    }
    catch (const std::exception& e)
    {
        err = std::string("invalid JSON response: ") + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = "response is not a JSON object";
        return false;
    }
    if (j.contains("error") && j["error"].is_string())
    {
        err = j["error"].get<std::string>();
        return false;
    }
    if (!j.contains("translatedText"))
    {
        err = "response has no translatedText";
        return false;
    }

    const json& t = j["translatedText"];
    if (t.is_string() && expected == 1)
    {
        out.push_back(t.get<std::string>());
        return true;
    }
    if (!t.is_array() || t.size() != expected)
    {
        err = "translatedText does not match the number of texts sent";
        return false;
    }
    for (const auto& v : t)
    {
        if (!v.is_string())
        {
            err = "translatedText contains a non-string entry";
            out.clear();
            return false;
        }
        out.push_back(v.get<std::string>());
    }
    return true;
}

TranslationResult HttpTranslationService::Run(const TranslationRequest& request) const
{
    TranslationResult result;
    result.table = request.seed;

    if (config_.endpoint.empty())
    {
        result.error = Error::Make(ErrorKind::ServiceFailure, "translation endpoint is not configured");
        return result;
    }
    if (request.texts.empty())
    {
        result.ok = true;
        return result;
    }

    const std::string url = http::JoinUrl(config_.endpoint, "translate");
    const std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    http::Options opts;
    opts.timeout_seconds = config_.timeout_seconds;

    for (const auto& target : request.to)
    {
        const std::string body = BuildRequestBody(request.texts, request.from, target, config_.api_key);
        const http::Response resp = transport_(url, body, headers, opts);

        std::vector<std::string> translated;
        std::string perr;
        if (!http::Ok(resp))
        {
            // Error bodies usually carry {"error": "..."}; prefer that text.
            std::string detail;
            if (!resp.body.empty() && !ParseResponse(resp.body, request.texts.size(), translated, detail) && !detail.empty())
                perr = resp.err + " (" + detail + ")";
            else
                perr = resp.err;
            result.error = Error::Make(ErrorKind::ServiceFailure, request.from + "->" + target + ": " + perr);
            return result;
        }
        if (!ParseResponse(resp.body, request.texts.size(), translated, perr))
        {
            result.error = Error::Make(ErrorKind::ServiceFailure, request.from + "->" + target + ": " + perr);
            return result;
        }

        for (size_t i = 0; i < translated.size(); ++i)
            result.table.Set(target, request.texts[i], std::move(translated[i]));
    }

    result.ok = true;
    return result;
}

void HttpTranslationService::Translate(TranslationRequest request, Completion done)
{
    auto req = std::make_shared<TranslationRequest>(std::move(request));
    const bool posted = worker_.Post([this, req, done]()
    {
        TranslationResult r = Run(*req);
        if (!r.ok)
            std::fprintf(stderr, "[http] %s\n", Describe(r.error).c_str());
        done(std::move(r));
    });
    if (!posted)
    {
        TranslationResult r;
        r.error = Error::Make(ErrorKind::ServiceFailure, "translation service is shutting down");
        done(std::move(r));
    }
}

} // namespace lingua
