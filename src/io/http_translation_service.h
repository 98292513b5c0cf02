#pragma once

#include "core/task_queue.h"
#include "core/translation_service.h"
#include "io/http_client.h"
#include "io/store_config.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lingua
{

// TranslationService backed by a LibreTranslate-compatible HTTP API.
//
//   POST <endpoint>/translate
//   {"q": ["hello", ...], "source": "en", "target": "sv", "format": "text", "api_key": "..."}
//   -> {"translatedText": ["hej", ...]}
//
// One request per target language, run on the service's own worker thread.
// Any failure fails the whole request with ErrorKind::ServiceFailure.
class HttpTranslationService final : public TranslationService
{
public:
    using Transport = std::function<http::Response(const std::string& url,
                                                   const std::string& body,
                                                   const std::map<std::string, std::string>& headers,
                                                   const http::Options& options)>;

    // `transport` defaults to http::Post (tests inject a fake).
    explicit HttpTranslationService(TranslationServiceConfig config, Transport transport = {});
    ~HttpTranslationService() override;

    void Translate(TranslationRequest request, Completion done) override;

    static std::string BuildRequestBody(const std::vector<std::string>& texts,
                                        const std::string& source,
                                        const std::string& target,
                                        const std::string& api_key);

    static bool ParseResponse(const std::string& body,
                              size_t expected,
                              std::vector<std::string>& out,
                              std::string& err);

private:
    TranslationResult Run(const TranslationRequest& request) const;

    TranslationServiceConfig config_;
    Transport                transport_;
    WorkerPool               worker_{1};
};

} // namespace lingua
