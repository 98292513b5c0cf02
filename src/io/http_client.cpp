#include "io/http_client.h"

#include <curl/curl.h>

#include <mutex>
#include <sstream>

namespace lingua::http
{
namespace
{
static size_t WriteToString(void* contents, size_t size, size_t nmemb, void* userp)
{
    const size_t n = size * nmemb;
    auto* out = reinterpret_cast<std::string*>(userp);
    out->append(reinterpret_cast<const char*>(contents), n);
    return n;
}

static void EnsureCurlGlobalInit()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}
} // namespace

std::string JoinUrl(const std::string& base, const std::string& path)
{
    if (base.empty())
        return path;
    std::string out = base;
    while (!out.empty() && out.back() == '/')
        out.pop_back();
    size_t b = 0;
    while (b < path.size() && path[b] == '/')
        ++b;
    out.push_back('/');
    out.append(path, b, std::string::npos);
    return out;
}

Response Post(const std::string& url,
              const std::string& body,
              const std::map<std::string, std::string>& headers,
              const Options& options)
{
    Response r;

    EnsureCurlGlobalInit();

    CURL* curl = curl_easy_init();
    if (!curl)
    {
        r.err = "curl_easy_init failed.";
        return r;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""); // enable gzip/deflate/br when built with support
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "lingua/0.1");
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // called from worker threads

    // Build header list.
    curl_slist* hdrs = nullptr;
    for (const auto& kv : headers)
    {
        std::string line = kv.first + ": " + kv.second;
        hdrs = curl_slist_append(hdrs, line.c_str());
    }
    if (hdrs)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK)
    {
        r.err = curl_easy_strerror(code);
        if (hdrs)
            curl_slist_free_all(hdrs);
        curl_easy_cleanup(curl);
        return r;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    r.status = status;

    if (hdrs)
        curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);

    if (r.status < 200 || r.status >= 300)
    {
        std::ostringstream oss;
        oss << "HTTP " << r.status;
        r.err = oss.str();
    }
    return r;
}

} // namespace lingua::http
