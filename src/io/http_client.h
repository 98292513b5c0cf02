#pragma once

#include <map>
#include <string>

namespace lingua::http
{

struct Response
{
    long        status = 0;
    std::string body;
    std::string err;
};

struct Options
{
    long timeout_seconds = 30;
    long connect_timeout_seconds = 10;
};

// Simple blocking POST (HTTPS supported via libcurl).
// - Follows redirects
// - Sets a basic User-Agent
// - Returns status code + raw body
Response Post(const std::string& url,
              const std::string& body,
              const std::map<std::string, std::string>& headers = {},
              const Options& options = {});

inline bool Ok(const Response& r) { return r.err.empty() && r.status >= 200 && r.status < 300; }

// Joins a base URL and a path with exactly one '/' between them.
std::string JoinUrl(const std::string& base, const std::string& path);

} // namespace lingua::http
