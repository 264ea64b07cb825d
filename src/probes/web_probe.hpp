#pragma once
#include <string>

namespace gwmon {
struct HttpUrl {
    std::string host;
    std::string port;
    std::string path;
};

// http://host[:port][/path]. https and anything else are rejected.
bool parse_http_url(const std::string& url, HttpUrl& out);

// Minimal HTTP/1.0 GET over TCP, used only for "is the site answering OK".
class WebProbe {
   public:
    // Returns the response status code, or 0 when no status line arrived.
    int get(const std::string& url, int timeout_ms);

   private:
    bool warned_https_{false};
};
}  // namespace gwmon
