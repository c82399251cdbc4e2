#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace toolhost {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 when the transfer itself failed
    std::string reason;     // status line reason phrase
    std::string body;
    std::string error;      // transport error when status_code == 0
};

// Standard reason phrase for a status code ("Not Found"), or "" if unknown.
// HTTP/2 responses carry no reason phrase on the wire.
std::string http_reason_phrase(long status_code);

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;
};

// libcurl-backed client; follows redirects.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

} // namespace toolhost
