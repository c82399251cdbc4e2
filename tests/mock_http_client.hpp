#pragma once
#include "http.hpp"

namespace toolhost {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_url;
    std::vector<Header> last_headers;
    long last_timeout = 0;
    int call_count = 0;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds) override {
        call_count++;
        last_url = url;
        last_headers = headers;
        last_timeout = timeout_seconds;
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

    std::string header(const std::string& name) const {
        for (const auto& h : last_headers) {
            if (h.first == name) return h.second;
        }
        return "";
    }
};

} // namespace toolhost
