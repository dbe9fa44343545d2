#pragma once
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP GET. Transport-level failures throw TrackerError; any HTTP
// status is returned to the caller.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_seconds);

    HttpResponse get(const std::string& url) override;

private:
    long timeout_seconds;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
