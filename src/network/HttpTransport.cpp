#include "HttpTransport.hpp"
#include "../core/Errors.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

CurlTransport::CurlTransport(long timeout_seconds) : timeout_seconds(timeout_seconds) {
    ensure_curl_global_init();
}

HttpResponse CurlTransport::get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) throw TrackerError("Failed to initialize CURL");

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw TrackerError("curl_easy_perform() failed: " + std::string(curl_easy_strerror(res)));

    return response;
}

size_t CurlTransport::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* output = static_cast<std::string*>(userp);
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}
