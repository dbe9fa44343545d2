#pragma once
#include <cstdint>
#include <string>

class NetworkUtils {
public:
    // percent-encodes everything but RFC 3986 unreserved characters
    static std::string url_encode(const std::string& value);

    // appends a query string, keeping any query already present on the url
    static std::string with_query(const std::string& url, const std::string& query);

    // "http://tracker.example:6969/announce" -> "tracker.example"
    static std::string host_of(const std::string& url);

    static std::string ipv4_to_string(const uint8_t bytes[4]);
};
