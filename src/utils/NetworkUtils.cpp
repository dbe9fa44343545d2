#include "NetworkUtils.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>

std::string NetworkUtils::url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << int(uc);
        }
    }
    return escaped.str();
}

std::string NetworkUtils::with_query(const std::string& url, const std::string& query) {
    std::string base = url;
    std::string fragment;
    size_t hash_pos = base.find('#');
    if (hash_pos != std::string::npos) {
        fragment = base.substr(hash_pos);
        base.erase(hash_pos);
    }
    if (query.empty()) {
        return base + fragment;
    }
    size_t q_pos = base.find('?');
    if (q_pos == std::string::npos) {
        base += '?';
    } else if (q_pos + 1 != base.size() && base.back() != '&') {
        base += '&';
    }
    return base + query + fragment;
}

std::string NetworkUtils::host_of(const std::string& url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    size_t end = url.find_first_of(":/?#", start);
    if (end == std::string::npos) {
        end = url.size();
    }
    // bracketed IPv6 literal
    if (start < url.size() && url[start] == '[') {
        size_t close = url.find(']', start);
        if (close != std::string::npos) {
            return url.substr(start, close - start + 1);
        }
    }
    return url.substr(start, end - start);
}

std::string NetworkUtils::ipv4_to_string(const uint8_t bytes[4]) {
    return std::to_string(bytes[0]) + "." +
           std::to_string(bytes[1]) + "." +
           std::to_string(bytes[2]) + "." +
           std::to_string(bytes[3]);
}
