#pragma once
#include <string>
#include <cstdint>

struct Peer {
    std::string ip;
    uint16_t port;

    Peer(const std::string& ip, uint16_t port);
    std::string to_string() const;

    bool operator==(const Peer& other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const Peer& other) const { return !(*this == other); }
    bool operator<(const Peer& other) const {
        return ip < other.ip || (ip == other.ip && port < other.port);
    }
};
