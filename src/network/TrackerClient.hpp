#pragma once
#include "../core/Peer.hpp"
#include "../utils/BencodeParser.hpp"
#include "HttpTransport.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TrackerEvent { Started, Stopped, Completed };

const char* to_string(TrackerEvent event);

struct TrackerRequest {
    std::string info_hash;  // 20 raw bytes
    std::string peer_id;    // 20 raw bytes
    uint16_t port = 0;
    uint64_t uploaded = 0;
    uint64_t downloaded = 0;
    uint64_t left = 0;
    bool compact = true;
    bool no_peer_id = false;
    std::optional<TrackerEvent> event;
    std::optional<std::string> ip;
    std::optional<uint32_t> numwant;
    std::optional<std::string> key;
    std::optional<std::string> trackerid;

    std::string as_query_string() const;
};

struct TrackerResponse {
    uint64_t interval = 0;
    std::vector<Peer> peers;
    std::optional<std::string> tracker_id;
    std::optional<std::string> warning_message;
};

class TrackerClient {
public:
    // Sends one announce. Throws TrackerError when the transport fails, the
    // status is not 2xx or the tracker reports a failure reason, and
    // DecodeError when a successful reply cannot be decoded.
    static TrackerResponse announce(HttpTransport& transport, const std::string& tracker_url,
                                    const TrackerRequest& request);

    static std::string build_announce_url(const std::string& tracker_url, const TrackerRequest& request);
    static TrackerResponse parse_response(const std::string& body);

    static std::vector<Peer> parse_peers_compact(const std::string& peers_compact);
    static std::vector<Peer> parse_peers_list(const json& peers);
};
