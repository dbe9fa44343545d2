#include "TrackerClient.hpp"
#include "../core/Errors.hpp"
#include "../utils/NetworkUtils.hpp"
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <arpa/inet.h>

const char* to_string(TrackerEvent event) {
    switch (event) {
        case TrackerEvent::Started: return "started";
        case TrackerEvent::Stopped: return "stopped";
        case TrackerEvent::Completed: return "completed";
    }
    return "";
}

std::string TrackerRequest::as_query_string() const {
    std::ostringstream query;
    query << "info_hash=" << NetworkUtils::url_encode(info_hash)
          << "&peer_id=" << NetworkUtils::url_encode(peer_id)
          << "&port=" << port
          << "&uploaded=" << uploaded
          << "&downloaded=" << downloaded
          << "&left=" << left
          << "&compact=" << (compact ? 1 : 0)
          << "&no_peer_id=" << (no_peer_id ? 1 : 0);
    if (event) {
        query << "&event=" << to_string(*event);
    }
    if (ip) {
        query << "&ip=" << NetworkUtils::url_encode(*ip);
    }
    if (numwant) {
        query << "&numwant=" << *numwant;
    }
    if (key) {
        query << "&key=" << NetworkUtils::url_encode(*key);
    }
    if (trackerid) {
        query << "&trackerid=" << NetworkUtils::url_encode(*trackerid);
    }
    return query.str();
}

std::string TrackerClient::build_announce_url(const std::string& tracker_url, const TrackerRequest& request) {
    return NetworkUtils::with_query(tracker_url, request.as_query_string());
}

TrackerResponse TrackerClient::announce(HttpTransport& transport, const std::string& tracker_url,
                                        const TrackerRequest& request) {
    HttpResponse response = transport.get(build_announce_url(tracker_url, request));
    if (response.status < 200 || response.status >= 300) {
        throw TrackerError("tracker responded with HTTP " + std::to_string(response.status));
    }
    return parse_response(response.body);
}

TrackerResponse TrackerClient::parse_response(const std::string& body) {
    json reply;
    try {
        reply = BencodeParser::decode_bencoded_value(body);
    } catch (const std::exception& e) {
        throw DecodeError(std::string("cannot decode tracker response: ") + e.what());
    }
    if (!reply.is_object()) {
        throw DecodeError("tracker response is not a dictionary");
    }

    if (reply.contains("failure reason")) {
        const json& reason = reply["failure reason"];
        throw TrackerError("tracker returned failure. Failure reason: " +
                           (reason.is_string() ? reason.get<std::string>() : BencodeParser::to_display_string(reason)));
    }

    TrackerResponse out;
    if (!reply.contains("interval") || !reply["interval"].is_number_integer() ||
        reply["interval"].get<long long>() < 0) {
        throw DecodeError("tracker response has no valid interval");
    }
    out.interval = static_cast<uint64_t>(reply["interval"].get<long long>());

    if (!reply.contains("peers")) {
        throw DecodeError("tracker response has no peers");
    }
    const json& peers = reply["peers"];
    if (peers.is_string()) {
        out.peers = parse_peers_compact(peers.get<std::string>());
    } else if (peers.is_array()) {
        out.peers = parse_peers_list(peers);
    } else {
        throw DecodeError("tracker response peers must be a string or a list");
    }

    if (reply.contains("tracker id") && reply["tracker id"].is_string()) {
        out.tracker_id = reply["tracker id"].get<std::string>();
    }
    if (reply.contains("warning message") && reply["warning message"].is_string()) {
        out.warning_message = reply["warning message"].get<std::string>();
    }
    return out;
}

std::vector<Peer> TrackerClient::parse_peers_compact(const std::string& peers_compact) {
    if (peers_compact.size() % 6 != 0) {
        throw DecodeError("compact peers length " + std::to_string(peers_compact.size()) +
                          " is not a multiple of 6");
    }
    std::vector<Peer> peers;

    for (size_t i = 0; i + 6 <= peers_compact.size(); i += 6) {
        uint8_t ip_bytes[4];
        uint16_t port;

        memcpy(ip_bytes, &peers_compact[i], 4);
        memcpy(&port, &peers_compact[i + 4], 2);

        peers.emplace_back(NetworkUtils::ipv4_to_string(ip_bytes), ntohs(port));
    }

    return peers;
}

std::vector<Peer> TrackerClient::parse_peers_list(const json& peers) {
    std::vector<Peer> out;
    for (const auto& entry : peers) {
        if (!entry.is_object()) {
            continue;
        }
        if (!entry.contains("ip") || !entry["ip"].is_string()) {
            continue;
        }
        if (!entry.contains("port") || !entry["port"].is_number_integer()) {
            continue;
        }
        long long port = entry["port"].get<long long>();
        if (port <= 0 || port > 65535) {
            continue;
        }
        out.emplace_back(entry["ip"].get<std::string>(), static_cast<uint16_t>(port));
    }
    return out;
}
