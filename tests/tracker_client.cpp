#include "core/Errors.hpp"
#include "network/TrackerClient.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

int main() {
    TrackerRequest request;
    request.info_hash = std::string("\x12\x34\x56\x78\x9a\xbc\xde\xf0\x00\x11\x22\x33\x44\x55\x66\x77\x88\x99\xaa\xbb", 20);
    request.peer_id = "-SF0001-abcdefghijkl";
    request.port = 6881;
    request.uploaded = 10;
    request.downloaded = 20;
    request.left = 30;
    request.event = TrackerEvent::Started;

    std::string query = request.as_query_string();
    assert(contains(query, "info_hash=%124Vx%9A%BC%DE%F0%00%11%223DUfw%88%99%AA%BB"));
    assert(contains(query, "&peer_id=-SF0001-abcdefghijkl"));
    assert(contains(query, "&port=6881"));
    assert(contains(query, "&uploaded=10&downloaded=20&left=30"));
    assert(contains(query, "&compact=1"));
    assert(contains(query, "&no_peer_id=0"));
    assert(contains(query, "&event=started"));
    assert(!contains(query, "numwant"));
    assert(!contains(query, "trackerid"));

    request.event.reset();
    request.numwant = 50;
    request.trackerid = std::string("id 1");
    request.key = std::string("k");
    request.ip = std::string("10.0.0.1");
    query = request.as_query_string();
    assert(!contains(query, "event="));
    assert(contains(query, "&ip=10.0.0.1"));
    assert(contains(query, "&numwant=50"));
    assert(contains(query, "&key=k"));
    assert(contains(query, "&trackerid=id%201"));

    assert(TrackerClient::build_announce_url("http://t.example/announce", request)
               .rfind("http://t.example/announce?info_hash=", 0) == 0);
    assert(TrackerClient::build_announce_url("http://t.example/announce?passkey=x", request)
               .rfind("http://t.example/announce?passkey=x&info_hash=", 0) == 0);

    // compact peers, network byte order
    std::string compact = test::compact_peer(10, 0, 0, 1, 6881) + test::compact_peer(192, 168, 1, 20, 51413);
    json reply = json::object();
    reply["interval"] = 1800;
    reply["peers"] = compact;
    reply["tracker id"] = "abc";
    TrackerResponse parsed = TrackerClient::parse_response(BencodeParser::json_to_bencode(reply));
    assert(parsed.interval == 1800);
    assert(parsed.peers.size() == 2);
    assert(parsed.peers[0] == Peer("10.0.0.1", 6881));
    assert(parsed.peers[1] == Peer("192.168.1.20", 51413));
    assert(parsed.tracker_id && *parsed.tracker_id == "abc");

    // dictionary peers; malformed entries are skipped
    json list_reply = json::object();
    list_reply["interval"] = 900;
    list_reply["peers"] = json::array({
        json{{"ip", "1.2.3.4"}, {"port", 1000}, {"peer id", "xxxxxxxxxxxxxxxxxxxx"}},
        json{{"ip", "5.6.7.8"}},
        json{{"ip", "9.9.9.9"}, {"port", 70000}},
        json{{"ip", "tracker.example"}, {"port", 2000}},
    });
    list_reply["warning message"] = "slow down";
    parsed = TrackerClient::parse_response(BencodeParser::json_to_bencode(list_reply));
    assert(parsed.interval == 900);
    assert(parsed.peers.size() == 2);
    assert(parsed.peers[0] == Peer("1.2.3.4", 1000));
    assert(parsed.peers[1] == Peer("tracker.example", 2000));
    assert(parsed.warning_message && *parsed.warning_message == "slow down");

    // explicit failure payload
    bool tracker_error = false;
    try {
        TrackerClient::parse_response("d14:failure reason12:unregisterede");
    } catch (const TrackerError& e) {
        tracker_error = contains(e.what(), "unregistered");
    }
    assert(tracker_error);

    // undecodable or incomplete success payloads
    const char* bad_payloads[] = {"<html>", "le", "d5:peers0:e", "d8:intervali-5e5:peers0:e", "d8:intervali10e5:peersi3ee",
                                 "d8:intervali10e5:peers7:abcdefge"};
    for (const char* body : bad_payloads) {
        bool decode_error = false;
        try {
            TrackerClient::parse_response(body);
        } catch (const DecodeError&) {
            decode_error = true;
        }
        assert(decode_error);
    }

    // transport and status failures
    test::FakeTransport transport;
    transport.push_reply(503, "d8:intervali10e5:peers0:e");
    bool status_error = false;
    try {
        TrackerClient::announce(transport, "http://t.example/announce", request);
    } catch (const TrackerError& e) {
        status_error = contains(e.what(), "503");
    }
    assert(status_error);
    assert(transport.urls().size() == 1);

    test::FakeTransport dead;
    dead.push_transport_failure();
    bool transport_error = false;
    try {
        TrackerClient::announce(dead, "http://t.example/announce", request);
    } catch (const TrackerError&) {
        transport_error = true;
    }
    assert(transport_error);

    return 0;
}
