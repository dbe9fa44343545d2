#pragma once
#include "../core/Peer.hpp"
#include "../utils/Sleeper.hpp"
#include "HttpTransport.hpp"
#include "TrackerClient.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// What an announce loop needs from the download it reports for.
class AnnounceHost {
public:
    virtual ~AnnounceHost() = default;

    virtual std::string get_info_hash() const = 0;
    virtual std::string get_peer_id() const = 0;
    virtual uint64_t get_uploaded_bytes() const = 0;
    virtual uint64_t get_downloaded_bytes() const = 0;
    virtual uint64_t get_left_to_download_bytes() const = 0;

    // Returns true if the peer was new.
    virtual bool add_peer_if_not_seen(const Peer& peer) = 0;
};

struct AnnounceOptions {
    uint16_t port = 0;
    std::optional<std::chrono::seconds> force_interval;
    std::chrono::seconds min_interval{0};
    std::chrono::seconds retry_interval{60};
    std::optional<uint32_t> numwant;
};

struct AnnounceStep {
    std::chrono::seconds sleep{0};
    std::optional<TrackerEvent> event;
};

// Pure retry policy. reply_interval is the tracker's interval after a
// successful announce and empty after a failed one. A failure keeps the
// pending event so "started" is repeated until a tracker accepts it.
AnnounceStep next_announce_step(std::optional<TrackerEvent> event,
                                std::optional<uint64_t> reply_interval,
                                const AnnounceOptions& options);

// Announce loop for one tracker url. Shares nothing with other loops except
// the host's peer set.
class TrackerAnnouncer {
public:
    TrackerAnnouncer(std::string tracker_url, AnnounceHost& host, HttpTransport& transport,
                     Sleeper& sleeper, AnnounceOptions options);

    // One announce plus state update; returns how long to wait before the next.
    AnnounceStep announce_once();

    // Announces until the sleeper is cancelled.
    void run();

    std::optional<TrackerEvent> get_event() const { return event; }
    const std::string& get_url() const { return tracker_url; }
    uint64_t get_success_count() const { return successes; }
    uint64_t get_failure_count() const { return failures; }

private:
    std::string tracker_url;
    AnnounceHost& host;
    HttpTransport& transport;
    Sleeper& sleeper;
    AnnounceOptions options;
    std::optional<TrackerEvent> event = TrackerEvent::Started;
    std::optional<std::string> tracker_id;
    uint64_t successes = 0;
    uint64_t failures = 0;

    TrackerRequest make_request() const;
};
