#pragma once
#include "Config.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class HttpTransport;
class Sleeper;

// Receives raw counters once per sampling period. Smoothing is the
// receiver's business.
class ThroughputSink {
public:
    virtual ~ThroughputSink() = default;
    virtual void add_snapshot(uint64_t fetched_bytes, uint64_t remaining_bytes,
                              std::chrono::steady_clock::time_point at) = 0;
};

struct ManagerOptions {
    // reuse existing output files instead of failing with FileConflict
    bool overwrite = false;
    // indices into TorrentInfo::files; pieces outside them are never checked
    std::optional<std::vector<size_t>> only_files;
    std::optional<std::string> peer_id;

    std::optional<std::chrono::seconds> force_tracker_interval;
    std::chrono::seconds min_tracker_interval{0};
    std::chrono::seconds tracker_retry_interval{Config::TRACKER_RETRY_SECONDS};
    uint16_t listen_port = Config::DEFAULT_PORT;
    bool announce = true;

    std::chrono::milliseconds sample_period{std::chrono::seconds(Config::SPEED_SAMPLE_SECONDS)};
    size_t blocking_threads = Config::BLOCKING_THREADS;

    // defaults: CurlTransport, CancellableSleeper, no sink
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<Sleeper> sleeper;
    std::shared_ptr<ThroughputSink> throughput_sink;
};
