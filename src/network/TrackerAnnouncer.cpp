#include "TrackerAnnouncer.hpp"
#include "../utils/Logger.hpp"
#include "../utils/NetworkUtils.hpp"
#include <algorithm>

AnnounceStep next_announce_step(std::optional<TrackerEvent> event,
                                std::optional<uint64_t> reply_interval,
                                const AnnounceOptions& options) {
    AnnounceStep step;
    if (!reply_interval) {
        step.sleep = options.retry_interval;
        step.event = event;
        return step;
    }
    if (options.force_interval) {
        step.sleep = *options.force_interval;
    } else {
        step.sleep = std::max(std::chrono::seconds(static_cast<long long>(*reply_interval)), options.min_interval);
    }
    step.event = std::nullopt;
    return step;
}

TrackerAnnouncer::TrackerAnnouncer(std::string tracker_url, AnnounceHost& host, HttpTransport& transport,
                                   Sleeper& sleeper, AnnounceOptions options)
    : tracker_url(std::move(tracker_url)), host(host), transport(transport),
      sleeper(sleeper), options(options) {}

TrackerRequest TrackerAnnouncer::make_request() const {
    TrackerRequest request;
    request.info_hash = host.get_info_hash();
    request.peer_id = host.get_peer_id();
    request.port = options.port;
    request.uploaded = host.get_uploaded_bytes();
    request.downloaded = host.get_downloaded_bytes();
    request.left = host.get_left_to_download_bytes();
    request.compact = true;
    request.no_peer_id = false;
    request.event = event;
    request.numwant = options.numwant;
    request.trackerid = tracker_id;
    return request;
}

AnnounceStep TrackerAnnouncer::announce_once() {
    std::optional<uint64_t> interval;
    try {
        TrackerResponse response = TrackerClient::announce(transport, tracker_url, make_request());
        if (response.warning_message) {
            Logger::warn("tracker " + tracker_url + " warning: " + *response.warning_message);
        }
        if (response.tracker_id) {
            tracker_id = response.tracker_id;
        }
        size_t added = 0;
        for (const auto& peer : response.peers) {
            if (host.add_peer_if_not_seen(peer)) {
                ++added;
            }
        }
        Logger::debug("tracker " + NetworkUtils::host_of(tracker_url) + " returned " +
                      std::to_string(response.peers.size()) + " peers, " + std::to_string(added) + " new");
        interval = response.interval;
        ++successes;
    } catch (const std::exception& e) {
        ++failures;
        Logger::warn("error calling the tracker " + tracker_url + ": " + e.what());
    }

    AnnounceStep step = next_announce_step(event, interval, options);
    event = step.event;
    Logger::debug("sleeping for " + std::to_string(step.sleep.count()) + "s after calling tracker " +
                  NetworkUtils::host_of(tracker_url));
    return step;
}

void TrackerAnnouncer::run() {
    while (!sleeper.is_cancelled()) {
        AnnounceStep step = announce_once();
        if (!sleeper.sleep_for(step.sleep)) {
            break;
        }
    }
}
