#pragma once
#include <atomic>
#include <cstdint>

// Aggregate byte counters shared by the chunk tracker, the announce loops
// and the peer layer.
//
// fetched counts every byte written, duplicates and pieces that later fail
// verification included. downloaded_and_checked grows when a piece passes
// its hash check and shrinks again if that piece fails a later re-check.
// Remaining work is derived from the latter.
class DownloadProgress {
private:
    std::atomic<uint64_t> uploaded{0};
    std::atomic<uint64_t> fetched{0};
    std::atomic<uint64_t> downloaded_and_checked{0};
    const uint64_t needed_initially;
    const uint64_t have_initially;

public:
    struct Snapshot {
        uint64_t uploaded_bytes = 0;
        uint64_t fetched_bytes = 0;
        uint64_t downloaded_and_checked_bytes = 0;
        uint64_t needed_initially_bytes = 0;
        uint64_t have_initially_bytes = 0;
    };

    DownloadProgress(uint64_t needed_initially, uint64_t have_initially);

    void add_uploaded(uint64_t bytes);
    void add_fetched(uint64_t bytes);
    void add_checked(uint64_t bytes);
    // a verified piece failed a later re-check; floored at zero
    void remove_checked(uint64_t bytes);

    uint64_t get_uploaded() const;
    uint64_t get_fetched() const;
    uint64_t get_downloaded_and_checked() const;
    uint64_t get_needed_initially() const { return needed_initially; }
    uint64_t get_have_initially() const { return have_initially; }

    // needed_initially - downloaded_and_checked, floored at zero
    uint64_t get_left_to_download() const;

    // Remaining bytes as seen by a throughput estimator. fetched may exceed
    // needed_initially, so the subtraction saturates, and the result is never
    // larger than get_left_to_download().
    uint64_t get_remaining_estimate() const;

    Snapshot snapshot() const;
};
