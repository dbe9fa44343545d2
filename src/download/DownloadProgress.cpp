#include "DownloadProgress.hpp"
#include <algorithm>

DownloadProgress::DownloadProgress(uint64_t needed_initially, uint64_t have_initially)
    : needed_initially(needed_initially), have_initially(have_initially) {}

void DownloadProgress::add_uploaded(uint64_t bytes) {
    uploaded.fetch_add(bytes, std::memory_order_relaxed);
}

void DownloadProgress::add_fetched(uint64_t bytes) {
    fetched.fetch_add(bytes, std::memory_order_relaxed);
}

void DownloadProgress::add_checked(uint64_t bytes) {
    downloaded_and_checked.fetch_add(bytes, std::memory_order_relaxed);
}

void DownloadProgress::remove_checked(uint64_t bytes) {
    uint64_t current = downloaded_and_checked.load(std::memory_order_relaxed);
    uint64_t next;
    do {
        next = current >= bytes ? current - bytes : 0;
    } while (!downloaded_and_checked.compare_exchange_weak(current, next, std::memory_order_relaxed));
}

uint64_t DownloadProgress::get_uploaded() const {
    return uploaded.load(std::memory_order_relaxed);
}

uint64_t DownloadProgress::get_fetched() const {
    return fetched.load(std::memory_order_relaxed);
}

uint64_t DownloadProgress::get_downloaded_and_checked() const {
    return downloaded_and_checked.load(std::memory_order_relaxed);
}

uint64_t DownloadProgress::get_left_to_download() const {
    uint64_t checked = get_downloaded_and_checked();
    return checked >= needed_initially ? 0 : needed_initially - checked;
}

uint64_t DownloadProgress::get_remaining_estimate() const {
    uint64_t fetched_now = get_fetched();
    uint64_t by_fetched = fetched_now >= needed_initially ? 0 : needed_initially - fetched_now;
    return std::min(by_fetched, get_left_to_download());
}

DownloadProgress::Snapshot DownloadProgress::snapshot() const {
    Snapshot snap;
    snap.uploaded_bytes = get_uploaded();
    snap.fetched_bytes = get_fetched();
    snap.downloaded_and_checked_bytes = get_downloaded_and_checked();
    snap.needed_initially_bytes = needed_initially;
    snap.have_initially_bytes = have_initially;
    return snap;
}
