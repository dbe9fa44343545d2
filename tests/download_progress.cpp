#include "download/DownloadProgress.hpp"

#include <cassert>

int main() {
    DownloadProgress progress(1000, 24);
    assert(progress.get_left_to_download() == 1000);
    assert(progress.get_remaining_estimate() == 1000);

    progress.add_fetched(600);
    progress.add_checked(500);
    assert(progress.get_left_to_download() == 500);
    assert(progress.get_remaining_estimate() == 400);

    // duplicate and wasted bytes push fetched past what was ever needed
    progress.add_fetched(5000);
    assert(progress.get_fetched() == 5600);
    assert(progress.get_left_to_download() == 500);
    assert(progress.get_remaining_estimate() == 0);

    progress.add_checked(500);
    assert(progress.get_left_to_download() == 0);

    // checked can only overshoot through a caller bug; still floored at zero
    progress.add_checked(10);
    assert(progress.get_left_to_download() == 0);
    assert(progress.get_left_to_download() <= progress.get_needed_initially());

    progress.add_uploaded(77);
    auto snap = progress.snapshot();
    assert(snap.uploaded_bytes == 77);
    assert(snap.fetched_bytes == 5600);
    assert(snap.downloaded_and_checked_bytes == 1010);
    assert(snap.needed_initially_bytes == 1000);
    assert(snap.have_initially_bytes == 24);

    // re-check failures take bytes back out, never below zero
    progress.remove_checked(1000);
    assert(progress.get_downloaded_and_checked() == 10);
    assert(progress.get_left_to_download() == 990);
    progress.remove_checked(64);
    assert(progress.get_downloaded_and_checked() == 0);
    assert(progress.get_left_to_download() == 1000);

    return 0;
}
