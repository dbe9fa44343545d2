#include "core/Errors.hpp"
#include "core/Lengths.hpp"
#include "download/ChunkTracker.hpp"
#include "download/DownloadProgress.hpp"

#include <cassert>
#include <memory>
#include <vector>

namespace {

// 3 full pieces of 4 blocks plus a 1-block tail piece
Lengths test_lengths() {
    return Lengths(3 * 64 + 10, 64, 16u);
}

std::vector<bool> negate(const std::vector<bool>& bits) {
    std::vector<bool> out(bits.size());
    for (size_t i = 0; i < bits.size(); ++i) {
        out[i] = !bits[i];
    }
    return out;
}

void write_whole_piece(ChunkTracker& tracker, const Lengths& lengths, uint32_t piece) {
    uint32_t blocks = lengths.block_count_of(piece);
    for (uint32_t b = 0; b < blocks; ++b) {
        bool completed = tracker.on_block_written(piece, b, lengths.block_length_of(piece, b));
        assert(completed == (b + 1 == blocks));
    }
}

}  // namespace

int main() {
    Lengths lengths = test_lengths();
    assert(lengths.get_piece_count() == 4);

    // seeding: piece 1 already on disk
    {
        std::vector<bool> have{false, true, false, false};
        auto progress = std::make_shared<DownloadProgress>(3 * 64 + 10 - 64, 64);
        ChunkTracker tracker(negate(have), have, lengths, progress);
        assert(tracker.get_piece_state(1) == PieceState::Verified);
        assert(tracker.get_piece_state(0) == PieceState::Needed);
        assert(tracker.get_verified_count() == 1);
        for (uint32_t b = 0; b < 4; ++b) {
            assert(tracker.is_block_received(1, b));
        }

        // sequential: piece 0 blocks first, then piece 2 (1 is verified)
        for (uint32_t b = 0; b < 4; ++b) {
            auto req = tracker.next_block();
            assert(req && req->piece == 0 && req->block == b);
            assert(req->offset == b * 16 && req->length == 16);
        }
        assert(tracker.get_piece_state(0) == PieceState::InProgress);
        auto req = tracker.next_block();
        assert(req && req->piece == 2 && req->block == 0);

        // preferred piece goes first
        auto tail = tracker.next_block(true, 3u);
        assert(tail && tail->piece == 3 && tail->block == 0 && tail->length == 10);

        // without the exclusion an in-flight block can be handed out again
        auto dup = tracker.next_block(false);
        assert(dup && dup->piece == 0 && dup->block == 0);

        // released blocks come back
        tracker.release_block(2, 0);
        auto again = tracker.next_block();
        assert(again && again->piece == 2 && again->block == 0);
    }

    // completion, verification and counters
    {
        std::vector<bool> none(4, false);
        auto progress = std::make_shared<DownloadProgress>(lengths.get_total_length(), 0);
        ChunkTracker tracker(negate(none), none, lengths, progress);

        // blocks may arrive in any order
        assert(!tracker.on_block_written(0, 3, 16));
        assert(!tracker.on_block_written(0, 1, 16));
        assert(!tracker.on_block_written(0, 0, 16));
        assert(tracker.get_piece_state(0) == PieceState::InProgress);
        assert(tracker.on_block_written(0, 2, 16));
        assert(tracker.get_piece_state(0) == PieceState::Complete);
        assert(progress->get_fetched() == 64);

        // complete pieces are not handed out while their hash is pending
        auto req = tracker.next_block();
        assert(req && req->piece == 1);

        tracker.on_piece_verified(0, true);
        assert(tracker.get_piece_state(0) == PieceState::Verified);
        assert(progress->get_downloaded_and_checked() == 64);

        // a second success report does not double count
        tracker.on_piece_verified(0, true);
        assert(progress->get_downloaded_and_checked() == 64);

        // duplicate writes are accepted and counted as fetched only
        assert(!tracker.on_block_written(0, 1, 16));
        assert(progress->get_fetched() == 80);
        assert(progress->get_downloaded_and_checked() == 64);

        // failed verification wipes the piece
        write_whole_piece(tracker, lengths, 2);
        uint64_t fetched_before = progress->get_fetched();
        tracker.on_piece_verified(2, false);
        assert(tracker.get_piece_state(2) == PieceState::Needed);
        for (uint32_t b = 0; b < 4; ++b) {
            assert(!tracker.is_block_received(2, b));
        }
        assert(progress->get_fetched() == fetched_before);
        assert(progress->get_downloaded_and_checked() == 64);

        // and its blocks are offered again
        tracker.release_block(1, 0);
        auto retry = tracker.next_block();
        assert(retry && retry->piece == 1 && retry->block == 0);
        bool saw_piece_2 = false;
        while (auto next = tracker.next_block()) {
            if (next->piece == 2) {
                saw_piece_2 = true;
                break;
            }
        }
        assert(saw_piece_2);
    }

    // finishing, and a late re-check failure demoting a verified piece
    {
        std::vector<bool> none(4, false);
        auto progress = std::make_shared<DownloadProgress>(lengths.get_total_length(), 0);
        ChunkTracker tracker(negate(none), none, lengths, progress);
        for (uint32_t p = 0; p < 4; ++p) {
            write_whole_piece(tracker, lengths, p);
            tracker.on_piece_verified(p, true);
        }
        assert(tracker.is_finished());
        assert(!tracker.next_block());
        assert(progress->get_downloaded_and_checked() == lengths.get_total_length());
        assert(progress->get_left_to_download() == 0);

        tracker.on_piece_verified(3, false);
        assert(!tracker.is_finished());
        assert(tracker.get_piece_state(3) == PieceState::Needed);
        auto req = tracker.next_block();
        assert(req && req->piece == 3);
        auto have = tracker.get_have_bitfield();
        assert(have[0] && have[1] && have[2] && !have[3]);
        assert(progress->get_downloaded_and_checked() == lengths.get_total_length() - 10);
        assert(progress->get_left_to_download() == 10);
    }

    // demote and re-verify: checked bytes count the piece once
    {
        Lengths two(128, 64, 16u);
        std::vector<bool> none(2, false);
        auto progress = std::make_shared<DownloadProgress>(128, 0);
        ChunkTracker tracker(negate(none), none, two, progress);

        write_whole_piece(tracker, two, 0);
        tracker.on_piece_verified(0, true);
        assert(progress->get_downloaded_and_checked() == 64);

        tracker.on_piece_verified(0, false);
        assert(progress->get_downloaded_and_checked() == 0);
        write_whole_piece(tracker, two, 0);
        tracker.on_piece_verified(0, true);

        assert(tracker.get_piece_state(1) == PieceState::Needed);
        assert(progress->get_downloaded_and_checked() == 64);
        assert(progress->get_left_to_download() == 64);
        assert(progress->get_fetched() == 128);
    }

    // a piece present at startup was never counted as checked
    {
        Lengths two(128, 64, 16u);
        std::vector<bool> have{true, false};
        auto progress = std::make_shared<DownloadProgress>(64, 64);
        ChunkTracker tracker(negate(have), have, two, progress);
        write_whole_piece(tracker, two, 1);
        tracker.on_piece_verified(1, true);
        assert(progress->get_downloaded_and_checked() == 64);

        tracker.on_piece_verified(0, false);
        assert(tracker.get_piece_state(0) == PieceState::Needed);
        assert(progress->get_downloaded_and_checked() == 64);
    }

    // writes are refused once a piece is complete or verified
    {
        Lengths two(128, 64, 16u);
        std::vector<bool> none(2, false);
        ChunkTracker tracker(negate(none), none, two, std::make_shared<DownloadProgress>(128, 0));
        assert(tracker.accepts_write(0));
        tracker.on_block_written(0, 0, 16);
        assert(tracker.accepts_write(0));
        write_whole_piece(tracker, two, 1);
        assert(!tracker.accepts_write(1));
        tracker.on_piece_verified(1, true);
        assert(!tracker.accepts_write(1));
        tracker.on_piece_verified(1, false);
        assert(tracker.accepts_write(1));
    }

    // contract violations
    {
        std::vector<bool> none(4, false);
        ChunkTracker tracker(negate(none), none, lengths, std::make_shared<DownloadProgress>(0, 0));
        bool thrown = false;
        try {
            tracker.on_block_written(3, 1, 10);
        } catch (const OutOfRange&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ChunkTracker bad(std::vector<bool>(3, true), std::vector<bool>(3, false), lengths,
                             std::make_shared<DownloadProgress>(0, 0));
        } catch (const InvalidGeometry&) {
            thrown = true;
        }
        assert(thrown);
    }

    return 0;
}
