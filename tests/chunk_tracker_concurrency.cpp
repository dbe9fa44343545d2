#include "core/Lengths.hpp"
#include "download/ChunkTracker.hpp"
#include "download/DownloadProgress.hpp"

#include <atomic>
#include <cassert>
#include <memory>
#include <thread>
#include <vector>

int main() {
    constexpr uint32_t block = 1024;
    constexpr uint32_t blocks_per_piece = 64;
    constexpr uint32_t pieces = 8;
    Lengths lengths(static_cast<uint64_t>(pieces) * blocks_per_piece * block, blocks_per_piece * block, block);

    for (int round = 0; round < 20; ++round) {
        auto progress = std::make_shared<DownloadProgress>(lengths.get_total_length(), 0);
        ChunkTracker tracker(std::vector<bool>(pieces, true), std::vector<bool>(pieces, false), lengths, progress);

        // several writers, each taking every n-th block of every piece
        constexpr int writers = 4;
        std::atomic<int> completions{0};
        std::vector<std::thread> threads;
        for (int w = 0; w < writers; ++w) {
            threads.emplace_back([&, w] {
                for (uint32_t p = 0; p < pieces; ++p) {
                    for (uint32_t b = static_cast<uint32_t>(w); b < blocks_per_piece; b += writers) {
                        if (tracker.on_block_written(p, b, block)) {
                            completions++;
                        }
                    }
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        // every piece completes exactly once, no block is lost
        assert(completions == static_cast<int>(pieces));
        for (uint32_t p = 0; p < pieces; ++p) {
            assert(tracker.get_piece_state(p) == PieceState::Complete);
        }
        assert(progress->get_fetched() == lengths.get_total_length());

        // verifications for different pieces from different threads
        threads.clear();
        for (uint32_t p = 0; p < pieces; ++p) {
            threads.emplace_back([&tracker, p] { tracker.on_piece_verified(p, true); });
        }
        for (auto& t : threads) {
            t.join();
        }
        assert(tracker.is_finished());
        assert(progress->get_downloaded_and_checked() == lengths.get_total_length());
    }

    // two peers racing for the same blocks: both writes succeed, counted twice
    {
        auto progress = std::make_shared<DownloadProgress>(lengths.get_total_length(), 0);
        ChunkTracker tracker(std::vector<bool>(pieces, true), std::vector<bool>(pieces, false), lengths, progress);
        std::atomic<int> completions{0};
        std::vector<std::thread> threads;
        for (int peer = 0; peer < 2; ++peer) {
            threads.emplace_back([&] {
                for (uint32_t b = 0; b < blocks_per_piece; ++b) {
                    if (tracker.on_block_written(0, b, block)) {
                        completions++;
                    }
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        assert(completions == 1);
        assert(tracker.get_piece_state(0) == PieceState::Complete);
        assert(progress->get_fetched() == 2ull * blocks_per_piece * block);
    }

    return 0;
}
