#pragma once
#include "../core/Lengths.hpp"
#include "DownloadProgress.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class PieceState { Needed, InProgress, Complete, Verified };

const char* to_string(PieceState state);

// A block handed out by next_block().
struct BlockRequest {
    uint32_t piece;
    uint32_t block;
    uint32_t offset;  // within the piece
    uint32_t length;
};

// Piece/block bookkeeping for one download.
//
// Needed -> InProgress when a block is handed out or written,
// InProgress -> Complete when every block has been written,
// Complete -> Verified on a good hash, anything -> Needed on a bad one.
// Every public method takes the tracker's mutex for its own duration only.
class ChunkTracker {
public:
    ChunkTracker(std::vector<bool> needed_pieces, std::vector<bool> have_pieces,
                 const Lengths& lengths, std::shared_ptr<DownloadProgress> progress);

    // Lowest-index unverified piece first, preferred_piece ahead of all others.
    // With exclude_in_progress_by_other set, blocks handed out earlier and not
    // yet written are skipped; otherwise they can be handed out again.
    std::optional<BlockRequest> next_block(bool exclude_in_progress_by_other = true,
                                           std::optional<uint32_t> preferred_piece = std::nullopt);

    // Gives back a handed-out block whose request failed.
    void release_block(uint32_t piece, uint32_t block);

    // Returns true when this write completed the piece; the caller must then
    // hash it and report through on_piece_verified().
    bool on_block_written(uint32_t piece, uint32_t block, uint32_t bytes_len);

    void on_piece_verified(uint32_t piece, bool success);

    // False once the piece is Complete or Verified; its bytes on disk are
    // then awaiting or past the hash check and must not be overwritten.
    bool accepts_write(uint32_t piece) const;

    PieceState get_piece_state(uint32_t piece) const;
    bool is_block_received(uint32_t piece, uint32_t block) const;
    std::vector<bool> get_have_bitfield() const;
    uint32_t get_verified_count() const;
    bool is_finished() const;

    const Lengths& get_lengths() const { return lengths; }
    const std::shared_ptr<DownloadProgress>& get_progress() const { return progress; }

private:
    struct PieceSlot {
        PieceState state = PieceState::Needed;
        std::vector<bool> received;
        std::vector<bool> requested;
        uint32_t received_count = 0;
        // piece length is included in downloaded_and_checked
        bool counted_as_checked = false;
    };

    Lengths lengths;
    std::shared_ptr<DownloadProgress> progress;
    std::vector<PieceSlot> pieces;
    uint32_t verified_count = 0;
    mutable std::mutex mtx;

    void check_index(uint32_t piece, uint32_t block) const;
    std::optional<BlockRequest> take_block(uint32_t piece, bool exclude_in_progress_by_other);
    void reset_piece(PieceSlot& slot);
};
