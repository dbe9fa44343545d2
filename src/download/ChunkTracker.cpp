#include "ChunkTracker.hpp"
#include "../core/Errors.hpp"
#include <algorithm>

const char* to_string(PieceState state) {
    switch (state) {
        case PieceState::Needed: return "needed";
        case PieceState::InProgress: return "in-progress";
        case PieceState::Complete: return "complete";
        case PieceState::Verified: return "verified";
    }
    return "unknown";
}

ChunkTracker::ChunkTracker(std::vector<bool> needed_pieces, std::vector<bool> have_pieces,
                           const Lengths& lengths, std::shared_ptr<DownloadProgress> progress)
    : lengths(lengths), progress(std::move(progress)) {
    uint32_t count = lengths.get_piece_count();
    if (needed_pieces.size() != count || have_pieces.size() != count) {
        throw InvalidGeometry("piece bitfields do not match piece count " + std::to_string(count));
    }
    if (!this->progress) {
        this->progress = std::make_shared<DownloadProgress>(0, 0);
    }

    pieces.resize(count);
    for (uint32_t i = 0; i < count; ++i) {
        PieceSlot& slot = pieces[i];
        uint32_t blocks = lengths.block_count_of(i);
        bool have = have_pieces[i] && !needed_pieces[i];
        slot.received.assign(blocks, have);
        slot.requested.assign(blocks, false);
        slot.received_count = have ? blocks : 0;
        slot.state = have ? PieceState::Verified : PieceState::Needed;
        if (have) {
            ++verified_count;
        }
    }
}

void ChunkTracker::check_index(uint32_t piece, uint32_t block) const {
    if (piece >= pieces.size()) {
        throw OutOfRange("piece " + std::to_string(piece) + " out of range");
    }
    if (block >= pieces[piece].received.size()) {
        throw OutOfRange("block " + std::to_string(block) + " out of range for piece " + std::to_string(piece));
    }
}

std::optional<BlockRequest> ChunkTracker::take_block(uint32_t piece, bool exclude_in_progress_by_other) {
    PieceSlot& slot = pieces[piece];
    if (slot.state == PieceState::Verified || slot.state == PieceState::Complete) {
        return std::nullopt;
    }
    for (uint32_t block = 0; block < slot.received.size(); ++block) {
        if (slot.received[block]) {
            continue;
        }
        if (exclude_in_progress_by_other && slot.requested[block]) {
            continue;
        }
        slot.requested[block] = true;
        if (slot.state == PieceState::Needed) {
            slot.state = PieceState::InProgress;
        }
        return BlockRequest{piece, block, lengths.block_offset(block), lengths.block_length_of(piece, block)};
    }
    return std::nullopt;
}

std::optional<BlockRequest> ChunkTracker::next_block(bool exclude_in_progress_by_other,
                                                     std::optional<uint32_t> preferred_piece) {
    std::lock_guard<std::mutex> lock(mtx);
    if (preferred_piece && *preferred_piece < pieces.size()) {
        if (auto found = take_block(*preferred_piece, exclude_in_progress_by_other)) {
            return found;
        }
    }
    for (uint32_t piece = 0; piece < pieces.size(); ++piece) {
        if (auto found = take_block(piece, exclude_in_progress_by_other)) {
            return found;
        }
    }
    return std::nullopt;
}

void ChunkTracker::release_block(uint32_t piece, uint32_t block) {
    std::lock_guard<std::mutex> lock(mtx);
    check_index(piece, block);
    PieceSlot& slot = pieces[piece];
    if (slot.received[block]) {
        return;
    }
    slot.requested[block] = false;
    if (slot.state == PieceState::InProgress && slot.received_count == 0 &&
        std::none_of(slot.requested.begin(), slot.requested.end(), [](bool r) { return r; })) {
        slot.state = PieceState::Needed;
    }
}

bool ChunkTracker::on_block_written(uint32_t piece, uint32_t block, uint32_t bytes_len) {
    std::lock_guard<std::mutex> lock(mtx);
    check_index(piece, block);

    // Counted even when the block was already written or the piece is done.
    // Duplicate bytes stay in fetched and are never reconciled against the
    // checked counter; only get_left_to_download() clamps for it.
    progress->add_fetched(bytes_len);

    PieceSlot& slot = pieces[piece];
    if (slot.state == PieceState::Verified || slot.state == PieceState::Complete) {
        return false;
    }
    if (slot.received[block]) {
        return false;
    }
    slot.received[block] = true;
    slot.requested[block] = true;
    ++slot.received_count;
    if (slot.received_count == slot.received.size()) {
        slot.state = PieceState::Complete;
        return true;
    }
    slot.state = PieceState::InProgress;
    return false;
}

void ChunkTracker::reset_piece(PieceSlot& slot) {
    std::fill(slot.received.begin(), slot.received.end(), false);
    std::fill(slot.requested.begin(), slot.requested.end(), false);
    slot.received_count = 0;
    slot.counted_as_checked = false;
    slot.state = PieceState::Needed;
}

void ChunkTracker::on_piece_verified(uint32_t piece, bool success) {
    std::lock_guard<std::mutex> lock(mtx);
    check_index(piece, 0);
    PieceSlot& slot = pieces[piece];

    if (success) {
        if (slot.state != PieceState::Complete) {
            return; // already verified, or reset by a concurrent failure
        }
        slot.state = PieceState::Verified;
        ++verified_count;
        slot.counted_as_checked = true;
        progress->add_checked(lengths.piece_length_of(piece));
        return;
    }

    // fetched is not decremented: those bytes were transferred, just wasted
    if (slot.state == PieceState::Verified) {
        --verified_count;
    }
    if (slot.counted_as_checked) {
        progress->remove_checked(lengths.piece_length_of(piece));
    }
    reset_piece(slot);
}

bool ChunkTracker::accepts_write(uint32_t piece) const {
    std::lock_guard<std::mutex> lock(mtx);
    check_index(piece, 0);
    PieceState state = pieces[piece].state;
    return state != PieceState::Complete && state != PieceState::Verified;
}

PieceState ChunkTracker::get_piece_state(uint32_t piece) const {
    std::lock_guard<std::mutex> lock(mtx);
    check_index(piece, 0);
    return pieces[piece].state;
}

bool ChunkTracker::is_block_received(uint32_t piece, uint32_t block) const {
    std::lock_guard<std::mutex> lock(mtx);
    check_index(piece, block);
    return pieces[piece].received[block];
}

std::vector<bool> ChunkTracker::get_have_bitfield() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<bool> have(pieces.size(), false);
    for (size_t i = 0; i < pieces.size(); ++i) {
        have[i] = pieces[i].state == PieceState::Verified;
    }
    return have;
}

uint32_t ChunkTracker::get_verified_count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return verified_count;
}

bool ChunkTracker::is_finished() const {
    std::lock_guard<std::mutex> lock(mtx);
    return verified_count == pieces.size();
}
