#include "Lengths.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <limits>

namespace {

// in 64 bits so piece lengths near 2^32 do not wrap
uint32_t ceil_div(uint32_t value, uint32_t divisor) {
    return static_cast<uint32_t>((static_cast<uint64_t>(value) + divisor - 1) / divisor);
}

}  // namespace

Lengths::Lengths(uint64_t total_length, uint32_t piece_length,
                 std::optional<uint32_t> block_length_override)
    : total_length(total_length), piece_length(piece_length) {
    if (total_length == 0) {
        throw InvalidGeometry("total length must be positive");
    }
    if (piece_length == 0) {
        throw InvalidGeometry("piece length must be positive");
    }
    if (block_length_override) {
        if (*block_length_override == 0) {
            throw InvalidGeometry("block length must be positive");
        }
        if (*block_length_override > piece_length) {
            throw InvalidGeometry("block length " + std::to_string(*block_length_override) +
                                  " exceeds piece length " + std::to_string(piece_length));
        }
        block_length = *block_length_override;
    } else {
        block_length = std::min(Config::BLOCK_SIZE, piece_length);
    }

    uint64_t pieces = total_length / piece_length + (total_length % piece_length != 0 ? 1 : 0);
    if (pieces > std::numeric_limits<uint32_t>::max()) {
        throw InvalidGeometry("too many pieces: " + std::to_string(pieces));
    }
    piece_count = static_cast<uint32_t>(pieces);
    blocks_per_piece = ceil_div(piece_length, block_length);

    uint64_t remainder = total_length % piece_length;
    last_piece_length = remainder == 0 ? piece_length : static_cast<uint32_t>(remainder);
}

uint64_t Lengths::piece_offset(uint32_t piece) const {
    if (piece >= piece_count) {
        throw OutOfRange("piece " + std::to_string(piece) + " out of range (count " +
                         std::to_string(piece_count) + ")");
    }
    return static_cast<uint64_t>(piece) * piece_length;
}

uint32_t Lengths::piece_length_of(uint32_t piece) const {
    if (piece >= piece_count) {
        throw OutOfRange("piece " + std::to_string(piece) + " out of range (count " +
                         std::to_string(piece_count) + ")");
    }
    return piece == piece_count - 1 ? last_piece_length : piece_length;
}

uint32_t Lengths::block_count_of(uint32_t piece) const {
    return ceil_div(piece_length_of(piece), block_length);
}

uint32_t Lengths::block_length_of(uint32_t piece, uint32_t block) const {
    uint32_t len = piece_length_of(piece);
    uint32_t count = ceil_div(len, block_length);
    if (block >= count) {
        throw OutOfRange("block " + std::to_string(block) + " out of range for piece " +
                         std::to_string(piece));
    }
    if (block == count - 1) {
        uint32_t tail = len % block_length;
        return tail == 0 ? block_length : tail;
    }
    return block_length;
}

uint64_t Lengths::global_block_offset(uint32_t piece, uint32_t block) const {
    block_length_of(piece, block); // range check
    return piece_offset(piece) + block_offset(block);
}

std::string Lengths::to_string() const {
    return "Lengths{total=" + std::to_string(total_length) +
           ", piece=" + std::to_string(piece_length) +
           ", block=" + std::to_string(block_length) +
           ", pieces=" + std::to_string(piece_count) +
           ", blocks_per_piece=" + std::to_string(blocks_per_piece) +
           ", last_piece=" + std::to_string(last_piece_length) + "}";
}
