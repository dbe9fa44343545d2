#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Piece and block geometry of a torrent. Every piece/block size computation
// goes through here so the short final piece and block are handled once.
class Lengths {
public:
    // Blocks default to Config::BLOCK_SIZE, capped at the piece length.
    Lengths(uint64_t total_length, uint32_t piece_length,
            std::optional<uint32_t> block_length_override = std::nullopt);

    uint64_t get_total_length() const { return total_length; }
    uint32_t get_piece_length() const { return piece_length; }
    uint32_t get_block_length() const { return block_length; }
    uint32_t get_piece_count() const { return piece_count; }
    uint32_t get_blocks_per_piece() const { return blocks_per_piece; }
    uint32_t get_last_piece_length() const { return last_piece_length; }

    uint64_t piece_offset(uint32_t piece) const;
    uint32_t piece_length_of(uint32_t piece) const;
    uint32_t block_count_of(uint32_t piece) const;
    uint32_t block_length_of(uint32_t piece, uint32_t block) const;
    uint32_t block_offset(uint32_t block) const { return block * block_length; }

    // absolute offset of a block within the whole torrent
    uint64_t global_block_offset(uint32_t piece, uint32_t block) const;

    std::string to_string() const;

private:
    uint64_t total_length;
    uint32_t piece_length;
    uint32_t block_length;
    uint32_t piece_count;
    uint32_t blocks_per_piece;
    uint32_t last_piece_length;
};
