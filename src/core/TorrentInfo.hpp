#pragma once
#include "../utils/CryptoUtils.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct FileEntry {
    std::string path;   // relative to the output directory, '/' separated
    uint64_t length = 0;
};

// Already-parsed content descriptor.
class TorrentInfo {
public:
    std::string name;
    std::string info_hash_raw;          // 20 raw bytes
    std::vector<std::string> trackers;  // announce urls
    std::vector<FileEntry> files;       // concatenation order
    uint32_t piece_length = 0;
    std::vector<Sha1Digest> piece_hashes;

    uint64_t get_total_length() const;
    uint32_t get_piece_count() const;
    std::string get_info_hash_hex() const;

    // throws InvalidGeometry when files, hashes and piece length disagree
    void validate() const;

    void print_info() const;
};
