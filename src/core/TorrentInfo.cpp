#include "TorrentInfo.hpp"
#include "Errors.hpp"
#include "Lengths.hpp"
#include <iostream>
#include <sstream>

namespace {

bool has_parent_component(const std::string& path) {
    std::istringstream parts(path);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

}  // namespace

uint64_t TorrentInfo::get_total_length() const {
    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.length;
    }
    return total;
}

uint32_t TorrentInfo::get_piece_count() const {
    return static_cast<uint32_t>(piece_hashes.size());
}

std::string TorrentInfo::get_info_hash_hex() const {
    std::string hex;
    static const char digits[] = "0123456789abcdef";
    for (unsigned char c : info_hash_raw) {
        hex.push_back(digits[c >> 4]);
        hex.push_back(digits[c & 0x0f]);
    }
    return hex;
}

void TorrentInfo::validate() const {
    if (info_hash_raw.size() != 20) {
        throw InvalidGeometry("info hash must be 20 bytes, got " + std::to_string(info_hash_raw.size()));
    }
    if (files.empty()) {
        throw InvalidGeometry("descriptor lists no files");
    }
    for (const auto& file : files) {
        if (file.path.empty()) {
            throw InvalidGeometry("descriptor contains a file with an empty path");
        }
        if (file.path.front() == '/' || has_parent_component(file.path)) {
            throw InvalidGeometry("file path escapes the output directory: " + file.path);
        }
    }
    Lengths lengths(get_total_length(), piece_length);
    if (lengths.get_piece_count() != get_piece_count()) {
        throw InvalidGeometry("descriptor has " + std::to_string(get_piece_count()) +
                              " piece hashes but its length needs " +
                              std::to_string(lengths.get_piece_count()));
    }
}

void TorrentInfo::print_info() const {
    std::cout << "Name: " << name << std::endl;
    for (const auto& tracker : trackers) {
        std::cout << "Tracker URL: " << tracker << std::endl;
    }
    std::cout << "Length: " << get_total_length() << std::endl;
    std::cout << "Info Hash: " << get_info_hash_hex() << std::endl;
    std::cout << "Piece Length: " << piece_length << std::endl;
    std::cout << "Pieces: " << get_piece_count() << std::endl;
    std::cout << "Files:" << std::endl;
    for (const auto& file : files) {
        std::cout << "  " << file.path << " (" << file.length << ")" << std::endl;
    }
}
