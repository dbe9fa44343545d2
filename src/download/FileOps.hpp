#pragma once
#include "../core/Lengths.hpp"
#include "../core/TorrentInfo.hpp"
#include "../utils/CryptoUtils.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// One output file, opened once at startup and kept until shutdown.
// Every read/write/resize holds the file's own mutex for that call only.
class OpenFile {
private:
    std::string path;
    int fd;
    mutable std::mutex mtx;

public:
    OpenFile(std::string path, int fd);
    ~OpenFile();
    OpenFile(const OpenFile&) = delete;
    OpenFile& operator=(const OpenFile&) = delete;

    // Creates parent directories. Without overwrite the file must not exist
    // yet (FileConflict); with overwrite an existing file is reused as is.
    static std::unique_ptr<OpenFile> open(const std::string& path, bool overwrite);

    void read_at(uint64_t offset, uint8_t* buf, size_t len) const;
    void write_at(uint64_t offset, const uint8_t* data, size_t len) const;
    void set_length(uint64_t length) const;
    uint64_t size() const;

    const std::string& get_path() const { return path; }
};

// A piece of a global byte range that lies inside a single file.
struct FileSlice {
    size_t file_id;
    uint64_t local_offset;
    uint64_t length;
};

struct InitialCheckResult {
    std::vector<bool> have_pieces;
    std::vector<bool> needed_pieces;
    uint64_t have_bytes = 0;
    uint64_t needed_bytes = 0;
};

// Maps torrent offsets onto the output files and does piece I/O and hashing.
class FileOps {
private:
    const TorrentInfo& info;
    std::vector<std::unique_ptr<OpenFile>> files;
    Lengths lengths;
    std::vector<uint64_t> file_offsets;

public:
    FileOps(const TorrentInfo& info, std::vector<std::unique_ptr<OpenFile>> files, const Lengths& lengths);

    // Splits [global_offset, global_offset + length) at file boundaries.
    // Zero-length files never produce a slice.
    std::vector<FileSlice> resolve(uint64_t global_offset, uint64_t length) const;

    std::vector<uint8_t> read(uint64_t global_offset, uint64_t length) const;
    void write(uint64_t global_offset, const uint8_t* data, size_t len) const;
    void write(uint64_t global_offset, const std::vector<uint8_t>& data) const;

    Sha1Digest hash_piece(uint32_t piece) const;
    bool check_piece(uint32_t piece) const;

    // Hashes every piece already on disk. Pieces touching a file outside
    // only_files, or extending past the current end of a file, are needed.
    InitialCheckResult initial_check(const std::optional<std::vector<size_t>>& only_files) const;

    void ensure_length(size_t file_id, uint64_t length) const;

    size_t get_file_count() const { return files.size(); }
    const OpenFile& get_file(size_t file_id) const;
    const Lengths& get_lengths() const { return lengths; }
};
