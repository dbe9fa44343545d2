#include "FileOps.hpp"
#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include "../utils/FormatUtils.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// ============================================================================
// OpenFile
// ============================================================================

OpenFile::OpenFile(std::string path, int fd) : path(std::move(path)), fd(fd) {}

OpenFile::~OpenFile() {
    if (fd >= 0) {
        ::close(fd);
    }
}

std::unique_ptr<OpenFile> OpenFile::open(const std::string& path, bool overwrite) {
    std::filesystem::path full_path(path);
    if (full_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(full_path.parent_path(), ec);
        if (ec) {
            throw IoError::from_errno(ec.value(), "error creating directory " + full_path.parent_path().string());
        }
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (!overwrite) {
        flags |= O_EXCL;
    }
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        int err = errno;
        if (err == EEXIST && !overwrite) {
            throw FileConflict("error creating " + path + ": file already exists");
        }
        throw IoError::from_errno(err, "open(" + path + ")");
    }
    return std::make_unique<OpenFile>(path, fd);
}

void OpenFile::read_at(uint64_t offset, uint8_t* buf, size_t len) const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError::from_errno(errno, "pread(" + path + ")");
        }
        if (n == 0) {
            throw IoError(IoErrorKind::Truncated,
                          "pread(" + path + "): short read at offset " + std::to_string(offset) +
                          ", got " + std::to_string(done) + " of " + std::to_string(len) + " bytes");
        }
        done += static_cast<size_t>(n);
    }
}

void OpenFile::write_at(uint64_t offset, const uint8_t* data, size_t len) const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError::from_errno(errno, "pwrite(" + path + ")");
        }
        if (n == 0) {
            throw IoError(IoErrorKind::Truncated,
                          "pwrite(" + path + "): write error - disk full?");
        }
        done += static_cast<size_t>(n);
    }
}

void OpenFile::set_length(uint64_t length) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (::ftruncate(fd, static_cast<off_t>(length)) != 0) {
        throw IoError::from_errno(errno, "ftruncate(" + path + ")");
    }
}

uint64_t OpenFile::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw IoError::from_errno(errno, "fstat(" + path + ")");
    }
    return static_cast<uint64_t>(st.st_size);
}

// ============================================================================
// FileOps
// ============================================================================

FileOps::FileOps(const TorrentInfo& info, std::vector<std::unique_ptr<OpenFile>> files, const Lengths& lengths)
    : info(info), files(std::move(files)), lengths(lengths) {
    if (this->files.size() != info.files.size()) {
        throw InvalidGeometry("descriptor lists " + std::to_string(info.files.size()) +
                              " files but " + std::to_string(this->files.size()) + " were opened");
    }
    if (info.get_total_length() != lengths.get_total_length()) {
        throw InvalidGeometry("file lengths do not add up to the torrent length");
    }
    uint64_t offset = 0;
    for (const auto& file : info.files) {
        file_offsets.push_back(offset);
        offset += file.length;
    }
}

std::vector<FileSlice> FileOps::resolve(uint64_t global_offset, uint64_t length) const {
    uint64_t total = lengths.get_total_length();
    if (length > total || global_offset > total - length) {
        throw OutOfRange("range [" + std::to_string(global_offset) + ", +" + std::to_string(length) +
                         ") exceeds torrent length " + std::to_string(total));
    }

    std::vector<FileSlice> slices;
    uint64_t pos = global_offset;
    uint64_t remaining = length;
    for (size_t i = 0; i < info.files.size() && remaining > 0; ++i) {
        uint64_t start = file_offsets[i];
        uint64_t end = start + info.files[i].length;
        if (pos >= end) {
            continue; // also skips zero-length files
        }
        uint64_t take = std::min(end - pos, remaining);
        slices.push_back(FileSlice{i, pos - start, take});
        pos += take;
        remaining -= take;
    }
    return slices;
}

std::vector<uint8_t> FileOps::read(uint64_t global_offset, uint64_t length) const {
    std::vector<FileSlice> slices = resolve(global_offset, length);
    std::vector<uint8_t> out(static_cast<size_t>(length));
    size_t pos = 0;
    for (const auto& slice : slices) {
        files[slice.file_id]->read_at(slice.local_offset, out.data() + pos, static_cast<size_t>(slice.length));
        pos += static_cast<size_t>(slice.length);
    }
    return out;
}

void FileOps::write(uint64_t global_offset, const uint8_t* data, size_t len) const {
    std::vector<FileSlice> slices = resolve(global_offset, len);
    size_t pos = 0;
    for (const auto& slice : slices) {
        files[slice.file_id]->write_at(slice.local_offset, data + pos, static_cast<size_t>(slice.length));
        pos += static_cast<size_t>(slice.length);
    }
}

void FileOps::write(uint64_t global_offset, const std::vector<uint8_t>& data) const {
    write(global_offset, data.data(), data.size());
}

Sha1Digest FileOps::hash_piece(uint32_t piece) const {
    std::vector<FileSlice> slices = resolve(lengths.piece_offset(piece), lengths.piece_length_of(piece));
    Sha1 sha;
    std::vector<uint8_t> buf;
    for (const auto& slice : slices) {
        uint64_t done = 0;
        while (done < slice.length) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(Config::HASH_READ_CHUNK, slice.length - done));
            buf.resize(chunk);
            files[slice.file_id]->read_at(slice.local_offset + done, buf.data(), chunk);
            sha.update(buf.data(), chunk);
            done += chunk;
        }
    }
    return sha.finish();
}

bool FileOps::check_piece(uint32_t piece) const {
    if (piece >= info.piece_hashes.size()) {
        throw OutOfRange("no hash for piece " + std::to_string(piece));
    }
    return hash_piece(piece) == info.piece_hashes[piece];
}

InitialCheckResult FileOps::initial_check(const std::optional<std::vector<size_t>>& only_files) const {
    auto started = std::chrono::steady_clock::now();
    uint32_t piece_count = lengths.get_piece_count();

    InitialCheckResult result;
    result.have_pieces.assign(piece_count, false);
    result.needed_pieces.assign(piece_count, false);

    std::vector<uint64_t> on_disk;
    on_disk.reserve(files.size());
    for (const auto& file : files) {
        on_disk.push_back(file->size());
    }

    auto selected = [&only_files](size_t file_id) {
        return !only_files ||
               std::find(only_files->begin(), only_files->end(), file_id) != only_files->end();
    };

    for (uint32_t piece = 0; piece < piece_count; ++piece) {
        uint32_t piece_len = lengths.piece_length_of(piece);
        std::vector<FileSlice> slices = resolve(lengths.piece_offset(piece), piece_len);

        bool candidate = true;
        for (const auto& slice : slices) {
            if (!selected(slice.file_id) || on_disk[slice.file_id] < slice.local_offset + slice.length) {
                candidate = false;
                break;
            }
        }

        bool have = false;
        if (candidate) {
            try {
                have = check_piece(piece);
            } catch (const IoError& e) {
                // file shrank underneath us; same as a mismatch
                if (e.get_kind() != IoErrorKind::Truncated) {
                    throw;
                }
                Logger::debug("piece " + std::to_string(piece) + " unreadable during initial check: " + e.what());
            }
        }

        if (have) {
            result.have_pieces[piece] = true;
            result.have_bytes += piece_len;
        } else {
            result.needed_pieces[piece] = true;
            result.needed_bytes += piece_len;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::debug("initial check of " + std::to_string(piece_count) + " pieces took " +
                  FormatUtils::format_duration(elapsed));
    return result;
}

void FileOps::ensure_length(size_t file_id, uint64_t length) const {
    get_file(file_id).set_length(length);
}

const OpenFile& FileOps::get_file(size_t file_id) const {
    if (file_id >= files.size()) {
        throw OutOfRange("file id " + std::to_string(file_id) + " out of range");
    }
    return *files[file_id];
}
