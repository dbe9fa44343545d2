#include "TorrentManager.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "../network/HttpTransport.hpp"
#include "../utils/FormatUtils.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Sleeper.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <random>
#include <stdexcept>

namespace {

Lengths make_lengths(const TorrentInfo& info) {
    info.validate();
    return Lengths(info.get_total_length(), info.piece_length);
}

}  // namespace

std::shared_ptr<TorrentManager> TorrentManager::start(TorrentInfo info, const std::string& output_dir,
                                                      ManagerOptions options) {
    Lengths lengths = make_lengths(info);
    Logger::debug("computed lengths: " + lengths.to_string());

    std::shared_ptr<TorrentManager> mgr(
        new TorrentManager(std::move(info), lengths, output_dir, std::move(options)));
    mgr->startup();
    return mgr;
}

TorrentManager::TorrentManager(TorrentInfo info, Lengths lengths, std::string output_dir, ManagerOptions options)
    : info(std::move(info)), lengths(lengths), output_dir(std::move(output_dir)), options(std::move(options)) {
    peer_id = this->options.peer_id ? *this->options.peer_id : generate_peer_id();
    if (peer_id.size() != 20) {
        throw std::invalid_argument("peer id must be 20 bytes, got " + std::to_string(peer_id.size()));
    }
    if (this->options.only_files) {
        for (size_t file_id : *this->options.only_files) {
            if (file_id >= this->info.files.size()) {
                throw OutOfRange("only_files names file " + std::to_string(file_id) +
                                 " but the torrent has " + std::to_string(this->info.files.size()));
            }
        }
    }
    transport = this->options.transport
                    ? this->options.transport
                    : std::make_shared<CurlTransport>(Config::TRACKER_HTTP_TIMEOUT_SECONDS);
    sleeper = this->options.sleeper ? this->options.sleeper : std::make_shared<CancellableSleeper>();
    pool = std::make_unique<BlockingPool>(this->options.blocking_threads);
}

TorrentManager::~TorrentManager() {
    shutdown();
}

void TorrentManager::startup() {
    open_files();

    Logger::info("Doing initial checksum validation, this might take a while...");
    InitialCheckResult check = pool->run([this] { return file_ops->initial_check(options.only_files); });
    Logger::info("Initial check results: have " + FormatUtils::format_size(check.have_bytes) +
                 ", needed " + FormatUtils::format_size(check.needed_bytes));

    pool->run([this] { resize_files(); });

    progress = std::make_shared<DownloadProgress>(check.needed_bytes, check.have_bytes);
    chunk_tracker = std::make_unique<ChunkTracker>(check.needed_pieces, check.have_pieces, lengths, progress);

    if (options.throughput_sink) {
        std::lock_guard<std::mutex> lock(tasks_mtx);
        tasks.emplace_back(&TorrentManager::sample_throughput, this);
    }
    if (options.announce) {
        for (const auto& url : info.trackers) {
            add_tracker(url);
        }
    }
}

void TorrentManager::open_files() {
    std::vector<std::unique_ptr<OpenFile>> files;
    files.reserve(info.files.size());
    for (const auto& entry : info.files) {
        std::string full_path = (std::filesystem::path(output_dir) / entry.path).string();
        files.push_back(OpenFile::open(full_path, options.overwrite));
        filenames.push_back(full_path);
    }
    file_ops = std::make_unique<FileOps>(info, std::move(files), lengths);
}

bool TorrentManager::is_selected(size_t file_id) const {
    if (!options.only_files) {
        return true;
    }
    const auto& only = *options.only_files;
    return std::find(only.begin(), only.end(), file_id) != only.end();
}

void TorrentManager::resize_files() {
    for (size_t idx = 0; idx < info.files.size(); ++idx) {
        if (!is_selected(idx)) {
            continue;
        }
        const FileEntry& entry = info.files[idx];
        auto started = std::chrono::steady_clock::now();
        try {
            file_ops->ensure_length(idx, entry.length);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            Logger::debug("Set length for file " + filenames[idx] + " to " +
                          FormatUtils::format_size(entry.length) + " in " + FormatUtils::format_duration(elapsed));
        } catch (const IoError& e) {
            // a short file just fails its hash check and is downloaded again
            Logger::warn("Error setting length for file " + filenames[idx] + " to " +
                         std::to_string(entry.length) + ": " + e.what());
        }
    }
}

void TorrentManager::sample_throughput() {
    do {
        try {
            options.throughput_sink->add_snapshot(progress->get_fetched(), progress->get_remaining_estimate(),
                                                  std::chrono::steady_clock::now());
        } catch (const std::exception& e) {
            Logger::warn(std::string("throughput sink failed: ") + e.what());
        }
    } while (sleeper->sleep_for(options.sample_period));
}

bool TorrentManager::add_tracker(const std::string& url) {
    std::lock_guard<std::mutex> lock(tasks_mtx);
    if (stopped || !chunk_tracker) {
        return false;
    }
    if (!trackers.insert(url).second) {
        return false;
    }

    AnnounceOptions announce_options;
    announce_options.port = options.listen_port;
    announce_options.force_interval = options.force_tracker_interval;
    announce_options.min_interval = options.min_tracker_interval;
    announce_options.retry_interval = options.tracker_retry_interval;

    announcers.push_back(std::make_unique<TrackerAnnouncer>(url, *this, *transport, *sleeper, announce_options));
    TrackerAnnouncer* announcer = announcers.back().get();
    tasks.emplace_back([announcer] { announcer->run(); });
    Logger::debug("started announce loop for " + url);
    return true;
}

void TorrentManager::shutdown() {
    std::vector<std::thread> to_join;
    {
        std::lock_guard<std::mutex> lock(tasks_mtx);
        if (stopped) {
            return;
        }
        stopped = true;
        to_join.swap(tasks);
    }
    sleeper->cancel();
    for (auto& task : to_join) {
        if (task.joinable()) {
            task.join();
        }
    }
    pool->shutdown();
}

uint64_t TorrentManager::get_uploaded_bytes() const {
    return progress->get_uploaded();
}

uint64_t TorrentManager::get_downloaded_bytes() const {
    return progress->get_fetched();
}

uint64_t TorrentManager::get_left_to_download_bytes() const {
    return progress->get_left_to_download();
}

bool TorrentManager::add_peer_if_not_seen(const Peer& peer) {
    bool added = peers.add_if_not_seen(peer);
    if (added) {
        Logger::debug("new peer " + peer.to_string());
    }
    return added;
}

void TorrentManager::add_uploaded_bytes(uint64_t bytes) {
    progress->add_uploaded(bytes);
}

std::optional<BlockRequest> TorrentManager::next_block(bool exclude_in_progress_by_other,
                                                       std::optional<uint32_t> preferred_piece) {
    return chunk_tracker->next_block(exclude_in_progress_by_other, preferred_piece);
}

void TorrentManager::release_block(uint32_t piece, uint32_t block) {
    chunk_tracker->release_block(piece, block);
}

bool TorrentManager::on_block_written(uint32_t piece, uint32_t block, uint32_t bytes_len) {
    return chunk_tracker->on_block_written(piece, block, bytes_len);
}

void TorrentManager::on_piece_verified(uint32_t piece, bool success) {
    chunk_tracker->on_piece_verified(piece, success);
}

bool TorrentManager::write_block(uint32_t piece, uint32_t block, const std::vector<uint8_t>& data) {
    uint32_t expected = lengths.block_length_of(piece, block);
    if (data.size() != expected) {
        throw OutOfRange("block " + std::to_string(block) + " of piece " + std::to_string(piece) + " has " +
                         std::to_string(data.size()) + " bytes, expected " + std::to_string(expected));
    }

    if (!chunk_tracker->accepts_write(piece)) {
        // late duplicate: count the bytes, keep the checked data on disk
        chunk_tracker->on_block_written(piece, block, expected);
        return false;
    }

    try {
        file_ops->write(lengths.global_block_offset(piece, block), data);
    } catch (const IoError&) {
        chunk_tracker->release_block(piece, block);
        throw;
    }

    if (!chunk_tracker->on_block_written(piece, block, expected)) {
        return false;
    }
    return check_piece(piece);
}

bool TorrentManager::check_piece(uint32_t piece) {
    PieceState state = chunk_tracker->get_piece_state(piece);
    if (state != PieceState::Complete && state != PieceState::Verified) {
        return false;
    }

    bool ok = false;
    try {
        ok = file_ops->check_piece(piece);
    } catch (const IoError& e) {
        Logger::warn("error reading piece " + std::to_string(piece) + " for verification: " + e.what());
    }
    chunk_tracker->on_piece_verified(piece, ok);

    if (!ok) {
        Logger::warn("piece " + std::to_string(piece) + " failed its hash check, it will be downloaded again");
        return false;
    }
    Logger::debug("piece " + std::to_string(piece) + " verified");
    if (chunk_tracker->is_finished() && !finish_logged.exchange(true)) {
        Logger::info("download finished: " + info.name + ", " +
                     FormatUtils::format_size(progress->get_downloaded_and_checked()) + " checked, " +
                     FormatUtils::format_size(progress->get_fetched()) + " fetched");
    }
    return true;
}

std::optional<std::vector<uint8_t>> TorrentManager::read_block(uint32_t piece, uint32_t begin, uint32_t length) const {
    uint32_t piece_len = lengths.piece_length_of(piece);
    if (length == 0 || begin > piece_len || length > piece_len - begin) {
        throw OutOfRange("request [" + std::to_string(begin) + ", +" + std::to_string(length) +
                         ") outside piece " + std::to_string(piece));
    }
    if (chunk_tracker->get_piece_state(piece) != PieceState::Verified) {
        return std::nullopt;
    }
    return file_ops->read(lengths.piece_offset(piece) + begin, length);
}

bool TorrentManager::is_finished() const {
    return chunk_tracker->is_finished();
}

uint64_t TorrentManager::get_initially_needed() const {
    return progress->get_needed_initially();
}

DownloadProgress::Snapshot TorrentManager::stats_snapshot() const {
    return progress->snapshot();
}

std::string TorrentManager::generate_peer_id() {
    std::string id = Config::PEER_ID_PREFIX;
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);
    while (id.size() < 20) {
        id += static_cast<char>(dis(gen));
    }
    return id;
}
