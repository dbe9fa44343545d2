#pragma once
#include "Lengths.hpp"
#include "ManagerOptions.hpp"
#include "Peer.hpp"
#include "PeerSet.hpp"
#include "TorrentInfo.hpp"
#include "../download/ChunkTracker.hpp"
#include "../download/DownloadProgress.hpp"
#include "../download/FileOps.hpp"
#include "../network/TrackerAnnouncer.hpp"
#include "../utils/BlockingPool.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

// Owns everything one download needs: output files, chunk tracker, byte
// counters, discovered peers and the background announce/sampling threads.
//
// start() returns only after the initial hash check, so nothing can ask for
// a block before the on-disk state is known.
class TorrentManager : public AnnounceHost {
public:
    static std::shared_ptr<TorrentManager> start(TorrentInfo info, const std::string& output_dir,
                                                 ManagerOptions options = ManagerOptions());

    ~TorrentManager() override;
    TorrentManager(const TorrentManager&) = delete;
    TorrentManager& operator=(const TorrentManager&) = delete;

    // Stops and joins every background thread. Idempotent.
    void shutdown();

    // Starts an announce loop for url unless one already runs for it.
    bool add_tracker(const std::string& url);

    // AnnounceHost
    std::string get_info_hash() const override { return info.info_hash_raw; }
    std::string get_peer_id() const override { return peer_id; }
    uint64_t get_uploaded_bytes() const override;
    uint64_t get_downloaded_bytes() const override;
    uint64_t get_left_to_download_bytes() const override;
    bool add_peer_if_not_seen(const Peer& peer) override;

    std::vector<Peer> get_peers() const { return peers.snapshot(); }
    void add_uploaded_bytes(uint64_t bytes);

    // Peer-layer entry points, forwarded to the chunk tracker.
    std::optional<BlockRequest> next_block(bool exclude_in_progress_by_other = true,
                                           std::optional<uint32_t> preferred_piece = std::nullopt);
    void release_block(uint32_t piece, uint32_t block);
    bool on_block_written(uint32_t piece, uint32_t block, uint32_t bytes_len);
    void on_piece_verified(uint32_t piece, bool success);

    // Writes a received block, marks it, and hashes the piece if that block
    // completed it. Returns true when the piece was verified by this call.
    // Blocks for a complete or verified piece are counted but not written.
    // Write failures release the block and propagate as IoError.
    bool write_block(uint32_t piece, uint32_t block, const std::vector<uint8_t>& data);

    // Hashes a complete or verified piece and records the outcome. A verified
    // piece that no longer matches goes back to Needed.
    bool check_piece(uint32_t piece);

    // Data for an upload; empty unless the piece is verified.
    std::optional<std::vector<uint8_t>> read_block(uint32_t piece, uint32_t begin, uint32_t length) const;

    bool is_finished() const;
    uint64_t get_initially_needed() const;
    DownloadProgress::Snapshot stats_snapshot() const;

    const TorrentInfo& get_info() const { return info; }
    const Lengths& get_lengths() const { return lengths; }
    const std::vector<std::string>& get_filenames() const { return filenames; }
    const ChunkTracker& get_chunk_tracker() const { return *chunk_tracker; }
    const FileOps& get_file_ops() const { return *file_ops; }

    static std::string generate_peer_id();

private:
    TorrentInfo info;
    Lengths lengths;
    std::string output_dir;
    ManagerOptions options;
    std::string peer_id;
    std::vector<std::string> filenames;

    std::unique_ptr<BlockingPool> pool;
    std::unique_ptr<FileOps> file_ops;
    std::shared_ptr<DownloadProgress> progress;
    std::unique_ptr<ChunkTracker> chunk_tracker;
    PeerSet peers;

    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<Sleeper> sleeper;

    mutable std::mutex tasks_mtx;
    std::set<std::string> trackers;
    std::vector<std::unique_ptr<TrackerAnnouncer>> announcers;
    std::vector<std::thread> tasks;
    bool stopped = false;
    std::atomic<bool> finish_logged{false};

    TorrentManager(TorrentInfo info, Lengths lengths, std::string output_dir, ManagerOptions options);

    void startup();
    void open_files();
    void resize_files();
    void sample_throughput();
    bool is_selected(size_t file_id) const;
};
