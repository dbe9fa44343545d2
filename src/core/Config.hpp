#ifndef SWARMFETCH_CONFIG_HPP
#define SWARMFETCH_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace Config {
    // Announce defaults
    constexpr uint16_t DEFAULT_PORT = 6881;
    constexpr const char* PEER_ID_PREFIX = "-SF0001-";
    constexpr int TRACKER_RETRY_SECONDS = 60;
    constexpr long TRACKER_HTTP_TIMEOUT_SECONDS = 30;

    // Piece transfer
    constexpr uint32_t BLOCK_SIZE = 16384; // 16 KiB

    // Background work
    constexpr int SPEED_SAMPLE_SECONDS = 1;
    constexpr size_t BLOCKING_THREADS = 2;
    constexpr size_t HASH_READ_CHUNK = 65536;
}

#endif // SWARMFETCH_CONFIG_HPP
