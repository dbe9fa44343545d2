#pragma once
#include "../../core/TorrentInfo.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Reads a JSON rendition of an already-decoded descriptor:
//
//   {
//     "name": "example",
//     "info_hash": "<40 hex chars>",
//     "piece_length": 262144,
//     "pieces": ["<40 hex chars>", ...],
//     "files": [{"path": "dir/a.bin", "length": 1234}, ...],
//     "trackers": ["http://tracker.example/announce"]
//   }
class DescriptorLoader {
public:
    static TorrentInfo load_file(const std::string& filename);
    static TorrentInfo from_json(const nlohmann::json& j);
    static nlohmann::json to_json(const TorrentInfo& info);
};
