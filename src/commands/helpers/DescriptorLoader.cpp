#include "DescriptorLoader.hpp"
#include "../../core/Errors.hpp"
#include "../../utils/CryptoUtils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

TorrentInfo DescriptorLoader::load_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw DecodeError("invalid descriptor " + filename + ": " + e.what());
    }
    return from_json(j);
}

TorrentInfo DescriptorLoader::from_json(const json& j) {
    TorrentInfo info;
    try {
        info.name = j.value("name", std::string());
        info.info_hash_raw = CryptoUtils::hex_to_raw(j.at("info_hash").get<std::string>());
        info.piece_length = j.at("piece_length").get<uint32_t>();
        for (const auto& hex : j.at("pieces")) {
            info.piece_hashes.push_back(CryptoUtils::hex_to_digest(hex.get<std::string>()));
        }
        for (const auto& entry : j.at("files")) {
            FileEntry file;
            file.path = entry.at("path").get<std::string>();
            file.length = entry.at("length").get<uint64_t>();
            info.files.push_back(file);
        }
        if (j.contains("trackers")) {
            info.trackers = j.at("trackers").get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        throw DecodeError(std::string("malformed descriptor: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("malformed descriptor: ") + e.what());
    }
    info.validate();
    return info;
}

json DescriptorLoader::to_json(const TorrentInfo& info) {
    json j;
    j["name"] = info.name;
    j["info_hash"] = info.get_info_hash_hex();
    j["piece_length"] = info.piece_length;
    json pieces = json::array();
    for (const auto& digest : info.piece_hashes) {
        pieces.push_back(CryptoUtils::digest_to_hex(digest));
    }
    j["pieces"] = pieces;
    json files = json::array();
    for (const auto& file : info.files) {
        files.push_back({{"path", file.path}, {"length", file.length}});
    }
    j["files"] = files;
    j["trackers"] = info.trackers;
    return j;
}
