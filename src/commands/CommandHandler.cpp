#include "CommandHandler.hpp"
#include "helpers/DescriptorLoader.hpp"
#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/TorrentInfo.hpp"
#include "../core/TorrentManager.hpp"
#include "../network/HttpTransport.hpp"
#include "../network/TrackerClient.hpp"
#include "../utils/BencodeParser.hpp"
#include "../utils/FormatUtils.hpp"

#include <iostream>
#include <sstream>

// ============================================================================
// COMMAND EXECUTOR
// ============================================================================

int CommandHandler::execute(const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "decode") {
            handle_decode(args);
        } else if (command == "info") {
            handle_info(args);
        } else if (command == "check") {
            handle_check(args);
        } else if (command == "announce") {
            handle_announce(args);
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            return 1;
        }
    } catch (const FileConflict& e) {
        std::cerr << "Error: " << e.what() << " (pass --overwrite to reuse existing files)" << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

// ============================================================================
// COMMANDS
// ============================================================================

void CommandHandler::handle_decode(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: decode <encoded_value>" << std::endl;
        return;
    }
    auto decoded = BencodeParser::decode_bencoded_value(args[0]);
    std::cout << BencodeParser::to_display_string(decoded) << std::endl;
}

void CommandHandler::handle_info(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: info <descriptor.json>" << std::endl;
        return;
    }
    TorrentInfo info = DescriptorLoader::load_file(args[0]);
    info.print_info();
}

void CommandHandler::handle_check(const std::vector<std::string>& args) {
    std::string output_dir = ".";
    std::string descriptor;
    ManagerOptions options;
    options.announce = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-o" && i + 1 < args.size()) {
            output_dir = args[++i];
        } else if (args[i] == "--overwrite") {
            options.overwrite = true;
        } else if (args[i] == "--only" && i + 1 < args.size()) {
            std::vector<size_t> only;
            std::istringstream list(args[++i]);
            std::string item;
            while (std::getline(list, item, ',')) {
                only.push_back(static_cast<size_t>(std::stoul(item)));
            }
            options.only_files = only;
        } else {
            descriptor = args[i];
        }
    }
    if (descriptor.empty()) {
        std::cerr << "Usage: check [-o <output_dir>] [--overwrite] [--only <i,j,...>] <descriptor.json>" << std::endl;
        return;
    }

    TorrentInfo info = DescriptorLoader::load_file(descriptor);
    auto manager = TorrentManager::start(info, output_dir, options);
    const ChunkTracker& tracker = manager->get_chunk_tracker();
    auto stats = manager->stats_snapshot();

    std::cout << "Pieces verified: " << tracker.get_verified_count() << "/"
              << manager->get_lengths().get_piece_count() << std::endl;
    std::cout << "Have: " << FormatUtils::format_size(stats.have_initially_bytes) << std::endl;
    std::cout << "Needed: " << FormatUtils::format_size(stats.needed_initially_bytes) << std::endl;
    manager->shutdown();
}

void CommandHandler::handle_announce(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: announce <descriptor.json> [tracker_url]" << std::endl;
        return;
    }
    TorrentInfo info = DescriptorLoader::load_file(args[0]);
    std::string tracker_url = args.size() > 1 ? args[1] : "";
    if (tracker_url.empty()) {
        if (info.trackers.empty()) {
            throw std::runtime_error("descriptor lists no trackers");
        }
        tracker_url = info.trackers.front();
    }

    TrackerRequest request;
    request.info_hash = info.info_hash_raw;
    request.peer_id = TorrentManager::generate_peer_id();
    request.port = Config::DEFAULT_PORT;
    request.left = info.get_total_length();
    request.event = TrackerEvent::Started;

    CurlTransport transport(Config::TRACKER_HTTP_TIMEOUT_SECONDS);
    TrackerResponse response = TrackerClient::announce(transport, tracker_url, request);
    std::cout << "Interval: " << response.interval << "s" << std::endl;
    for (const auto& peer : response.peers) {
        std::cout << peer.to_string() << std::endl;
    }
}
