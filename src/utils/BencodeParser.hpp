#pragma once
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Bencode <-> nlohmann::json. Byte strings map to json strings holding the raw
// bytes, integers to json integers, lists to arrays and dictionaries to objects.
class BencodeParser {
public:
    static json decode_bencoded_value(const std::string& s);
    static json decode_bencoded_value(const std::string& s, size_t& pos);
    static std::string json_to_bencode(const json& j);

    // json text that is safe to print even when strings hold binary data
    static std::string to_display_string(const json& j);

private:
    static constexpr int MAX_DEPTH = 64;
    static json decode_at(const std::string& s, size_t& pos, int depth);
};
