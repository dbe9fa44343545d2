#include "BencodeParser.hpp"
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <vector>

namespace {

bool all_digits(const std::string& s, size_t from, size_t to) {
    if (from >= to) {
        return false;
    }
    for (size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

json BencodeParser::decode_at(const std::string& s, size_t& pos, int depth) {
    if (pos >= s.size()) {
        throw std::runtime_error("Unexpected end of bencoded string");
    }
    if (depth > MAX_DEPTH) {
        throw std::runtime_error("Bencode nesting too deep");
    }

    char c = s[pos];

    if (std::isdigit(static_cast<unsigned char>(c))) {
        size_t colon = s.find(':', pos);
        if (colon == std::string::npos || !all_digits(s, pos, colon)) {
            throw std::runtime_error("Invalid bencode string length (missing ':')");
        }
        unsigned long long len = std::stoull(s.substr(pos, colon - pos));
        pos = colon + 1;
        if (len > s.size() - pos) {
            throw std::runtime_error("Invalid bencode string (length exceeds input)");
        }
        std::string str = s.substr(pos, static_cast<size_t>(len));
        pos += static_cast<size_t>(len);
        return json(str);

    } else if (c == 'i') {
        pos++;
        size_t e_pos = s.find('e', pos);
        if (e_pos == std::string::npos) {
            throw std::runtime_error("Invalid bencode integer (missing 'e')");
        }
        size_t digits_from = (pos < e_pos && s[pos] == '-') ? pos + 1 : pos;
        if (!all_digits(s, digits_from, e_pos)) {
            throw std::runtime_error("Invalid bencode integer at pos " + std::to_string(pos));
        }
        long long value = std::stoll(s.substr(pos, e_pos - pos));
        pos = e_pos + 1;
        return json(value);

    } else if (c == 'l') {
        pos++;
        json arr = json::array();
        while (pos < s.size() && s[pos] != 'e') {
            arr.push_back(decode_at(s, pos, depth + 1));
        }
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated bencode list");
        }
        pos++; // skip 'e'
        return arr;

    } else if (c == 'd') {
        pos++;
        json obj = json::object();
        while (pos < s.size() && s[pos] != 'e') {
            json key = decode_at(s, pos, depth + 1);
            if (!key.is_string()) {
                throw std::runtime_error("Bencode dictionary key is not a string");
            }
            json value = decode_at(s, pos, depth + 1);
            obj[key.get<std::string>()] = value;
        }
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated bencode dictionary");
        }
        pos++; // skip 'e'
        return obj;

    } else {
        throw std::runtime_error("Unhandled encoded value at pos " +
                                 std::to_string(pos) +
                                 " (char='" + std::string(1, c) + "')");
    }
}

json BencodeParser::decode_bencoded_value(const std::string& s, size_t& pos) {
    return decode_at(s, pos, 0);
}

json BencodeParser::decode_bencoded_value(const std::string& s) {
    size_t pos = 0;
    return decode_at(s, pos, 0);
}

std::string BencodeParser::json_to_bencode(const json& j) {
    if (j.is_string()) {
        const std::string& str = j.get_ref<const std::string&>();
        return std::to_string(str.size()) + ":" + str;
    } else if (j.is_number_integer()) {
        return "i" + std::to_string(j.get<long long>()) + "e";
    } else if (j.is_array()) {
        std::string result = "l";
        for (const auto& item : j) {
            result += json_to_bencode(item);
        }
        result += "e";
        return result;
    } else if (j.is_object()) {
        std::string result = "d";
        std::vector<std::string> keys;
        for (auto it = j.begin(); it != j.end(); ++it) {
            keys.push_back(it.key());
        }
        std::sort(keys.begin(), keys.end());
        for (const std::string& key : keys) {
            result += std::to_string(key.size()) + ":" + key;
            result += json_to_bencode(j.at(key));
        }
        result += "e";
        return result;
    } else {
        throw std::runtime_error("Unsupported JSON type for bencoding");
    }
}

std::string BencodeParser::to_display_string(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
