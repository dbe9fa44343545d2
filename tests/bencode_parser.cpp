#include "utils/BencodeParser.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

namespace {

bool rejects(const std::string& input) {
    try {
        BencodeParser::decode_bencoded_value(input);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    assert(BencodeParser::decode_bencoded_value("5:hello") == json("hello"));
    assert(BencodeParser::decode_bencoded_value("i-42e") == json(-42));
    assert(BencodeParser::decode_bencoded_value("le").is_array());

    json dict = BencodeParser::decode_bencoded_value("d8:intervali1800e5:peersl5:helloi7eee");
    assert(dict["interval"].get<long long>() == 1800);
    assert(dict["peers"].size() == 2);
    assert(dict["peers"][0] == json("hello"));

    // binary strings survive untouched
    std::string raw("\x00\xff\x10", 3);
    json bin = BencodeParser::decode_bencoded_value("3:" + raw);
    assert(bin.get<std::string>() == raw);
    assert(!BencodeParser::to_display_string(bin).empty());

    // keys come out sorted regardless of insertion order
    json obj = json::object();
    obj["zeta"] = 1;
    obj["alpha"] = "x";
    assert(BencodeParser::json_to_bencode(obj) == "d5:alpha1:x4:zetai1ee");

    assert(rejects(""));
    assert(rejects("i12"));
    assert(rejects("ixe"));
    assert(rejects("i-e"));
    assert(rejects("5:abc"));
    assert(rejects("-1:a"));
    assert(rejects("l5:hello"));
    assert(rejects("di1ei2ee"));
    assert(rejects("x"));

    std::string deep(200, 'l');
    assert(rejects(deep + std::string(200, 'e')));

    return 0;
}
