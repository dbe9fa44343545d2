#include "core/Errors.hpp"
#include "core/Lengths.hpp"
#include "download/FileOps.hpp"
#include "test_support.hpp"

#include <cassert>
#include <memory>
#include <vector>

namespace {

std::vector<std::unique_ptr<OpenFile>> open_all(const test::TempDir& dir, const TorrentInfo& info) {
    std::vector<std::unique_ptr<OpenFile>> files;
    for (const auto& entry : info.files) {
        files.push_back(OpenFile::open((dir.path() / entry.path).string(), false));
    }
    return files;
}

}  // namespace

int main() {
    constexpr uint32_t piece_length = 32768;
    test::TempDir dir("resolve");

    // a = 1.5 pieces, b = 0.5 pieces: piece 1 straddles the boundary
    auto payload = test::make_payload(2 * piece_length, 7);
    TorrentInfo info = test::make_info({{"a.bin", 49152}, {"sub/b.bin", 16384}}, piece_length, payload);
    Lengths lengths(info.get_total_length(), info.piece_length);
    FileOps ops(info, open_all(dir, info), lengths);

    auto first = ops.resolve(0, piece_length);
    assert(first.size() == 1);
    assert(first[0].file_id == 0 && first[0].local_offset == 0 && first[0].length == piece_length);

    auto straddle = ops.resolve(piece_length, piece_length);
    assert(straddle.size() == 2);
    assert(straddle[0].file_id == 0);
    assert(straddle[0].local_offset == 32768);
    assert(straddle[0].length == 16384);
    assert(straddle[1].file_id == 1);
    assert(straddle[1].local_offset == 0);
    assert(straddle[1].length == 16384);
    assert(straddle[0].length + straddle[1].length == piece_length);

    auto tail = ops.resolve(60000, 5536);
    assert(tail.size() == 1 && tail[0].file_id == 1 && tail[0].local_offset == 60000 - 49152);

    assert(ops.resolve(100, 0).empty());

    bool out_of_range = false;
    try {
        ops.resolve(60000, 5537);
    } catch (const OutOfRange&) {
        out_of_range = true;
    }
    assert(out_of_range);

    // one logical write across the boundary lands in both files
    std::vector<uint8_t> piece(payload.begin() + piece_length, payload.end());
    ops.write(piece_length, piece);
    auto a = test::read_file(dir.path() / "a.bin");
    auto b = test::read_file(dir.path() / "sub/b.bin");
    assert(a.size() == 49152);
    assert(b.size() == 16384);
    assert(std::equal(piece.begin(), piece.begin() + 16384, a.begin() + 32768));
    assert(std::equal(piece.begin() + 16384, piece.end(), b.begin()));
    assert(ops.read(piece_length, piece_length) == piece);
    assert(ops.check_piece(1));

    // zero-length files never show up in a resolution
    test::TempDir dir2("resolve_empty");
    auto small = test::make_payload(300, 9);
    TorrentInfo with_empty = test::make_info({{"x", 100}, {"empty", 0}, {"y", 200}}, 128, small);
    Lengths small_lengths(with_empty.get_total_length(), with_empty.piece_length);
    FileOps ops2(with_empty, open_all(dir2, with_empty), small_lengths);
    auto across = ops2.resolve(50, 100);
    assert(across.size() == 2);
    assert(across[0].file_id == 0 && across[0].length == 50);
    assert(across[1].file_id == 2 && across[1].local_offset == 0 && across[1].length == 50);

    return 0;
}
