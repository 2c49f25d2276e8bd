#include "temp_dir.h"
#include <algorithm>
#include <core/network/transfer/receive_manager.h>
#include <core/security/file_hasher.h>
#include <doctest/doctest.h>
#include <limits>
#include <numeric>
#include <random>

using namespace lanlink;
using namespace lanlink::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

BinaryData Slice(const BinaryData& data, std::size_t seq) {
    auto begin = seq * protocol::kChunkSize;
    auto end = std::min(data.size(), begin + protocol::kChunkSize);
    return BinaryData(data.begin() + begin, data.begin() + end);
}

std::size_t CountEntries(const fs::path& dir) {
    return static_cast<std::size_t>(
        std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
}

} // namespace

TEST_CASE("chunks arriving in any order are written in sequence order") {
    test::TempDir dir;
    auto content = test::PatternBytes(2345);
    auto total = protocol::TotalChunks(content.size());
    REQUIRE(total == 10);

    std::vector<std::size_t> order(total);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(42);

    for (int round = 0; round < 5; ++round) {
        std::shuffle(order.begin(), order.end(), gen);
        ReceiveManager manager(dir.path());
        auto file_id = "f" + std::to_string(round);

        REQUIRE(manager.BeginTransfer(file_id, "data.bin", content.size(), "alice")
                == FileStartStatus::kStarted);
        for (auto seq : order) {
            CHECK(manager.AcceptChunk(file_id, seq, Slice(content, seq)) == ChunkStatus::kStored);
        }
        CHECK(manager.ReceivedChunks(file_id) == total);

        auto result = manager.Finish(file_id, FileHasher::CalculateDataChecksum(content));
        REQUIRE(result.status == FinishStatus::kCompleted);
        CHECK(result.saved_path == dir.path() / "data.bin");
        CHECK(test::ReadAll(result.saved_path) == content);
        CHECK_FALSE(manager.IsPending(file_id));
    }
}

TEST_CASE("duplicate FILE and CHUNK leave the state untouched") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    auto content = test::PatternBytes(600);

    CHECK(manager.BeginTransfer("f1", "a.bin", content.size(), "alice")
          == FileStartStatus::kStarted);
    CHECK(manager.AcceptChunk("f1", 0, Slice(content, 0)) == ChunkStatus::kStored);
    CHECK(manager.BeginTransfer("f1", "a.bin", content.size(), "alice")
          == FileStartStatus::kAlreadyPending);
    CHECK(manager.ReceivedChunks("f1") == std::optional<std::size_t>(1));

    CHECK(manager.AcceptChunk("f1", 0, BinaryData{1, 2, 3}) == ChunkStatus::kDuplicate);
    CHECK(manager.ReceivedChunks("f1") == std::optional<std::size_t>(1));

    CHECK(manager.AcceptChunk("f1", 1, Slice(content, 1)) == ChunkStatus::kStored);
    CHECK(manager.AcceptChunk("f1", 2, Slice(content, 2)) == ChunkStatus::kStored);
    auto result = manager.Finish("f1", FileHasher::CalculateDataChecksum(content));
    REQUIRE(result.status == FinishStatus::kCompleted);
    CHECK(test::ReadAll(result.saved_path) == content);
}

TEST_CASE("invalid and unknown chunks") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    CHECK(manager.AcceptChunk("X", 0, BinaryData{1}) == ChunkStatus::kUnknownTransfer);

    manager.BeginTransfer("f1", "a.bin", 500, "alice");
    CHECK(manager.AcceptChunk("f1", 2, BinaryData{1}) == ChunkStatus::kInvalid);
    CHECK(manager.AcceptChunk("f1", 0, BinaryData(protocol::kChunkSize + 1)) == ChunkStatus::kInvalid);
    CHECK(manager.ReceivedChunks("f1") == std::optional<std::size_t>(0));
}

TEST_CASE("hash mismatch discards the transfer and leaves no file") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    auto content = test::PatternBytes(300);

    manager.BeginTransfer("f1", "broken.bin", content.size(), "alice");
    manager.AcceptChunk("f1", 0, Slice(content, 0));
    manager.AcceptChunk("f1", 1, Slice(content, 1));

    auto result = manager.Finish("f1", std::string(64, '0'));
    CHECK(result.status == FinishStatus::kHashMismatch);
    CHECK_FALSE(manager.IsPending("f1"));
    CHECK_FALSE(fs::exists(dir.path() / "broken.bin"));
    CHECK(CountEntries(dir.path()) == 0);

    // The state is gone, a retransmitted END is not recognised
    CHECK(manager.Finish("f1", std::string(64, '0')).status == FinishStatus::kUnknownTransfer);
}

TEST_CASE("END and FILE after a completed transfer are recognised") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    auto content = test::PatternBytes(10);
    auto checksum = FileHasher::CalculateDataChecksum(content);

    manager.BeginTransfer("f1", "small.txt", content.size(), "alice");
    manager.AcceptChunk("f1", 0, content);
    REQUIRE(manager.Finish("f1", checksum).status == FinishStatus::kCompleted);

    CHECK(manager.Finish("f1", checksum).status == FinishStatus::kAlreadyCompleted);
    CHECK(manager.BeginTransfer("f1", "small.txt", content.size(), "alice")
          == FileStartStatus::kAlreadyCompleted);
    CHECK_FALSE(manager.IsPending("f1"));
}

TEST_CASE("the declared name is reduced to its last component") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    BinaryData content{'h', 'i'};

    manager.BeginTransfer("f1", "../../etc/evil.txt", content.size(), "mallory");
    manager.AcceptChunk("f1", 0, content);
    auto result = manager.Finish("f1", FileHasher::CalculateDataChecksum(content));
    REQUIRE(result.status == FinishStatus::kCompleted);
    CHECK(result.saved_path == dir.path() / "evil.txt");
}

TEST_CASE("a second transfer with the same name overwrites the first") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    BinaryData first{'o', 'n', 'e'};
    BinaryData second{'t', 'w', 'o', '!'};

    manager.BeginTransfer("f1", "same.txt", first.size(), "alice");
    manager.AcceptChunk("f1", 0, first);
    manager.Finish("f1", FileHasher::CalculateDataChecksum(first));

    manager.BeginTransfer("f2", "same.txt", second.size(), "alice");
    manager.AcceptChunk("f2", 0, second);
    manager.Finish("f2", FileHasher::CalculateDataChecksum(second));

    CHECK(test::ReadAll(dir.path() / "same.txt") == second);
}

TEST_CASE("empty files complete without chunks") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    manager.BeginTransfer("f1", "empty.txt", 0, "alice");
    auto result = manager.Finish("f1", FileHasher::CalculateDataChecksum({}));
    REQUIRE(result.status == FinishStatus::kCompleted);
    CHECK(fs::file_size(result.saved_path) == 0);
}

TEST_CASE("idle transfers expire and are reported") {
    test::TempDir dir;
    std::vector<std::pair<FeedbackType, nlohmann::json>> events;
    ReceiveManager manager(dir.path(), 120s, [&events](FeedbackType type, const nlohmann::json& data) {
        events.emplace_back(type, data);
    });
    auto t0 = ReceiveManager::Clock::now();

    manager.BeginTransfer("idle", "a.bin", 500, "alice", t0);
    manager.BeginTransfer("busy", "b.bin", 500, "alice", t0);
    manager.AcceptChunk("busy", 0, BinaryData(250), t0 + 100s);

    CHECK(manager.ExpireStale(t0 + 120s).empty());
    auto expired = manager.ExpireStale(t0 + 121s);
    REQUIRE(expired.size() == 1);
    CHECK(expired[0] == "idle");
    CHECK_FALSE(manager.IsPending("idle"));
    CHECK(manager.IsPending("busy"));
    CHECK(manager.pending_count() == 1);

    REQUIRE_FALSE(events.empty());
    CHECK(events.back().first == FeedbackType::kReceiveSessionEnded);
    CHECK(events.back().second["file_id"] == "idle");
    CHECK(events.back().second["success"] == false);
}

TEST_CASE("progress and completion feedback") {
    test::TempDir dir;
    std::vector<FeedbackType> types;
    ReceiveManager manager(dir.path(), 120s, [&types](FeedbackType type, const nlohmann::json&) {
        types.push_back(type);
    });
    auto content = test::PatternBytes(400);

    manager.BeginTransfer("f1", "p.bin", content.size(), "alice");
    manager.AcceptChunk("f1", 0, Slice(content, 0));
    manager.AcceptChunk("f1", 0, Slice(content, 0));
    manager.AcceptChunk("f1", 1, Slice(content, 1));
    manager.Finish("f1", FileHasher::CalculateDataChecksum(content));

    std::vector<FeedbackType> expected{FeedbackType::kFileReceivingStarted,
                                       FeedbackType::kFileReceivingProgress,
                                       FeedbackType::kFileReceivingProgress,
                                       FeedbackType::kFileReceivingCompleted};
    CHECK(types == expected);
}

TEST_CASE("a declared size too large to reassemble is refused") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    constexpr auto kHuge = std::numeric_limits<std::uint64_t>::max();

    CHECK(protocol::TotalChunks(kHuge) == static_cast<std::size_t>(kHuge / 250 + 1));
    CHECK(manager.BeginTransfer("huge", "huge.bin", kHuge, "alice")
          == FileStartStatus::kTooLarge);
    CHECK_FALSE(manager.IsPending("huge"));
    CHECK(manager.AcceptChunk("huge", 0, BinaryData{1}) == ChunkStatus::kUnknownTransfer);
}

TEST_CASE("END does not allocate the declared size up front") {
    test::TempDir dir;
    ReceiveManager manager(dir.path());
    BinaryData abc{'a', 'b', 'c'};

    REQUIRE(manager.BeginTransfer("big", "big.bin", 1'000'000'000'000'000ULL, "alice")
            == FileStartStatus::kStarted);
    REQUIRE(manager.AcceptChunk("big", 0, abc) == ChunkStatus::kStored);

    FinishResult result{};
    CHECK_NOTHROW(result = manager.Finish("big", std::string(64, '0')));
    CHECK(result.status == FinishStatus::kHashMismatch);
    CHECK(manager.pending_count() == 0);
    CHECK(CountEntries(dir.path()) == 0);
}
