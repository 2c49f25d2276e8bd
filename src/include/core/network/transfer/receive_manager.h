#pragma once

#include <chrono>
#include <core/constant/path.h>
#include <core/constant/protocol.h>
#include <core/model/feedback.h>
#include <core/model/file_receive_context.h>
#include <core/util/binary_data.h>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanlink::core {

enum class FileStartStatus {
    kStarted,
    kAlreadyPending,   // duplicate FILE, state untouched
    kAlreadyCompleted, // FILE retransmitted after the transfer finished
    kTooLarge,         // declared size cannot be reassembled in memory
};

enum class ChunkStatus {
    kStored,
    kDuplicate,
    kUnknownTransfer,
    kInvalid, // sequence outside [0, total_chunks) or payload larger than a chunk
};

enum class FinishStatus {
    kCompleted,
    kAlreadyCompleted, // END retransmitted after a successful finish
    kHashMismatch,
    kWriteFailed,
    kUnknownTransfer,
};

struct FinishResult {
    FinishStatus status;
    std::filesystem::path saved_path;
};

// Receiver side of file transfers: one reassembly buffer per file id, created by FILE,
// filled by CHUNK and consumed by END.
class ReceiveManager {
public:
    using Clock = std::chrono::steady_clock;

    ReceiveManager(const std::filesystem::path& save_dir = path::kSystemDownloadDir,
                   std::chrono::seconds transfer_timeout = protocol::kTransferTimeout,
                   FeedbackCallback callback = nullptr);
    ~ReceiveManager() = default;
    ReceiveManager(const ReceiveManager&) = delete;
    ReceiveManager& operator=(const ReceiveManager&) = delete;

    FileStartStatus BeginTransfer(const std::string& file_id,
                                  const std::string& file_name,
                                  std::uint64_t file_size,
                                  const std::string& sender,
                                  Clock::time_point now = Clock::now());

    ChunkStatus AcceptChunk(const std::string& file_id,
                            std::size_t seq,
                            BinaryData data,
                            Clock::time_point now = Clock::now());

    // Writes the chunks in ascending sequence order and checks the SHA-256 against
    // expected_checksum. The transfer state is discarded whatever the outcome; on a
    // mismatch nothing is left in the save directory.
    FinishResult Finish(const std::string& file_id,
                        const std::string& expected_checksum,
                        Clock::time_point now = Clock::now());

    // Drops transfers idle for longer than the transfer timeout. Returns their ids.
    std::vector<std::string> ExpireStale(Clock::time_point now = Clock::now());

    bool IsPending(const std::string& file_id) const;
    std::optional<std::size_t> ReceivedChunks(const std::string& file_id) const;
    std::size_t pending_count() const;

    const std::filesystem::path& save_dir() const { return save_dir_; }

private:
    struct CompletedFile {
        std::string file_checksum;
        Clock::time_point finished_at;
    };

    std::filesystem::path writeFile(const ReceiveFileContext& file_context,
                                    const BinaryData& content) const;

    void feedback(FeedbackType type, const nlohmann::json& data) const {
        if (callback_) {
            callback_(type, data);
        }
    }

    std::filesystem::path save_dir_;
    std::chrono::seconds transfer_timeout_;
    FeedbackCallback callback_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ReceiveFileContext> pending_files_;
    std::unordered_map<std::string, CompletedFile> completed_files_;
};

} // namespace lanlink::core
