#include <core/network/transfer/receive_manager.h>
#include <core/security/file_hasher.h>
#include <fstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lanlink::core {

namespace {

// Keep only the final path component of a sender-declared name
std::string SafeFileName(const std::string& declared, const std::string& file_id) {
    auto name = fs::path(declared).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return fs::path(file_id).filename().string() + ".bin";
    }
    return name;
}

} // namespace

ReceiveManager::ReceiveManager(const fs::path& save_dir,
                               std::chrono::seconds transfer_timeout,
                               FeedbackCallback callback)
    : save_dir_(save_dir)
    , transfer_timeout_(transfer_timeout)
    , callback_(callback) {
    std::error_code ec;
    if (!fs::exists(save_dir_, ec)) {
        fs::create_directories(save_dir_, ec);
        if (ec) {
            spdlog::error("Failed to create save directory \"{}\": {}",
                          save_dir_.string(),
                          ec.message());
        }
    }
}

FileStartStatus ReceiveManager::BeginTransfer(const std::string& file_id,
                                              const std::string& file_name,
                                              std::uint64_t file_size,
                                              const std::string& sender,
                                              Clock::time_point now) {
    if (file_size > protocol::kMaxFileSize) {
        spdlog::warn("Refusing file {} from {}: declared size {} is too large",
                     file_id,
                     sender,
                     file_size);
        return FileStartStatus::kTooLarge;
    }

    ReceiveFileContext file_context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto iter = pending_files_.find(file_id); iter != pending_files_.end()) {
            iter->second.last_activity = now;
            return FileStartStatus::kAlreadyPending;
        }
        if (completed_files_.contains(file_id)) {
            return FileStartStatus::kAlreadyCompleted;
        }

        file_context = ReceiveFileContext{
            .file_name = SafeFileName(file_name, file_id),
            .file_size = file_size,
            .total_chunks = protocol::TotalChunks(file_size),
            .received_count = 0,
            .sender = sender,
            .chunks = {},
            .last_activity = now,
        };
        pending_files_.emplace(file_id, file_context);
    }

    spdlog::info("Receiving file \"{}\" ({} bytes, {} chunks) from {}",
                 file_context.file_name,
                 file_context.file_size,
                 file_context.total_chunks,
                 sender);

    feedback(FeedbackType::kFileReceivingStarted,
             feedback::FileReceivingStarted{
                 .file_id = file_id,
                 .filename = file_context.file_name,
                 .file_size = file_context.file_size,
                 .sender = sender,
             });
    return FileStartStatus::kStarted;
}

ChunkStatus ReceiveManager::AcceptChunk(const std::string& file_id,
                                        std::size_t seq,
                                        BinaryData data,
                                        Clock::time_point now) {
    std::string file_name;
    std::size_t received_count = 0;
    std::size_t total_chunks = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iter = pending_files_.find(file_id);
        if (iter == pending_files_.end()) {
            return ChunkStatus::kUnknownTransfer;
        }
        auto& file_context = iter->second;
        if (seq >= file_context.total_chunks || data.size() > protocol::kChunkSize) {
            spdlog::warn("Invalid chunk {} ({} bytes) for file {} with {} chunks",
                         seq,
                         data.size(),
                         file_id,
                         file_context.total_chunks);
            return ChunkStatus::kInvalid;
        }
        file_context.last_activity = now;
        if (file_context.chunks.contains(seq)) {
            spdlog::debug("Chunk {} for file {} already received", seq, file_id);
            return ChunkStatus::kDuplicate;
        }

        file_context.chunks.emplace(seq, std::move(data));
        file_context.received_count++;

        file_name = file_context.file_name;
        received_count = file_context.received_count;
        total_chunks = file_context.total_chunks;
    }

    double progress = static_cast<double>(received_count) / total_chunks * 100.0;
    if (received_count % 10 == 0 || received_count == total_chunks) {
        spdlog::info("Received chunk {}/{} of \"{}\" ({:.1f}%)",
                     received_count,
                     total_chunks,
                     file_name,
                     progress);
    }

    feedback(FeedbackType::kFileReceivingProgress,
             feedback::FileReceivingProgress{
                 .file_id = file_id,
                 .filename = file_name,
                 .progress = progress,
             });
    return ChunkStatus::kStored;
}

FinishResult ReceiveManager::Finish(const std::string& file_id,
                                    const std::string& expected_checksum,
                                    Clock::time_point now) {
    ReceiveFileContext file_context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iter = pending_files_.find(file_id);
        if (iter == pending_files_.end()) {
            if (auto done = completed_files_.find(file_id);
                done != completed_files_.end() && done->second.file_checksum == expected_checksum) {
                return {FinishStatus::kAlreadyCompleted, {}};
            }
            return {FinishStatus::kUnknownTransfer, {}};
        }
        file_context = std::move(iter->second);
        pending_files_.erase(iter);
    }

    // Ascending sequence order regardless of arrival order
    BinaryData content;
    std::string actual_checksum;
    try {
        std::size_t received_bytes = 0;
        for (const auto& [seq, chunk] : file_context.chunks) {
            received_bytes += chunk.size();
        }
        content.reserve(received_bytes);
        for (const auto& [seq, chunk] : file_context.chunks) {
            content.insert(content.end(), chunk.begin(), chunk.end());
        }
        actual_checksum = FileHasher::CalculateDataChecksum(content);
    } catch (const std::exception& e) {
        spdlog::error("Failed to reassemble \"{}\": {}", file_context.file_name, e.what());
        feedback(FeedbackType::kReceiveSessionEnded,
                 feedback::ReceiveSessionEnd{
                     .file_id = file_id,
                     .filename = file_context.file_name,
                     .success = false,
                     .error_message = e.what(),
                 });
        return {FinishStatus::kWriteFailed, {}};
    }
    if (actual_checksum != expected_checksum) {
        spdlog::error("File checksum mismatch for \"{}\" (id = {}): expected {}, got {} "
                      "({} of {} chunks received)",
                      file_context.file_name,
                      file_id,
                      expected_checksum,
                      actual_checksum,
                      file_context.received_count,
                      file_context.total_chunks);
        feedback(FeedbackType::kReceiveSessionEnded,
                 feedback::ReceiveSessionEnd{
                     .file_id = file_id,
                     .filename = file_context.file_name,
                     .success = false,
                     .error_message = "hash mismatch",
                 });
        return {FinishStatus::kHashMismatch, {}};
    }

    fs::path final_file_path;
    try {
        final_file_path = writeFile(file_context, content);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save \"{}\": {}", file_context.file_name, e.what());
        feedback(FeedbackType::kReceiveSessionEnded,
                 feedback::ReceiveSessionEnd{
                     .file_id = file_id,
                     .filename = file_context.file_name,
                     .success = false,
                     .error_message = e.what(),
                 });
        return {FinishStatus::kWriteFailed, {}};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_files_[file_id] = CompletedFile{expected_checksum, now};
    }

    spdlog::info("File \"{}\" from {} received successfully, saved as \"{}\"",
                 file_context.file_name,
                 file_context.sender,
                 final_file_path.string());

    feedback(FeedbackType::kFileReceivingCompleted,
             feedback::FileReceivingCompleted{
                 .file_id = file_id,
                 .filename = file_context.file_name,
                 .sender = file_context.sender,
                 .saved_path = final_file_path.string(),
             });
    return {FinishStatus::kCompleted, final_file_path};
}

std::vector<std::string> ReceiveManager::ExpireStale(Clock::time_point now) {
    std::vector<std::pair<std::string, std::string>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_files_.begin(); it != pending_files_.end();) {
            if (now - it->second.last_activity > transfer_timeout_) {
                expired.emplace_back(it->first, it->second.file_name);
                it = pending_files_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = completed_files_.begin(); it != completed_files_.end();) {
            if (now - it->second.finished_at > transfer_timeout_) {
                it = completed_files_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::vector<std::string> expired_ids;
    for (auto& [file_id, file_name] : expired) {
        spdlog::warn("Transfer of \"{}\" (id = {}) expired without END", file_name, file_id);
        feedback(FeedbackType::kReceiveSessionEnded,
                 feedback::ReceiveSessionEnd{
                     .file_id = file_id,
                     .filename = file_name,
                     .success = false,
                     .error_message = "transfer expired",
                 });
        expired_ids.push_back(std::move(file_id));
    }
    return expired_ids;
}

bool ReceiveManager::IsPending(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_files_.contains(file_id);
}

std::optional<std::size_t> ReceiveManager::ReceivedChunks(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto iter = pending_files_.find(file_id); iter != pending_files_.end()) {
        return iter->second.received_count;
    }
    return std::nullopt;
}

std::size_t ReceiveManager::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_files_.size();
}

fs::path ReceiveManager::writeFile(const ReceiveFileContext& file_context,
                                   const BinaryData& content) const {
    if (!fs::exists(save_dir_)) {
        fs::create_directories(save_dir_);
    }

    // Same name overwrites the previous file
    fs::path final_file_path = save_dir_ / file_context.file_name;
    fs::path temp_file_path = save_dir_ / ("." + file_context.file_name + ".part");

    {
        std::ofstream temp_file(temp_file_path, std::ios::binary | std::ios::trunc);
        if (!temp_file) {
            throw std::runtime_error(fmt::format("Failed to create temporary file {}",
                                                 temp_file_path.string()));
        }
        temp_file.write(reinterpret_cast<const char*>(content.data()),
                        static_cast<std::streamsize>(content.size()));
        if (!temp_file) {
            temp_file.close();
            std::error_code ec;
            fs::remove(temp_file_path, ec);
            throw std::runtime_error(fmt::format("Failed to write temporary file {}",
                                                 temp_file_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp_file_path, final_file_path, ec);
    if (ec) {
        fs::remove(temp_file_path, ec);
        throw std::runtime_error(fmt::format("Failed to move {} to {}",
                                             temp_file_path.string(),
                                             final_file_path.string()));
    }
    return final_file_path;
}

} // namespace lanlink::core
