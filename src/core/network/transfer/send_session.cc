#include <algorithm>
#include <cctype>
#include <core/network/protocol/message_codec.h>
#include <core/network/transfer/send_session.h>
#include <core/security/file_hasher.h>
#include <core/util/message_id.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lanlink::core {

namespace {

std::string WireFileName(const fs::path& file_path) {
    std::string name = file_path.filename().string();
    std::replace_if(
        name.begin(),
        name.end(),
        [](unsigned char c) { return std::isspace(c); },
        '_');
    return name;
}

} // namespace

SendSession::SendSession(ReliableSender& sender,
                         std::string local_name,
                         std::string device_name,
                         Endpoint target,
                         fs::path file_path,
                         FeedbackCallback callback)
    : sender_(sender)
    , device_name_(std::move(device_name))
    , target_(std::move(target))
    , file_path_(std::move(file_path))
    , callback_(callback)
    , file_id_(GenerateMessageId(local_name))
    , file_name_(WireFileName(file_path_)) {}

SendResult SendSession::Run() {
    try {
        file_size_ = fs::file_size(file_path_);
        total_chunks_ = protocol::TotalChunks(file_size_);
        file_checksum_ = FileHasher::CalculateFileChecksum(file_path_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to prepare {}: {}", file_path_.string(), e.what());
        return fail(SendResult::kFailed, e.what());
    }

    spdlog::debug("SendSession: file_id={}, file_name={}, file_size={}, total_chunks={}, "
                  "file_checksum={}",
                  file_id_,
                  file_name_,
                  file_size_,
                  total_chunks_,
                  file_checksum_);

    if (auto result = announce(); result != SendResult::kSuccess) {
        return fail(result, fmt::format("FILE {}", ToString(result)));
    }
    if (auto result = sendChunks(); result != SendResult::kSuccess) {
        return fail(result, fmt::format("CHUNK {}", ToString(result)));
    }
    if (auto result = finish(); result != SendResult::kSuccess) {
        return fail(result, fmt::format("END {}", ToString(result)));
    }

    session_status_ = SessionStatus::kCompleted;
    spdlog::info("File \"{}\" sent to {} successfully", file_name_, device_name_);
    feedback(FeedbackType::kSendSessionEnded,
             feedback::SendSessionEnd{
                 .file_id = file_id_,
                 .device_name = device_name_,
                 .filename = file_name_,
                 .result = SendResult::kSuccess,
                 .error_message = "",
             });
    return SendResult::kSuccess;
}

SendResult SendSession::announce() {
    session_status_ = SessionStatus::kAnnouncing;
    spdlog::info("Sending file \"{}\" ({} bytes, {} chunks) to {}",
                 file_name_,
                 file_size_,
                 total_chunks_,
                 device_name_);
    auto payload = MessageCodec::Encode(message::FileStart{file_id_, file_name_, file_size_});
    return sender_.Deliver(file_id_, payload, target_);
}

SendResult SendSession::sendChunks() {
    session_status_ = SessionStatus::kSending;

    std::ifstream file(file_path_, std::ios::binary);
    if (!file) {
        spdlog::error("Failed to open file: {}", file_path_.string());
        return SendResult::kFailed;
    }

    BinaryData buffer(protocol::kChunkSize);
    for (std::size_t seq = 0; seq < total_chunks_; ++seq) {
        file.read(reinterpret_cast<char*>(buffer.data()), protocol::kChunkSize);
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            spdlog::error("Unexpected end of file {} at chunk {}", file_path_.string(), seq);
            return SendResult::kFailed;
        }

        BinaryData chunk(buffer.begin(), buffer.begin() + bytes_read);
        auto payload = MessageCodec::Encode(message::Chunk{file_id_, seq, std::move(chunk)});
        auto result = sender_.Deliver(ChunkAckId(file_id_, seq), payload, target_);
        if (result != SendResult::kSuccess) {
            spdlog::error("Chunk {} of \"{}\" failed: {}", seq, file_name_, ToString(result));
            return result;
        }

        auto sent = seq + 1;
        double progress = static_cast<double>(sent) / total_chunks_ * 100.0;
        if (sent % 10 == 0 || sent == total_chunks_) {
            spdlog::info("Sent chunk {}/{} of \"{}\" ({:.1f}%)",
                         sent,
                         total_chunks_,
                         file_name_,
                         progress);
        }
        feedback(FeedbackType::kFileSendingProgress,
                 feedback::FileSendingProgress{
                     .file_id = file_id_,
                     .filename = file_name_,
                     .progress = progress,
                 });
    }
    return SendResult::kSuccess;
}

SendResult SendSession::finish() {
    session_status_ = SessionStatus::kFinishing;
    auto payload = MessageCodec::Encode(message::End{file_id_, file_checksum_});
    auto result = sender_.Deliver(file_id_, payload, target_);
    if (result == SendResult::kRejected) {
        spdlog::error("Receiver rejected \"{}\": checksum verification failed", file_name_);
    }
    return result;
}

SendResult SendSession::fail(SendResult result, const std::string& error_message) {
    session_status_ = result == SendResult::kAborted ? SessionStatus::kCancelled
                                                     : SessionStatus::kFailed;
    spdlog::error("Send session for \"{}\" to {} failed: {}",
                  file_name_,
                  device_name_,
                  error_message);
    feedback(FeedbackType::kSendSessionEnded,
             feedback::SendSessionEnd{
                 .file_id = file_id_,
                 .device_name = device_name_,
                 .filename = file_name_,
                 .result = result,
                 .error_message = error_message,
             });
    return result;
}

} // namespace lanlink::core
